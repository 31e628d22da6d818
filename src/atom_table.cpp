//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Aspect.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <aspect/atom_table.h>

#include <potassco/error.h>

#include <algorithm>
#include <functional>
#include <ostream>
#include <sstream>

namespace Aspect {

std::size_t AtomTable::SigHash::operator()(const SigKey& k) const noexcept {
    return std::hash<std::string>{}(k.name) ^ (static_cast<std::size_t>(k.arity) * 0x9e3779b9u);
}

Pred_t AtomTable::addPredicate(std::string_view name, uint32_t arity) {
    SigKey key{std::string(name), arity};
    if (auto it = sigs_.find(key); it != sigs_.end()) {
        return it->second;
    }
    auto p = size32(preds_);
    preds_.push_back(PredData{Sig{key.name, arity}, {}, {}});
    preds_.back().index.resize(arity);
    lookup_.emplace_back();
    sigs_.emplace(std::move(key), p);
    return p;
}
Pred_t AtomTable::findPredicate(std::string_view name, uint32_t arity) const {
    auto it = sigs_.find(SigKey{std::string(name), arity});
    return it != sigs_.end() ? it->second : pred_none;
}
const Sig& AtomTable::predicate(Pred_t p) const {
    POTASSCO_CHECK_PRE(p < numPredicates(), "invalid predicate %u", p);
    return preds_[p].sig;
}

std::pair<Atom_t, bool> AtomTable::add(Pred_t p, SymVec args) {
    POTASSCO_CHECK_PRE(p < numPredicates(), "invalid predicate %u", p);
    auto& pd = preds_[p];
    POTASSCO_CHECK_PRE(args.size() == pd.sig.arity, "arity mismatch for %s", pd.sig.name.c_str());
    auto [it, added] = lookup_[p].try_emplace(args, size());
    if (not added) {
        return {it->second, false};
    }
    auto id = it->second;
    pd.atoms.push_back(id);
    for (auto i : irange(args)) { pd.index[i][args[i]].push_back(id); }
    atoms_.push_back(AtomData{p, std::move(args)});
    return {id, true};
}
Atom_t AtomTable::find(Pred_t p, const SymVec& args) const {
    if (p >= numPredicates()) {
        return atom_none;
    }
    auto it = lookup_[p].find(args);
    return it != lookup_[p].end() ? it->second : atom_none;
}
Atom_t AtomTable::find(std::string_view name, const SymVec& args) const {
    return find(findPredicate(name, size32(args)), args);
}

std::span<const Atom_t> AtomTable::atoms(Pred_t p) const {
    POTASSCO_CHECK_PRE(p < numPredicates(), "invalid predicate %u", p);
    return preds_[p].atoms;
}
std::span<const Atom_t> AtomTable::atoms(Pred_t p, uint32_t pos, const Symbol& v) const {
    POTASSCO_CHECK_PRE(p < numPredicates() && pos < preds_[p].sig.arity, "invalid index lookup");
    const auto& idx = preds_[p].index[pos];
    if (auto it = idx.find(v); it != idx.end()) {
        return it->second;
    }
    return {};
}

bool AtomTable::less(Atom_t lhs, Atom_t rhs) const {
    const auto& l = atoms_[lhs];
    const auto& r = atoms_[rhs];
    if (l.pred != r.pred) {
        const auto& ls = preds_[l.pred].sig;
        const auto& rs = preds_[r.pred].sig;
        if (auto c = ls.name.compare(rs.name); c != 0) {
            return c < 0;
        }
        return ls.arity < rs.arity;
    }
    return std::lexicographical_compare(l.args.begin(), l.args.end(), r.args.begin(), r.args.end());
}

void AtomTable::print(std::ostream& os, Atom_t a) const {
    os << name(a);
    if (const auto& as = args(a); not as.empty()) {
        os << '(';
        const char* sep = "";
        for (const auto& s : as) {
            os << sep << s;
            sep = ",";
        }
        os << ')';
    }
}
std::string AtomTable::toString(Atom_t a) const {
    std::ostringstream str;
    print(str, a);
    return str.str();
}

} // namespace Aspect
