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
#include <aspect/instantiator.h>

#include <potassco/error.h>

namespace Aspect {
/////////////////////////////////////////////////////////////////////////////////////////
// VarTable
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t VarTable::add(std::string_view name) {
    if (auto s = find(name); s != var_none) {
        return s;
    }
    names_.emplace_back(name);
    return size32(names_) - 1;
}
uint32_t VarTable::find(std::string_view name) const {
    for (auto i : irange(names_)) {
        if (names_[i] == name) {
            return i;
        }
    }
    return var_none;
}
/////////////////////////////////////////////////////////////////////////////////////////
// BoundTerm
/////////////////////////////////////////////////////////////////////////////////////////
BoundTerm BoundTerm::compile(const Term& t, VarTable& vars) {
    BoundTerm res;
    switch (t.type()) {
        case Term::Type::constant: res.value_ = t.symbol(); break;
        case Term::Type::variable:
            res.type_ = Type::variable;
            res.slot_ = vars.add(t.name());
            break;
        case Term::Type::binary:
            res.type_ = Type::binary;
            res.op_   = t.op();
            res.args_.push_back(compile(t.lhs(), vars));
            res.args_.push_back(compile(t.rhs(), vars));
            break;
    }
    return res;
}
bool BoundTerm::evaluable(const Binding& b) const {
    switch (type_) {
        case Type::constant: return true;
        case Type::variable: return b.bound(slot_);
        default            : return args_[0].evaluable(b) && args_[1].evaluable(b);
    }
}
bool BoundTerm::eval(const Binding& b, Symbol& out) const {
    switch (type_) {
        case Type::constant: out = value_; return true;
        case Type::variable:
            POTASSCO_ASSERT(b.bound(slot_));
            out = b[slot_];
            return true;
        default: {
            Symbol l, r;
            return args_[0].eval(b, l) && args_[1].eval(b, r) && apply(op_, l, r, out);
        }
    }
}
void BoundTerm::collectSlots(std::vector<uint32_t>& out) const {
    if (type_ == Type::variable) {
        out.push_back(slot_);
    }
    for (const auto& a : args_) { a.collectSlots(out); }
}
/////////////////////////////////////////////////////////////////////////////////////////
// BoundAtom
/////////////////////////////////////////////////////////////////////////////////////////
BoundAtom::BoundAtom(const AtomTable& atoms, const Atom& a, VarTable& vars)
    : atom_(a)
    , pred_(atoms.findPredicate(a.name(), a.arity())) {
    for (const auto& t : a.args()) { args_.push_back(BoundTerm::compile(t, vars)); }
}
void BoundAtom::bindingSlots(std::vector<uint32_t>& out) const {
    for (const auto& t : args_) {
        if (t.type() == BoundTerm::Type::variable) {
            out.push_back(t.slot());
        }
    }
}
void BoundAtom::arithmeticSlots(std::vector<uint32_t>& out) const {
    for (const auto& t : args_) {
        if (t.type() == BoundTerm::Type::binary) {
            t.collectSlots(out);
        }
    }
}
bool BoundAtom::ground(const Binding& b, SymVec& out) const {
    out.clear();
    out.reserve(args_.size());
    for (const auto& t : args_) {
        Symbol v;
        if (not t.eval(b, v)) {
            return false;
        }
        out.push_back(std::move(v));
    }
    return true;
}
Atom_t BoundAtom::find(const AtomTable& atoms, const Binding& b) const {
    SymVec args;
    if (pred_ == pred_none || not ground(b, args)) {
        return atom_none;
    }
    return atoms.find(pred_, args);
}
bool BoundAtom::match(const SymVec& args, Binding& b, std::vector<uint32_t>& newly) const {
    POTASSCO_ASSERT(args.size() == args_.size());
    // plain arguments first so that arithmetic arguments may refer to variables bound by this atom
    for (auto i : irange(args_)) {
        const auto& t = args_[i];
        if (t.type() == BoundTerm::Type::binary) {
            continue;
        }
        if (t.type() == BoundTerm::Type::variable && not b.bound(t.slot())) {
            b.bind(t.slot(), args[i]);
            newly.push_back(t.slot());
        }
        else if (not(t.type() == BoundTerm::Type::variable ? b[t.slot()] == args[i] : t.value() == args[i])) {
            return false;
        }
    }
    for (auto i : irange(args_)) {
        Symbol v;
        if (args_[i].type() == BoundTerm::Type::binary && (not args_[i].eval(b, v) || not(v == args[i]))) {
            return false;
        }
    }
    return true;
}
uint32_t BoundAtom::indexPosition(const Binding& b) const {
    for (auto i : irange(args_)) {
        if (args_[i].type() != BoundTerm::Type::binary && args_[i].evaluable(b)) {
            return i;
        }
    }
    return var_none;
}
/////////////////////////////////////////////////////////////////////////////////////////
// JoinPlan
/////////////////////////////////////////////////////////////////////////////////////////
JoinPlan::JoinPlan(const AtomTable& atoms, std::span<const CondLiteral* const> lits, VarTable& vars) {
    std::vector<uint8_t> bound(vars.size(), 1);
    auto                 isBound = [&](const std::vector<uint32_t>& slots) {
        return std::all_of(slots.begin(), slots.end(), [&](uint32_t s) { return s < bound.size() && bound[s]; });
    };
    auto markBound = [&](const std::vector<uint32_t>& slots) {
        for (auto s : slots) {
            if (s >= bound.size()) {
                bound.resize(s + 1, 0);
            }
            bound[s] = 1;
        }
    };
    struct Pending {
        JoinStep              step;
        std::vector<uint32_t> needs; // slots that must be bound before the step can run
        std::vector<uint32_t> binds;
    };
    std::vector<Pending> pending;
    for (const auto* lit : lits) {
        Pending p;
        if (lit->isComparison()) {
            p.step.type = JoinStep::Type::comparison;
            p.step.op   = lit->op();
            p.step.lhs  = BoundTerm::compile(lit->lhs(), vars);
            p.step.rhs  = BoundTerm::compile(lit->rhs(), vars);
            p.step.lhs.collectSlots(p.needs);
            p.step.rhs.collectSlots(p.needs);
        }
        else if (lit->negative()) {
            p.step.type = JoinStep::Type::negative;
            p.step.atom = BoundAtom(atoms, lit->atom(), vars);
            for (const auto& t : p.step.atom.args()) { t.collectSlots(p.needs); }
        }
        else {
            p.step.type  = JoinStep::Type::positive;
            p.step.atom  = BoundAtom(atoms, lit->atom(), vars);
            p.step.index = numPos_++;
            p.step.atom.bindingSlots(p.binds);
            p.step.atom.arithmeticSlots(p.needs);
            std::erase_if(p.needs, [&](uint32_t s) {
                return std::find(p.binds.begin(), p.binds.end(), s) != p.binds.end();
            });
        }
        pending.push_back(std::move(p));
    }
    bound.resize(vars.size(), 0);
    // Greedy scheduling: tests first, then the first positive literal that is ready.
    while (not pending.empty()) {
        bool progress = false;
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->step.type != JoinStep::Type::positive && isBound(it->needs)) {
                steps_.push_back(std::move(it->step));
                it       = pending.erase(it);
                progress = true;
            }
            else {
                ++it;
            }
        }
        auto pos = std::find_if(pending.begin(), pending.end(), [&](const Pending& p) {
            return p.step.type == JoinStep::Type::positive && isBound(p.needs);
        });
        if (pos != pending.end()) {
            markBound(pos->binds);
            steps_.push_back(std::move(pos->step));
            pending.erase(pos);
            progress = true;
        }
        if (not progress) {
            break;
        }
    }
    if (not pending.empty()) {
        for (const auto& p : pending) {
            for (auto s : p.needs) {
                if (s >= bound.size() || not bound[s]) {
                    unsafe_ = vars.name(s);
                    return;
                }
            }
        }
    }
}

} // namespace Aspect
