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
#include <aspect/model_check.h>

#include <potassco/error.h>

#include <algorithm>
#include <cstdlib>
#include <span>

namespace Aspect {
namespace {
constexpr auto rule_inactive = static_cast<uint32_t>(-1);

//! Evaluates monotone body aggregates of the reduct over D and the variables assigned true.
struct ReductAggregates {
    const GroundProgram&         prg;
    const std::vector<Val_t>&    vals;
    const std::vector<uint8_t>&  derived;
    const std::vector<uint32_t>& varOf;

    [[nodiscard]] bool holds(uint32_t g, const std::vector<int8_t>& vars) const {
        auto inM = [&](Atom_t a) { return vals[a] == value_true; };
        auto inN = [&](Atom_t a) { return derived[a] != 0 || (varOf[a] != 0 && vars[varOf[a] - 1] > 0); };
        return holdsReduct(prg.aggregates()[g], inN, inM);
    }
};

//! A minimal DPLL procedure for the clauses of the minimality check.
/*!
 * A clause may be guarded by monotone aggregates. Such a clause only takes
 * part in propagation once all of its guards hold over the atoms assigned
 * true so far. Once they hold, they hold in every extension.
 */
class SubModelSearch {
public:
    using Lits = std::vector<int32_t>; // literal v+1 (true) or -(v+1) (false)
    struct Clause {
        Lits                  lits;
        std::vector<uint32_t> guards;
    };

    SubModelSearch(uint32_t numVars, const ReductAggregates& aggs) : aggs_(&aggs), vals_(numVars, 0) {}
    void addClause(Lits lits, std::vector<uint32_t> guards = {}) {
        clauses_.push_back(Clause{std::move(lits), std::move(guards)});
    }
    bool solve() { return search(); }

private:
    [[nodiscard]] int8_t value(int32_t lit) const {
        auto v = vals_[static_cast<uint32_t>(std::abs(lit) - 1)];
        return lit > 0 ? v : static_cast<int8_t>(-v);
    }
    [[nodiscard]] bool active(const Clause& c) const {
        return std::all_of(c.guards.begin(), c.guards.end(), [&](uint32_t g) { return aggs_->holds(g, vals_); });
    }
    void set(int32_t lit, std::vector<uint32_t>& undo) {
        auto v = static_cast<uint32_t>(std::abs(lit) - 1);
        vals_[v] = lit > 0 ? 1 : -1;
        undo.push_back(v);
    }
    // Unit propagation over all active clauses. Returns false on conflict.
    bool propagate(std::vector<uint32_t>& undo) {
        for (bool changed = true; changed;) {
            changed = false;
            for (const auto& c : clauses_) {
                int32_t  unit = 0;
                uint32_t free = 0;
                bool     sat  = false;
                for (auto lit : c.lits) {
                    if (auto v = value(lit); v > 0) {
                        sat = true;
                        break;
                    }
                    else if (v == 0) {
                        ++free;
                        unit = lit;
                    }
                }
                if (sat || free > 1 || not active(c)) {
                    continue;
                }
                if (free == 0) {
                    return false;
                }
                set(unit, undo);
                changed = true;
            }
        }
        return true;
    }
    bool search() {
        std::vector<uint32_t> undo;
        bool                  res = false;
        if (propagate(undo)) {
            auto it = std::find(vals_.begin(), vals_.end(), 0);
            if (it == vals_.end()) {
                res = true;
            }
            else {
                auto var = static_cast<int32_t>(it - vals_.begin()) + 1;
                // prefer smaller models
                for (auto lit : {-var, var}) {
                    std::vector<uint32_t> local;
                    set(lit, local);
                    res = search();
                    for (auto v : local) { vals_[v] = 0; }
                    if (res) {
                        break;
                    }
                }
            }
        }
        for (auto v : undo) { vals_[v] = 0; }
        return res;
    }

    const ReductAggregates* aggs_;
    std::vector<int8_t>     vals_;
    std::vector<Clause>     clauses_;
};
} // namespace

ModelChecker::ModelChecker(const GroundProgram& prg)
    : prg_(&prg)
    , posWatch_(prg.numAtoms())
    , aggWatch_(prg.numAtoms())
    , missing_(prg.rules().size(), rule_inactive) {
    for (auto i : irange(prg.rules())) {
        const auto& r = prg.rules()[i];
        for (auto a : r.body.pos) { posWatch_[a].push_back(i); }
        for (auto g : r.body.aggs) {
            const auto& agg = prg.aggregates()[g];
            if (agg.monotone()) {
                for (auto a : agg.atoms()) { aggWatch_[a].push_back(i); }
            }
        }
    }
}

bool ModelChecker::bodyHolds(const GroundRule& r, const std::vector<Val_t>& vals) const {
    auto inM = [&](Atom_t a) { return vals[a] == value_true; };
    return std::all_of(r.body.pos.begin(), r.body.pos.end(), inM) &&
           std::none_of(r.body.neg.begin(), r.body.neg.end(), inM) &&
           std::all_of(r.body.aggs.begin(), r.body.aggs.end(),
                       [&](uint32_t g) { return holds(prg_->aggregates()[g], inM); });
}

bool ModelChecker::isModel(const std::vector<Val_t>& vals) const {
    POTASSCO_CHECK_PRE(vals.size() == prg_->numAtoms(), "invalid assignment");
    auto inM = [&](Atom_t a) { return vals[a] == value_true; };
    for (auto a : prg_->facts()) {
        if (not inM(a)) {
            return false;
        }
    }
    for (const auto& r : prg_->rules()) {
        if (not bodyHolds(r, vals)) {
            continue;
        }
        auto numTrue = static_cast<uint32_t>(std::count_if(r.head.begin(), r.head.end(), inM));
        switch (r.type) {
            case HeadType::constraint: return false;
            case HeadType::normal:
            case HeadType::disjunctive:
                if (numTrue == 0) {
                    return false;
                }
                break;
            case HeadType::choice:
                if (numTrue < r.lower || numTrue > r.upper) {
                    return false;
                }
                break;
        }
    }
    return true;
}

uint32_t ModelChecker::fixpoint(const std::vector<Val_t>& vals) {
    const auto& rules = prg_->rules();
    auto        inM   = [&](Atom_t a) { return vals[a] == value_true; };
    auto        inD   = [&](Atom_t a) { return derived_[a] != 0; };
    derived_.assign(prg_->numAtoms(), 0);
    AtomVec  queue;
    uint32_t count  = 0;
    auto     derive = [&](Atom_t a) {
        if (not derived_[a]) {
            derived_[a] = 1;
            queue.push_back(a);
            ++count;
        }
    };
    auto fire = [&](uint32_t i) {
        const auto& r = rules[i];
        if (missing_[i] != 0 || not std::all_of(r.body.aggs.begin(), r.body.aggs.end(), [&](uint32_t g) {
                const auto& agg = prg_->aggregates()[g];
                return not agg.monotone() || holdsReduct(agg, inD, inM);
            })) {
            return;
        }
        missing_[i] = rule_inactive;
        if (r.type == HeadType::disjunctive) {
            // shifted: only derivable if the atom is the only true head atom
            if (std::count_if(r.head.begin(), r.head.end(), inM) == 1) {
                derive(*std::find_if(r.head.begin(), r.head.end(), inM));
            }
            return;
        }
        for (auto h : r.head) {
            if (inM(h)) {
                derive(h);
            }
        }
    };
    for (auto i : irange(rules)) {
        const auto& r = rules[i];
        missing_[i]   = rule_inactive;
        if (r.type == HeadType::constraint || std::none_of(r.head.begin(), r.head.end(), inM) ||
            not std::all_of(r.body.pos.begin(), r.body.pos.end(), inM) ||
            std::any_of(r.body.neg.begin(), r.body.neg.end(), inM) ||
            not std::all_of(r.body.aggs.begin(), r.body.aggs.end(),
                            [&](uint32_t g) { return holds(prg_->aggregates()[g], inM); })) {
            continue;
        }
        missing_[i] = size32(r.body.pos);
    }
    for (auto a : prg_->facts()) { derive(a); }
    for (auto i : irange(rules)) {
        if (missing_[i] == 0) {
            fire(i);
        }
    }
    while (not queue.empty()) {
        auto a = queue.back();
        queue.pop_back();
        for (auto i : posWatch_[a]) {
            if (missing_[i] != rule_inactive && missing_[i] > 0 && --missing_[i] == 0) {
                fire(i);
            }
        }
        for (auto i : aggWatch_[a]) {
            if (missing_[i] == 0) {
                fire(i);
            }
        }
    }
    return count;
}

bool ModelChecker::hasProperSubModel(const std::vector<Val_t>& vals) const {
    // Variables are the atoms of M that are not in D. Atoms of D are true in every model of the reduct below M.
    auto                  inM = [&](Atom_t a) { return vals[a] == value_true; };
    auto                  inD = [&](Atom_t a) { return derived_[a] != 0; };
    std::vector<uint32_t> varOf(prg_->numAtoms(), 0);
    uint32_t              numVars = 0;
    for (auto a : irange(prg_->numAtoms())) {
        if (inM(a) && not derived_[a]) {
            varOf[a] = ++numVars;
        }
    }
    POTASSCO_ASSERT(numVars > 0);
    ReductAggregates aggs{*prg_, vals, derived_, varOf};
    SubModelSearch   search(numVars, aggs);
    for (const auto& r : prg_->rules()) {
        if (r.type == HeadType::constraint || not bodyHolds(r, vals)) {
            continue;
        }
        SubModelSearch::Lits body;
        for (auto p : r.body.pos) {
            if (varOf[p]) {
                body.push_back(-static_cast<int32_t>(varOf[p]));
            }
        }
        // non-monotone aggregates keep their value in M
        std::vector<uint32_t> guards;
        for (auto g : r.body.aggs) {
            const auto& agg = prg_->aggregates()[g];
            if (agg.monotone() && not holdsReduct(agg, inD, inM)) {
                guards.push_back(g);
            }
        }
        auto addRule = [&](std::span<const Atom_t> heads) {
            auto c = body;
            for (auto h : heads) {
                if (not inM(h)) {
                    continue;
                }
                if (not varOf[h]) {
                    return; // satisfied by D
                }
                c.push_back(static_cast<int32_t>(varOf[h]));
            }
            search.addClause(std::move(c), guards);
        };
        if (r.type == HeadType::choice) {
            for (const auto& h : r.head) {
                if (inM(h)) {
                    addRule({&h, 1});
                }
            }
        }
        else {
            addRule(r.head);
        }
    }
    SubModelSearch::Lits strict;
    for (auto v : irange(numVars)) { strict.push_back(-static_cast<int32_t>(v + 1)); }
    search.addClause(std::move(strict));
    return search.solve();
}

bool ModelChecker::isStable(const std::vector<Val_t>& vals) {
    if (not isModel(vals)) {
        return false;
    }
    auto size = static_cast<uint32_t>(std::count(vals.begin(), vals.end(), value_true));
    if (fixpoint(vals) == size) {
        return true;
    }
    if (not prg_->disjunctive()) {
        return false;
    }
    auto inM      = [&](Atom_t a) { return vals[a] == value_true; };
    bool multiple = std::any_of(prg_->rules().begin(), prg_->rules().end(), [&](const GroundRule& r) {
        return r.type == HeadType::disjunctive && std::count_if(r.head.begin(), r.head.end(), inM) > 1 &&
               bodyHolds(r, vals);
    });
    if (not multiple) {
        return false;
    }
    ++minChecks_;
    return not hasProperSubModel(vals);
}

} // namespace Aspect
