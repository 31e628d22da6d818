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
#include <aspect/solver.h>

#include <potassco/error.h>

#include <algorithm>

namespace Aspect {

Solver::Solver(const GroundProgram& prg, const SolveOptions& opts, uint32_t id)
    : prg_(&prg)
    , opts_(opts)
    , id_(id)
    , checker_(prg) {
    init();
}

void Solver::init() {
    const auto& rules = prg_->rules();
    auto        n     = prg_->numAtoms();
    vals_.assign(n, value_free);
    choice_.assign(n, 0);
    occurs_.assign(n, {});
    heads_.assign(n, {});
    inAggs_.assign(n, {});
    aggRules_.assign(prg_->aggregates().size(), {});
    ruleInQ_.assign(rules.size(), 0);
    atomInQ_.assign(n, 0);
    for (auto i : irange(rules)) {
        const auto& r = rules[i];
        for (auto a : r.head) {
            heads_[a].push_back(i);
            occurs_[a].push_back(i);
            choice_[a] = choice_[a] || r.type == HeadType::choice;
        }
        for (auto a : r.body.pos) { occurs_[a].push_back(i); }
        for (auto a : r.body.neg) { occurs_[a].push_back(i); }
        for (auto g : r.body.aggs) { aggRules_[g].push_back(i); }
    }
    for (auto g : irange(prg_->aggregates())) {
        for (auto a : prg_->aggregates()[g].atoms()) { inAggs_[a].push_back(g); }
    }
    for (auto& occ : occurs_) { occ.erase(std::unique(occ.begin(), occ.end()), occ.end()); }
    for (auto& rs : aggRules_) { rs.erase(std::unique(rs.begin(), rs.end()), rs.end()); }

    // decision order: choice atoms first, then all others, each group in lexical order
    order_.clear();
    for (auto a : irange(n)) {
        if (not prg_->isFact(a)) {
            order_.push_back(a);
        }
    }
    const auto& atoms = prg_->atoms();
    std::stable_sort(order_.begin(), order_.end(), [&](Atom_t x, Atom_t y) {
        if (choice_[x] != choice_[y]) {
            return choice_[x] > choice_[y];
        }
        return atoms.less(x, y);
    });
    if (id_ > 0) {
        // alternate tie-break: rotate each group by a pseudo-random offset
        Rng  rng(id_);
        auto mid = std::find_if(order_.begin(), order_.end(), [&](Atom_t a) { return choice_[a] == 0; });
        for (auto [first, last] : {std::pair{order_.begin(), mid}, std::pair{mid, order_.end()}}) {
            if (auto size = static_cast<unsigned>(last - first); size > 1) {
                std::rotate(first, first + rng.irand(size), last);
            }
        }
    }
}

void Solver::reset() {
    undoUntil(0);
    levels_.clear();
    cursor_ = 0;
    stop_.store(false);
    model_  = Model();
    stats_  = SolverStats();
}

bool Solver::assign(Atom_t a, Val_t v) {
    if (vals_[a] == v) {
        return true;
    }
    if (vals_[a] != value_free) {
        return false;
    }
    vals_[a] = v;
    trail_.push_back(a);
    return true;
}

void Solver::enqueueRule(uint32_t r) {
    if (not ruleInQ_[r]) {
        ruleInQ_[r] = 1;
        ruleQ_.push_back(r);
    }
}
void Solver::enqueueAtom(Atom_t a) {
    if (not atomInQ_[a]) {
        atomInQ_[a] = 1;
        atomQ_.push_back(a);
    }
}

void Solver::undoUntil(uint32_t trailPos) {
    while (size32(trail_) > trailPos) {
        vals_[trail_.back()] = value_free;
        trail_.pop_back();
    }
    front_ = std::min(front_, trailPos);
    for (auto r : ruleQ_) { ruleInQ_[r] = 0; }
    for (auto a : atomQ_) { atomInQ_[a] = 0; }
    ruleQ_.clear();
    atomQ_.clear();
}

Val_t Solver::aggValue(uint32_t agg) const {
    return evaluate(prg_->aggregates()[agg], [this](Atom_t a) { return vals_[a]; });
}

Val_t Solver::bodyValue(const GroundRule& r) const {
    bool free = false;
    for (auto p : r.body.pos) {
        if (vals_[p] == value_false) {
            return value_false;
        }
        free = free || vals_[p] == value_free;
    }
    for (auto n : r.body.neg) {
        if (vals_[n] == value_true) {
            return value_false;
        }
        free = free || vals_[n] == value_free;
    }
    for (auto g : r.body.aggs) {
        auto v = aggValue(g);
        if (v == value_false) {
            return value_false;
        }
        free = free || v == value_free;
    }
    return free ? value_free : value_true;
}

bool Solver::supports(uint32_t r, Atom_t a) const {
    const auto& rule = prg_->rules()[r];
    if (bodyValue(rule) == value_false) {
        return false;
    }
    if (rule.type == HeadType::disjunctive) {
        return std::none_of(rule.head.begin(), rule.head.end(),
                            [&](Atom_t h) { return h != a && vals_[h] == value_true; });
    }
    return true;
}

bool Solver::falsifyBody(const GroundRule& r) {
    Atom_t   cand    = atom_none;
    Val_t    cval    = value_free;
    uint32_t numFree = 0;
    for (auto p : r.body.pos) {
        if (vals_[p] == value_false) {
            return true;
        }
        if (vals_[p] == value_free) {
            ++numFree;
            cand = p;
            cval = value_false;
        }
    }
    for (auto n : r.body.neg) {
        if (vals_[n] == value_true) {
            return true;
        }
        if (vals_[n] == value_free) {
            ++numFree;
            cand = n;
            cval = value_true;
        }
    }
    for (auto g : r.body.aggs) {
        auto v = aggValue(g);
        if (v == value_false) {
            return true;
        }
        if (v == value_free) {
            ++numFree;
            cand = atom_none;
        }
    }
    if (numFree == 0) {
        return false;
    }
    if (numFree == 1 && cand != atom_none) {
        ++stats_.propagations;
        return assign(cand, cval);
    }
    return true;
}

bool Solver::makeBodyTrue(const GroundRule& r) {
    for (auto p : r.body.pos) {
        if (not assign(p, value_true)) {
            return false;
        }
    }
    for (auto n : r.body.neg) {
        if (not assign(n, value_false)) {
            return false;
        }
    }
    return std::none_of(r.body.aggs.begin(), r.body.aggs.end(),
                        [&](uint32_t g) { return aggValue(g) == value_false; });
}

bool Solver::checkRule(uint32_t ri) {
    const auto& r = prg_->rules()[ri];
    for (auto h : r.head) { enqueueAtom(h); }
    switch (r.type) {
        case HeadType::constraint: return falsifyBody(r);
        case HeadType::normal: {
            auto b = bodyValue(r);
            auto h = r.head[0];
            if (b == value_true) {
                ++stats_.propagations;
                return assign(h, value_true);
            }
            return vals_[h] != value_false || b == value_false || falsifyBody(r);
        }
        case HeadType::disjunctive: {
            auto b = bodyValue(r);
            if (b == value_false) {
                return true;
            }
            uint32_t open = 0;
            Atom_t   last = atom_none;
            for (auto h : r.head) {
                if (vals_[h] != value_false) {
                    ++open;
                    last = h;
                }
            }
            if (open == 0) {
                return falsifyBody(r);
            }
            if (b == value_true && open == 1) {
                ++stats_.propagations;
                return assign(last, value_true);
            }
            return true;
        }
        case HeadType::choice: {
            if (not r.hasBounds()) {
                return true;
            }
            auto b = bodyValue(r);
            if (b == value_false) {
                return true;
            }
            auto numTrue = static_cast<uint32_t>(
                std::count_if(r.head.begin(), r.head.end(), [&](Atom_t h) { return vals_[h] == value_true; }));
            auto numFree = static_cast<uint32_t>(
                std::count_if(r.head.begin(), r.head.end(), [&](Atom_t h) { return vals_[h] == value_free; }));
            if (numTrue > r.upper || numTrue + numFree < r.lower) {
                return falsifyBody(r);
            }
            if (b == value_true && numFree > 0 && (numTrue == r.upper || numTrue + numFree == r.lower)) {
                auto v = numTrue == r.upper ? value_false : value_true;
                for (auto h : r.head) {
                    if (vals_[h] == value_free) {
                        ++stats_.propagations;
                        assign(h, v);
                    }
                }
            }
            return true;
        }
    }
    POTASSCO_ASSERT_NOT_REACHED("invalid head type");
}

bool Solver::checkSupport(Atom_t a) {
    if (vals_[a] == value_false || prg_->isFact(a)) {
        return true;
    }
    uint32_t alive = 0;
    uint32_t last  = 0;
    for (auto r : heads_[a]) {
        if (supports(r, a)) {
            ++alive;
            last = r;
            if (alive > 1) {
                break;
            }
        }
    }
    if (alive == 0) {
        ++stats_.propagations;
        return assign(a, value_false);
    }
    if (alive == 1 && vals_[a] == value_true) {
        const auto& r = prg_->rules()[last];
        if (not makeBodyTrue(r)) {
            return false;
        }
        if (r.type == HeadType::disjunctive) {
            for (auto h : r.head) {
                if (h != a && not assign(h, value_false)) {
                    return false;
                }
            }
        }
    }
    return true;
}

bool Solver::propagate() {
    const auto& aggs = aggRules_;
    for (;;) {
        if (front_ < size32(trail_)) {
            auto a = trail_[front_++];
            for (auto r : occurs_[a]) { enqueueRule(r); }
            for (auto g : inAggs_[a]) {
                for (auto r : aggs[g]) { enqueueRule(r); }
            }
            enqueueAtom(a);
        }
        else if (not ruleQ_.empty()) {
            auto r = ruleQ_.back();
            ruleQ_.pop_back();
            ruleInQ_[r] = 0;
            if (not checkRule(r)) {
                return false;
            }
        }
        else if (not atomQ_.empty()) {
            auto a = atomQ_.back();
            atomQ_.pop_back();
            atomInQ_[a] = 0;
            if (not checkSupport(a)) {
                return false;
            }
        }
        else {
            return true;
        }
    }
}

bool Solver::decide() {
    while (cursor_ < size32(order_) && vals_[order_[cursor_]] != value_free) { ++cursor_; }
    if (cursor_ == size32(order_)) {
        return false;
    }
    levels_.push_back(Level{size32(trail_), cursor_, false});
    ++stats_.choices;
    stats_.maxLevel = std::max(stats_.maxLevel, decisionLevel());
    assign(order_[cursor_], opts_.signFirst ? value_true : value_false);
    return true;
}

bool Solver::backtrack() {
    while (not levels_.empty()) {
        auto& l = levels_.back();
        auto  d = trail_[l.trailPos];
        auto  v = vals_[d];
        undoUntil(l.trailPos);
        cursor_ = l.cursor;
        if (not l.flipped) {
            l.flipped = true;
            assign(d, v == value_true ? value_false : value_true);
            return true;
        }
        levels_.pop_back();
    }
    return false;
}

Solver::Stop Solver::checkStop(const Timer<RealTime>& t) const {
    if (stop_.load(std::memory_order_relaxed) || (extStop_ && extStop_->load(std::memory_order_relaxed))) {
        return Stop::interrupt;
    }
    const auto& lim = opts_.limits;
    if (steps() >= lim.steps || (lim.time >= 0.0 && t.current() >= lim.time)) {
        return Stop::limit;
    }
    return Stop::none;
}

SolveResult Solver::solve(ModelHandler* h) {
    reset();
    auto*            eh = dynamic_cast<EventHandler*>(h);
    Timer<RealTime>  timer;
    timer.start();
    log(eh, Event::subsystem_solve, Event::verbosity_high, this, "solver %u: search over %u atoms and %u rules", id_,
        prg_->numAtoms(), size32(prg_->rules()));
    for (auto a : prg_->facts()) { assign(a, value_true); }
    for (auto r : irange(prg_->rules())) { enqueueRule(r); }
    for (auto a : irange(prg_->numAtoms())) { enqueueAtom(a); }

    uint64_t found     = 0;
    bool     exhausted = false;
    Stop     stop      = Stop::none;
    bool     ok        = propagate();
    for (;;) {
        if (not ok) {
            ++stats_.conflicts;
            if (not backtrack()) {
                exhausted = true;
                break;
            }
            ok = propagate();
        }
        else if (decide()) {
            ok = propagate();
        }
        else if (checker_.isStable(vals_)) {
            ++stats_.models;
            model_.prg = prg_;
            model_.num = ++found;
            model_.sId = id_;
            model_.atoms.clear();
            for (auto a : irange(prg_->numAtoms())) {
                if (vals_[a] == value_true) {
                    model_.atoms.push_back(a);
                }
            }
            log(eh, Event::subsystem_solve, Event::verbosity_max, this, "solver %u: model %llu", id_,
                static_cast<unsigned long long>(found));
            if ((h && not h->onModel(*this, model_)) || (opts_.numModels != 0 && found >= opts_.numModels)) {
                break;
            }
            ok = false;
        }
        else {
            ++stats_.rejected;
            ok = false;
        }
        if ((stop = checkStop(timer)) != Stop::none) {
            break;
        }
    }
    SolveResult res;
    if (found) {
        res.flags |= SolveResult::res_sat;
    }
    else if (exhausted) {
        res.flags |= SolveResult::res_unsat;
    }
    if (exhausted) {
        res.flags |= SolveResult::ext_exhaust;
    }
    if (stop == Stop::interrupt) {
        res.flags |= SolveResult::ext_interrupt;
    }
    log(eh, Event::subsystem_solve, Event::verbosity_high, this, "solver %u: %s after %llu choices and %llu conflicts",
        id_, toString(res), static_cast<unsigned long long>(stats_.choices),
        static_cast<unsigned long long>(stats_.conflicts));
    return res;
}

} // namespace Aspect
