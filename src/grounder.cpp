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
#include <aspect/grounder.h>

#include <aspect/errors.h>

#include <potassco/error.h>

#include <unordered_set>

namespace Aspect {
namespace {
// Semi-naive join policy: positive literal i uses old atoms if i < delta, new atoms if i == delta, and all atoms otherwise.
struct DeltaPolicy {
    [[nodiscard]] std::pair<Atom_t, Atom_t> range(uint32_t i) const {
        if (i < delta) {
            return {0, prevEnd};
        }
        return {i == delta ? prevEnd : 0, curEnd};
    }
    [[nodiscard]] static bool accept(Atom_t) { return true; }
    [[nodiscard]] static bool holdsNot(Atom_t) { return true; }
    uint32_t                  delta;
    Atom_t                    prevEnd;
    Atom_t                    curEnd;
};
// Join policy over the final universe: negative literals fail on facts only.
struct UniversePolicy {
    [[nodiscard]] std::pair<Atom_t, Atom_t> range(uint32_t) const { return {0, size32(*facts)}; }
    [[nodiscard]] static bool               accept(Atom_t) { return true; }
    [[nodiscard]] bool holdsNot(Atom_t a) const { return a == atom_none || not(*facts)[a]; }
    const std::vector<bool>* facts;
};

void bindPlain(const Atom& a, std::unordered_set<std::string>& bound) {
    for (const auto& t : a.args()) {
        if (t.isVariable()) {
            bound.insert(t.name());
        }
    }
}
const std::string* firstUnbound(const std::vector<std::string>& vars, const std::unordered_set<std::string>& bound) {
    for (const auto& v : vars) {
        if (not bound.contains(v)) {
            return &v;
        }
    }
    return nullptr;
}
// Returns the first variable of (extra, cond) that is neither in bound nor bound by a positive atom of cond.
std::string unsafeIn(const CondVec& cond, std::vector<std::string> extra, std::unordered_set<std::string> bound) {
    for (const auto& lit : cond) {
        if (lit.positive()) {
            bindPlain(lit.atom(), bound);
        }
        lit.collectVars(extra);
    }
    const auto* v = firstUnbound(extra, bound);
    return v ? *v : std::string();
}
std::vector<const CondLiteral*> pointers(const CondVec& cond) {
    std::vector<const CondLiteral*> out;
    for (const auto& c : cond) { out.push_back(&c); }
    return out;
}
} // namespace

/////////////////////////////////////////////////////////////////////////////////////////
// Grounder::RuleData
/////////////////////////////////////////////////////////////////////////////////////////
struct Grounder::RuleData {
    //! A conjunctive condition with element-local variables.
    struct Condition {
        Condition(const AtomTable& atoms, const CondVec& cond, const VarTable& globals) : vars(globals) {
            auto lits = pointers(cond);
            plan      = JoinPlan(atoms, lits, vars);
            for (const auto& c : cond) {
                if (c.isAtom()) {
                    (c.positive() ? pos : neg).emplace_back(atoms, c.atom(), vars);
                }
            }
        }
        VarTable               vars;
        JoinPlan               plan;
        std::vector<BoundAtom> pos;
        std::vector<BoundAtom> neg;
    };
    struct ChoiceElem {
        Condition cond;
        BoundAtom atom;
    };
    struct AggElem {
        Condition              cond;
        std::vector<BoundTerm> tuple;
    };
    struct Agg {
        const Literal*       lit;
        BoundTerm            bound;
        std::vector<AggElem> elems;
    };

    RuleData(const AtomTable& atoms, const Rule& r, uint32_t idx) : index(idx), rule(&r) {
        std::vector<const CondLiteral*> lits;
        for (const auto& l : r.body()) {
            if (not l.isAggregate() && not l.cond().negative()) {
                lits.push_back(&l.cond());
            }
        }
        body       = JoinPlan(atoms, lits, vars);
        numGlobals = vars.size();
        if (not body.unsafe().empty()) {
            throw UnsafeVariable(index, r.toString(), body.unsafe());
        }
        for (const auto& l : r.body()) {
            if (l.isAggregate()) {
                Agg a{&l, BoundTerm::compile(l.bound(), vars), {}};
                for (const auto& e : l.elements()) {
                    AggElem elem{Condition(atoms, e.condition, vars), {}};
                    for (const auto& t : e.tuple) { elem.tuple.push_back(BoundTerm::compile(t, elem.cond.vars)); }
                    a.elems.push_back(std::move(elem));
                }
                aggs.push_back(std::move(a));
            }
            else if (l.cond().isAtom()) {
                (l.cond().positive() ? positive : negative).emplace_back(atoms, l.cond().atom(), vars);
            }
        }
        for (const auto& e : r.head().elements()) {
            if (r.head().type() == HeadType::choice) {
                ChoiceElem ce{Condition(atoms, e.condition, vars), {}};
                ce.atom = BoundAtom(atoms, e.atom, ce.cond.vars);
                choice.push_back(std::move(ce));
            }
            else {
                head.emplace_back(atoms, e.atom, vars);
            }
        }
        POTASSCO_ASSERT(vars.size() == numGlobals, "unsafe rule not detected");
    }
    [[nodiscard]] HeadType type() const { return rule->head().type(); }
    //! Stores the instance given by the global variables of b unless it is already known.
    bool addInstance(const Binding& b) {
        auto vals = b.values(numGlobals);
        if (not seen.insert(vals).second) {
            return false;
        }
        instances.push_back(std::move(vals));
        return true;
    }
    [[nodiscard]] Binding binding(const SymVec& inst, const VarTable& vt) const {
        Binding b(vt.size());
        b.assign(inst);
        return b;
    }

    uint32_t                               index;
    const Rule*                            rule;
    VarTable                               vars;
    uint32_t                               numGlobals{0};
    JoinPlan                               body;     // positive atoms and comparisons
    std::vector<BoundAtom>                 positive; // positive body atoms
    std::vector<BoundAtom>                 negative; // negative body atoms
    std::vector<Agg>                       aggs;
    std::vector<BoundAtom>                 head;   // normal and disjunctive heads
    std::vector<ChoiceElem>                choice; // choice heads
    std::vector<SymVec>                    instances;
    std::unordered_set<SymVec, SymVecHash> seen;
};

/////////////////////////////////////////////////////////////////////////////////////////
// Grounder::Context
/////////////////////////////////////////////////////////////////////////////////////////
struct Grounder::Context {
    Context(const GrounderOptions& o, EventHandler* h) : opts(o), handler(h) {}

    void registerAtom(const Atom& a) { atoms.addPredicate(a.name(), a.arity()); }
    void registerCond(const CondVec& cond) {
        for (const auto& c : cond) {
            if (c.isAtom()) {
                registerAtom(c.atom());
            }
        }
    }
    void registerRule(const Rule& r) {
        for (const auto& e : r.head().elements()) {
            registerAtom(e.atom);
            registerCond(e.condition);
        }
        for (const auto& l : r.body()) {
            if (not l.isAggregate()) {
                registerCond({l.cond()});
                continue;
            }
            for (const auto& e : l.elements()) { registerCond(e.condition); }
        }
    }

    void addAtom(Pred_t p, SymVec args, const RuleData& r) {
        if (atoms.add(p, std::move(args)).second && atoms.size() > opts.atomLimit) {
            throw GroundingLimit(opts.atomLimit, r.rule->toString());
        }
    }
    void deriveHead(const RuleData& r, const SymVec& inst) {
        std::vector<std::pair<Pred_t, SymVec>> out;
        if (r.type() == HeadType::choice) {
            for (const auto& e : r.choice) {
                auto b = r.binding(inst, e.cond.vars);
                join(atoms, e.cond.plan, b, DeltaPolicy{0, 0, atoms.size()}, [&]() {
                    SymVec args;
                    if (e.atom.ground(b, args)) {
                        out.emplace_back(e.atom.pred(), std::move(args));
                    }
                });
            }
        }
        else {
            auto b = r.binding(inst, r.vars);
            for (const auto& h : r.head) {
                if (SymVec args; h.ground(b, args)) {
                    out.emplace_back(h.pred(), std::move(args));
                }
            }
        }
        for (auto& [p, args] : out) { addAtom(p, std::move(args), r); }
    }
    void instantiate();
    void computeFacts(const Program& prg);
    void emit();
    bool emitAggregate(const RuleData::Agg& a, const SymVec& inst, GroundBody& body);
    bool addAggregate(GroundAggregate g, GroundBody& body);
    bool emitChoice(const RuleData& r, const SymVec& inst, GroundRule& gr);

    const GrounderOptions& opts;
    EventHandler*          handler;
    AtomTable              atoms;
    std::vector<RuleData>  rules;
    std::vector<bool>      isFact;
    GroundStats            stats;
    // output
    std::vector<GroundRule>      outRules;
    std::vector<GroundAggregate> outAggs;
    bool                         disjunctive{false};
};

void Grounder::Context::instantiate() {
    Atom_t prevEnd = 0;
    for (uint32_t iter = 0;; ++iter) {
        Atom_t curEnd = atoms.size();
        if (iter > 0 && curEnd == prevEnd) {
            break;
        }
        ++stats.iterations;
        for (auto& r : rules) {
            auto first = size32(r.instances);
            auto b     = Binding(r.vars.size());
            auto onNew = [&]() { stats.instances += r.addInstance(b); };
            if (r.body.numPositive() == 0) {
                if (iter == 0) {
                    join(atoms, r.body, b, DeltaPolicy{0, 0, curEnd}, onNew);
                }
            }
            else {
                for (auto j : irange(r.body.numPositive())) {
                    join(atoms, r.body, b, DeltaPolicy{j, prevEnd, curEnd}, onNew);
                }
            }
            // conditions of choice elements may match atoms derived after the instance was found
            auto start = r.type() == HeadType::choice && iter > 0 ? 0u : first;
            for (auto k : irange(start, size32(r.instances))) { deriveHead(r, r.instances[k]); }
        }
        log(handler, Event::subsystem_ground, Event::verbosity_max, nullptr, "iteration %u: %u atoms, %u instances",
            iter, atoms.size(), stats.instances);
        prevEnd = curEnd;
    }
}

void Grounder::Context::computeFacts(const Program& prg) {
    isFact.assign(atoms.size(), false);
    AtomVec queue;
    auto    setFact = [&](Atom_t a) {
        if (not isFact[a]) {
            isFact[a] = true;
            queue.push_back(a);
        }
    };
    for (const auto& f : prg.facts()) { setFact(atoms.find(f.name, f.args)); }
    // Definite instances: normal head, no aggregates, all negative atoms outside of the universe.
    struct Definite {
        Atom_t   head;
        uint32_t missing;
    };
    std::vector<Definite>              defs;
    std::vector<std::vector<uint32_t>> watches(atoms.size());
    for (const auto& r : rules) {
        bool single = r.type() == HeadType::normal || (r.type() == HeadType::disjunctive && r.head.size() == 1);
        if (not single || not r.aggs.empty()) {
            continue;
        }
        for (const auto& inst : r.instances) {
            auto b = r.binding(inst, r.vars);
            auto h = r.head[0].find(atoms, b);
            if (h == atom_none || std::any_of(r.negative.begin(), r.negative.end(),
                                              [&](const BoundAtom& n) { return n.find(atoms, b) != atom_none; })) {
                continue;
            }
            auto id = size32(defs);
            defs.push_back({h, size32(r.positive)});
            for (const auto& p : r.positive) { watches[p.find(atoms, b)].push_back(id); }
            if (r.positive.empty()) {
                setFact(h);
            }
        }
    }
    while (not queue.empty()) {
        auto a = queue.back();
        queue.pop_back();
        for (auto d : watches[a]) {
            if (--defs[d].missing == 0) {
                setFact(defs[d].head);
            }
        }
    }
}

bool Grounder::Context::emitAggregate(const RuleData::Agg& a, const SymVec& inst, GroundBody& body) {
    const auto& lit = *a.lit;
    Symbol      bound;
    auto        b = Binding(size32(inst));
    b.assign(inst);
    if (not a.bound.eval(b, bound)) {
        return false;
    }
    if (not bound.isNumber()) {
        throw TypeMismatch(toString(lit.op()), std::string(toString(lit.fun())), toString(bound));
    }
    GroundAggregate g;
    g.fun   = lit.fun();
    g.op    = lit.op();
    g.bound = bound.num();
    for (const auto& e : a.elems) {
        auto eb = Binding(e.cond.vars.size());
        eb.assign(inst);
        join(atoms, e.cond.plan, eb, UniversePolicy{&isFact}, [&]() {
            GroundElement ge;
            for (const auto& t : e.tuple) {
                if (Symbol v; t.eval(eb, v)) {
                    ge.tuple.push_back(std::move(v));
                }
                else {
                    return;
                }
            }
            if (g.fun != AggFun::count) {
                if (ge.tuple.empty() || not ge.tuple[0].isNumber()) {
                    throw TypeMismatch(toString(g.fun), ge.tuple.empty() ? "()" : toString(ge.tuple[0]), "number");
                }
                ge.weight = ge.tuple[0].num();
            }
            for (const auto& p : e.cond.pos) {
                if (auto id = p.find(atoms, eb); not isFact[id]) {
                    ge.pos.push_back(id);
                }
            }
            for (const auto& n : e.cond.neg) {
                if (auto id = n.find(atoms, eb); id != atom_none) {
                    ge.neg.push_back(id);
                }
            }
            g.elems.push_back(std::move(ge));
        });
    }
    return addAggregate(std::move(g), body);
}

// Adds g to body unless its value is already fixed by the facts. Returns false if g cannot hold.
bool Grounder::Context::addAggregate(GroundAggregate g, GroundBody& body) {
    std::stable_sort(g.elems.begin(), g.elems.end(),
                     [](const GroundElement& x, const GroundElement& y) { return x.tuple < y.tuple; });
    switch (evaluate(g, [&](Atom_t x) { return isFact[x] ? value_true : value_free; })) {
        case value_true : return true;
        case value_false: return false;
        default         : break;
    }
    body.aggs.push_back(size32(outAggs));
    outAggs.push_back(std::move(g));
    return true;
}

// Elements with a certain condition stay in the head of gr. Every other element becomes a rule
// "{a} :- body, condition". If a bounded head has such elements, its bounds become constraints
// over the number of true elements. Returns false if gr itself is not needed.
bool Grounder::Context::emitChoice(const RuleData& r, const SymVec& inst, GroundRule& gr) {
    struct Elem {
        Atom_t  atom;
        AtomVec pos;
        AtomVec neg;
    };
    std::vector<Elem> elems;
    for (const auto& e : r.choice) {
        auto eb = r.binding(inst, e.cond.vars);
        join(atoms, e.cond.plan, eb, UniversePolicy{&isFact}, [&]() {
            Elem x{e.atom.find(atoms, eb), {}, {}};
            if (x.atom == atom_none) {
                return;
            }
            for (const auto& p : e.cond.pos) {
                if (auto id = p.find(atoms, eb); not isFact[id]) {
                    x.pos.push_back(id);
                }
            }
            for (const auto& n : e.cond.neg) {
                if (auto id = n.find(atoms, eb); id != atom_none) {
                    x.neg.push_back(id);
                }
            }
            elems.push_back(std::move(x));
        });
    }
    AtomVec all;
    bool    conditional = false;
    for (const auto& x : elems) {
        all.push_back(x.atom);
        if (x.pos.empty() && x.neg.empty()) {
            gr.head.push_back(x.atom);
        }
        else {
            conditional = true;
        }
    }
    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());
    std::sort(gr.head.begin(), gr.head.end());
    gr.head.erase(std::unique(gr.head.begin(), gr.head.end()), gr.head.end());
    const bool simp = opts.simplify;
    if (conditional) {
        for (const auto& x : elems) {
            if (x.pos.empty() && x.neg.empty()) {
                continue;
            }
            GroundRule cr;
            cr.type   = HeadType::choice;
            cr.origin = gr.origin;
            cr.head   = {x.atom};
            cr.body   = gr.body;
            cr.body.pos.insert(cr.body.pos.end(), x.pos.begin(), x.pos.end());
            cr.body.neg.insert(cr.body.neg.end(), x.neg.begin(), x.neg.end());
            if (not simp || not isFact[x.atom]) {
                outRules.push_back(std::move(cr));
            }
        }
        if (gr.lower > 0 || gr.upper < size32(all)) {
            GroundAggregate agg;
            agg.fun = AggFun::count;
            for (const auto& x : elems) {
                GroundElement ge;
                ge.tuple = {Symbol::number(static_cast<int32_t>(x.atom))};
                ge.pos   = x.pos;
                ge.neg   = x.neg;
                if (not isFact[x.atom]) {
                    ge.pos.push_back(x.atom);
                }
                agg.elems.push_back(std::move(ge));
            }
            auto bound = [&](CmpOp op, uint32_t b) {
                GroundRule c;
                c.origin  = gr.origin;
                c.body    = gr.body;
                agg.op    = op;
                agg.bound = b;
                if (addAggregate(agg, c.body)) {
                    outRules.push_back(std::move(c));
                }
            };
            if (gr.lower > 0) {
                bound(CmpOp::lt, gr.lower);
            }
            if (gr.upper < size32(all)) {
                bound(CmpOp::gt, gr.upper);
            }
        }
        gr.lower = 0;
        gr.upper = bound_max;
    }
    if (simp && not gr.hasBounds()) {
        std::erase_if(gr.head, [&](Atom_t a) { return isFact[a]; });
        return not gr.head.empty();
    }
    return true;
}

void Grounder::Context::emit() {
    const bool simp = opts.simplify;
    for (const auto& r : rules) {
        const auto& head = r.rule->head();
        for (const auto& inst : r.instances) {
            auto       b = r.binding(inst, r.vars);
            GroundRule gr;
            gr.type   = head.type();
            gr.origin = r.index;
            gr.lower  = head.lower();
            gr.upper  = head.upper();
            bool keep = true;
            for (const auto& p : r.positive) {
                auto id = p.find(atoms, b);
                POTASSCO_ASSERT(id != atom_none, "positive body atom not in universe");
                if (not simp || not isFact[id]) {
                    gr.body.pos.push_back(id);
                }
            }
            for (const auto& n : r.negative) {
                if (auto id = n.find(atoms, b); id != atom_none) {
                    keep = keep && not isFact[id];
                    gr.body.neg.push_back(id);
                }
            }
            for (auto it = r.aggs.begin(); keep && it != r.aggs.end(); ++it) {
                keep = emitAggregate(*it, inst, gr.body);
            }
            if (not keep) {
                continue;
            }
            switch (gr.type) {
                case HeadType::constraint: break;
                case HeadType::normal:
                case HeadType::disjunctive:
                    for (const auto& h : r.head) {
                        auto id = h.find(atoms, b);
                        keep    = keep && id != atom_none && not(simp && isFact[id]);
                        gr.head.push_back(id);
                    }
                    break;
                case HeadType::choice: keep = emitChoice(r, inst, gr); break;
            }
            if (not keep) {
                continue;
            }
            std::sort(gr.head.begin(), gr.head.end());
            gr.head.erase(std::unique(gr.head.begin(), gr.head.end()), gr.head.end());
            disjunctive = disjunctive || (gr.type == HeadType::disjunctive && gr.head.size() > 1);
            outRules.push_back(std::move(gr));
        }
    }
}

/////////////////////////////////////////////////////////////////////////////////////////
// Grounder
/////////////////////////////////////////////////////////////////////////////////////////
Grounder::Grounder(const GrounderOptions& opts) : opts_(opts) {}

void Grounder::checkSafety(const Program& prg) {
    for (auto i : irange(prg.numRules())) {
        const auto&                     r = prg.rule(i);
        std::unordered_set<std::string> bound;
        std::vector<std::string>        vars;
        for (const auto& l : r.body()) {
            if (l.isAggregate()) {
                l.bound().collectVars(vars);
                continue;
            }
            if (l.cond().positive()) {
                bindPlain(l.cond().atom(), bound);
            }
            l.cond().collectVars(vars);
        }
        if (r.head().type() != HeadType::choice) {
            for (const auto& e : r.head().elements()) { e.atom.collectVars(vars); }
        }
        if (const auto* v = firstUnbound(vars, bound)) {
            throw UnsafeVariable(i, r.toString(), *v);
        }
        auto check = [&](const CondVec& cond, std::vector<std::string> extra) {
            if (auto v = unsafeIn(cond, std::move(extra), bound); not v.empty()) {
                throw UnsafeVariable(i, r.toString(), v);
            }
        };
        for (const auto& l : r.body()) {
            if (not l.isAggregate()) {
                continue;
            }
            for (const auto& e : l.elements()) {
                std::vector<std::string> extra;
                for (const auto& t : e.tuple) { t.collectVars(extra); }
                check(e.condition, std::move(extra));
            }
        }
        if (r.head().type() == HeadType::choice) {
            for (const auto& e : r.head().elements()) {
                std::vector<std::string> extra;
                e.atom.collectVars(extra);
                check(e.condition, std::move(extra));
            }
        }
    }
}

GroundProgram Grounder::ground(const Program& prg, EventHandler* h) {
    checkSafety(prg);
    Context ctx(opts_, h);
    for (const auto& f : prg.facts()) {
        auto p = ctx.atoms.addPredicate(f.name, size32(f.args));
        ctx.atoms.add(p, f.args);
    }
    for (const auto& r : prg.rules()) { ctx.registerRule(r); }
    ctx.rules.reserve(prg.numRules());
    for (auto i : irange(prg.numRules())) { ctx.rules.emplace_back(ctx.atoms, prg.rule(i), i); }

    ctx.instantiate();
    ctx.computeFacts(prg);

    ctx.emit();
    GroundProgram out;
    out.rules_       = std::move(ctx.outRules);
    out.aggs_        = std::move(ctx.outAggs);
    out.disjunctive_ = ctx.disjunctive;
    for (auto a : irange(ctx.atoms.size())) {
        if (ctx.isFact[a]) {
            out.facts_.push_back(a);
        }
    }
    ctx.stats.rules      = size32(out.rules_);
    ctx.stats.atoms      = ctx.atoms.size();
    ctx.stats.facts      = size32(out.facts_);
    ctx.stats.aggregates = size32(out.aggs_);
    out.stats_           = ctx.stats;
    out.isFact_          = std::move(ctx.isFact);
    out.atoms_           = std::move(ctx.atoms);
    log(h, Event::subsystem_ground, Event::verbosity_low, nullptr,
        "grounded %u rules over %u atoms (%u facts) in %u iterations", out.stats_.rules, out.stats_.atoms,
        out.stats_.facts, out.stats_.iterations);
    return out;
}

} // namespace Aspect
