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
#include "test_programs.h"

#include <aspect/grounder.h>
#include <aspect/solver.h>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>

namespace Aspect::Test {
using AtomSet = std::vector<bool>;

//! Returns whether aggregate a holds if positive conditions are read from n and negated ones from m.
static bool aggHolds(const GroundAggregate& a, const AtomSet& n, const AtomSet& m) {
    std::map<SymVec, int64_t> tuples;
    for (const auto& e : a.elems) {
        if (std::all_of(e.pos.begin(), e.pos.end(), [&](Atom_t x) { return n[x]; }) &&
            std::none_of(e.neg.begin(), e.neg.end(), [&](Atom_t x) { return m[x]; })) {
            tuples.emplace(e.tuple, e.weight);
        }
    }
    int64_t v = a.fun == AggFun::min ? agg_sup : (a.fun == AggFun::max ? agg_inf : 0);
    for (const auto& [t, w] : tuples) {
        switch (a.fun) {
            case AggFun::count: ++v; break;
            case AggFun::sum  : v += w; break;
            case AggFun::min  : v = std::min(v, w); break;
            case AggFun::max  : v = std::max(v, w); break;
        }
    }
    switch (a.op) {
        case CmpOp::eq : return v == a.bound;
        case CmpOp::neq: return v != a.bound;
        case CmpOp::lt : return v < a.bound;
        case CmpOp::leq: return v <= a.bound;
        case CmpOp::gt : return v > a.bound;
        case CmpOp::geq: return v >= a.bound;
    }
    return false;
}

static bool bodyHolds(const GroundProgram& g, const GroundRule& r, const AtomSet& m) {
    return std::all_of(r.body.pos.begin(), r.body.pos.end(), [&](Atom_t x) { return m[x]; }) &&
           std::none_of(r.body.neg.begin(), r.body.neg.end(), [&](Atom_t x) { return m[x]; }) &&
           std::all_of(r.body.aggs.begin(), r.body.aggs.end(),
                       [&](uint32_t i) { return aggHolds(g.aggregates()[i], m, m); });
}

static bool isModel(const GroundProgram& g, const AtomSet& m) {
    for (const auto& r : g.rules()) {
        if (not bodyHolds(g, r, m)) {
            continue;
        }
        auto n = static_cast<uint32_t>(std::count_if(r.head.begin(), r.head.end(), [&](Atom_t x) { return m[x]; }));
        if (r.type == HeadType::constraint || (r.type != HeadType::choice && n == 0) ||
            (r.type == HeadType::choice && (n < r.lower || n > r.upper))) {
            return false;
        }
    }
    return true;
}

//! Returns whether n is a model of the reduct of g w.r.t. m.
/*!
 * The reduct keeps the rules whose body holds in m. In a kept rule, positive
 * atoms and monotone aggregates must hold in n. A choice rule derives each of
 * its head atoms contained in m.
 */
static bool isReductModel(const GroundProgram& g, const AtomSet& n, const AtomSet& m) {
    for (const auto& r : g.rules()) {
        if (r.type == HeadType::constraint || not bodyHolds(g, r, m) ||
            not std::all_of(r.body.pos.begin(), r.body.pos.end(), [&](Atom_t x) { return n[x]; }) ||
            not std::all_of(r.body.aggs.begin(), r.body.aggs.end(), [&](uint32_t i) {
                const auto& a = g.aggregates()[i];
                return not a.monotone() || aggHolds(a, n, m);
            })) {
            continue;
        }
        if (r.type == HeadType::choice) {
            if (std::any_of(r.head.begin(), r.head.end(), [&](Atom_t x) { return m[x] && not n[x]; })) {
                return false;
            }
        }
        else if (std::none_of(r.head.begin(), r.head.end(), [&](Atom_t x) { return n[x]; })) {
            return false;
        }
    }
    return true;
}

//! Enumerates all answer sets of g by checking every candidate set of non-fact atoms.
/*!
 * A candidate m is an answer set if it is a model of g and no proper subset of
 * m containing the facts is a model of the reduct of g w.r.t. m.
 */
static std::vector<std::string> bruteForce(const GroundProgram& g) {
    AtomVec open;
    for (auto a : irange(g.numAtoms())) {
        if (not g.isFact(a)) {
            open.push_back(a);
        }
    }
    REQUIRE(open.size() <= 14);
    std::vector<std::string> res;
    auto                     toSet = [&](uint32_t mask) {
        AtomSet s(g.numAtoms(), true);
        for (auto i : irange(open)) { s[open[i]] = Potassco::test_bit(mask, i); }
        return s;
    };
    for (uint32_t mask = 0; mask != (1u << open.size()); ++mask) {
        auto m = toSet(mask);
        if (not isModel(g, m)) {
            continue;
        }
        bool minimal = true;
        // proper submasks of mask
        for (uint32_t sub = (mask - 1) & mask; minimal && sub != mask; sub = (sub - 1) & mask) {
            minimal = not isReductModel(g, toSet(sub), m);
            if (sub == 0) {
                break;
            }
        }
        if (minimal) {
            Model model;
            model.prg = &g;
            for (auto a : irange(g.numAtoms())) {
                if (m[a]) {
                    model.atoms.push_back(a);
                }
            }
            res.push_back(model.toString());
        }
    }
    std::sort(res.begin(), res.end());
    return res;
}

static std::vector<std::string> enumerate(const GroundProgram& g, uint32_t id = 0) {
    SolveOptions opts;
    opts.numModels = 0;
    Solver    s(g, opts, id);
    ModelList models;
    auto      res = s.solve(&models);
    REQUIRE(res.exhausted());
    REQUIRE(res.sat() == not models.models.empty());
    REQUIRE(res.unsat() == models.models.empty());
    return models.sorted();
}

static std::string firstModel(const GroundProgram& g, bool signFirst = true) {
    SolveOptions opts;
    opts.signFirst = signFirst;
    Solver s(g, opts);
    REQUIRE(s.solve().sat());
    return s.model().toString();
}

TEST_CASE("Solver finds all answer sets", "[solver]") {
    Program     prg;
    RuleBuilder rb;
    auto        X = var("X"), Y = var("Y");
    auto        check = [&](const std::vector<std::string>& expected) {
        auto g = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all == expected);
        // solvers with a different tie-break find the same answer sets
        REQUIRE(enumerate(g, 1) == all);
        REQUIRE(enumerate(g, 3) == all);
    };
    SECTION("even negative cycle") {
        prg.addRule(rb.start().addHead(atom("a")).addGoal(neg(atom("b"))));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(neg(atom("a"))));
        check({"a", "b"});
    }
    SECTION("odd negative cycle") {
        prg.addRule(rb.start().addHead(atom("a")).addGoal(neg(atom("b"))));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(neg(atom("a"))));
        prg.addRule(rb.start().addHead(atom("c")).addGoal(atom("a")).addGoal(neg(atom("c"))));
        check({"b"});
    }
    SECTION("positive loop") {
        prg.addRule(rb.start(HeadType::choice).addHead(atom("c")));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(atom("b")));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(atom("a")));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(atom("c")));
        check({"", "a b c"});
    }
    SECTION("graph coloring") {
        prg = coloringProgram(3, {{1, 2}, {2, 3}}, 2);
        auto g = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all.size() == 2);
    }
    SECTION("choice bounds") {
        prg.addRange("d", 1, 3);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}).setBounds(2, 2));
        auto g   = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all.size() == 3);
    }
    SECTION("count aggregate") {
        prg.addRange("d", 1, 4);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        prg.addConstraint({count({elem({X}, {atom("p", X)})}, CmpOp::neq, num(2))});
        auto g   = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all.size() == 6);
    }
    SECTION("sum aggregate") {
        prg.addRange("d", 1, 3);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        prg.addConstraint({sum({elem({X}, {atom("p", X)})}, CmpOp::neq, num(3))});
        check({"d(1) d(2) d(3) p(1) p(2)", "d(1) d(2) d(3) p(3)"});
    }
    SECTION("min and max aggregates") {
        prg.addRange("d", 1, 3);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        prg.addRule(rb.start().addHead(atom("low")).addGoal(min({elem({X}, {atom("p", X)})}, CmpOp::leq, num(1))));
        prg.addRule(rb.start().addHead(atom("high")).addGoal(max({elem({X}, {atom("p", X)})}, CmpOp::geq, num(3))));
        prg.addConstraint({atom("low"), atom("high")});
        auto g   = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all.size() == 6);
    }
    SECTION("recursive aggregate") {
        // reach(Y) :- #count{X : reach(X), edge(X,Y)} >= 1, node(Y).
        prg.addRange("node", 1, 3);
        prg.addFact("start", {sym(1)});
        prg.addRule(rb.start(HeadType::choice)
                        .addHead(atom("edge", X, Y), {atom("node", Y), lt(X, Y)})
                        .addGoal(atom("node", X)));
        prg.addRule(rb.start().addHead(atom("reach", X)).addGoal(atom("start", X)));
        prg.addRule(rb.start()
                        .addHead(atom("reach", Y))
                        .addGoal(atom("node", Y))
                        .addGoal(count({elem({X}, {atom("reach", X), atom("edge", X, Y)})}, CmpOp::geq, num(1))));
        auto g   = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE(all.size() == 8);
    }
    SECTION("disjunction") {
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")).addHead(atom("c")));
        prg.addConstraint({atom("a")});
        check({"b", "c"});
    }
    SECTION("disjunction with saturation") {
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(atom("b")));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(atom("a")));
        check({"a b"});
    }
    SECTION("disjunction with aggregate") {
        // a v b. c :- #count{1 : a} >= 1. a :- c. b :- c.
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")));
        prg.addRule(rb.start().addHead(atom("c")).addGoal(count({elem({num(1)}, {atom("a")})}, CmpOp::geq, num(1))));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(atom("c")));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(atom("c")));
        check({"b"});
    }
    SECTION("disjunction with sum aggregate") {
        // a v b. c :- #sum{2 : a; 1 : b} >= 1. a :- c.
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")));
        prg.addRule(rb.start().addHead(atom("c")).addGoal(
            sum({elem({num(2)}, {atom("a")}), elem({num(1)}, {atom("b")})}, CmpOp::geq, num(1))));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(atom("c")));
        check({"a c"});
    }
    SECTION("choice condition over choice atom") {
        // {q(1)}. {p(X) : q(X)}. :- not p(1).
        prg.addRule(rb.start(HeadType::choice).addHead(atom("q", 1)));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("q", X)}));
        prg.addConstraint({neg(atom("p", 1))});
        check({"p(1) q(1)"});
    }
    SECTION("choice condition with negated derived atom") {
        // d(1). b(1) :- not c. c :- not b(1). {a(X) : d(X), not b(X)}. :- not a(1).
        prg.addFact("d", {sym(1)});
        prg.addRule(rb.start().addHead(atom("b", 1)).addGoal(neg(atom("c"))));
        prg.addRule(rb.start().addHead(atom("c")).addGoal(neg(atom("b", 1))));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("a", X), {atom("d", X), neg(atom("b", X))}));
        prg.addConstraint({neg(atom("a", 1))});
        check({"a(1) c d(1)"});
    }
    SECTION("bounded choice with conditions") {
        // {q(1); q(2)}. 1 {p(X) : q(X)} 1.
        prg.addRule(rb.start(HeadType::choice).addHead(atom("q", 1)).addHead(atom("q", 2)));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("q", X)}).setBounds(1, 1));
        check({"p(1) q(1)", "p(1) q(1) q(2)", "p(2) q(1) q(2)", "p(2) q(2)"});
    }
    SECTION("disjunction with conditional choice") {
        // {q}. a v b :- q. {c : a}.
        prg.addRule(rb.start(HeadType::choice).addHead(atom("q")));
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")).addGoal(atom("q")));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("c"), {atom("a")}));
        check({"", "a c q", "a q", "b q"});
    }
    SECTION("disjunction and negation") {
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")).addGoal(neg(atom("c"))));
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("c")).addHead(atom("d")).addGoal(neg(atom("a"))));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(atom("d")));
        auto g   = Grounder().ground(prg);
        auto all = enumerate(g);
        REQUIRE(all == bruteForce(g));
        REQUIRE_FALSE(all.empty());
    }
}

TEST_CASE("Solver search", "[solver]") {
    Program     prg;
    RuleBuilder rb;
    auto        X = var("X");
    SECTION("decisions are true-first in lexical order") {
        prg.addRule(rb.start(HeadType::choice).addHead(atom("c")).addHead(atom("a")).addHead(atom("b")));
        auto g = Grounder().ground(prg);
        REQUIRE(firstModel(g) == "a b c");
        REQUIRE(firstModel(g, false).empty());
        prg.clear();
        prg.addRule(
            rb.start(HeadType::choice).addHead(atom("c")).addHead(atom("a")).addHead(atom("b")).setBounds(1, 1));
        auto h = Grounder().ground(prg);
        REQUIRE(firstModel(h) == "a");
    }
    SECTION("choice atoms are decided first") {
        prg.addRule(rb.start().addHead(atom("a")).addGoal(neg(atom("b"))));
        prg.addRule(rb.start().addHead(atom("b")).addGoal(neg(atom("a"))));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("z")));
        auto   g = Grounder().ground(prg);
        Solver s(g);
        REQUIRE(s.order().size() == g.numAtoms());
        auto z = g.atoms().find("z", {});
        REQUIRE(s.order().front() == z);
        REQUIRE(s.isChoiceAtom(z));
        REQUIRE_FALSE(s.isChoiceAtom(g.atoms().find("a", {})));
        REQUIRE(firstModel(g) == "a z");
    }
    SECTION("search is deterministic") {
        auto g = Grounder().ground(coloringProgram(6, {{1, 2}, {2, 3}, {3, 4}, {4, 5}, {5, 6}, {6, 1}, {1, 4}}, 3));
        Solver a(g), b(g);
        REQUIRE(a.solve().sat());
        REQUIRE(b.solve().sat());
        REQUIRE(a.model().atoms == b.model().atoms);
        auto first = a.model().atoms;
        REQUIRE(a.solve().sat());
        REQUIRE(a.model().atoms == first);
        REQUIRE(a.model().num == 1);
        REQUIRE(a.model().sId == 0);
    }
    SECTION("tie-break variants") {
        auto   g = Grounder().ground(coloringProgram(4, {{1, 2}, {2, 3}, {3, 4}}, 3));
        Solver s0(g), s1(g, SolveOptions(), 1), s2(g, SolveOptions(), 1);
        auto   sorted = [](AtomVec v) {
            std::sort(v.begin(), v.end());
            return v;
        };
        REQUIRE(sorted(s0.order()) == sorted(s1.order()));
        REQUIRE(s1.order() == s2.order());
        REQUIRE(s1.id() == 1);
        REQUIRE(s1.solve().sat());
        ModelChecker mc(g);
        std::vector<Val_t> vals(g.numAtoms(), value_false);
        for (auto a : s1.model().atoms) { vals[a] = value_true; }
        REQUIRE(mc.isStable(vals));
    }
    SECTION("inconsistent programs") {
        prg.addRule(rb.start().addHead(atom("a")).addGoal(neg(atom("a"))));
        auto      g = Grounder().ground(prg);
        Solver    s(g);
        ModelList models;
        auto      res = s.solve(&models);
        REQUIRE(res.unsat());
        REQUIRE_FALSE(res.sat());
        REQUIRE(res.exhausted());
        REQUIRE((res == SolveResult::res_unsat));
        REQUIRE(models.models.empty());
        REQUIRE(std::string(toString(res)) == "INCONSISTENT");
    }
    SECTION("unsatisfiable coloring") {
        auto g   = Grounder().ground(coloringProgram(3, {{1, 2}, {2, 3}, {1, 3}}, 2));
        auto res = Solver(g).solve();
        REQUIRE(res.unsat());
        REQUIRE(bruteForce(g).empty());
    }
    SECTION("number of models") {
        prg.addRange("d", 1, 4);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        auto         g = Grounder().ground(prg);
        SolveOptions opts;
        opts.numModels = 3;
        Solver    s(g, opts);
        ModelList models;
        auto      res = s.solve(&models);
        REQUIRE(res.sat());
        REQUIRE_FALSE(res.exhausted());
        REQUIRE(models.models.size() == 3);
        REQUIRE(s.stats().models == 3);
        REQUIRE(s.model().num == 3);
    }
    SECTION("handler stops search") {
        prg.addRange("d", 1, 4);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        auto g = Grounder().ground(prg);
        struct StopAfterTwo : ModelHandler {
            bool onModel(const Solver&, const Model&) override { return ++seen < 2; }
            int  seen = 0;
        } h;
        SolveOptions opts;
        opts.numModels = 0;
        auto res       = Solver(g, opts).solve(&h);
        REQUIRE(res.sat());
        REQUIRE_FALSE(res.exhausted());
        REQUIRE(h.seen == 2);
    }
    SECTION("model access") {
        prg.addRange("d", 1, 3);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}).setBounds(1, 1));
        auto   g = Grounder().ground(prg);
        Solver s(g);
        REQUIRE(s.solve().sat());
        const auto& m = s.model();
        REQUIRE(m.prg == &g);
        REQUIRE(m.contains("p", {sym(1)}));
        REQUIRE_FALSE(m.contains("p", {sym(2)}));
        REQUIRE(m.contains("d", {sym(3)}));
        REQUIRE_FALSE(m.contains("unknown", {}));
        REQUIRE(m.atomsOf("d", 1) == std::vector<SymVec>{{sym(1)}, {sym(2)}, {sym(3)}});
        REQUIRE(m.atomsOf("p", 2).empty());
        REQUIRE(m.size() == 4);
        REQUIRE(m.toString() == "d(1) d(2) d(3) p(1)");
    }
    SECTION("statistics") {
        auto   g = Grounder().ground(coloringProgram(3, {{1, 2}, {2, 3}, {1, 3}}, 2));
        Solver s(g);
        s.solve();
        REQUIRE(s.stats().choices > 0);
        REQUIRE(s.stats().conflicts > 0);
        REQUIRE(s.stats().models == 0);
        REQUIRE(s.stats().maxLevel > 0);
        SolverStats sum;
        sum.accu(s.stats());
        sum.accu(s.stats());
        REQUIRE(sum.choices == 2 * s.stats().choices);
        REQUIRE(sum.maxLevel == s.stats().maxLevel);
    }
}

TEST_CASE("Solver limits", "[solver]") {
    auto g = Grounder().ground(sudokuProgram(Grid(9, std::vector<int32_t>(9, 0))));
    SECTION("step limit") {
        SolveOptions opts;
        opts.limits = SolveLimits(0);
        Solver s(g, opts);
        auto   res = s.solve();
        REQUIRE(res.unknown());
        REQUIRE_FALSE(res.exhausted());
        REQUIRE_FALSE(res.interrupted());
        REQUIRE(std::string(toString(res)) == "UNKNOWN");
        REQUIRE(s.stats().choices + s.stats().conflicts <= 1);
    }
    SECTION("time limit") {
        SolveOptions opts;
        opts.limits = SolveLimits(UINT64_MAX, 0.0);
        auto res    = Solver(g, opts).solve();
        REQUIRE(res.unknown());
        REQUIRE_FALSE(res.exhausted());
    }
    SECTION("external stop flag") {
        std::atomic<bool> stop{true};
        Solver            s(g);
        s.setStopFlag(&stop);
        auto res = s.solve();
        REQUIRE(res.unknown());
        REQUIRE(res.interrupted());
        stop = false;
        REQUIRE(s.solve().sat());
    }
    SECTION("logging") {
        LogRecorder rec;
        Solver      s(g);
        REQUIRE(s.solve(&rec).sat());
        REQUIRE(rec.contains("solver 0: search over"));
        REQUIRE(rec.contains("solver 0: model 1"));
    }
}

} // namespace Aspect::Test
