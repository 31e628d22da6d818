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

#include <aspect/errors.h>
#include <aspect/grounder.h>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <sstream>

namespace Aspect::Test {
static std::string print(const GroundProgram& g) {
    std::ostringstream str;
    g.print(str);
    return str.str();
}

TEST_CASE("Safety", "[ground]") {
    Program     prg;
    RuleBuilder rb;
    auto        X = var("X"), Y = var("Y");
    prg.addFact("q", {sym(1)});
    SECTION("negative literals do not bind") {
        prg.addRule(rb.start().addHead(atom("p", X)).addGoal(neg(atom("q", X))));
        try {
            Grounder::checkSafety(prg);
            FAIL("unsafe rule not detected");
        }
        catch (const UnsafeVariable& e) {
            REQUIRE(e.variable() == "X");
            REQUIRE(e.rule() == 0);
            REQUIRE(e.ruleText() == "p(X) :- not q(X).");
            REQUIRE(e.code() == ErrorCode::unsafe_variable);
        }
    }
    SECTION("head variable not in body") {
        prg.addRule(rb.start().addHead(atom("r")).addGoal(atom("q", X)));
        prg.addRule(rb.start().addHead(atom("p", X)).addGoal(atom("q", Y)));
        try {
            Grounder().ground(prg);
            FAIL("unsafe rule not detected");
        }
        catch (const UnsafeVariable& e) {
            REQUIRE(e.variable() == "X");
            REQUIRE(e.rule() == 1);
        }
    }
    SECTION("comparisons and arithmetic do not bind") {
        prg.addRule(rb.start().addHead(atom("p", X)).addGoal(atom("q", Y)).addGoal(eq(X, Y)));
        REQUIRE_THROWS_AS(Grounder::checkSafety(prg), UnsafeVariable);
        prg.clear();
        prg.addRule(rb.start().addHead(atom("p", X)).addGoal(atom("q", X + num(1))));
        REQUIRE_THROWS_AS(Grounder::checkSafety(prg), UnsafeVariable);
    }
    SECTION("aggregate elements") {
        prg.addConstraint({count({elem({X}, {atom("q", Y)})}, CmpOp::gt, num(0))});
        REQUIRE_THROWS_AS(Grounder::checkSafety(prg), UnsafeVariable);
    }
    SECTION("aggregate bound") {
        prg.addConstraint({count({elem({X}, {atom("q", X)})}, CmpOp::gt, Y)});
        REQUIRE_THROWS_AS(Grounder::checkSafety(prg), UnsafeVariable);
    }
    SECTION("choice elements") {
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X)));
        REQUIRE_THROWS_AS(Grounder::checkSafety(prg), UnsafeVariable);
        prg.clear();
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("q", X)}));
        REQUIRE_NOTHROW(Grounder::checkSafety(prg));
    }
    SECTION("safe rules") {
        prg.addRule(rb.start()
                        .addHead(atom("p", X + num(1)))
                        .addGoal(atom("q", X))
                        .addGoal(gt(X, num(0)))
                        .addGoal(neg(atom("r", X))));
        prg.addConstraint({atom("q", X), count({elem({Y}, {atom("q", Y), lt(X, Y)})}, CmpOp::geq, X)});
        REQUIRE_NOTHROW(Grounder::checkSafety(prg));
    }
}

TEST_CASE("Grounder", "[ground]") {
    Program     prg;
    RuleBuilder rb;
    auto        X = var("X"), Y = var("Y"), Z = var("Z");
    SECTION("domain declarations") {
        prg.addRange("n", 1, 3);
        prg.addEnum("c", {sym("red"), sym("green")});
        auto g = Grounder().ground(prg);
        REQUIRE(g.numAtoms() == 5);
        REQUIRE(g.facts().size() == 5);
        REQUIRE(g.rules().empty());
        REQUIRE(g.isFact(g.atoms().find("n", {sym(2)})));
        REQUIRE(g.atoms().find("n", {sym(4)}) == atom_none);
        REQUIRE(print(g) == "n(1).\nn(2).\nn(3).\nc(red).\nc(green).\n");
    }
    SECTION("recursion is evaluated semi-naively") {
        for (auto [x, y] : std::vector<std::pair<int32_t, int32_t>>{{1, 2}, {2, 3}, {3, 4}}) {
            prg.addFact("edge", {sym(x), sym(y)});
        }
        prg.addRule(rb.start().addHead(atom("path", X, Y)).addGoal(atom("edge", X, Y)));
        prg.addRule(rb.start().addHead(atom("path", X, Z)).addGoal(atom("path", X, Y)).addGoal(atom("edge", Y, Z)));
        auto g = Grounder().ground(prg);
        REQUIRE(g.atoms().atoms(g.atoms().findPredicate("path", 2)).size() == 6);
        REQUIRE(g.isFact(g.atoms().find("path", {sym(1), sym(4)})));
        REQUIRE(g.facts().size() == 9);
        REQUIRE(g.rules().empty());
        REQUIRE(g.stats().iterations >= 3);
        // every instance is produced exactly once
        REQUIRE(g.stats().instances == 6);
    }
    SECTION("without simplification") {
        prg.addFact("p", {sym(1)});
        prg.addRule(rb.start().addHead(atom("q")).addGoal(atom("p", 1)));
        GrounderOptions opts;
        opts.simplify = false;
        auto g        = Grounder(opts).ground(prg);
        REQUIRE(g.rules().size() == 1);
        REQUIRE(g.isFact(g.atoms().find("q", {})));
        REQUIRE(print(g) == "p(1).\nq.\nq :- p(1).\n");
        auto s = Grounder().ground(prg);
        REQUIRE(s.rules().empty());
    }
    SECTION("negation") {
        prg.addFact("d", {sym(1)});
        prg.addFact("d", {sym(2)});
        prg.addFact("e", {sym(2)});
        prg.addRule(rb.start().addHead(atom("p", X)).addGoal(atom("d", X)).addGoal(neg(atom("e", X))));
        prg.addRule(rb.start().addHead(atom("a")).addGoal(neg(atom("b"))));
        auto g = Grounder().ground(prg);
        // not e(1) holds since e(1) is not derivable, not e(2) fails since e(2) is a fact
        REQUIRE(g.isFact(g.atoms().find("p", {sym(1)})));
        REQUIRE(g.atoms().find("p", {sym(2)}) != atom_none);
        REQUIRE_FALSE(g.isFact(g.atoms().find("p", {sym(2)})));
        REQUIRE(g.isFact(g.atoms().find("a", {})));
        REQUIRE(g.rules().empty());
    }
    SECTION("choice rules") {
        prg.addRange("d", 1, 2);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("d", X)}));
        prg.addRule(rb.start().addHead(atom("q")).addGoal(atom("p", 1)).addGoal(neg(atom("p", 2))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.rules().size() == 2);
        REQUIRE(print(g) == "d(1).\nd(2).\n{p(1);p(2)}.\nq :- p(1), not p(2).\n");
        REQUIRE_FALSE(g.disjunctive());
    }
    SECTION("choice conditions over derived atoms") {
        prg.addRule(rb.start(HeadType::choice).addHead(atom("q", 1)));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("p", X), {atom("q", X)}));
        prg.addRule(rb.start(HeadType::choice).addHead(atom("s", X), {atom("q", X), neg(atom("t", X))}));
        auto g = Grounder().ground(prg);
        REQUIRE(print(g) == "{q(1)}.\n{p(1)} :- q(1).\n{s(1)} :- q(1).\n");
        prg.addRule(rb.start().addHead(atom("t", X)).addGoal(atom("q", X)).addGoal(neg(atom("p", X))));
        auto h = Grounder().ground(prg);
        REQUIRE(print(h) == "{q(1)}.\n{p(1)} :- q(1).\n{s(1)} :- q(1), not t(1).\nt(1) :- q(1), not p(1).\n");
    }
    SECTION("bounded choice with conditions") {
        prg.addRange("d", 1, 2);
        prg.addRule(rb.start(HeadType::choice).addHead(atom("q", X), {atom("d", X)}));
        prg.addRule(
            rb.start(HeadType::choice).addHead(atom("p", X), {atom("q", X)}).addHead(atom("r")).setBounds(1, 1));
        auto g = Grounder().ground(prg);
        // {q(1);q(2)}. {p(1)} :- q(1). {p(2)} :- q(2). {r}. and one constraint per bound
        REQUIRE(g.rules().size() == 6);
        REQUIRE(std::count_if(g.rules().begin(), g.rules().end(), [](const GroundRule& r) {
                    return r.type == HeadType::constraint;
                }) == 2);
        REQUIRE(std::none_of(g.rules().begin(), g.rules().end(), [](const GroundRule& r) { return r.hasBounds(); }));
        REQUIRE(g.aggregates().size() == 2);
        REQUIRE(g.aggregates()[0].op == CmpOp::lt);
        REQUIRE(g.aggregates()[1].op == CmpOp::gt);
        for (const auto& agg : g.aggregates()) {
            REQUIRE(agg.fun == AggFun::count);
            REQUIRE(agg.bound == 1);
            REQUIRE(agg.elems.size() == 3);
        }
    }
    SECTION("disjunctive rules") {
        prg.addRule(rb.start(HeadType::disjunctive).addHead(atom("a")).addHead(atom("b")));
        auto g = Grounder().ground(prg);
        REQUIRE(g.disjunctive());
        REQUIRE(print(g) == "a v b.\n");
    }
    SECTION("arithmetic") {
        prg.addRange("p", 1, 2);
        prg.addFact("r", {sym(0)});
        prg.addFact("r", {sym(2)});
        prg.addRule(rb.start().addHead(atom("q", X + num(1))).addGoal(atom("p", X)));
        prg.addRule(rb.start().addHead(atom("h", X / Y)).addGoal(atom("p", X)).addGoal(atom("r", Y)));
        auto g = Grounder().ground(prg);
        REQUIRE(g.isFact(g.atoms().find("q", {sym(2)})));
        REQUIRE(g.isFact(g.atoms().find("q", {sym(3)})));
        // division by zero makes the instance undefined
        auto h = g.atoms().findPredicate("h", 1);
        REQUIRE(g.atoms().atoms(h).size() == 2);
        REQUIRE(g.atoms().find("h", {sym(0)}) != atom_none);
        REQUIRE(g.atoms().find("h", {sym(1)}) != atom_none);
    }
    SECTION("comparisons") {
        prg.addRange("p", 1, 4);
        prg.addRule(rb.start().addHead(atom("odd", X)).addGoal(atom("p", X)).addGoal(eq(X % num(2), num(1))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.atoms().atoms(g.atoms().findPredicate("odd", 1)).size() == 2);
    }
    SECTION("comparisons of mixed types") {
        prg.addRange("p", 1, 2);
        prg.addFact("p", {sym("a")});
        prg.addRule(rb.start().addHead(atom("one", X)).addGoal(atom("p", X)).addGoal(eq(X, num(1))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.isFact(g.atoms().find("one", {sym(1)})));
        REQUIRE(g.atoms().find("one", {sym("a")}) == atom_none);
        prg.addRule(rb.start().addHead(atom("small", X)).addGoal(atom("p", X)).addGoal(lt(X, num(3))));
        REQUIRE_THROWS_AS(Grounder().ground(prg), TypeMismatch);
    }
    SECTION("type errors in arithmetic") {
        prg.addFact("p", {sym("a")});
        prg.addRule(rb.start().addHead(atom("q", X + num(1))).addGoal(atom("p", X)));
        REQUIRE_THROWS_AS(Grounder().ground(prg), TypeMismatch);
    }
    SECTION("atom limit") {
        prg.addFact("nat", {sym(0)});
        prg.addRule(rb.start().addHead(atom("nat", X + num(1))).addGoal(atom("nat", X)));
        GrounderOptions opts;
        opts.atomLimit = 50;
        try {
            Grounder(opts).ground(prg);
            FAIL("limit not detected");
        }
        catch (const GroundingLimit& e) {
            REQUIRE(e.limit() == 50);
            REQUIRE(e.code() == ErrorCode::grounding_limit);
        }
    }
    SECTION("logging") {
        prg.addRange("p", 1, 3);
        LogRecorder rec(Event::verbosity_low);
        auto        g = Grounder().ground(prg, &rec);
        REQUIRE(g.stats().atoms == 3);
        REQUIRE(rec.contains("grounded 0 rules over 3 atoms"));
    }
}

TEST_CASE("Grounding aggregates", "[ground]") {
    Program     prg;
    RuleBuilder rb;
    auto        X = var("X"), B = var("B");
    prg.addRange("p", 1, 3);
    SECTION("aggregates over facts are decided") {
        prg.addRule(rb.start().addHead(atom("ok")).addGoal(count({elem({X}, {atom("p", X)})}, CmpOp::geq, num(2))));
        prg.addRule(rb.start().addHead(atom("big")).addGoal(sum({elem({X}, {atom("p", X)})}, CmpOp::gt, num(10))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.aggregates().empty());
        REQUIRE(g.stats().aggregates == 0);
        REQUIRE(print(g) == "p(1).\np(2).\np(3).\nok.\n");
    }
    SECTION("aggregates over choices are kept") {
        prg.addRule(rb.start(HeadType::choice).addHead(atom("c", X), {atom("p", X)}));
        prg.addRule(rb.start().addHead(atom("two")).addGoal(count({elem({X}, {atom("c", X)})}, CmpOp::geq, num(2))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.aggregates().size() == 1);
        const auto& agg = g.aggregates()[0];
        REQUIRE(agg.elems.size() == 3);
        REQUIRE(agg.bound == 2);
        REQUIRE(agg.monotone());
    }
    SECTION("negative fact kills element") {
        prg.addFact("skip", {sym(2)});
        prg.addRule(rb.start(HeadType::choice).addHead(atom("c", X), {atom("p", X)}));
        prg.addRule(rb.start().addHead(atom("all")).addGoal(
            count({elem({X}, {atom("c", X), neg(atom("skip", X))})}, CmpOp::eq, num(2))));
        auto g = Grounder().ground(prg);
        REQUIRE(g.aggregates().size() == 1);
        REQUIRE(g.aggregates()[0].elems.size() == 2);
    }
    SECTION("weights must be numbers") {
        prg.addFact("p", {sym("a")});
        prg.addRule(rb.start().addHead(atom("s")).addGoal(sum({elem({X}, {atom("p", X)})}, CmpOp::gt, num(0))));
        REQUIRE_THROWS_AS(Grounder().ground(prg), TypeMismatch);
    }
    SECTION("bound must be a number") {
        prg.addFact("b", {sym("x")});
        prg.addRule(rb.start().addHead(atom("s")).addGoal(atom("b", B)).addGoal(
            count({elem({X}, {atom("p", X)})}, CmpOp::gt, B)));
        REQUIRE_THROWS_AS(Grounder().ground(prg), TypeMismatch);
    }
}

} // namespace Aspect::Test
