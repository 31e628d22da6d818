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
#include <aspect/ground_program.h>

#include <catch2/catch_test_macros.hpp>

namespace Aspect::Test {
static Symbol n(int32_t x) { return Symbol::number(x); }

TEST_CASE("Atom table", "[term]") {
    AtomTable tab;
    auto      p = tab.addPredicate("p", 2);
    auto      q = tab.addPredicate("q", 0);
    SECTION("predicates are unique per signature") {
        REQUIRE(tab.addPredicate("p", 2) == p);
        REQUIRE(tab.addPredicate("p", 1) != p);
        REQUIRE(tab.findPredicate("p", 2) == p);
        REQUIRE(tab.findPredicate("r", 0) == pred_none);
        REQUIRE(tab.predicate(q) == Sig{"q", 0});
        REQUIRE(tab.numPredicates() == 3);
    }
    SECTION("atom ids are dense") {
        auto [a, newA] = tab.add(p, {n(1), n(2)});
        auto [b, newB] = tab.add(q, {});
        auto [c, newC] = tab.add(p, {n(1), n(2)});
        REQUIRE((newA && newB && not newC));
        REQUIRE(a == 0);
        REQUIRE(b == 1);
        REQUIRE(c == a);
        REQUIRE(tab.size() == 2);
        REQUIRE(tab.contains(1));
        REQUIRE_FALSE(tab.contains(2));
        REQUIRE(tab.pred(a) == p);
        REQUIRE(tab.name(b) == "q");
        REQUIRE(tab.args(a) == SymVec{n(1), n(2)});
    }
    SECTION("find") {
        auto a = tab.add(p, {n(1), Symbol::string("x")}).first;
        REQUIRE(tab.find(p, {n(1), Symbol::string("x")}) == a);
        REQUIRE(tab.find("p", {n(1), Symbol::string("x")}) == a);
        REQUIRE(tab.find("p", {n(2), Symbol::string("x")}) == atom_none);
        REQUIRE(tab.find("p", {n(1)}) == atom_none);
        REQUIRE(tab.find("unknown", {}) == atom_none);
    }
    SECTION("argument index") {
        tab.add(p, {n(1), n(1)});
        tab.add(p, {n(2), n(1)});
        tab.add(p, {n(1), n(3)});
        REQUIRE(tab.atoms(p).size() == 3);
        auto first = tab.atoms(p, 0, n(1));
        REQUIRE(AtomVec(first.begin(), first.end()) == AtomVec{0, 2});
        auto second = tab.atoms(p, 1, n(1));
        REQUIRE(AtomVec(second.begin(), second.end()) == AtomVec{0, 1});
        REQUIRE(tab.atoms(p, 1, n(7)).empty());
        REQUIRE_THROWS_AS(tab.atoms(p, 2, n(1)), std::logic_error);
    }
    SECTION("arity is checked") { REQUIRE_THROWS_AS(tab.add(p, {n(1)}), std::logic_error); }
    SECTION("lexical order") {
        auto r  = tab.addPredicate("a", 1);
        auto p3 = tab.add(p, {n(3), n(1)}).first;
        auto p1 = tab.add(p, {n(1), Symbol::string("z")}).first;
        auto p2 = tab.add(p, {n(1), n(9)}).first;
        auto a  = tab.add(r, {n(5)}).first;
        auto qa = tab.add(q, {}).first;
        REQUIRE(tab.less(a, p2));
        REQUIRE(tab.less(p2, p1));
        REQUIRE(tab.less(p1, p3));
        REQUIRE(tab.less(p3, qa));
        REQUIRE_FALSE(tab.less(p3, p3));
    }
    SECTION("print") {
        auto a = tab.add(p, {n(-1), Symbol::string("Hello World")}).first;
        auto b = tab.add(q, {}).first;
        REQUIRE(tab.toString(a) == "p(-1,\"Hello World\")");
        REQUIRE(tab.toString(b) == "q");
    }
}

TEST_CASE("Aggregate evaluation", "[term]") {
    SECTION("compare range") {
        REQUIRE(compareRange(CmpOp::eq, 2, 2, 2) == value_true);
        REQUIRE(compareRange(CmpOp::eq, 0, 3, 2) == value_free);
        REQUIRE(compareRange(CmpOp::eq, 0, 1, 2) == value_false);
        REQUIRE(compareRange(CmpOp::neq, 0, 1, 2) == value_true);
        REQUIRE(compareRange(CmpOp::lt, 0, 1, 2) == value_true);
        REQUIRE(compareRange(CmpOp::lt, 2, 5, 2) == value_false);
        REQUIRE(compareRange(CmpOp::geq, 2, 5, 2) == value_true);
        REQUIRE(compareRange(CmpOp::geq, 0, 5, 2) == value_free);
        REQUIRE(compareRange(CmpOp::gt, 0, 2, 2) == value_false);
        REQUIRE(compareRange(CmpOp::leq, 0, 2, 2) == value_true);
    }
    // #sum{ 3,a : 0; 2,b : 1; -1,c : 2 } >= 4
    GroundAggregate agg;
    agg.fun   = AggFun::sum;
    agg.op    = CmpOp::geq;
    agg.bound = 4;
    agg.elems.push_back({{n(-1), Symbol::string("c")}, -1, {2}, {}});
    agg.elems.push_back({{n(2), Symbol::string("b")}, 2, {1}, {}});
    agg.elems.push_back({{n(3), Symbol::string("a")}, 3, {0}, {}});
    std::vector<Val_t> vals(3, value_free);
    auto               valueOf = [&](Atom_t a) { return vals[a]; };
    SECTION("sum") {
        REQUIRE(evaluate(agg, valueOf) == value_free);
        vals = {value_true, value_free, value_free};
        REQUIRE(evaluate(agg, valueOf) == value_free);
        vals = {value_true, value_true, value_free};
        REQUIRE(evaluate(agg, valueOf) == value_true);
        vals = {value_true, value_true, value_false};
        REQUIRE(evaluate(agg, valueOf) == value_true);
        vals = {value_true, value_false, value_free};
        REQUIRE(evaluate(agg, valueOf) == value_false);
        REQUIRE_FALSE(agg.monotone());
        REQUIRE(agg.atoms() == AtomVec{0, 1, 2});
    }
    SECTION("count folds equal tuples") {
        GroundAggregate cnt;
        cnt.op    = CmpOp::eq;
        cnt.bound = 1;
        cnt.elems.push_back({{n(1)}, 1, {0}, {}});
        cnt.elems.push_back({{n(1)}, 1, {1}, {}});
        vals = {value_true, value_true, value_false};
        REQUIRE(evaluate(cnt, valueOf) == value_true);
        REQUIRE(holds(cnt, [](Atom_t a) { return a < 2; }));
        cnt.op = CmpOp::geq;
        REQUIRE(cnt.monotone());
    }
    SECTION("negative conditions") {
        GroundAggregate cnt;
        cnt.op    = CmpOp::geq;
        cnt.bound = 1;
        cnt.elems.push_back({{n(1)}, 1, {}, {0}});
        vals = {value_true, value_free, value_free};
        REQUIRE(evaluate(cnt, valueOf) == value_false);
        vals = {value_false, value_free, value_free};
        REQUIRE(evaluate(cnt, valueOf) == value_true);
    }
    SECTION("min and max") {
        GroundAggregate mn;
        mn.fun   = AggFun::min;
        mn.op    = CmpOp::lt;
        mn.bound = 3;
        mn.elems.push_back({{n(2)}, 2, {0}, {}});
        mn.elems.push_back({{n(5)}, 5, {1}, {}});
        vals = {value_free, value_true, value_free};
        REQUIRE(evaluate(mn, valueOf) == value_free);
        vals = {value_true, value_true, value_free};
        REQUIRE(evaluate(mn, valueOf) == value_true);
        vals = {value_false, value_true, value_free};
        REQUIRE(evaluate(mn, valueOf) == value_false);
        REQUIRE(mn.monotone());

        GroundAggregate mx = mn;
        mx.fun             = AggFun::max;
        mx.op              = CmpOp::geq;
        mx.bound           = 5;
        vals               = {value_true, value_free, value_free};
        REQUIRE(evaluate(mx, valueOf) == value_free);
        vals = {value_true, value_true, value_free};
        REQUIRE(evaluate(mx, valueOf) == value_true);
        REQUIRE(mx.monotone());
    }
}

} // namespace Aspect::Test
