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
#include <aspect/errors.h>
#include <aspect/program.h>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

namespace Aspect::Test {
template <typename T>
static std::string print(const T& x) {
    std::ostringstream str;
    str << x;
    return str.str();
}

TEST_CASE("Symbol", "[term]") {
    SECTION("numbers before strings") {
        REQUIRE(Symbol::number(100) < Symbol::string("a"));
        REQUIRE(Symbol::number(-1) < Symbol::number(0));
        REQUIRE(Symbol::string("a") < Symbol::string("b"));
        REQUIRE(Symbol::string("ab") > Symbol::string("a"));
        REQUIRE(Symbol() == Symbol::number(0));
    }
    SECTION("equality distinguishes types") {
        REQUIRE(Symbol::number(1) != Symbol::string("1"));
        REQUIRE(Symbol::string("x") == Symbol::string("x"));
        REQUIRE(Symbol::string("x").hash() == Symbol::string("x").hash());
    }
    SECTION("print quotes non-identifiers") {
        REQUIRE(toString(Symbol::number(-7)) == "-7");
        REQUIRE(toString(Symbol::string("math")) == "math");
        REQUIRE(toString(Symbol::string("Math")) == "\"Math\"");
        REQUIRE(toString(Symbol::string("a b")) == "\"a b\"");
        REQUIRE(toString(Symbol::string("say \"hi\"")) == "\"say \\\"hi\\\"\"");
    }
    SECTION("strict comparison requires same type") {
        REQUIRE((compareStrict(Symbol::number(1), Symbol::number(2), "<") == std::strong_ordering::less));
        REQUIRE_THROWS_AS(compareStrict(Symbol::number(1), Symbol::string("a"), "<"), TypeMismatch);
    }
}

TEST_CASE("Term operations", "[term]") {
    auto one = Symbol::number(1), two = Symbol::number(2), a = Symbol::string("a");
    SECTION("compare") {
        REQUIRE(compare(CmpOp::lt, one, two));
        REQUIRE(compare(CmpOp::geq, two, two));
        REQUIRE_FALSE(compare(CmpOp::gt, one, two));
        REQUIRE(compare(CmpOp::neq, one, a));
        REQUIRE_FALSE(compare(CmpOp::eq, one, a));
        REQUIRE_THROWS_AS(compare(CmpOp::lt, one, a), TypeMismatch);
    }
    SECTION("negate") {
        for (auto op : {CmpOp::eq, CmpOp::neq, CmpOp::lt, CmpOp::leq, CmpOp::gt, CmpOp::geq}) {
            REQUIRE(compare(op, one, two) != compare(negate(op), one, two));
            REQUIRE(negate(negate(op)) == op);
        }
    }
    SECTION("apply") {
        Symbol out;
        REQUIRE(apply(BinOp::add, one, two, out));
        REQUIRE(out == Symbol::number(3));
        REQUIRE(apply(BinOp::div, Symbol::number(7), two, out));
        REQUIRE(out == Symbol::number(3));
        REQUIRE(apply(BinOp::mod, Symbol::number(7), two, out));
        REQUIRE(out == Symbol::number(1));
    }
    SECTION("undefined results") {
        Symbol out = Symbol::number(42);
        REQUIRE_FALSE(apply(BinOp::div, one, Symbol::number(0), out));
        REQUIRE_FALSE(apply(BinOp::mod, one, Symbol::number(0), out));
        REQUIRE_FALSE(apply(BinOp::mul, Symbol::number(1 << 20), Symbol::number(1 << 20), out));
        REQUIRE(out == Symbol::number(42));
    }
    SECTION("arithmetic on strings") {
        Symbol out;
        REQUIRE_THROWS_AS(apply(BinOp::add, one, a, out), TypeMismatch);
    }
}

TEST_CASE("Rule schemas", "[term]") {
    SECTION("terms") {
        auto t = var("X") + num(1) * var("Y");
        REQUIRE_FALSE(t.ground());
        std::vector<std::string> vars;
        t.collectVars(vars);
        REQUIRE(vars == std::vector<std::string>{"X", "Y"});
        REQUIRE(print(t) == "(X+(1*Y))");
        REQUIRE((num(2) - num(1)).ground());
        REQUIRE(var("X") == var("X"));
        REQUIRE_FALSE(var("X") == var("Y"));
    }
    SECTION("atoms") {
        auto a = atom("p", var("X"), str("b"), 3);
        REQUIRE(a.arity() == 3);
        REQUIRE(a.sig() == Sig{"p", 3});
        REQUIRE(print(a) == "p(X,b,3)");
        REQUIRE(print(atom("q")) == "q");
        REQUIRE(atom("q", 1).ground());
    }
    SECTION("rules") {
        RuleBuilder rb;
        auto        r = rb.start().addHead(atom("a", var("X"))).addGoal(atom("b", var("X"))).addGoal(neg(atom("c"))).rule();
        REQUIRE(r.head().type() == HeadType::normal);
        REQUIRE(r.body().size() == 2);
        REQUIRE(r.body()[1].cond().negative());
        REQUIRE(r.toString() == "a(X) :- b(X), not c.");

        auto c = rb.start(HeadType::choice)
                     .addHead(atom("p", var("X")), {atom("d", var("X"))})
                     .setBounds(1, 2)
                     .addGoal(atom("e"))
                     .rule();
        REQUIRE(c.head().type() == HeadType::choice);
        REQUIRE(c.head().lower() == 1);
        REQUIRE(c.head().upper() == 2);
        REQUIRE(c.head().elements()[0].condition.size() == 1);
    }
    SECTION("builder checks preconditions") {
        RuleBuilder rb;
        REQUIRE_THROWS_AS(rb.start(HeadType::constraint).addHead(atom("a")), std::logic_error);
        REQUIRE_THROWS_AS(rb.start(HeadType::normal).addHead(atom("a"), {atom("b")}), std::logic_error);
    }
    SECTION("aggregates") {
        auto agg = count({elem({var("X")}, {atom("p", var("X"))})}, CmpOp::geq, num(2));
        REQUIRE(agg.isAggregate());
        REQUIRE(agg.type() == Literal::Type::aggregate);
        REQUIRE(agg.fun() == AggFun::count);
        REQUIRE(agg.elements().size() == 1);
        REQUIRE(agg.op() == CmpOp::geq);
    }
    SECTION("programs") {
        Program prg;
        REQUIRE(prg.empty());
        prg.addRange("n", 1, 3);
        prg.addEnum("c", {Symbol::string("red"), Symbol::string("green")});
        prg.addFact("edge", {Symbol::number(1), Symbol::number(2)});
        REQUIRE(prg.facts().size() == 6);
        REQUIRE(prg.addConstraint({atom("n", var("X")), neg(atom("c", var("X")))}) == 0);
        REQUIRE(prg.numRules() == 1);
        REQUIRE(prg.rule(0).head().empty());
        prg.clear();
        REQUIRE(prg.empty());
    }
}

} // namespace Aspect::Test
