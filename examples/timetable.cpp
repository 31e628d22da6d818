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
#include "example.h"

#include <aspect/facade.h>

// Build a weekly timetable for two classes sharing a math teacher.
void timetable() {
    using namespace Aspect;
    auto s = [](const char* x) { return Symbol::string(x); };

    Program prg;
    prg.addEnum("class", {s("c1"), s("c2")});
    prg.addFact("qualified", {s("smith"), s("math")});
    prg.addFact("qualified", {s("jones"), s("art")});
    prg.addFact("qualified", {s("jones"), s("music")});
    prg.addFact("weekly", {s("c1"), s("math"), Symbol::number(3)});
    prg.addFact("weekly", {s("c1"), s("art"), Symbol::number(1)});
    prg.addFact("weekly", {s("c2"), s("math"), Symbol::number(2)});
    prg.addFact("weekly", {s("c2"), s("music"), Symbol::number(2)});
    prg.addRange("day", 0, 1);
    prg.addRange("period", 0, 2);

    auto        C = var("C"), S = var("S"), T = var("T"), D = var("D"), P = var("P"), N = var("N");
    auto        S1 = var("S1"), S2 = var("S2"), T1 = var("T1"), T2 = var("T2"), C1 = var("C1"), C2 = var("C2");
    RuleBuilder rb;
    // Lessons may be placed in any slot and given by any qualified teacher:
    //    { assign(C,S,T,D,P) : qualified(T,S) } :- weekly(C,S,N), day(D), period(P).
    prg.addRule(rb.start(HeadType::choice)
                    .addHead(atom("assign", C, S, T, D, P), {atom("qualified", T, S)})
                    .addGoal(atom("weekly", C, S, N))
                    .addGoal(atom("day", D))
                    .addGoal(atom("period", P)));
    // The number of lessons per subject is fixed:
    //    :- weekly(C,S,N), #count{ D,P : assign(C,S,T,D,P) } != N.
    prg.addConstraint({atom("weekly", C, S, N), count({elem({D, P}, {atom("assign", C, S, T, D, P)})}, CmpOp::neq, N)});
    // Neither classes nor teachers can be in two places at once.
    prg.addConstraint({atom("assign", C, S1, T1, D, P), atom("assign", C, S2, T2, D, P), lt(S1, S2)});
    prg.addConstraint({atom("assign", C, S, T1, D, P), atom("assign", C, S, T2, D, P), lt(T1, T2)});
    prg.addConstraint({atom("assign", C1, S1, T, D, P), atom("assign", C2, S2, T, D, P), lt(C1, C2)});
    // Slots without a lesson are free.
    prg.addRule(rb.start().addHead(atom("busy", C, D, P)).addGoal(atom("assign", C, S, T, D, P)));
    prg.addRule(rb.start().addHead(atom("slot", C, D, P, S)).addGoal(atom("assign", C, S, T, D, P)));
    prg.addRule(rb.start()
                    .addHead(atom("slot", C, D, P, str("free")))
                    .addGoal(atom("class", C))
                    .addGoal(atom("day", D))
                    .addGoal(atom("period", P))
                    .addGoal(neg(atom("busy", C, D, P))));

    // schedule maps each class to its days, each day being a sequence of slots.
    // teachers lists who teaches what and is defined via a simple set.
    OutputSpecification spec;
    spec.add("schedule",
             OutputExpr::mapping(
                 {atom("class", C)}, OutputExpr::variable("C"),
                 OutputExpr::sequence({atom("day", D)}, "D",
                                      OutputExpr::sequence({atom("slot", C, D, P, S)}, "P", OutputExpr::variable("S")))));
    spec.add("teachers", OutputExpr::simpleSet("qualified"));

    AspectFacade facade;
    if (auto out = facade.solveOne(prg, spec)) {
        printProjection(*out);
    }
    else {
        std::cout << "No timetable!" << std::endl;
    }
}
