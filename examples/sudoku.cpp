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

#include <vector>

// Solve a sudoku puzzle and print the solution as a grid.
void sudoku() {
    using namespace Aspect;
    const int32_t puzzle[9][9] = {{5, 3, 0, 0, 7, 0, 0, 0, 0}, {6, 0, 0, 1, 9, 5, 0, 0, 0}, {0, 9, 8, 0, 0, 0, 0, 6, 0},
                                  {8, 0, 0, 0, 6, 0, 0, 0, 3}, {4, 0, 0, 8, 0, 3, 0, 0, 1}, {7, 0, 0, 0, 2, 0, 0, 0, 6},
                                  {0, 6, 0, 0, 0, 0, 2, 8, 0}, {0, 0, 0, 4, 1, 9, 0, 0, 5}, {0, 0, 0, 0, 8, 0, 0, 7, 9}};

    // Program is the non-ground input of the grounder.
    // Facts describe the instance, rules the problem.
    Program prg;
    prg.addRange("idx", 0, 8);
    prg.addRange("num", 1, 9);
    for (int32_t r = 0; r != 9; ++r) {
        for (int32_t c = 0; c != 9; ++c) {
            if (puzzle[r][c] != 0) {
                prg.addFact("given", {Symbol::number(r), Symbol::number(c), Symbol::number(puzzle[r][c])});
            }
        }
    }
    auto        R = var("R"), C = var("C"), V = var("V");
    auto        R1 = var("R1"), R2 = var("R2"), C1 = var("C1"), C2 = var("C2");
    RuleBuilder rb;
    // Each cell holds exactly one number:
    //    1 { sol(R,C,V) : num(V) } 1 :- idx(R), idx(C).
    prg.addRule(rb.start(HeadType::choice)
                    .addHead(atom("sol", R, C, V), {atom("num", V)})
                    .setBounds(1, 1)
                    .addGoal(atom("idx", R))
                    .addGoal(atom("idx", C)));
    // Clues must be kept.
    prg.addConstraint({atom("given", R, C, V), neg(atom("sol", R, C, V))});
    // No number twice in a row, a column, or a block.
    prg.addConstraint({atom("sol", R, C1, V), atom("sol", R, C2, V), lt(C1, C2)});
    prg.addConstraint({atom("sol", R1, C, V), atom("sol", R2, C, V), lt(R1, R2)});
    prg.addConstraint({atom("sol", R1, C1, V), atom("sol", R2, C2, V), lt(R1, R2), eq(R1 / num(3), R2 / num(3)),
                       eq(C1 / num(3), C2 / num(3))});

    // The output specification turns the answer set into a sequence of rows.
    OutputSpecification spec;
    spec.add("grid", OutputExpr::sequence({atom("idx", R)}, "R",
                                          OutputExpr::sequence({atom("sol", R, C, V)}, "C", OutputExpr::variable("V"))));

    // The facade runs grounding, solving, and projection in one go.
    AspectFacade facade;
    auto         out = facade.solveOne(prg, spec);
    if (not out) {
        std::cout << "No solution!" << std::endl;
        return;
    }
    for (const auto& row : (*out)["grid"].elements()) {
        for (const auto& cell : row.elements()) { std::cout << cell << ' '; }
        std::cout << '\n';
    }
    facade.summary().print(std::cout);
}
