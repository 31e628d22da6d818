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

#include <utility>

// This example enumerates all 3-colorings of a small graph with a portfolio
// of solvers and prints each model as it is reported.

namespace {
class Printer : public Aspect::EventHandler {
public:
    Printer() : EventHandler(Aspect::Event::verbosity_low) {}
    void onEvent(const Aspect::Event& ev) override {
        if (const auto* log = Aspect::event_cast<Aspect::LogEvent>(ev)) {
            std::cout << "c " << log->msg << '\n';
        }
    }
    bool onModel(const Aspect::Solver&, const Aspect::Model& m) override {
        printModel(m);
        return true;
    }
};
} // namespace

void coloring() {
    using namespace Aspect;
    AspectConfig config;
    config.solve.numModels = 0;
    config.solve.threads   = 2;

    Program prg;
    prg.addRange("node", 1, 4);
    prg.addRange("col", 1, 3);
    for (auto [x, y] : {std::pair{1, 2}, std::pair{2, 3}, std::pair{3, 4}, std::pair{4, 1}, std::pair{1, 3}}) {
        prg.addFact("edge", {Symbol::number(x), Symbol::number(y)});
    }
    auto        N = var("N"), C = var("C"), X = var("X"), Y = var("Y");
    RuleBuilder rb;
    //    1 { color(N,C) : col(C) } 1 :- node(N).
    //    :- edge(X,Y), color(X,C), color(Y,C).
    prg.addRule(rb.start(HeadType::choice)
                    .addHead(atom("color", N, C), {atom("col", C)})
                    .setBounds(1, 1)
                    .addGoal(atom("node", N)));
    prg.addConstraint({atom("edge", X, Y), atom("color", X, C), atom("color", Y, C)});

    AspectFacade facade(config);
    Printer      printer;
    facade.ground(prg, &printer);
    facade.solve(&printer);
    std::cout << (facade.summary().complete() ? "No more models!" : "Search interrupted!") << std::endl;
    facade.summary().print(std::cout);
}
