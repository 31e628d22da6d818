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
#include <aspect/projector.h>
#include <aspect/solver_types.h>
void printModel(const Aspect::Model& model) {
    std::cout << "Model " << model.num << ": \n";
    // Print all atoms that are true wrt the current model.
    model.print(std::cout);
    std::cout << std::endl;
}

void printProjection(const Aspect::Projection& out) { out.print(std::cout); }

#define RUN(x)                                                                                                         \
    try {                                                                                                              \
        std::cout << "*** Running " << static_cast<const char*>(#x) << " ***" << std::endl;                            \
        x();                                                                                                           \
    }                                                                                                                  \
    catch (const std::exception& e) {                                                                                  \
        std::cout << " *** ERROR: " << e.what() << std::endl;                                                          \
    }

int main() {
    RUN(sudoku);
    RUN(timetable);
    RUN(coloring);
}
