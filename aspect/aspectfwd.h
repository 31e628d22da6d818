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
#pragma once
/*!
 * \file
 * \brief Forward declarations of important aspect types.
 */

//! Root namespace for all types and functions of libaspect.
namespace Aspect {
class Symbol;
class Term;
class Atom;
class Literal;
class CondLiteral;
class Rule;
class Program;
class AtomTable;
class GroundProgram;
class Grounder;
class Solver;
class ModelChecker;
namespace mt {
class ParallelSolve;
}
struct Model;
class Value;
class OutputExpr;
class OutputSpecification;
class Projector;
class AspectFacade;
class EventHandler;
} // namespace Aspect
