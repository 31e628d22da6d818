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

#include <aspect/ground_program.h>
#include <aspect/instantiator.h>
#include <aspect/solver_types.h>

/*!
 * \file
 * \brief Instantiation of rule schemas over finite domains.
 */
namespace Aspect {
/*!
 * \defgroup grounder Grounder
 * \brief Semi-naive bottom-up instantiation of programs.
 */
//@{

//! Options for grounding.
struct GrounderOptions {
    uint32_t atomLimit{10'000'000}; //!< Maximal number of atoms in the universe.
    bool     simplify{true};        //!< Remove facts from rule bodies and drop rules with fact heads.
};

//! Computes the ground instances of a program.
/*!
 * Grounding proceeds in two phases. The first phase computes the atom
 * universe as the least fixpoint of the positive parts of all rules using
 * semi-naive evaluation: in each iteration, a rule is only instantiated for
 * bindings that use at least one atom derived in the previous iteration.
 * Negative literals and aggregates are ignored in this phase. The second phase
 * computes the atoms that are certainly true and then emits one ground rule
 * for each instance, evaluating negative literals and aggregates against the
 * final universe.
 */
class Grounder {
public:
    explicit Grounder(const GrounderOptions& opts = GrounderOptions());

    //! Checks that every variable of every rule of prg is bound by a positive body atom.
    /*!
     * Variables local to an aggregate element or a choice element must be bound
     * by a positive atom of the respective condition.
     * \throw UnsafeVariable for the first rule containing an unbound variable.
     */
    static void checkSafety(const Program& prg);

    //! Grounds the given program.
    /*!
     * \param prg The program to ground.
     * \param h Optional handler for progress events.
     * \throw UnsafeVariable if prg contains an unsafe rule.
     * \throw TypeMismatch if an operation is applied to operands of incompatible types.
     * \throw GroundingLimit if the universe grows beyond the configured atom limit.
     */
    GroundProgram ground(const Program& prg, EventHandler* h = nullptr);

    [[nodiscard]] const GrounderOptions& options() const noexcept { return opts_; }

private:
    struct RuleData;
    struct Context;
    GrounderOptions opts_;
};

//@}
} // namespace Aspect
