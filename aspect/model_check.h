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

/*!
 * \file
 * \brief Verification of answer sets.
 */
namespace Aspect {
/*!
 * \addtogroup solver
 */
//@{

//! Checks whether a total assignment is an answer set of a ground program.
/*!
 * Given a candidate set M of true atoms, the checker first verifies that M
 * satisfies every rule of the program. It then computes the least fixpoint D
 * of the reduct of the program w.r.t. M where a disjunctive rule may only
 * derive an atom a if a is the only head atom contained in M. Aggregates that
 * are monotone are evaluated over D, all others over M. If D equals M, M is an
 * answer set. Otherwise, M may still be an answer set if some disjunctive rule
 * has more than one true head atom. In that case, M is accepted iff the reduct
 * has no model that is a proper subset of M.
 */
class ModelChecker {
public:
    explicit ModelChecker(const GroundProgram& prg);

    //! Returns true if the atoms a with vals[a] == value_true form an answer set.
    /*!
     * \pre vals.size() == program().numAtoms() and no atom is value_free.
     */
    [[nodiscard]] bool isStable(const std::vector<Val_t>& vals);

    //! Returns true if the true atoms of vals satisfy all rules of the program.
    [[nodiscard]] bool isModel(const std::vector<Val_t>& vals) const;

    [[nodiscard]] const GroundProgram& program() const noexcept { return *prg_; }
    //! Number of candidates for which the minimality check was necessary.
    [[nodiscard]] uint64_t             minimalityChecks() const noexcept { return minChecks_; }

private:
    //! Computes the fixpoint D into derived_ and returns its size.
    uint32_t              fixpoint(const std::vector<Val_t>& vals);
    [[nodiscard]] bool    hasProperSubModel(const std::vector<Val_t>& vals) const;
    [[nodiscard]] bool    bodyHolds(const GroundRule& r, const std::vector<Val_t>& vals) const;

    const GroundProgram*               prg_;
    std::vector<std::vector<uint32_t>> posWatch_; // atom -> rules with atom in positive body
    std::vector<std::vector<uint32_t>> aggWatch_; // atom -> rules with atom in a monotone body aggregate
    std::vector<uint32_t>              missing_;  // rule -> number of positive body atoms not yet derived
    std::vector<uint8_t>               derived_;
    uint64_t                           minChecks_{0};
};

//@}
} // namespace Aspect
