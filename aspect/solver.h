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

#include <aspect/model_check.h>
#include <aspect/solver_types.h>
#include <aspect/util/timer.h>

#include <atomic>

/*!
 * \file
 * \brief A trail-based backtracking solver for ground programs.
 */
namespace Aspect {
/*!
 * \addtogroup solver
 */
//@{

//! Searches for answer sets of a ground program.
/*!
 * The solver maintains a partial assignment of truth values to the atoms of
 * the program together with a trail recording the order in which atoms were
 * assigned. Each decision opens a new decision level. Propagation derives
 * consequences from the rules of the program:
 *  - forward: a rule whose body is true forces its head,
 *  - backward: a rule whose head is false forces its body to become false,
 *  - support: an atom without any rule that may still derive it is false, and
 *    a true atom with exactly one such rule forces the body of that rule.
 *
 * Once all atoms are assigned, the assignment is verified by a ModelChecker.
 * Conflicts and rejected assignments are resolved by chronological
 * backtracking: the most recent decision that was not yet flipped is flipped.
 *
 * Decisions are made in a fixed order: atoms occurring in choice heads come
 * first, then all other atoms, each group ordered lexically by predicate name
 * and arguments. The decision value is given by SolveOptions::signFirst.
 */
class Solver {
public:
    /*!
     * \param prg The ground program to solve. Must outlive the solver.
     * \param opts Options for solving.
     * \param id Id of this solver. Solvers with id > 0 use a different tie-break
     *           among atoms of the same rank.
     */
    explicit Solver(const GroundProgram& prg, const SolveOptions& opts = SolveOptions(), uint32_t id = 0);
    Solver(const Solver&)            = delete;
    Solver& operator=(const Solver&) = delete;

    //! Searches for up to options().numModels answer sets.
    /*!
     * Each answer set is passed to h (if any). The search stops once the
     * requested number of models is found, h returns false, the search space
     * is exhausted, or a limit is reached.
     *
     * \return res_sat if at least one model was found, res_unsat if the
     *         program is inconsistent, and res_unknown if a limit was hit before
     *         a model was found.
     */
    SolveResult solve(ModelHandler* h = nullptr);

    //! Requests termination of an active search. The search stops at its next poll point.
    void interrupt() { stop_.store(true); }
    //! Uses the given flag for cooperative cancellation instead of the solver's own flag.
    void setStopFlag(std::atomic<bool>* flag) { extStop_ = flag; }

    [[nodiscard]] const GroundProgram& program() const noexcept { return *prg_; }
    [[nodiscard]] const SolveOptions&  options() const noexcept { return opts_; }
    [[nodiscard]] uint32_t             id() const noexcept { return id_; }
    [[nodiscard]] Val_t                value(Atom_t a) const { return vals_[a]; }
    [[nodiscard]] bool                 isTrue(Atom_t a) const { return vals_[a] == value_true; }
    [[nodiscard]] uint32_t             decisionLevel() const { return size32(levels_); }
    [[nodiscard]] uint32_t             numAssigned() const { return size32(trail_); }
    //! Returns true if a occurs in the head of some choice rule.
    [[nodiscard]] bool                 isChoiceAtom(Atom_t a) const { return choice_[a] != 0; }
    //! The decision order of this solver.
    [[nodiscard]] const AtomVec&       order() const noexcept { return order_; }
    //! The last model found.
    [[nodiscard]] const Model&         model() const noexcept { return model_; }
    [[nodiscard]] const SolverStats&   stats() const noexcept { return stats_; }

private:
    struct Level {
        uint32_t trailPos; // trail position of the decision
        uint32_t cursor;   // position in order_ where the decision was found
        bool     flipped;  // decision was already flipped
    };
    enum class Stop { none, limit, interrupt };
    void                  init();
    void                  reset();
    bool                  assign(Atom_t a, Val_t v);
    void                  enqueueRule(uint32_t r);
    void                  enqueueAtom(Atom_t a);
    bool                  propagate();
    bool                  checkRule(uint32_t r);
    bool                  checkSupport(Atom_t a);
    bool                  falsifyBody(const GroundRule& r);
    bool                  makeBodyTrue(const GroundRule& r);
    [[nodiscard]] Val_t   bodyValue(const GroundRule& r) const;
    [[nodiscard]] Val_t   aggValue(uint32_t agg) const;
    [[nodiscard]] bool    supports(uint32_t r, Atom_t a) const;
    bool                  decide();
    bool                  backtrack();
    void                  undoUntil(uint32_t trailPos);
    [[nodiscard]] Stop    checkStop(const Timer<RealTime>& t) const;
    [[nodiscard]] uint64_t steps() const { return stats_.choices + stats_.conflicts; }

    const GroundProgram*               prg_;
    SolveOptions                       opts_;
    uint32_t                           id_;
    ModelChecker                       checker_;
    std::vector<Val_t>                 vals_;
    AtomVec                            trail_;
    std::vector<Level>                 levels_;
    uint32_t                           front_{0};  // next trail position to propagate
    uint32_t                           cursor_{0}; // first position in order_ that may be free
    AtomVec                            order_;
    std::vector<uint8_t>               choice_;
    std::vector<std::vector<uint32_t>> occurs_;   // atom -> rules with atom in body or head
    std::vector<std::vector<uint32_t>> heads_;    // atom -> rules with atom in head
    std::vector<std::vector<uint32_t>> inAggs_;   // atom -> aggregates containing atom
    std::vector<std::vector<uint32_t>> aggRules_; // aggregate -> rules with aggregate in body
    std::vector<uint32_t>              ruleQ_;
    AtomVec                            atomQ_;
    std::vector<uint8_t>               ruleInQ_;
    std::vector<uint8_t>               atomInQ_;
    std::atomic<bool>                  stop_{false};
    std::atomic<bool>*                 extStop_{nullptr};
    Model                              model_;
    SolverStats                        stats_;
};

//@}
} // namespace Aspect
