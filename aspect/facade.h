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

#include <aspect/grounder.h>
#include <aspect/projector.h>
#include <aspect/util/timer.h>

#include <memory>
#include <optional>

/*!
 * \file
 * \brief High-level API driving grounding, solving, and projection.
 */
namespace Aspect {
/*!
 * \defgroup facade Facade
 * \brief Simplified interface for the whole pipeline.
 */
//@{

//! Configuration of an AspectFacade.
struct AspectConfig {
    GrounderOptions ground; //!< Options for the grounder.
    SolveOptions    solve;  //!< Options for the solver (portfolio).
};

//! Provides a simplified interface to the pipeline ground, solve, and project.
/*!
 * Usage:
 * \code
 * AspectFacade f;
 * f.ground(program);
 * if (f.solve().sat()) {
 *     auto out = f.project(spec);
 * }
 * \endcode
 */
class AspectFacade {
public:
    //! Statistics and timing of the last run.
    struct Summary {
        [[nodiscard]] bool sat() const { return result.sat(); }
        [[nodiscard]] bool unsat() const { return result.unsat(); }
        [[nodiscard]] bool complete() const { return result.exhausted(); }
        //! Writes a human-readable summary.
        void               print(std::ostream& os) const;

        double      groundTime{0.0};  //!< Wall clock time for grounding.
        double      solveTime{0.0};   //!< Wall clock time for solving.
        double      projectTime{0.0}; //!< Wall clock time for projection.
        double      totalTime{0.0};   //!< Total wall clock time.
        double      cpuTime{0.0};     //!< Total cpu time.
        uint64_t    numModels{0};     //!< Models found by the last solve call.
        uint32_t    winner{0};        //!< Id of the solver that produced the result.
        uint32_t    threads{1};       //!< Number of solvers.
        SolveResult result;           //!< Result of the last solve call.
        GroundStats ground;           //!< Statistics of the grounder.
        SolverStats solve;            //!< Statistics accumulated over all solvers.
    };

    explicit AspectFacade(const AspectConfig& config = AspectConfig());
    ~AspectFacade();
    AspectFacade(const AspectFacade&)            = delete;
    AspectFacade& operator=(const AspectFacade&) = delete;

    //! Grounds the given program and prepares it for solving.
    /*!
     * Any previous ground program and models are discarded.
     * \throw UnsafeVariable, TypeMismatch, GroundingLimit
     */
    const GroundProgram& ground(const Program& prg, EventHandler* h = nullptr);
    //! Searches for answer sets of the ground program.
    /*!
     * Found answer sets are stored and also passed to h (if any).
     * \pre grounded()
     * \return The result of the search. An inconsistent program yields a
     *         result with unsat() set.
     */
    SolveResult          solve(EventHandler* h = nullptr);
    //! Evaluates spec over the first answer set found by the last call to solve().
    /*!
     * \pre not models().empty()
     */
    [[nodiscard]] Projection project(const OutputSpecification& spec, EventHandler* h = nullptr);
    //! Evaluates spec over the i-th answer set found by the last call to solve().
    /*!
     * \pre i < models().size()
     */
    [[nodiscard]] Projection projectModel(uint32_t i, const OutputSpecification& spec, EventHandler* h = nullptr);
    //! Grounds and solves prg and projects its first answer set.
    /*!
     * \return The projection or an empty optional if prg has no answer set
     *         (or no answer set was found within the configured limits).
     */
    std::optional<Projection> solveOne(const Program& prg, const OutputSpecification& spec, EventHandler* h = nullptr);

    //! Requests termination of an active solve call. Can be called from any thread.
    void interrupt();

    [[nodiscard]] bool                      grounded() const { return ground_ != nullptr; }
    [[nodiscard]] const GroundProgram&      program() const;
    //! Answer sets found by the last call to solve().
    [[nodiscard]] const std::vector<Model>& models() const noexcept { return models_; }
    [[nodiscard]] SolveResult               result() const noexcept { return summary_.result; }
    [[nodiscard]] const Summary&            summary() const noexcept { return summary_; }
    [[nodiscard]] const AspectConfig&       config() const noexcept { return config_; }

private:
    class ModelCollector;
    AspectConfig                       config_;
    std::unique_ptr<GroundProgram>     ground_;
    std::unique_ptr<mt::ParallelSolve> solve_;
    std::vector<Model>                 models_;
    Summary                            summary_;
    Timer<ProcessTime>                 cpu_;
};

//@}
} // namespace Aspect
