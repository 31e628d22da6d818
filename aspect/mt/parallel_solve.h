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

#include <aspect/solver.h>

#include <memory>

/*!
 * \file
 * \brief Defines a portfolio of solvers competing on separate threads.
 */
namespace Aspect::mt {
/*!
 * \addtogroup solver
 */
//@{

//! A parallel algorithm that runs competing solvers in a portfolio.
/*!
 * The portfolio creates SolveOptions::threads solvers over the same (read-only)
 * ground program. Solver i uses tie-break variant i, i.e. solver 0 uses the
 * default decision order. Each solver runs on its own thread and owns its
 * assignment exclusively. The first solver that reaches a definite result
 * (the requested number of models or an exhausted search space) becomes the
 * winner and cancels all other solvers at their next poll point.
 *
 * With more than one solver, models of the winner are reported to the model
 * handler on the calling thread once all threads are joined. A single solver
 * runs on the calling thread and reports its models as they are found.
 * Without thread support, the portfolio degenerates to solver 0.
 */
class ParallelSolve {
public:
    explicit ParallelSolve(const GroundProgram& prg, const SolveOptions& opts = SolveOptions());
    ~ParallelSolve();
    ParallelSolve(ParallelSolve&&) = delete;

    //! Runs all solvers and returns the result of the winner.
    /*!
     * If no solver reaches a definite result, the result of the first solver
     * that found a model (if any) is returned.
     * \throws Any exception raised in one of the solver threads.
     */
    SolveResult solve(ModelHandler* h = nullptr);
    //! Cancels all active solvers.
    void        interrupt();

    [[nodiscard]] uint32_t      numThreads() const;
    //! Id of the solver whose result was returned by the last call to solve() or UINT32_MAX.
    [[nodiscard]] uint32_t      winner() const;
    [[nodiscard]] const Solver& solver(uint32_t id) const;
    //! Statistics accumulated over all solvers.
    [[nodiscard]] SolverStats   stats() const;

private:
    struct SharedData;
    struct ThreadData;
    void solveThread(uint32_t id, ModelHandler* direct);
    bool terminate(uint32_t id);

    std::unique_ptr<SharedData>              shared_;
    std::vector<std::unique_ptr<ThreadData>> thread_;
};

//@}
} // namespace Aspect::mt
