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
#include <aspect/mt/parallel_solve.h>

#include <aspect/mt/thread.h>

#include <potassco/error.h>

#include <exception>

namespace Aspect::mt {
/////////////////////////////////////////////////////////////////////////////////////////
// ParallelSolve::SharedData
/////////////////////////////////////////////////////////////////////////////////////////
struct ParallelSolve::SharedData {
    explicit SharedData(const GroundProgram& p, const SolveOptions& o) : prg(&p), opts(o) {}
    void reset() {
        stop.store(false);
        interrupted.store(false);
        winner = UINT32_MAX;
    }
    const GroundProgram* prg;
    SolveOptions         opts;
    mutex                lock;        // protects winner
    std::atomic<bool>    stop{false}; // shared cancellation flag of all solvers
    std::atomic<bool>    interrupted{false};
    uint32_t             winner{UINT32_MAX};
};
/////////////////////////////////////////////////////////////////////////////////////////
// ParallelSolve::ThreadData
/////////////////////////////////////////////////////////////////////////////////////////
// Stores the models of one solver until the winner is known.
struct ParallelSolve::ThreadData : ModelHandler {
    ThreadData(const GroundProgram& prg, const SolveOptions& opts, uint32_t id) : solver(prg, opts, id) {}
    bool onModel(const Solver&, const Model& m) override {
        models.push_back(m);
        return true;
    }
    Solver             solver;
    std::vector<Model> models;
    SolveResult        result;
    std::exception_ptr error;
};
/////////////////////////////////////////////////////////////////////////////////////////
// ParallelSolve
/////////////////////////////////////////////////////////////////////////////////////////
ParallelSolve::ParallelSolve(const GroundProgram& prg, const SolveOptions& opts)
    : shared_(std::make_unique<SharedData>(prg, opts)) {
    uint32_t n = std::max(opts.threads, 1u);
#if !ASPECT_HAS_THREADS
    n = 1;
#endif
    for (auto id : irange(n)) {
        thread_.push_back(std::make_unique<ThreadData>(prg, opts, id));
        thread_.back()->solver.setStopFlag(&shared_->stop);
    }
}
ParallelSolve::~ParallelSolve() = default;

uint32_t      ParallelSolve::numThreads() const { return size32(thread_); }
uint32_t      ParallelSolve::winner() const { return shared_->winner; }
const Solver& ParallelSolve::solver(uint32_t id) const {
    POTASSCO_CHECK_PRE(id < numThreads(), "invalid solver id");
    return thread_[id]->solver;
}
SolverStats ParallelSolve::stats() const {
    SolverStats res;
    for (const auto& t : thread_) { res.accu(t->solver.stats()); }
    return res;
}

void ParallelSolve::interrupt() {
    shared_->interrupted.store(true);
    shared_->stop.store(true);
}

// Returns true if the solver with the given id is the first to reach a definite result.
bool ParallelSolve::terminate(uint32_t id) {
    const auto& t      = *thread_[id];
    auto        wanted = shared_->opts.numModels;
    bool        done   = t.result.exhausted() || (wanted != 0 && t.solver.stats().models >= wanted);
    if (not done || t.result.interrupted()) {
        return false;
    }
    lock_guard<mutex> guard(shared_->lock);
    if (shared_->winner != UINT32_MAX) {
        return false;
    }
    shared_->winner = id;
    shared_->stop.store(true);
    return true;
}

void ParallelSolve::solveThread(uint32_t id, ModelHandler* direct) {
    auto& t = *thread_[id];
    t.models.clear();
    t.error = nullptr;
    try {
        t.result = t.solver.solve(direct ? direct : &t);
        terminate(id);
    }
    catch (...) {
        t.error = std::current_exception();
        shared_->stop.store(true);
    }
}

SolveResult ParallelSolve::solve(ModelHandler* h) {
    auto* eh = dynamic_cast<EventHandler*>(h);
    shared_->reset();
#if ASPECT_HAS_THREADS
    if (numThreads() > 1) {
        log(eh, Event::subsystem_solve, Event::verbosity_high, nullptr, "portfolio: starting %u solvers", numThreads());
        std::vector<thread> threads;
        threads.reserve(numThreads());
        for (auto id : irange(numThreads())) { threads.emplace_back(&ParallelSolve::solveThread, this, id, nullptr); }
        for (auto& th : threads) { th.join(); }
    }
    else
#endif
    {
        // a single solver reports its models as they are found
        solveThread(0, h);
    }
    for (const auto& t : thread_) {
        if (t->error) {
            std::rethrow_exception(t->error);
        }
    }
    if (shared_->winner == UINT32_MAX) {
        // no definite result: prefer a solver that found a model
        for (auto id : irange(numThreads())) {
            if (thread_[id]->result.sat() || shared_->winner == UINT32_MAX) {
                shared_->winner = id;
                if (thread_[id]->result.sat()) {
                    break;
                }
            }
        }
    }
    auto& win = *thread_[shared_->winner];
    log(eh, Event::subsystem_solve, Event::verbosity_low, &win.solver, "portfolio: solver %u wins with %s",
        shared_->winner, toString(win.result));
    if (h && numThreads() > 1) {
        for (const auto& m : win.models) {
            if (not h->onModel(win.solver, m)) {
                break;
            }
        }
    }
    SolveResult res = win.result;
    if (shared_->interrupted.load()) {
        res.flags |= SolveResult::ext_interrupt;
    }
    return res;
}

} // namespace Aspect::mt
