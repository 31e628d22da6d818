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
#include <aspect/facade.h>

#include <aspect/mt/parallel_solve.h>

#include <potassco/error.h>

#include <iomanip>
#include <ostream>

namespace Aspect {
/////////////////////////////////////////////////////////////////////////////////////////
// AspectFacade::ModelCollector
/////////////////////////////////////////////////////////////////////////////////////////
// Stores models in the facade and forwards events and models to an optional user handler.
class AspectFacade::ModelCollector : public EventHandler {
public:
    ModelCollector(AspectFacade& f, EventHandler* user) : self_(&f), user_(user) {
        if (user) {
            for (auto sys : {Event::subsystem_facade, Event::subsystem_ground, Event::subsystem_solve,
                             Event::subsystem_project}) {
                setVerbosity(sys, static_cast<Event::Verbosity>(user->verbosity(sys)));
            }
        }
    }
    void onEvent(const Event& ev) override {
        if (user_) {
            user_->dispatch(ev);
        }
    }
    bool onModel(const Solver& s, const Model& m) override {
        self_->models_.push_back(m);
        return not user_ || user_->onModel(s, m);
    }

private:
    AspectFacade* self_;
    EventHandler* user_;
};
/////////////////////////////////////////////////////////////////////////////////////////
// AspectFacade
/////////////////////////////////////////////////////////////////////////////////////////
AspectFacade::AspectFacade(const AspectConfig& config) : config_(config) {}
AspectFacade::~AspectFacade() = default;

const GroundProgram& AspectFacade::program() const {
    POTASSCO_CHECK_PRE(grounded(), "no ground program");
    return *ground_;
}

const GroundProgram& AspectFacade::ground(const Program& prg, EventHandler* h) {
    solve_.reset();
    ground_.reset();
    models_.clear();
    summary_ = Summary();
    cpu_.start();
    Timer<RealTime> timer;
    timer.start();
    log(h, Event::subsystem_facade, Event::verbosity_low, nullptr, "grounding %u rules and %u facts", prg.numRules(),
        size32(prg.facts()));
    Grounder grounder(config_.ground);
    ground_ = std::make_unique<GroundProgram>(grounder.ground(prg, h));
    solve_  = std::make_unique<mt::ParallelSolve>(*ground_, config_.solve);
    timer.stop();
    summary_.groundTime = timer.elapsed();
    summary_.totalTime  = timer.elapsed();
    summary_.ground     = ground_->stats();
    summary_.threads    = solve_->numThreads();
    summary_.cpuTime    = cpu_.current();
    return *ground_;
}

SolveResult AspectFacade::solve(EventHandler* h) {
    POTASSCO_CHECK_PRE(grounded(), "program must be grounded before solving");
    models_.clear();
    ModelCollector  collector(*this, h);
    Timer<RealTime> timer;
    timer.start();
    log(&collector, Event::subsystem_facade, Event::verbosity_low, nullptr, "solving with %u solver(s)",
        solve_->numThreads());
    auto res = solve_->solve(&collector);
    timer.stop();
    summary_.result     = res;
    summary_.solveTime  = timer.elapsed();
    summary_.totalTime += timer.elapsed();
    summary_.numModels  = models_.size();
    summary_.winner     = solve_->winner();
    summary_.solve      = solve_->stats();
    summary_.cpuTime    = cpu_.current();
    log(&collector, Event::subsystem_facade, Event::verbosity_low, nullptr, "%s: %u model(s) in %.3fs", toString(res),
        size32(models_), summary_.solveTime);
    return res;
}

Projection AspectFacade::project(const OutputSpecification& spec, EventHandler* h) { return projectModel(0, spec, h); }

Projection AspectFacade::projectModel(uint32_t i, const OutputSpecification& spec, EventHandler* h) {
    POTASSCO_CHECK_PRE(i < models_.size(), "no answer set to project");
    Timer<RealTime> timer;
    timer.start();
    Projector projector(*ground_, spec);
    auto      res = projector.project(models_[i], h);
    timer.stop();
    summary_.projectTime  = timer.elapsed();
    summary_.totalTime   += timer.elapsed();
    summary_.cpuTime      = cpu_.current();
    return res;
}

std::optional<Projection> AspectFacade::solveOne(const Program& prg, const OutputSpecification& spec,
                                                 EventHandler* h) {
    ground(prg, h);
    // report errors in the output specification before searching
    Projector projector(*ground_, spec);
    if (solve(h); models_.empty()) {
        return std::nullopt;
    }
    Timer<RealTime> timer;
    timer.start();
    auto res = projector.project(models_.front(), h);
    timer.stop();
    summary_.projectTime  = timer.elapsed();
    summary_.totalTime   += timer.elapsed();
    return res;
}

void AspectFacade::interrupt() {
    if (solve_) {
        solve_->interrupt();
    }
}

void AspectFacade::Summary::print(std::ostream& os) const {
    auto flags = os.flags();
    os << std::fixed << std::setprecision(3);
    os << "Result      : " << toString(result) << '\n';
    os << "Models      : " << numModels << (complete() || numModels == 0 ? "" : "+") << '\n';
    os << "Threads     : " << threads << " (Winner: " << winner << ")\n";
    os << "Atoms       : " << ground.atoms << " (Facts: " << ground.facts << ")\n";
    os << "Rules       : " << ground.rules << " (Iterations: " << ground.iterations << ")\n";
    os << "Choices     : " << solve.choices << '\n';
    os << "Conflicts   : " << solve.conflicts << " (Rejected: " << solve.rejected << ")\n";
    os << "Time        : " << totalTime << "s (Ground: " << groundTime << "s Solve: " << solveTime
       << "s Project: " << projectTime << "s)\n";
    os << "CPU Time    : " << cpuTime << "s\n";
    os.flags(flags);
}

} // namespace Aspect
