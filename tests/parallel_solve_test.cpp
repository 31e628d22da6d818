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
#include "test_programs.h"

#include <aspect/grounder.h>
#include <aspect/model_check.h>
#include <aspect/mt/parallel_solve.h>

#include <catch2/catch_test_macros.hpp>

namespace Aspect::Test {
static constexpr uint32_t expectedThreads(uint32_t n) { return ASPECT_HAS_THREADS ? n : 1u; }

static bool isStable(const GroundProgram& g, const Model& m) {
    ModelChecker       mc(g);
    std::vector<Val_t> vals(g.numAtoms(), value_false);
    for (auto a : m.atoms) { vals[a] = value_true; }
    return mc.isStable(vals);
}

TEST_CASE("Parallel solve", "[solver]") {
    auto coloring = Grounder().ground(
        coloringProgram(8, {{1, 2}, {2, 3}, {3, 4}, {4, 5}, {5, 6}, {6, 7}, {7, 8}, {8, 1}, {1, 5}, {2, 6}}, 3));
    SolveOptions opts;
    SECTION("single solver") {
        mt::ParallelSolve ps(coloring, opts);
        REQUIRE(ps.numThreads() == 1);
        ModelList models;
        auto      res = ps.solve(&models);
        REQUIRE(res.sat());
        REQUIRE(ps.winner() == 0);
        REQUIRE(models.models.size() == 1);
        Solver s(coloring, opts);
        REQUIRE(s.solve().sat());
        REQUIRE(models.models.front() == s.model().toString());
    }
    SECTION("portfolio finds a model") {
        opts.threads = 4;
        mt::ParallelSolve ps(coloring, opts);
        REQUIRE(ps.numThreads() == expectedThreads(4));
        for (auto id : irange(ps.numThreads())) { REQUIRE(ps.solver(id).id() == id); }
        struct Check : ModelHandler {
            bool onModel(const Solver& s, const Model& m) override {
                ids.push_back(s.id());
                models.push_back(m);
                return true;
            }
            std::vector<uint32_t> ids;
            std::vector<Model>    models;
        } h;
        auto res = ps.solve(&h);
        REQUIRE(res.sat());
        REQUIRE(ps.winner() < ps.numThreads());
        REQUIRE(h.models.size() == 1);
        REQUIRE(h.ids.front() == ps.winner());
        REQUIRE(h.models.front().sId == ps.winner());
        REQUIRE(isStable(coloring, h.models.front()));
        REQUIRE(ps.stats().models >= 1);
        REQUIRE(ps.stats().choices >= ps.solver(ps.winner()).stats().choices);
    }
    SECTION("portfolio enumerates all models") {
        auto g         = Grounder().ground(coloringProgram(4, {{1, 2}, {2, 3}, {3, 4}}, 2));
        opts.numModels = 0;
        Solver    single(g, opts);
        ModelList expected;
        REQUIRE(single.solve(&expected).exhausted());
        opts.threads = 3;
        mt::ParallelSolve ps(g, opts);
        ModelList         models;
        auto              res = ps.solve(&models);
        REQUIRE(res.sat());
        REQUIRE(res.exhausted());
        REQUIRE(models.sorted() == expected.sorted());
        REQUIRE(models.models.size() == 2);
    }
    SECTION("portfolio detects inconsistency") {
        auto g       = Grounder().ground(coloringProgram(4, {{1, 2}, {2, 3}, {3, 1}, {3, 4}}, 2));
        opts.threads = 4;
        mt::ParallelSolve ps(g, opts);
        ModelList         models;
        auto              res = ps.solve(&models);
        REQUIRE(res.unsat());
        REQUIRE(res.exhausted());
        REQUIRE(models.models.empty());
    }
    SECTION("solve can be repeated") {
        opts.threads = 2;
        mt::ParallelSolve ps(coloring, opts);
        REQUIRE(ps.solve().sat());
        REQUIRE(ps.solve().sat());
        REQUIRE(ps.winner() < ps.numThreads());
    }
    SECTION("limits apply to every solver") {
        auto g       = Grounder().ground(sudokuProgram(Grid(9, std::vector<int32_t>(9, 0))));
        opts.threads = 2;
        opts.limits  = SolveLimits(0);
        mt::ParallelSolve ps(g, opts);
        auto              res = ps.solve();
        REQUIRE(res.unknown());
        REQUIRE_FALSE(res.exhausted());
    }
    SECTION("interrupt") {
        opts.numModels = 0;
        mt::ParallelSolve ps(coloring, opts);
        struct Interrupt : ModelHandler {
            explicit Interrupt(mt::ParallelSolve& p) : ps(&p) {}
            bool onModel(const Solver&, const Model&) override {
                ++seen;
                ps->interrupt();
                return true;
            }
            mt::ParallelSolve* ps;
            int                seen = 0;
        } h(ps);
        auto res = ps.solve(&h);
        REQUIRE(res.sat());
        REQUIRE(res.interrupted());
        REQUIRE_FALSE(res.exhausted());
        REQUIRE(h.seen == 1);
    }
    SECTION("logging") {
        opts.threads = 2;
        mt::ParallelSolve ps(coloring, opts);
        LogRecorder       rec;
        REQUIRE(ps.solve(&rec).sat());
        REQUIRE(rec.contains("portfolio: solver"));
    }
}

} // namespace Aspect::Test
