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

#include <aspect/aspectfwd.h>
#include <aspect/ground_program.h>
#include <aspect/util/misc_types.h>

#include <potassco/bits.h>
#include <potassco/platform.h>

#include <algorithm>
#include <cstdint>
#include <iosfwd>

/*!
 * \file
 * \brief Types shared between the solver, the portfolio, and the facade.
 */
namespace Aspect {
/*!
 * \defgroup solver Solver
 * \brief Search for answer sets of a ground program.
 */
//@{

//! An answer set of a ground program.
/*!
 * A model references the ground program it belongs to. It is only valid as
 * long as this program is alive.
 */
struct Model {
    //! Returns true if atom a is contained in the answer set.
    [[nodiscard]] bool isTrue(Atom_t a) const {
        return std::binary_search(atoms.begin(), atoms.end(), a);
    }
    //! Returns true if the atom name(args) is contained in the answer set.
    [[nodiscard]] bool contains(std::string_view name, const SymVec& args) const;
    //! Returns the true atoms of the given predicate in lexical order.
    [[nodiscard]] std::vector<SymVec> atomsOf(std::string_view name, uint32_t arity) const;
    [[nodiscard]] uint32_t            size() const { return size32(atoms); }
    //! Writes the model as a space-separated list of atoms in lexical order.
    void                              print(std::ostream& os) const;
    [[nodiscard]] std::string         toString() const;

    const GroundProgram* prg{nullptr}; //!< The program this model belongs to.
    AtomVec              atoms;        //!< True atoms sorted by id.
    uint64_t             num{0};       //!< Number of this model (starting at 1).
    uint32_t             sId{0};       //!< Id of the solver that found this model.
};

//! Base class for handling results of a solve operation.
class ModelHandler {
public:
    virtual ~ModelHandler();
    //! Called for each model. Returning false stops the search.
    virtual bool onModel(const Solver&, const Model&) = 0;
};

//! Base class for event handlers.
class EventHandler : public ModelHandler {
public:
    //! Creates a handler for events with given verbosity or lower.
    explicit EventHandler(Event::Verbosity verbosity = Event::verbosity_quiet);
    EventHandler(const EventHandler&)            = delete;
    EventHandler& operator=(const EventHandler&) = delete;

    //! Sets the verbosity for the given event source.
    /*!
     * Events with higher verbosity are not dispatched to this handler.
     */
    void                   setVerbosity(Event::Subsystem sys, Event::Verbosity verb);
    [[nodiscard]] uint32_t verbosity(Event::Subsystem sys) const {
        return (static_cast<uint32_t>(verb_) >> (static_cast<uint32_t>(sys) << verb_shift)) & verb_mask;
    }
    //! Calls onEvent(ev) if ev has acceptable verbosity.
    void dispatch(const Event& ev) {
        if (ev.verb <= verbosity(static_cast<Event::Subsystem>(ev.system))) {
            onEvent(ev);
        }
    }
    virtual void onEvent(const Event& /* ev */) {}
    bool         onModel(const Solver&, const Model&) override { return true; }

private:
    static constexpr auto verb_mask  = 15u;
    static constexpr auto verb_shift = 2u;

    uint16_t verb_;
};

//! Event type for log or warning messages.
struct LogEvent : Event {
    enum Type { message = 'M', warning = 'W' };
    LogEvent(Subsystem sys, Verbosity v, Type t, const Solver* s, const char* what)
        : Event(this, sys, v)
        , solver(s)
        , msg(what) {
        op = static_cast<uint32_t>(t);
    }
    [[nodiscard]] bool isWarning() const { return op == static_cast<uint32_t>(warning); }
    const Solver*      solver;
    const char*        msg;
};

//! Formats a message and dispatches it as LogEvent to h (if any).
void log(EventHandler* h, Event::Subsystem sys, Event::Verbosity v, const Solver* s, const char* fmt, ...)
    POTASSCO_ATTRIBUTE_FORMAT(5, 6);

//! Result of a solve operation.
struct SolveResult {
    //! Possible solving results.
    enum Res {
        res_unknown = 0, //!< Satisfiability unknown - a given solve limit was hit.
        res_sat     = 1, //!< Problem is satisfiable (a model was found).
        res_unsat   = 2, //!< Problem is unsatisfiable (Inconsistent).
    };
    //! Additional flags applicable to a solve result.
    enum Ext {
        ext_exhaust   = 4, //!< Search space is exhausted.
        ext_interrupt = 8, //!< The run was interrupted from outside.
    };
    [[nodiscard]] constexpr bool sat() const { return Potassco::test_any(flags, res_sat); }
    [[nodiscard]] constexpr bool unsat() const { return Potassco::test_any(flags, res_unsat); }
    [[nodiscard]] constexpr bool unknown() const { return static_cast<Res>(*this) == res_unknown; }
    [[nodiscard]] constexpr bool exhausted() const { return Potassco::test_any(flags, ext_exhaust); }
    [[nodiscard]] constexpr bool interrupted() const { return Potassco::test_any(flags, ext_interrupt); }
    constexpr                    operator Res() const { return static_cast<Res>(flags & 3u); }

    uint8_t flags{0}; //!< Set of Res and Ext flags.
};
const char* toString(SolveResult res);

//! Budget of a solve operation.
struct SolveLimits {
    explicit SolveLimits(uint64_t st = UINT64_MAX, double t = -1.0) : steps(st), time(t) {}
    [[nodiscard]] bool enabled() const { return steps != UINT64_MAX || time >= 0.0; }
    uint64_t           steps; //!< Maximal number of decisions and conflicts.
    double             time;  //!< Maximal wall clock time in seconds or < 0 for no limit.
};

//! Options for solving.
struct SolveOptions {
    uint64_t    numModels{1};    //!< Number of models to compute (0 = all).
    SolveLimits limits;          //!< Budget of the search.
    uint32_t    threads{1};      //!< Number of portfolio threads.
    bool        signFirst{true}; //!< Initial polarity of decisions (true-first).
};

//! Search statistics of one solver.
struct SolverStats {
    void accu(const SolverStats& o);

    uint64_t choices{0};      //!< Number of decisions.
    uint64_t conflicts{0};    //!< Number of conflicts (including rejected candidates).
    uint64_t propagations{0}; //!< Number of atoms assigned by propagation.
    uint64_t models{0};       //!< Number of models found.
    uint64_t rejected{0};     //!< Number of total assignments failing the stable model check.
    uint32_t maxLevel{0};     //!< Maximal decision level.
};

//@}
} // namespace Aspect
