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
#include <aspect/solver_types.h>

#include <aspect/atom_table.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <iterator>
#include <ostream>
#include <sstream>

namespace Aspect {
/////////////////////////////////////////////////////////////////////////////////////////
// Events
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t Event::nextId() {
    static uint32_t id_s = 0;
    return id_s++;
}
ModelHandler::~ModelHandler() = default;
EventHandler::EventHandler(Event::Verbosity verbosity) : verb_(0) {
    if (uint32_t x = verbosity) {
        uint32_t r = (x | (x << 4) | (x << 8) | (x << 12));
        verb_      = static_cast<uint16_t>(r);
    }
}
void EventHandler::setVerbosity(Event::Subsystem sys, Event::Verbosity verb) {
    uint32_t s = static_cast<uint32_t>(sys) << verb_shift;
    uint32_t r = verb_;
    Potassco::store_clear_mask(r, verb_mask << s);
    Potassco::store_set_mask(r, static_cast<uint32_t>(verb) << s);
    verb_ = static_cast<uint16_t>(r);
}
POTASSCO_ATTRIBUTE_FORMAT(5, 6)
void log(EventHandler* h, Event::Subsystem sys, Event::Verbosity v, const Solver* s, const char* fmt, ...) {
    if (h && fmt && *fmt && v <= h->verbosity(sys)) {
        va_list args;
        va_start(args, fmt);
        char msg[1024];
        std::vsnprintf(msg, std::size(msg), fmt, args);
        va_end(args);
        h->dispatch(LogEvent(sys, v, LogEvent::message, s, msg));
    }
}
/////////////////////////////////////////////////////////////////////////////////////////
// Results and statistics
/////////////////////////////////////////////////////////////////////////////////////////
const char* toString(SolveResult res) {
    switch (static_cast<SolveResult::Res>(res)) {
        case SolveResult::res_sat  : return "SATISFIABLE";
        case SolveResult::res_unsat: return "INCONSISTENT";
        default                    : return res.interrupted() ? "INTERRUPTED" : "UNKNOWN";
    }
}
void SolverStats::accu(const SolverStats& o) {
    choices      += o.choices;
    conflicts    += o.conflicts;
    propagations += o.propagations;
    models       += o.models;
    rejected     += o.rejected;
    maxLevel      = std::max(maxLevel, o.maxLevel);
}
/////////////////////////////////////////////////////////////////////////////////////////
// Model
/////////////////////////////////////////////////////////////////////////////////////////
bool Model::contains(std::string_view name, const SymVec& args) const {
    if (not prg) {
        return false;
    }
    auto a = prg->atoms().find(name, args);
    return a != atom_none && isTrue(a);
}
std::vector<SymVec> Model::atomsOf(std::string_view name, uint32_t arity) const {
    std::vector<SymVec> res;
    if (not prg) {
        return res;
    }
    const auto& tab = prg->atoms();
    auto        p   = tab.findPredicate(name, arity);
    if (p == pred_none) {
        return res;
    }
    AtomVec found;
    for (auto a : tab.atoms(p)) {
        if (isTrue(a)) {
            found.push_back(a);
        }
    }
    std::sort(found.begin(), found.end(), [&](Atom_t x, Atom_t y) { return tab.less(x, y); });
    res.reserve(found.size());
    for (auto a : found) { res.push_back(tab.args(a)); }
    return res;
}
void Model::print(std::ostream& os) const {
    if (not prg) {
        return;
    }
    const auto& tab    = prg->atoms();
    AtomVec     sorted = atoms;
    std::sort(sorted.begin(), sorted.end(), [&](Atom_t x, Atom_t y) { return tab.less(x, y); });
    const char* sep = "";
    for (auto a : sorted) {
        os << sep;
        tab.print(os, a);
        sep = " ";
    }
}
std::string Model::toString() const {
    std::ostringstream str;
    print(str);
    return str.str();
}
} // namespace Aspect
