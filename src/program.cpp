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
#include <aspect/program.h>

#include <potassco/error.h>

#include <ostream>
#include <sstream>

namespace Aspect {

const char* toString(HeadType t) {
    switch (t) {
        case HeadType::constraint : return "constraint";
        case HeadType::normal     : return "normal";
        case HeadType::disjunctive: return "disjunctive";
        case HeadType::choice     : return "choice";
    }
    return "?";
}
/////////////////////////////////////////////////////////////////////////////////////////
// Head and rule
/////////////////////////////////////////////////////////////////////////////////////////
Head Head::normal(Atom a) {
    Head h;
    h.type_ = HeadType::normal;
    h.elems_.push_back({std::move(a), {}});
    return h;
}
Head Head::disjunctive(std::vector<Atom> atoms) {
    POTASSCO_CHECK_PRE(not atoms.empty(), "disjunctive head must not be empty");
    Head h;
    h.type_ = HeadType::disjunctive;
    for (auto& a : atoms) { h.elems_.push_back({std::move(a), {}}); }
    return h;
}
Head Head::choice(std::vector<HeadElement> elems, uint32_t lower, uint32_t upper) {
    POTASSCO_CHECK_PRE(lower <= upper, "invalid choice bounds [%u, %u]", lower, upper);
    Head h;
    h.type_  = HeadType::choice;
    h.elems_ = std::move(elems);
    h.lower_ = lower;
    h.upper_ = upper;
    return h;
}

std::string Rule::toString() const {
    std::ostringstream str;
    str << *this;
    return str.str();
}
std::ostream& operator<<(std::ostream& os, const Rule& r) {
    const auto& h = r.head();
    switch (h.type()) {
        case HeadType::constraint: break;
        case HeadType::normal    : os << h.elements()[0].atom; break;
        case HeadType::disjunctive: {
            const char* sep = "";
            for (const auto& e : h.elements()) {
                os << sep << e.atom;
                sep = " v ";
            }
            break;
        }
        case HeadType::choice: {
            if (h.lower() > 0) {
                os << h.lower() << ' ';
            }
            os << '{';
            const char* sep = "";
            for (const auto& e : h.elements()) {
                os << sep << e.atom;
                if (not e.condition.empty()) {
                    os << ':' << e.condition;
                }
                sep = ";";
            }
            os << '}';
            if (h.upper() != bound_max) {
                os << ' ' << h.upper();
            }
            break;
        }
    }
    if (not r.body().empty() || h.type() == HeadType::constraint) {
        os << (h.type() == HeadType::constraint ? ":- " : " :- ");
        const char* sep = "";
        for (const auto& lit : r.body()) {
            os << sep << lit;
            sep = ", ";
        }
    }
    return os << '.';
}
/////////////////////////////////////////////////////////////////////////////////////////
// RuleBuilder
/////////////////////////////////////////////////////////////////////////////////////////
RuleBuilder& RuleBuilder::start(HeadType t) {
    type_ = t;
    head_.clear();
    body_.clear();
    lower_ = 0;
    upper_ = bound_max;
    return *this;
}
RuleBuilder& RuleBuilder::addHead(Atom a, CondVec cond) {
    POTASSCO_CHECK_PRE(type_ != HeadType::constraint, "integrity constraints have no head");
    POTASSCO_CHECK_PRE(type_ != HeadType::normal || head_.empty(), "normal rules have exactly one head atom");
    POTASSCO_CHECK_PRE(cond.empty() || type_ == HeadType::choice, "only choice heads support conditions");
    head_.push_back({std::move(a), std::move(cond)});
    return *this;
}
RuleBuilder& RuleBuilder::setBounds(uint32_t lower, uint32_t upper) {
    POTASSCO_CHECK_PRE(type_ == HeadType::choice, "bounds require a choice head");
    POTASSCO_CHECK_PRE(lower <= upper, "invalid choice bounds [%u, %u]", lower, upper);
    lower_ = lower;
    upper_ = upper;
    return *this;
}
RuleBuilder& RuleBuilder::addGoal(Literal lit) {
    body_.push_back(std::move(lit));
    return *this;
}
Rule RuleBuilder::rule() {
    Head h;
    switch (type_) {
        case HeadType::constraint: break;
        case HeadType::normal:
            POTASSCO_CHECK_PRE(head_.size() == 1, "normal rule requires a head atom");
            h = Head::normal(std::move(head_[0].atom));
            break;
        case HeadType::disjunctive: {
            std::vector<Atom> atoms;
            for (auto& e : head_) { atoms.push_back(std::move(e.atom)); }
            h = Head::disjunctive(std::move(atoms));
            break;
        }
        case HeadType::choice: h = Head::choice(std::move(head_), lower_, upper_); break;
    }
    Rule r(std::move(h), std::move(body_));
    start(HeadType::normal);
    return r;
}
/////////////////////////////////////////////////////////////////////////////////////////
// Program
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t Program::addRule(Rule r) {
    rules_.push_back(std::move(r));
    return size32(rules_) - 1;
}
void Program::addFact(std::string_view pred, SymVec args) {
    POTASSCO_CHECK_PRE(not pred.empty(), "predicate name must not be empty");
    facts_.push_back({std::string(pred), std::move(args)});
}
void Program::addRange(std::string_view pred, int32_t lo, int32_t hi) {
    for (int64_t i = lo; i <= hi; ++i) { addFact(pred, {Symbol::number(static_cast<int32_t>(i))}); }
}
void Program::addEnum(std::string_view pred, const SymVec& values) {
    for (const auto& v : values) { addFact(pred, {v}); }
}
const Rule& Program::rule(uint32_t i) const {
    POTASSCO_CHECK_PRE(i < numRules(), "invalid rule index %u", i);
    return rules_[i];
}
void Program::clear() {
    rules_.clear();
    facts_.clear();
}
std::ostream& operator<<(std::ostream& os, const Program& prg) {
    for (const auto& f : prg.facts()) {
        os << f.name;
        if (not f.args.empty()) {
            os << '(';
            const char* sep = "";
            for (const auto& s : f.args) {
                os << sep << s;
                sep = ",";
            }
            os << ')';
        }
        os << ".\n";
    }
    for (const auto& r : prg.rules()) { os << r << '\n'; }
    return os;
}

} // namespace Aspect
