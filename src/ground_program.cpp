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
#include <aspect/ground_program.h>

#include <potassco/error.h>

#include <ostream>

namespace Aspect {

Val_t compareRange(CmpOp op, int64_t lo, int64_t hi, int64_t bound) {
    POTASSCO_ASSERT(lo <= hi, "invalid aggregate range");
    switch (op) {
        case CmpOp::eq:
            if (lo == hi) {
                return lo == bound ? value_true : value_false;
            }
            return bound < lo || bound > hi ? value_false : value_free;
        case CmpOp::neq:
            if (lo == hi) {
                return lo != bound ? value_true : value_false;
            }
            return bound < lo || bound > hi ? value_true : value_free;
        case CmpOp::lt : return hi < bound ? value_true : (lo >= bound ? value_false : value_free);
        case CmpOp::leq: return hi <= bound ? value_true : (lo > bound ? value_false : value_free);
        case CmpOp::gt : return lo > bound ? value_true : (hi <= bound ? value_false : value_free);
        case CmpOp::geq: return lo >= bound ? value_true : (hi < bound ? value_false : value_free);
    }
    POTASSCO_ASSERT_NOT_REACHED("invalid comparison operator");
}

bool GroundAggregate::monotone() const {
    switch (fun) {
        case AggFun::count:
        case AggFun::sum:
            return (op == CmpOp::gt || op == CmpOp::geq) &&
                   std::all_of(elems.begin(), elems.end(), [](const GroundElement& e) { return e.weight >= 0; });
        case AggFun::min: return op == CmpOp::lt || op == CmpOp::leq;
        case AggFun::max: return op == CmpOp::gt || op == CmpOp::geq;
    }
    return false;
}
AtomVec GroundAggregate::atoms() const {
    AtomVec out;
    for (const auto& e : elems) {
        out.insert(out.end(), e.pos.begin(), e.pos.end());
        out.insert(out.end(), e.neg.begin(), e.neg.end());
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

namespace {
struct Printer {
    const GroundProgram& prg;
    std::ostream&        os;

    void atom(Atom_t a) const { prg.atoms().print(os, a); }
    void conj(const AtomVec& pos, const AtomVec& neg, const char* sep) const {
        const char* s = "";
        for (auto a : pos) {
            os << s;
            atom(a);
            s = sep;
        }
        for (auto a : neg) {
            os << s << "not ";
            atom(a);
            s = sep;
        }
    }
    void aggregate(const GroundAggregate& g) const {
        os << toString(g.fun) << '{';
        const char* sep = "";
        for (const auto& e : g.elems) {
            os << sep;
            const char* t = "";
            for (const auto& s : e.tuple) {
                os << t << s;
                t = ",";
            }
            if (not e.pos.empty() || not e.neg.empty()) {
                os << ':';
                conj(e.pos, e.neg, ",");
            }
            sep = ";";
        }
        os << '}' << toString(g.op) << g.bound;
    }
    void rule(const GroundRule& r) const {
        switch (r.type) {
            case HeadType::constraint: break;
            case HeadType::normal    : atom(r.head[0]); break;
            case HeadType::disjunctive: {
                const char* sep = "";
                for (auto a : r.head) {
                    os << sep;
                    atom(a);
                    sep = " v ";
                }
                break;
            }
            case HeadType::choice: {
                if (r.lower > 0) {
                    os << r.lower << ' ';
                }
                os << '{';
                const char* sep = "";
                for (auto a : r.head) {
                    os << sep;
                    atom(a);
                    sep = ";";
                }
                os << '}';
                if (r.upper != bound_max) {
                    os << ' ' << r.upper;
                }
                break;
            }
        }
        if (not r.body.empty() || r.type == HeadType::constraint) {
            os << (r.type == HeadType::constraint ? ":- " : " :- ");
            conj(r.body.pos, r.body.neg, ", ");
            const char* sep = r.body.pos.empty() && r.body.neg.empty() ? "" : ", ";
            for (auto i : r.body.aggs) {
                os << sep;
                aggregate(prg.aggregates()[i]);
                sep = ", ";
            }
        }
        os << ".\n";
    }
};
} // namespace

void GroundProgram::print(std::ostream& os) const {
    Printer p{*this, os};
    for (auto a : facts_) {
        p.atom(a);
        os << ".\n";
    }
    for (const auto& r : rules_) { p.rule(r); }
}

} // namespace Aspect
