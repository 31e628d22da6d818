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

#include <aspect/atom_table.h>
#include <aspect/program.h>

#include <algorithm>

/*!
 * \file
 * \brief The output of the grounder: ground rules over an atom table.
 */
namespace Aspect {
/*!
 * \addtogroup program
 */
//@{

//! Type of the three truth values.
using Val_t                = uint8_t;
constexpr Val_t value_free  = 0; //!< Value of atoms that are unassigned.
constexpr Val_t value_true  = 1; //!< Value of atoms that are true.
constexpr Val_t value_false = 2; //!< Value of atoms that are false.

//! Conjunction of ground literals.
struct GroundBody {
    AtomVec               pos;  //!< Atoms that must be true.
    AtomVec               neg;  //!< Atoms that must be false.
    std::vector<uint32_t> aggs; //!< Aggregates (indices into GroundProgram::aggregates()) that must hold.

    [[nodiscard]] bool empty() const { return pos.empty() && neg.empty() && aggs.empty(); }
};

//! A ground rule instance.
struct GroundRule {
    HeadType   type{HeadType::constraint};
    AtomVec    head;
    uint32_t   lower{0};         //!< Lower bound of a choice head.
    uint32_t   upper{bound_max}; //!< Upper bound of a choice head.
    GroundBody body;
    uint32_t   origin{0}; //!< Index of the rule schema this rule was instantiated from.

    [[nodiscard]] bool hasBounds() const { return type == HeadType::choice && (lower > 0 || upper < size32(head)); }
};

//! One tuple of a ground aggregate together with its condition.
struct GroundElement {
    SymVec  tuple;
    int64_t weight{1}; //!< 1 for count, the first term of tuple otherwise.
    AtomVec pos;
    AtomVec neg;
};

//! A ground aggregate literal "#fun{ elements } op bound".
struct GroundAggregate {
    AggFun                     fun{AggFun::count};
    CmpOp                      op{CmpOp::eq};
    int64_t                    bound{0};
    std::vector<GroundElement> elems; //!< Sorted by tuple.

    //! Returns true if the aggregate can only change from false to true when atoms become true.
    [[nodiscard]] bool monotone() const;
    //! Returns the set of atoms occurring in the elements of this aggregate.
    [[nodiscard]] AtomVec atoms() const;
};

//! Statistics of a grounding run.
struct GroundStats {
    uint32_t iterations{0}; //!< Semi-naive iterations.
    uint32_t instances{0};  //!< Instances produced for the positive parts of all rule bodies.
    uint32_t rules{0};      //!< Ground rules after simplification.
    uint32_t atoms{0};      //!< Atoms in the universe.
    uint32_t facts{0};      //!< Atoms known to be true.
    uint32_t aggregates{0}; //!< Ground aggregates.
};

//! A ground program over an immutable atom table.
/*!
 * Once produced by the grounder, a ground program is never modified and can
 * be shared by reference between the solver(s) and the projector.
 */
class GroundProgram {
public:
    GroundProgram() = default;
    GroundProgram(const GroundProgram&)            = delete;
    GroundProgram& operator=(const GroundProgram&) = delete;
    GroundProgram(GroundProgram&&)                 = default;
    GroundProgram& operator=(GroundProgram&&)      = default;

    [[nodiscard]] const AtomTable&                    atoms() const noexcept { return atoms_; }
    [[nodiscard]] uint32_t                            numAtoms() const { return atoms_.size(); }
    [[nodiscard]] const std::vector<GroundRule>&      rules() const noexcept { return rules_; }
    [[nodiscard]] const std::vector<GroundAggregate>& aggregates() const noexcept { return aggs_; }
    [[nodiscard]] const AtomVec&                      facts() const noexcept { return facts_; }
    [[nodiscard]] bool                                isFact(Atom_t a) const { return a < isFact_.size() && isFact_[a]; }
    //! Returns true if some rule has a disjunctive head with more than one atom.
    [[nodiscard]] bool                                disjunctive() const noexcept { return disjunctive_; }
    [[nodiscard]] const GroundStats&                  stats() const noexcept { return stats_; }

    //! Writes the program in ASP syntax, facts first.
    void print(std::ostream& os) const;

private:
    friend class Grounder;
    AtomTable                    atoms_;
    std::vector<GroundRule>      rules_;
    std::vector<GroundAggregate> aggs_;
    AtomVec                      facts_;
    std::vector<bool>            isFact_;
    bool                         disjunctive_{false};
    GroundStats                  stats_;
};

constexpr auto agg_sup = std::numeric_limits<int64_t>::max();
constexpr auto agg_inf = std::numeric_limits<int64_t>::min();

//! Returns the truth value of (lo..hi op bound) where [lo, hi] is the range of possible aggregate values.
Val_t compareRange(CmpOp op, int64_t lo, int64_t hi, int64_t bound);

//! Evaluates the aggregate g in a (partial) three-valued assignment.
/*!
 * Tuples are counted once even if several elements share the same tuple. The
 * result is value_true (value_false) if the aggregate holds (does not hold) in
 * every total assignment extending the given one, and value_free otherwise.
 *
 * \tparam PosValue callable with signature Val_t(Atom_t) used for the positive conditions of elements.
 * \tparam NegValue callable with signature Val_t(Atom_t) used for the negated conditions of elements.
 */
template <typename PosValue, typename NegValue>
Val_t evaluate(const GroundAggregate& g, PosValue&& posValue, NegValue&& negValue) {
    int64_t lo = 0, hi = 0;
    if (g.fun == AggFun::min) {
        lo = hi = agg_sup;
    }
    else if (g.fun == AggFun::max) {
        lo = hi = agg_inf;
    }
    for (auto it = g.elems.begin(), end = g.elems.end(); it != end;) {
        // fold all elements with the same tuple
        Val_t tv = value_false;
        auto  w  = it->weight;
        for (const auto& tuple = it->tuple; it != end && it->tuple == tuple; ++it) {
            Val_t ev = value_true;
            for (auto a : it->pos) {
                if (auto v = posValue(a); v != value_true) {
                    ev = v == value_false ? value_false : (ev == value_true ? value_free : ev);
                }
                if (ev == value_false) {
                    break;
                }
            }
            for (auto a : it->neg) {
                if (ev == value_false) {
                    break;
                }
                if (auto v = negValue(a); v != value_false) {
                    ev = v == value_true ? value_false : value_free;
                }
            }
            if (ev == value_true) {
                tv = value_true;
            }
            else if (ev == value_free && tv == value_false) {
                tv = value_free;
            }
        }
        if (tv == value_false) {
            continue;
        }
        switch (g.fun) {
            case AggFun::count:
            case AggFun::sum:
                if (tv == value_true) {
                    lo += w;
                    hi += w;
                }
                else if (w < 0) {
                    lo += w;
                }
                else {
                    hi += w;
                }
                break;
            case AggFun::min:
                lo = std::min(lo, w);
                if (tv == value_true) {
                    hi = std::min(hi, w);
                }
                break;
            case AggFun::max:
                hi = std::max(hi, w);
                if (tv == value_true) {
                    lo = std::max(lo, w);
                }
                break;
        }
    }
    return compareRange(g.op, lo, hi, g.bound);
}

//! Evaluates the aggregate g with the same assignment for positive and negated conditions.
template <typename ValueOf>
Val_t evaluate(const GroundAggregate& g, ValueOf&& valueOf) {
    return evaluate(g, valueOf, valueOf);
}

//! Evaluates the aggregate g in a two-valued assignment.
/*!
 * \tparam IsTrue callable with signature bool(Atom_t).
 */
template <typename IsTrue>
bool holds(const GroundAggregate& g, IsTrue&& isTrue) {
    return evaluate(g, [&](Atom_t a) { return isTrue(a) ? value_true : value_false; }) == value_true;
}

//! Evaluates the aggregate g in the reduct of a program w.r.t. a model M.
/*!
 * Positive conditions are evaluated over the candidate N, negated conditions
 * over M.
 *
 * \tparam InN callable with signature bool(Atom_t).
 * \tparam InM callable with signature bool(Atom_t).
 */
template <typename InN, typename InM>
bool holdsReduct(const GroundAggregate& g, InN&& inN, InM&& inM) {
    return evaluate(
               g, [&](Atom_t a) { return inN(a) ? value_true : value_false; },
               [&](Atom_t a) { return inM(a) ? value_true : value_false; }) == value_true;
}

//@}
} // namespace Aspect
