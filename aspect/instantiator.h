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
#include <aspect/term.h>

#include <algorithm>

/*!
 * \file
 * \brief Matching of conjunctive patterns against a set of ground atoms.
 *
 * The grounder uses the join machinery to instantiate rule bodies against the
 * growing atom universe, the projector uses it to evaluate queries against an
 * answer set.
 */
namespace Aspect {
/*!
 * \defgroup instantiation Instantiation
 * \brief Variable bindings and join evaluation.
 */
//@{

constexpr auto var_none = static_cast<uint32_t>(-1);

//! Maps variable names to binding slots.
class VarTable {
public:
    //! Returns the slot of the given variable, adding it if necessary.
    uint32_t                         add(std::string_view name);
    [[nodiscard]] uint32_t           find(std::string_view name) const;
    [[nodiscard]] uint32_t           size() const { return size32(names_); }
    [[nodiscard]] const std::string& name(uint32_t slot) const { return names_[slot]; }

private:
    std::vector<std::string> names_;
};

//! Values of the variables of a VarTable.
class Binding {
public:
    explicit Binding(uint32_t n = 0) : vals_(n), set_(n, 0) {}

    void resize(uint32_t n) {
        vals_.resize(n);
        set_.resize(n, 0);
    }
    [[nodiscard]] uint32_t      size() const { return size32(vals_); }
    [[nodiscard]] bool          bound(uint32_t slot) const { return set_[slot] != 0; }
    [[nodiscard]] const Symbol& operator[](uint32_t slot) const { return vals_[slot]; }
    void                        bind(uint32_t slot, Symbol s) {
        vals_[slot] = std::move(s);
        set_[slot]  = 1;
    }
    void unbind(uint32_t slot) { set_[slot] = 0; }
    //! Returns the values of the first n slots.
    /*!
     * \pre All of the first n slots are bound.
     */
    [[nodiscard]] SymVec values(uint32_t n) const { return {vals_.begin(), vals_.begin() + n}; }
    //! Binds the first vals.size() slots to vals.
    void                 assign(const SymVec& vals) {
        for (auto i : irange(vals)) { bind(i, vals[i]); }
    }

private:
    SymVec               vals_;
    std::vector<uint8_t> set_;
};

//! A term whose variables are replaced by binding slots.
class BoundTerm {
public:
    enum class Type : uint8_t { constant, variable, binary };

    BoundTerm() = default;
    //! Compiles t adding its variables to vars.
    static BoundTerm compile(const Term& t, VarTable& vars);

    [[nodiscard]] Type          type() const noexcept { return type_; }
    [[nodiscard]] uint32_t      slot() const noexcept { return slot_; }
    [[nodiscard]] const Symbol& value() const noexcept { return value_; }
    //! Returns true if all variables of this term are bound in b.
    [[nodiscard]] bool          evaluable(const Binding& b) const;
    //! Evaluates the term under b.
    /*!
     * \pre evaluable(b)
     * \return false if the value is undefined.
     * \throw TypeMismatch if arithmetic is applied to strings.
     */
    bool                        eval(const Binding& b, Symbol& out) const;
    void                        collectSlots(std::vector<uint32_t>& out) const;

private:
    Type                   type_{Type::constant};
    BinOp                  op_{BinOp::add};
    uint32_t               slot_{var_none};
    Symbol                 value_;
    std::vector<BoundTerm> args_;
};

//! An atom whose terms are compiled against a VarTable.
class BoundAtom {
public:
    BoundAtom() = default;
    BoundAtom(const AtomTable& atoms, const Atom& a, VarTable& vars);

    [[nodiscard]] Pred_t                        pred() const noexcept { return pred_; }
    [[nodiscard]] const Atom&                   atom() const noexcept { return atom_; }
    [[nodiscard]] const std::vector<BoundTerm>& args() const noexcept { return args_; }
    //! Slots bound by this atom when it is matched, i.e. its variable arguments.
    void                                        bindingSlots(std::vector<uint32_t>& out) const;
    //! Slots that must be bound before the arithmetic arguments can be evaluated.
    void                                        arithmeticSlots(std::vector<uint32_t>& out) const;

    //! Computes the ground arguments of this atom under b.
    /*!
     * \pre All variables are bound.
     * \return false if some argument is undefined.
     */
    bool ground(const Binding& b, SymVec& out) const;
    //! Returns the id of the ground instance of this atom under b or atom_none.
    [[nodiscard]] Atom_t find(const AtomTable& atoms, const Binding& b) const;
    //! Unifies this atom with the given ground arguments.
    /*!
     * Unbound variables are bound and appended to newly. On failure, the
     * caller is responsible for unbinding the slots in newly.
     */
    bool match(const SymVec& args, Binding& b, std::vector<uint32_t>& newly) const;
    //! Returns an argument position that can be used for an index lookup under b or var_none.
    [[nodiscard]] uint32_t indexPosition(const Binding& b) const;

private:
    Atom                   atom_;
    Pred_t                 pred_{pred_none};
    std::vector<BoundTerm> args_;
};

//! One step of a join plan.
struct JoinStep {
    enum class Type : uint8_t { positive, negative, comparison };
    Type      type{Type::positive};
    BoundAtom atom;             //!< Atom of a positive or negative step.
    CmpOp     op{CmpOp::eq};    //!< Operator of a comparison step.
    BoundTerm lhs;              //!< Left operand of a comparison step.
    BoundTerm rhs;              //!< Right operand of a comparison step.
    uint32_t  index{var_none};  //!< Index of a positive step among all positive literals in input order.
};

//! An evaluation order for a conjunction of condition literals.
/*!
 * Positive atoms are joined in input order unless one of their arithmetic
 * arguments depends on a variable bound only by a later atom. Comparisons and
 * negative literals are scheduled as soon as all their variables are bound.
 */
class JoinPlan {
public:
    JoinPlan() = default;
    //! Compiles the given literals.
    /*!
     * Variables already contained in vars are considered bound by an outer scope.
     */
    JoinPlan(const AtomTable& atoms, std::span<const CondLiteral* const> lits, VarTable& vars);

    [[nodiscard]] const std::vector<JoinStep>& steps() const noexcept { return steps_; }
    [[nodiscard]] uint32_t                     numPositive() const noexcept { return numPos_; }
    //! Name of a variable that is not bound by any positive literal or empty if the plan is safe.
    [[nodiscard]] const std::string&           unsafe() const noexcept { return unsafe_; }

private:
    std::vector<JoinStep> steps_;
    uint32_t              numPos_{0};
    std::string           unsafe_;
};

//! Default join policy considering all atoms of the table.
/*!
 * A join policy provides:
 *  - range(i): the half-open interval of atom ids considered for the i-th positive literal,
 *  - accept(a): whether atom a may be used to match a positive literal,
 *  - holdsNot(a): whether the negative literal "not a" holds (a may be atom_none).
 */
struct AllAtoms {
    explicit AllAtoms(const AtomTable& t) : end(t.size()) {}
    [[nodiscard]] std::pair<Atom_t, Atom_t> range(uint32_t) const { return {0, end}; }
    [[nodiscard]] static bool               accept(Atom_t) { return true; }
    [[nodiscard]] static bool               holdsNot(Atom_t a) { return a == atom_none; }
    Atom_t                                  end;
};

//! Enumerates all extensions of b satisfying the plan and calls onMatch() for each.
/*!
 * The binding is restored before the function returns.
 */
template <typename Policy, typename OnMatch>
void join(const AtomTable& atoms, const JoinPlan& plan, Binding& b, const Policy& policy, OnMatch&& onMatch) {
    std::vector<uint32_t> newly;
    auto                  rec = [&](auto& self, uint32_t i) -> void {
        if (i == size32(plan.steps())) {
            onMatch();
            return;
        }
        const auto& s = plan.steps()[i];
        if (s.type == JoinStep::Type::comparison) {
            Symbol l, r;
            if (s.lhs.eval(b, l) && s.rhs.eval(b, r) && compare(s.op, l, r)) {
                self(self, i + 1);
            }
            return;
        }
        if (s.type == JoinStep::Type::negative) {
            if (policy.holdsNot(s.atom.find(atoms, b))) {
                self(self, i + 1);
            }
            return;
        }
        if (s.atom.pred() == pred_none) {
            return;
        }
        std::span<const Atom_t> cands;
        if (auto pos = s.atom.indexPosition(b); pos != var_none) {
            Symbol v;
            if (not s.atom.args()[pos].eval(b, v)) {
                return;
            }
            cands = atoms.atoms(s.atom.pred(), pos, v);
        }
        else {
            cands = atoms.atoms(s.atom.pred());
        }
        auto [lo, hi] = policy.range(s.index);
        auto first    = std::lower_bound(cands.begin(), cands.end(), lo);
        auto last     = std::lower_bound(first, cands.end(), hi);
        for (auto it = first; it != last; ++it) {
            if (not policy.accept(*it)) {
                continue;
            }
            auto mark = size32(newly);
            if (s.atom.match(atoms.args(*it), b, newly)) {
                self(self, i + 1);
            }
            while (size32(newly) > mark) {
                b.unbind(newly.back());
                newly.pop_back();
            }
        }
    };
    rec(rec, 0);
}

//@}
} // namespace Aspect
