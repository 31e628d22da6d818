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

#include <aspect/symbol.h>

#include <initializer_list>
#include <memory>

/*!
 * \file
 * \brief Non-ground terms, atoms and literals.
 *
 * These types form the already-parsed representation of rule schemas. They are
 * values: copies share immutable sub-terms.
 */
namespace Aspect {
/*!
 * \defgroup term Terms
 * \brief Terms, atoms, and literals of rule schemas.
 */
//@{

//! Arithmetic operators.
enum class BinOp : uint8_t { add, sub, mul, div, mod };
//! Comparison operators.
enum class CmpOp : uint8_t { eq, neq, lt, leq, gt, geq };

const char* toString(BinOp op);
const char* toString(CmpOp op);
//! Returns the operator op' s.th. (a op' b) == not (a op b).
constexpr CmpOp negate(CmpOp op) {
    switch (op) {
        case CmpOp::eq : return CmpOp::neq;
        case CmpOp::neq: return CmpOp::eq;
        case CmpOp::lt : return CmpOp::geq;
        case CmpOp::leq: return CmpOp::gt;
        case CmpOp::gt : return CmpOp::leq;
        default        : return CmpOp::lt;
    }
}
//! Evaluates (lhs op rhs).
/*!
 * Equality is defined between symbols of any type. Ordering operators
 * require both operands to have the same type.
 * \throw TypeMismatch if an ordering operator is applied to a number and a string.
 */
bool compare(CmpOp op, const Symbol& lhs, const Symbol& rhs);
//! Evaluates the arithmetic operation (lhs op rhs).
/*!
 * \return false if the result is undefined (division by zero), true otherwise.
 * \throw TypeMismatch if one of the operands is not a number.
 */
bool apply(BinOp op, const Symbol& lhs, const Symbol& rhs, Symbol& out);

//! A constant, a variable, or an arithmetic expression over terms.
class Term {
public:
    enum class Type : uint8_t { constant, variable, binary };

    //! Creates the constant 0.
    Term() = default;
    Term(int32_t n) : sym_(Symbol::number(n)) {}  // NOLINT
    Term(Symbol s) : sym_(std::move(s)) {}        // NOLINT
    static Term variable(std::string_view name);
    static Term binary(BinOp op, Term lhs, Term rhs);

    [[nodiscard]] Type               type() const noexcept { return type_; }
    [[nodiscard]] bool               isConstant() const noexcept { return type_ == Type::constant; }
    [[nodiscard]] bool               isVariable() const noexcept { return type_ == Type::variable; }
    //! The value of a constant.
    [[nodiscard]] const Symbol&      symbol() const noexcept { return sym_; }
    //! The name of a variable.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] BinOp              op() const;
    [[nodiscard]] const Term&        lhs() const;
    [[nodiscard]] const Term&        rhs() const;

    //! Returns true if the term contains no variable.
    [[nodiscard]] bool ground() const;
    //! Appends the names of all variables of this term to out.
    void collectVars(std::vector<std::string>& out) const;

    friend bool operator==(const Term& lhs, const Term& rhs);

private:
    struct Binary;
    Type                          type_{Type::constant};
    Symbol                        sym_;
    std::string                   name_;
    std::shared_ptr<const Binary> bin_;
};
using TermVec = std::vector<Term>;

std::ostream& operator<<(std::ostream& os, const Term& t);
Term          operator+(Term lhs, Term rhs);
Term          operator-(Term lhs, Term rhs);
Term          operator*(Term lhs, Term rhs);
Term          operator/(Term lhs, Term rhs);
Term          operator%(Term lhs, Term rhs);
Term          operator-(Term t);

//! A predicate name applied to a tuple of terms.
class Atom {
public:
    Atom() = default;
    Atom(std::string name, TermVec args) : name_(std::move(name)), args_(std::move(args)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const TermVec&     args() const noexcept { return args_; }
    [[nodiscard]] uint32_t           arity() const { return size32(args_); }
    [[nodiscard]] Sig                sig() const { return {name_, arity()}; }
    [[nodiscard]] bool               ground() const;
    void                             collectVars(std::vector<std::string>& out) const;

    friend bool operator==(const Atom&, const Atom&) = default;

private:
    std::string name_;
    TermVec     args_;
};
std::ostream& operator<<(std::ostream& os, const Atom& a);

//! A literal that may appear in a condition: a (default-negated) atom or a comparison.
class CondLiteral {
public:
    enum class Type : uint8_t { atom, comparison };

    CondLiteral(Atom a, bool negative = false) : atom_(std::move(a)), neg_(negative) {} // NOLINT
    static CondLiteral comparison(CmpOp op, Term lhs, Term rhs);

    [[nodiscard]] Type        type() const noexcept { return type_; }
    [[nodiscard]] bool        isAtom() const noexcept { return type_ == Type::atom; }
    [[nodiscard]] bool        isComparison() const noexcept { return type_ == Type::comparison; }
    [[nodiscard]] bool        positive() const noexcept { return isAtom() && not neg_; }
    [[nodiscard]] bool        negative() const noexcept { return isAtom() && neg_; }
    [[nodiscard]] const Atom& atom() const noexcept { return atom_; }
    [[nodiscard]] CmpOp       op() const noexcept { return op_; }
    [[nodiscard]] const Term& lhs() const noexcept { return lhs_; }
    [[nodiscard]] const Term& rhs() const noexcept { return rhs_; }
    void                      collectVars(std::vector<std::string>& out) const;

private:
    CondLiteral() = default;
    Type  type_{Type::atom};
    Atom  atom_;
    bool  neg_{false};
    CmpOp op_{CmpOp::eq};
    Term  lhs_;
    Term  rhs_;
};
using CondVec = std::vector<CondLiteral>;
std::ostream& operator<<(std::ostream& os, const CondLiteral& lit);
std::ostream& operator<<(std::ostream& os, const CondVec& cond);

//! Supported aggregate functions.
enum class AggFun : uint8_t { count, sum, min, max };
const char* toString(AggFun f);

//! An element "t1,...,tn : l1,...,lm" of an aggregate.
struct AggElement {
    TermVec tuple;
    CondVec condition;
};
using AggElemVec = std::vector<AggElement>;

//! A body literal: a condition literal or an aggregate literal.
/*!
 * An aggregate literal has the form "#fun{ elements } op bound" and holds iff
 * comparing the aggregate's value with bound using op yields true.
 */
class Literal {
public:
    enum class Type : uint8_t { atom, comparison, aggregate };

    Literal(Atom a) : cond_(std::move(a)) {}            // NOLINT
    Literal(CondLiteral c) : cond_(std::move(c)) {}      // NOLINT
    static Literal aggregate(AggFun fun, AggElemVec elems, CmpOp op, Term bound);

    [[nodiscard]] Type               type() const noexcept;
    [[nodiscard]] bool               isAggregate() const noexcept { return agg_ != nullptr; }
    //! The condition literal of a non-aggregate literal.
    [[nodiscard]] const CondLiteral& cond() const noexcept { return cond_; }
    [[nodiscard]] AggFun             fun() const;
    [[nodiscard]] const AggElemVec&  elements() const;
    [[nodiscard]] CmpOp              op() const;
    [[nodiscard]] const Term&        bound() const;

private:
    struct Aggregate;
    CondLiteral                      cond_;
    std::shared_ptr<const Aggregate> agg_;
};
using LitVec = std::vector<Literal>;
std::ostream& operator<<(std::ostream& os, const Literal& lit);

//! Functions for constructing rule schemas in code.
//@{
inline Term var(std::string_view name) { return Term::variable(name); }
inline Term num(int32_t n) { return {n}; }
inline Term str(std::string_view s) { return {Symbol::string(s)}; }
template <typename... Args>
Atom atom(std::string name, Args&&... args) {
    return Atom(std::move(name), TermVec{Term(std::forward<Args>(args))...});
}
inline CondLiteral neg(Atom a) { return {std::move(a), true}; }
inline CondLiteral eq(Term l, Term r) { return CondLiteral::comparison(CmpOp::eq, std::move(l), std::move(r)); }
inline CondLiteral neq(Term l, Term r) { return CondLiteral::comparison(CmpOp::neq, std::move(l), std::move(r)); }
inline CondLiteral lt(Term l, Term r) { return CondLiteral::comparison(CmpOp::lt, std::move(l), std::move(r)); }
inline CondLiteral le(Term l, Term r) { return CondLiteral::comparison(CmpOp::leq, std::move(l), std::move(r)); }
inline CondLiteral gt(Term l, Term r) { return CondLiteral::comparison(CmpOp::gt, std::move(l), std::move(r)); }
inline CondLiteral ge(Term l, Term r) { return CondLiteral::comparison(CmpOp::geq, std::move(l), std::move(r)); }
inline AggElement  elem(TermVec tuple, CondVec cond) { return {std::move(tuple), std::move(cond)}; }
inline Literal     count(AggElemVec e, CmpOp op, Term b) {
    return Literal::aggregate(AggFun::count, std::move(e), op, std::move(b));
}
inline Literal sum(AggElemVec e, CmpOp op, Term b) {
    return Literal::aggregate(AggFun::sum, std::move(e), op, std::move(b));
}
inline Literal min(AggElemVec e, CmpOp op, Term b) {
    return Literal::aggregate(AggFun::min, std::move(e), op, std::move(b));
}
inline Literal max(AggElemVec e, CmpOp op, Term b) {
    return Literal::aggregate(AggFun::max, std::move(e), op, std::move(b));
}
//@}

//@}
} // namespace Aspect
