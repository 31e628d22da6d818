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
#include <aspect/term.h>

#include <aspect/errors.h>

#include <potassco/error.h>

#include <algorithm>
#include <limits>
#include <ostream>

namespace Aspect {
/////////////////////////////////////////////////////////////////////////////////////////
// Operators
/////////////////////////////////////////////////////////////////////////////////////////
const char* toString(BinOp op) {
    switch (op) {
        case BinOp::add: return "+";
        case BinOp::sub: return "-";
        case BinOp::mul: return "*";
        case BinOp::div: return "/";
        case BinOp::mod: return "\\";
    }
    return "?";
}
const char* toString(CmpOp op) {
    switch (op) {
        case CmpOp::eq : return "=";
        case CmpOp::neq: return "!=";
        case CmpOp::lt : return "<";
        case CmpOp::leq: return "<=";
        case CmpOp::gt : return ">";
        case CmpOp::geq: return ">=";
    }
    return "?";
}
const char* toString(AggFun f) {
    switch (f) {
        case AggFun::count: return "#count";
        case AggFun::sum  : return "#sum";
        case AggFun::min  : return "#min";
        case AggFun::max  : return "#max";
    }
    return "#?";
}

bool compare(CmpOp op, const Symbol& lhs, const Symbol& rhs) {
    switch (op) {
        case CmpOp::eq : return lhs == rhs;
        case CmpOp::neq: return lhs != rhs;
        case CmpOp::lt : return compareStrict(lhs, rhs, toString(op)) < 0;
        case CmpOp::leq: return compareStrict(lhs, rhs, toString(op)) <= 0;
        case CmpOp::gt : return compareStrict(lhs, rhs, toString(op)) > 0;
        case CmpOp::geq: return compareStrict(lhs, rhs, toString(op)) >= 0;
    }
    POTASSCO_ASSERT_NOT_REACHED("invalid comparison operator");
}

bool apply(BinOp op, const Symbol& lhs, const Symbol& rhs, Symbol& out) {
    if (not lhs.isNumber() || not rhs.isNumber()) {
        throw TypeMismatch(toString(op), toString(lhs), toString(rhs));
    }
    auto    l = static_cast<int64_t>(lhs.num()), r = static_cast<int64_t>(rhs.num());
    int64_t res = 0;
    switch (op) {
        case BinOp::add: res = l + r; break;
        case BinOp::sub: res = l - r; break;
        case BinOp::mul: res = l * r; break;
        case BinOp::div:
            if (r == 0) {
                return false;
            }
            res = l / r;
            break;
        case BinOp::mod:
            if (r == 0) {
                return false;
            }
            res = l % r;
            break;
    }
    if (res < std::numeric_limits<int32_t>::min() || res > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = Symbol::number(static_cast<int32_t>(res));
    return true;
}
/////////////////////////////////////////////////////////////////////////////////////////
// Term
/////////////////////////////////////////////////////////////////////////////////////////
struct Term::Binary {
    BinOp op;
    Term  lhs;
    Term  rhs;
};
Term Term::variable(std::string_view name) {
    POTASSCO_CHECK_PRE(not name.empty(), "variable name must not be empty");
    Term t;
    t.type_ = Type::variable;
    t.name_ = name;
    return t;
}
Term Term::binary(BinOp op, Term lhs, Term rhs) {
    Symbol res;
    if (lhs.isConstant() && rhs.isConstant() && lhs.symbol().isNumber() && rhs.symbol().isNumber() &&
        apply(op, lhs.symbol(), rhs.symbol(), res)) {
        return {res};
    }
    Term t;
    t.type_ = Type::binary;
    t.bin_  = std::make_shared<const Binary>(Binary{op, std::move(lhs), std::move(rhs)});
    return t;
}
BinOp Term::op() const {
    POTASSCO_CHECK_PRE(type_ == Type::binary, "term is not binary");
    return bin_->op;
}
const Term& Term::lhs() const {
    POTASSCO_CHECK_PRE(type_ == Type::binary, "term is not binary");
    return bin_->lhs;
}
const Term& Term::rhs() const {
    POTASSCO_CHECK_PRE(type_ == Type::binary, "term is not binary");
    return bin_->rhs;
}
bool Term::ground() const {
    switch (type_) {
        case Type::constant: return true;
        case Type::variable: return false;
        default            : return bin_->lhs.ground() && bin_->rhs.ground();
    }
}
void Term::collectVars(std::vector<std::string>& out) const {
    if (type_ == Type::variable) {
        out.push_back(name_);
    }
    else if (type_ == Type::binary) {
        bin_->lhs.collectVars(out);
        bin_->rhs.collectVars(out);
    }
}
bool operator==(const Term& lhs, const Term& rhs) {
    if (lhs.type_ != rhs.type_) {
        return false;
    }
    switch (lhs.type_) {
        case Term::Type::constant: return lhs.sym_ == rhs.sym_;
        case Term::Type::variable: return lhs.name_ == rhs.name_;
        default:
            return lhs.bin_->op == rhs.bin_->op && lhs.bin_->lhs == rhs.bin_->lhs && lhs.bin_->rhs == rhs.bin_->rhs;
    }
}
std::ostream& operator<<(std::ostream& os, const Term& t) {
    switch (t.type()) {
        case Term::Type::constant: return os << t.symbol();
        case Term::Type::variable: return os << t.name();
        default                  : return os << '(' << t.lhs() << toString(t.op()) << t.rhs() << ')';
    }
}
Term operator+(Term lhs, Term rhs) { return Term::binary(BinOp::add, std::move(lhs), std::move(rhs)); }
Term operator-(Term lhs, Term rhs) { return Term::binary(BinOp::sub, std::move(lhs), std::move(rhs)); }
Term operator*(Term lhs, Term rhs) { return Term::binary(BinOp::mul, std::move(lhs), std::move(rhs)); }
Term operator/(Term lhs, Term rhs) { return Term::binary(BinOp::div, std::move(lhs), std::move(rhs)); }
Term operator%(Term lhs, Term rhs) { return Term::binary(BinOp::mod, std::move(lhs), std::move(rhs)); }
Term operator-(Term t) { return Term::binary(BinOp::sub, Term(0), std::move(t)); }
/////////////////////////////////////////////////////////////////////////////////////////
// Atom and literals
/////////////////////////////////////////////////////////////////////////////////////////
bool Atom::ground() const {
    return std::all_of(args_.begin(), args_.end(), [](const Term& t) { return t.ground(); });
}
void Atom::collectVars(std::vector<std::string>& out) const {
    for (const auto& t : args_) { t.collectVars(out); }
}
std::ostream& operator<<(std::ostream& os, const Atom& a) {
    os << a.name();
    if (not a.args().empty()) {
        os << '(';
        const char* sep = "";
        for (const auto& t : a.args()) {
            os << sep << t;
            sep = ",";
        }
        os << ')';
    }
    return os;
}

CondLiteral CondLiteral::comparison(CmpOp op, Term lhs, Term rhs) {
    CondLiteral lit;
    lit.type_ = Type::comparison;
    lit.op_   = op;
    lit.lhs_  = std::move(lhs);
    lit.rhs_  = std::move(rhs);
    return lit;
}
void CondLiteral::collectVars(std::vector<std::string>& out) const {
    if (isAtom()) {
        atom_.collectVars(out);
    }
    else {
        lhs_.collectVars(out);
        rhs_.collectVars(out);
    }
}
std::ostream& operator<<(std::ostream& os, const CondLiteral& lit) {
    if (lit.isComparison()) {
        return os << lit.lhs() << toString(lit.op()) << lit.rhs();
    }
    return os << (lit.negative() ? "not " : "") << lit.atom();
}
std::ostream& operator<<(std::ostream& os, const CondVec& cond) {
    const char* sep = "";
    for (const auto& c : cond) {
        os << sep << c;
        sep = ",";
    }
    return os;
}

struct Literal::Aggregate {
    AggFun     fun;
    AggElemVec elems;
    CmpOp      op;
    Term       bound;
};
Literal Literal::aggregate(AggFun fun, AggElemVec elems, CmpOp op, Term bound) {
    Literal lit{CondLiteral(Atom())};
    lit.agg_ = std::make_shared<const Aggregate>(Aggregate{fun, std::move(elems), op, std::move(bound)});
    return lit;
}
Literal::Type Literal::type() const noexcept {
    if (agg_) {
        return Type::aggregate;
    }
    return cond_.isAtom() ? Type::atom : Type::comparison;
}
AggFun Literal::fun() const {
    POTASSCO_CHECK_PRE(agg_, "literal is not an aggregate");
    return agg_->fun;
}
const AggElemVec& Literal::elements() const {
    POTASSCO_CHECK_PRE(agg_, "literal is not an aggregate");
    return agg_->elems;
}
CmpOp Literal::op() const {
    POTASSCO_CHECK_PRE(agg_, "literal is not an aggregate");
    return agg_->op;
}
const Term& Literal::bound() const {
    POTASSCO_CHECK_PRE(agg_, "literal is not an aggregate");
    return agg_->bound;
}
std::ostream& operator<<(std::ostream& os, const Literal& lit) {
    if (not lit.isAggregate()) {
        return os << lit.cond();
    }
    os << toString(lit.fun()) << '{';
    const char* sep = "";
    for (const auto& e : lit.elements()) {
        os << sep;
        const char* tsep = "";
        for (const auto& t : e.tuple) {
            os << tsep << t;
            tsep = ",";
        }
        if (not e.condition.empty()) {
            os << ':' << e.condition;
        }
        sep = ";";
    }
    return os << '}' << toString(lit.op()) << lit.bound();
}

} // namespace Aspect
