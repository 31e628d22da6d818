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

#include <aspect/util/misc_types.h>

#include <compare>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

/*!
 * \file
 * \brief Ground constants and predicate signatures.
 */
namespace Aspect {
/*!
 * \addtogroup term
 */
//@{

//! A ground constant: either an integer or a string.
/*!
 * Symbols are totally ordered: numbers come before strings, numbers are
 * ordered numerically and strings lexicographically.
 */
class Symbol {
public:
    enum class Type : uint8_t { number = 0, string = 1 };

    //! Creates the number 0.
    Symbol() noexcept = default;

    static Symbol number(int32_t n) { return Symbol(n); }
    static Symbol string(std::string_view s) { return Symbol(s); }

    [[nodiscard]] Type               type() const noexcept { return type_; }
    [[nodiscard]] bool               isNumber() const noexcept { return type_ == Type::number; }
    [[nodiscard]] bool               isString() const noexcept { return type_ == Type::string; }
    //! Returns the value of a number.
    /*!
     * \pre isNumber()
     */
    [[nodiscard]] int32_t            num() const noexcept { return num_; }
    //! Returns the value of a string.
    /*!
     * \pre isString()
     */
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] std::size_t        hash() const noexcept;

    friend bool                 operator==(const Symbol& lhs, const Symbol& rhs) noexcept;
    friend std::strong_ordering operator<=>(const Symbol& lhs, const Symbol& rhs) noexcept;

private:
    explicit Symbol(int32_t n) : num_(n) {}
    explicit Symbol(std::string_view s) : type_(Type::string), str_(s) {}

    Type        type_{Type::number};
    int32_t     num_{0};
    std::string str_;
};
using SymVec = std::vector<Symbol>;

//! Writes s in ASP syntax, i.e. strings are quoted unless they are identifiers.
std::ostream& operator<<(std::ostream& os, const Symbol& s);
std::string   toString(const Symbol& s);
//! Returns the ordering of two symbols of the same type.
/*!
 * \throw TypeMismatch if lhs and rhs have different types.
 */
std::strong_ordering compareStrict(const Symbol& lhs, const Symbol& rhs, std::string_view what);

struct SymbolHash {
    std::size_t operator()(const Symbol& s) const noexcept { return s.hash(); }
};
struct SymVecHash {
    std::size_t operator()(const SymVec& vec) const noexcept;
};

//! Name and arity of a predicate.
struct Sig {
    std::string name;
    uint32_t    arity{0};

    friend bool operator==(const Sig&, const Sig&)  = default;
    friend auto operator<=>(const Sig&, const Sig&) = default;
};
std::ostream& operator<<(std::ostream& os, const Sig& sig);

//@}
} // namespace Aspect
