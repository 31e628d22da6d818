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

#include <compare>
#include <string>
#include <vector>

/*!
 * \file
 * \brief Structured values produced by the projector.
 */
namespace Aspect {
/*!
 * \addtogroup project
 */
//@{

//! A nested value built from numbers and strings.
/*!
 * Values are ordered totally: first by type, then by content. Sets keep
 * their elements sorted and free of duplicates, mappings keep their entries
 * sorted by key.
 */
class Value {
public:
    enum class Type : uint8_t { number = 0, string = 1, tuple = 2, set = 3, sequence = 4, mapping = 5 };

    //! Creates the number 0.
    Value() = default;
    Value(const Symbol& s); // NOLINT

    static Value number(int32_t n) { return {Symbol::number(n)}; }
    static Value string(std::string_view s) { return {Symbol::string(s)}; }
    //! Creates a tuple with an optional constructor name.
    static Value tuple(std::vector<Value> elems, std::string name = {});
    //! Creates a set of the given elements removing duplicates.
    static Value set(std::vector<Value> elems);
    static Value sequence(std::vector<Value> elems);
    //! Creates a mapping from keys[i] to values[i].
    /*!
     * \pre keys.size() == values.size() and keys are pairwise different.
     */
    static Value mapping(std::vector<Value> keys, std::vector<Value> values);

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] bool isNumber() const noexcept { return type_ == Type::number; }
    [[nodiscard]] bool isString() const noexcept { return type_ == Type::string; }
    [[nodiscard]] bool isScalar() const noexcept { return type_ <= Type::string; }

    //! The symbol of a number or string.
    [[nodiscard]] const Symbol&             symbol() const;
    [[nodiscard]] int32_t                   num() const;
    [[nodiscard]] const std::string&        str() const;
    //! Constructor name of a tuple (empty if none).
    [[nodiscard]] const std::string&        name() const noexcept { return name_; }
    //! Elements of a tuple, set or sequence and the values of a mapping.
    [[nodiscard]] const std::vector<Value>& elements() const noexcept { return elems_; }
    //! Keys of a mapping in ascending order.
    [[nodiscard]] const std::vector<Value>& keys() const noexcept { return keys_; }
    [[nodiscard]] uint32_t                  size() const { return size32(elems_); }
    //! The i-th element of a tuple, set, or sequence.
    [[nodiscard]] const Value&              operator[](uint32_t i) const;
    //! Returns the value associated with key in a mapping or nullptr.
    [[nodiscard]] const Value*              find(const Value& key) const;
    //! Returns true if a set contains v or a mapping contains key v.
    [[nodiscard]] bool                      contains(const Value& v) const;

    friend bool                 operator==(const Value& lhs, const Value& rhs);
    friend std::strong_ordering operator<=>(const Value& lhs, const Value& rhs);

private:
    Type               type_{Type::number};
    Symbol             sym_;
    std::string        name_;
    std::vector<Value> elems_;
    std::vector<Value> keys_;
};

//! Writes v in a deterministic textual form.
/*!
 * Strings are quoted, tuples are written as "Name(a, b)" or "(a, b)", sets
 * as "{a, b}", sequences as "[a, b]", and mappings as "{k: v}".
 */
std::ostream& operator<<(std::ostream& os, const Value& v);
std::string   toString(const Value& v);

//@}
} // namespace Aspect
