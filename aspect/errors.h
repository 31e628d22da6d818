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

#include <aspect/config.h>

#include <stdexcept>
#include <string>

/*!
 * \file
 * \brief Exceptions reported by the grounder and the projector.
 *
 * Preconditions of the library interface are checked with the potassco error
 * macros and result in std::logic_error. The types defined here signal that the
 * program or the output specification given by the caller is faulty.
 */
namespace Aspect {

enum class ErrorCode {
    unsafe_variable = 1,
    type_mismatch   = 2,
    grounding_limit = 3,
    malformed_spec  = 4,
    missing_index   = 5,
    ambiguous_key   = 6,
};
const char* toString(ErrorCode code);

//! Base class of all errors of the aspect library.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg);
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

//! A variable of a rule is not bound by a positive body literal.
class UnsafeVariable : public Error {
public:
    UnsafeVariable(uint32_t rule, std::string ruleText, std::string var);
    [[nodiscard]] uint32_t           rule() const noexcept { return rule_; }
    [[nodiscard]] const std::string& ruleText() const noexcept { return text_; }
    [[nodiscard]] const std::string& variable() const noexcept { return var_; }

private:
    uint32_t    rule_;
    std::string text_;
    std::string var_;
};

//! An operation was applied to operands of incompatible types.
class TypeMismatch : public Error {
public:
    TypeMismatch(std::string operation, std::string lhs, std::string rhs);
    [[nodiscard]] const std::string& operation() const noexcept { return op_; }

private:
    std::string op_;
};

//! The atom universe exceeded the configured limit.
class GroundingLimit : public Error {
public:
    GroundingLimit(uint32_t limit, std::string ruleText);
    [[nodiscard]] uint32_t limit() const noexcept { return limit_; }

private:
    uint32_t limit_;
};

//! An output specification node is not well-formed.
class MalformedSpec : public Error {
public:
    MalformedSpec(std::string node, const std::string& what);
    [[nodiscard]] const std::string& node() const noexcept { return node_; }

private:
    std::string node_;
};

//! The indices of a sequence do not form a dense range starting at zero.
class MissingIndex : public Error {
public:
    MissingIndex(std::string node, std::string query, int32_t index);
    [[nodiscard]] const std::string& node() const noexcept { return node_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] int32_t            index() const noexcept { return index_; }

private:
    std::string node_;
    std::string query_;
    int32_t     index_;
};

//! A mapping key or sequence index stems from more than one binding of its query.
class AmbiguousKey : public Error {
public:
    AmbiguousKey(std::string node, std::string query, std::string key, std::string first, std::string second);
    [[nodiscard]] const std::string& node() const noexcept { return node_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& first() const noexcept { return first_; }
    [[nodiscard]] const std::string& second() const noexcept { return second_; }

private:
    std::string node_;
    std::string key_;
    std::string first_;
    std::string second_;
};

} // namespace Aspect
