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
#include <aspect/errors.h>

namespace Aspect {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::unsafe_variable: return "UnsafeVariable";
        case ErrorCode::type_mismatch  : return "TypeMismatch";
        case ErrorCode::grounding_limit: return "GroundingLimit";
        case ErrorCode::malformed_spec : return "MalformedSpec";
        case ErrorCode::missing_index  : return "MissingIndex";
        case ErrorCode::ambiguous_key  : return "AmbiguousKey";
    }
    return "Error";
}

Error::Error(ErrorCode code, const std::string& msg)
    : std::runtime_error(std::string(toString(code)).append(": ").append(msg))
    , code_(code) {}

UnsafeVariable::UnsafeVariable(uint32_t rule, std::string ruleText, std::string var)
    : Error(ErrorCode::unsafe_variable,
            "variable '" + var + "' in rule " + std::to_string(rule) + " '" + ruleText + "' is not bound by a positive literal")
    , rule_(rule)
    , text_(std::move(ruleText))
    , var_(std::move(var)) {}

TypeMismatch::TypeMismatch(std::string operation, std::string lhs, std::string rhs)
    : Error(ErrorCode::type_mismatch, "invalid operands for '" + operation + "': " + lhs + ", " + rhs)
    , op_(std::move(operation)) {}

GroundingLimit::GroundingLimit(uint32_t limit, std::string ruleText)
    : Error(ErrorCode::grounding_limit,
            "more than " + std::to_string(limit) + " atoms while instantiating '" + ruleText + "'")
    , limit_(limit) {}

MalformedSpec::MalformedSpec(std::string node, const std::string& what)
    : Error(ErrorCode::malformed_spec, "output '" + node + "': " + what)
    , node_(std::move(node)) {}

MissingIndex::MissingIndex(std::string node, std::string query, int32_t index)
    : Error(ErrorCode::missing_index,
            "output '" + node + "': no value for index " + std::to_string(index) + " of query '" + query + "'")
    , node_(std::move(node))
    , query_(std::move(query))
    , index_(index) {}

AmbiguousKey::AmbiguousKey(std::string node, std::string query, std::string key, std::string first,
                           std::string second)
    : Error(ErrorCode::ambiguous_key, "output '" + node + "': key " + key + " of query '" + query +
                                          "' has different bindings " + first + " and " + second)
    , node_(std::move(node))
    , key_(std::move(key))
    , first_(std::move(first))
    , second_(std::move(second)) {}

} // namespace Aspect
