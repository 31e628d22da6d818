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
#include <aspect/symbol.h>

#include <aspect/errors.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <ostream>
#include <sstream>

namespace Aspect {

std::size_t Symbol::hash() const noexcept {
    return isNumber() ? std::hash<int32_t>{}(num_) : (std::hash<std::string>{}(str_) ^ 0x9e3779b9u);
}
bool operator==(const Symbol& lhs, const Symbol& rhs) noexcept {
    return lhs.type_ == rhs.type_ && (lhs.isNumber() ? lhs.num_ == rhs.num_ : lhs.str_ == rhs.str_);
}
std::strong_ordering operator<=>(const Symbol& lhs, const Symbol& rhs) noexcept {
    if (lhs.type_ != rhs.type_) {
        return lhs.type_ <=> rhs.type_;
    }
    if (lhs.isNumber()) {
        return lhs.num_ <=> rhs.num_;
    }
    auto c = lhs.str_.compare(rhs.str_);
    return c < 0 ? std::strong_ordering::less : (c > 0 ? std::strong_ordering::greater : std::strong_ordering::equal);
}
std::strong_ordering compareStrict(const Symbol& lhs, const Symbol& rhs, std::string_view what) {
    if (lhs.type() != rhs.type()) {
        throw TypeMismatch(std::string(what), toString(lhs), toString(rhs));
    }
    return lhs <=> rhs;
}

static bool isIdentifier(const std::string& s) {
    if (s.empty() || not std::islower(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
}

std::ostream& operator<<(std::ostream& os, const Symbol& s) {
    if (s.isNumber()) {
        return os << s.num();
    }
    if (isIdentifier(s.str())) {
        return os << s.str();
    }
    os << '"';
    for (char c : s.str()) {
        switch (c) {
            case '"' : os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            default  : os << c; break;
        }
    }
    return os << '"';
}
std::string toString(const Symbol& s) {
    std::ostringstream str;
    str << s;
    return str.str();
}

std::size_t SymVecHash::operator()(const SymVec& vec) const noexcept {
    std::size_t seed = vec.size();
    for (const auto& s : vec) { seed ^= s.hash() + 0x9e3779b9u + (seed << 6) + (seed >> 2); }
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Sig& sig) { return os << sig.name << '/' << sig.arity; }

} // namespace Aspect
