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
#include <aspect/value.h>

#include <potassco/error.h>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace Aspect {

Value::Value(const Symbol& s) : type_(s.isNumber() ? Type::number : Type::string), sym_(s) {}

Value Value::tuple(std::vector<Value> elems, std::string name) {
    Value v;
    v.type_  = Type::tuple;
    v.name_  = std::move(name);
    v.elems_ = std::move(elems);
    return v;
}
Value Value::set(std::vector<Value> elems) {
    std::sort(elems.begin(), elems.end());
    elems.erase(std::unique(elems.begin(), elems.end()), elems.end());
    Value v;
    v.type_  = Type::set;
    v.elems_ = std::move(elems);
    return v;
}
Value Value::sequence(std::vector<Value> elems) {
    Value v;
    v.type_  = Type::sequence;
    v.elems_ = std::move(elems);
    return v;
}
Value Value::mapping(std::vector<Value> keys, std::vector<Value> values) {
    POTASSCO_CHECK_PRE(keys.size() == values.size(), "keys and values must have the same size");
    std::vector<uint32_t> order(keys.size());
    for (auto i : irange(keys)) { order[i] = i; }
    std::sort(order.begin(), order.end(), [&](uint32_t x, uint32_t y) { return keys[x] < keys[y]; });
    Value v;
    v.type_ = Type::mapping;
    for (auto i : order) {
        POTASSCO_CHECK_PRE(v.keys_.empty() || v.keys_.back() != keys[i], "duplicate key in mapping");
        v.keys_.push_back(std::move(keys[i]));
        v.elems_.push_back(std::move(values[i]));
    }
    return v;
}

const Symbol& Value::symbol() const {
    POTASSCO_CHECK_PRE(isScalar(), "value is not a scalar");
    return sym_;
}
int32_t Value::num() const {
    POTASSCO_CHECK_PRE(isNumber(), "value is not a number");
    return sym_.num();
}
const std::string& Value::str() const {
    POTASSCO_CHECK_PRE(isString(), "value is not a string");
    return sym_.str();
}
const Value& Value::operator[](uint32_t i) const {
    POTASSCO_CHECK_PRE(i < size(), "index out of range");
    return elems_[i];
}
const Value* Value::find(const Value& key) const {
    if (type_ != Type::mapping) {
        return nullptr;
    }
    auto it = std::lower_bound(keys_.begin(), keys_.end(), key);
    return it != keys_.end() && *it == key ? &elems_[static_cast<std::size_t>(it - keys_.begin())] : nullptr;
}
bool Value::contains(const Value& v) const {
    if (type_ == Type::set) {
        return std::binary_search(elems_.begin(), elems_.end(), v);
    }
    return find(v) != nullptr;
}

bool operator==(const Value& lhs, const Value& rhs) { return (lhs <=> rhs) == 0; }
std::strong_ordering operator<=>(const Value& lhs, const Value& rhs) {
    if (lhs.type_ != rhs.type_) {
        return lhs.type_ <=> rhs.type_;
    }
    if (lhs.isScalar()) {
        return lhs.sym_ <=> rhs.sym_;
    }
    auto less = [](const std::string& x, const std::string& y) {
        auto c = x.compare(y);
        return c < 0 ? std::strong_ordering::less : (c > 0 ? std::strong_ordering::greater : std::strong_ordering::equal);
    };
    if (auto c = less(lhs.name_, rhs.name_); c != 0) {
        return c;
    }
    if (auto c = std::lexicographical_compare_three_way(lhs.keys_.begin(), lhs.keys_.end(), rhs.keys_.begin(),
                                                        rhs.keys_.end());
        c != 0) {
        return c;
    }
    return std::lexicographical_compare_three_way(lhs.elems_.begin(), lhs.elems_.end(), rhs.elems_.begin(),
                                                  rhs.elems_.end());
}

namespace {
void printList(std::ostream& os, const std::vector<Value>& elems, char open, char close) {
    os << open;
    for (const char* sep = ""; const auto& e : elems) {
        os << sep << e;
        sep = ", ";
    }
    os << close;
}
} // namespace

std::ostream& operator<<(std::ostream& os, const Value& v) {
    switch (v.type()) {
        case Value::Type::number: return os << v.num();
        case Value::Type::string:
            os << '"';
            for (char c : v.str()) {
                if (c == '"' || c == '\\') {
                    os << '\\';
                }
                os << c;
            }
            return os << '"';
        case Value::Type::tuple:
            os << v.name();
            printList(os, v.elements(), '(', ')');
            return os;
        case Value::Type::set     : printList(os, v.elements(), '{', '}'); return os;
        case Value::Type::sequence: printList(os, v.elements(), '[', ']'); return os;
        case Value::Type::mapping:
            os << '{';
            for (auto i : irange(v.keys())) { os << (i ? ", " : "") << v.keys()[i] << ": " << v.elements()[i]; }
            return os << '}';
    }
    POTASSCO_ASSERT_NOT_REACHED("invalid value type");
}
std::string toString(const Value& v) {
    std::ostringstream str;
    str << v;
    return str.str();
}

} // namespace Aspect
