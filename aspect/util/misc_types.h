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

#include <cassert>
#include <cstddef>
#include <ranges>
#include <type_traits>
#include <utility>

/*!
 * \file
 * \brief Some utility types and functions.
 */
namespace Aspect {

/*!
 * \defgroup misc Miscellaneous
 * \brief Miscellaneous and Internal Stuff not specific to aspect.
 */
//@{

constexpr uint32_t toU32(std::size_t x) {
    assert(std::in_range<uint32_t>(x));
    return static_cast<uint32_t>(x);
}
template <typename T>
constexpr uint32_t size32(const T& c) {
    return toU32(c.size());
}
constexpr double ratio(uint64_t x, uint64_t y) { return y ? static_cast<double>(x) / static_cast<double>(y) : 0; }

//! Returns a (lazy) half-open range of integers [begin, end).
template <std::integral T>
constexpr auto irange(T begin, std::type_identity_t<T> end) {
    return std::views::iota(begin, end);
}
//! Behaves like irange(0u, size).
constexpr auto irange(unsigned size) { return irange(0u, size); }
//! Behaves like irange(r.size()).
template <typename T>
requires requires(const T& x) {
    { x.size() } -> std::unsigned_integral;
}
constexpr auto irange(const T& r) {
    return irange(0u, size32(r));
}

//! A very simple but fast Pseudo-random number generator.
class Rng {
public:
    constexpr explicit Rng(uint32_t seed = 1) : seed_(seed) {}
    constexpr void     srand(uint32_t seed) { seed_ = seed; }
    constexpr uint32_t rand() { return (((seed_ = seed_ * 214013L + 2531011L) >> 16) & 0x7fff); }
    //! random number in the range [0, max)
    constexpr unsigned irand(unsigned max) { return static_cast<unsigned>((rand() / static_cast<double>(0x8000u)) * max); }
    [[nodiscard]] constexpr uint32_t seed() const { return seed_; }

private:
    uint32_t seed_;
};

//! Base class for library events.
struct Event {
    template <typename T>
    struct Id {
        static const uint32_t id_s;
    };

    //! Set of known event sources.
    enum Subsystem { subsystem_facade = 0, subsystem_ground = 1, subsystem_solve = 2, subsystem_project = 3 };
    //! Possible verbosity levels.
    enum Verbosity { verbosity_quiet = 0, verbosity_low = 1, verbosity_high = 2, verbosity_max = 3 };
    template <typename SelfType>
    Event(SelfType*, Subsystem sys, Verbosity verbosity)
        : system(sys)
        , verb(verbosity)
        , op(0)
        , id(eventId<SelfType>()) {
        static_assert(std::is_base_of_v<Event, SelfType>);
    }
    static uint32_t nextId();
    template <typename T>
    static uint32_t eventId() {
        return Id<T>::id_s;
    }

    uint32_t system : 2;  //!< One of Event::Subsystem - subsystem that produced the event.
    uint32_t verb   : 2;  //!< One of Event::Verbosity - the verbosity level of this event.
    uint32_t op     : 8;  //!< Operation that triggered the event.
    uint32_t id     : 16; //!< Type id of event.
};
template <typename T>
const uint32_t Event::Id<T>::id_s = Event::nextId();

template <typename ToType>
const ToType* event_cast(const Event& ev) {
    return ev.id == Event::eventId<ToType>() ? static_cast<const ToType*>(&ev) : nullptr;
}
//@}
} // namespace Aspect
