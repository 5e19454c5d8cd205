#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>

namespace cobra {

using SizeType  = std::size_t;
using IndexType = std::ptrdiff_t;
using JobId     = std::uint64_t;

// Storage position of a point inside a branch's point array.
struct ArrayIndex {
    SizeType value{};

    constexpr auto operator<=>(const ArrayIndex&) const = default;
};

// Parameter-order label of a point. May be negative or non-contiguous after
// trimming or backward extension.
struct LogicalIndex {
    std::int64_t value{};

    constexpr auto operator<=>(const LogicalIndex&) const = default;
};

enum class Direction : std::uint8_t { kForward, kBackward };

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};

// Tangents with a norm at or below this are treated as unobtainable.
inline constexpr double kDegenerateNorm = 1e-12;
inline constexpr double kDefaultSeedStep = 0.01;

} // namespace cobra
