#pragma once

/// Common constants and sentinel values used throughout the codebase.

#include <cmath>
#include <cstdint>

namespace levelsplit {

/// Identity of any host-model element (levels, views, building elements).
using ElementId = std::int64_t;

/// Sentinel value meaning "no valid element."
inline constexpr ElementId INVALID_ID = -1;

/// Absolute epsilon for "is this length zero" tests.
inline constexpr double EPS = 1.0e-9;

/// Overflow allowed into the next level when splitting columns and walls:
/// 10 cm, expressed in feet (the model length unit).
inline constexpr double LEVEL_EXTENSION = 10.0 / (12.0 * 2.54);

inline bool is_almost_zero(double value) noexcept {
    return std::abs(value) < EPS;
}

} // namespace levelsplit
