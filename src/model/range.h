#pragma once

namespace levelsplit {

/// A closed vertical interval [start, end] in model length units.
/// Either an element's full extent or one split fragment.
struct Range {
    double start = 0.0;
    double end   = 0.0;

    double length() const noexcept { return end - start; }
};

inline bool operator==(const Range& a, const Range& b) noexcept {
    return a.start == b.start && a.end == b.end;
}

} // namespace levelsplit
