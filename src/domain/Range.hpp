/**
 * @file Range.hpp
 * @brief Value Object for a normalized {min, max, ideal} requirement range.
 */

#pragma once

#include <algorithm>
#include <cmath>

namespace terrascope::domain {

/**
 * @struct Range
 * @brief Requirement band on the 0-100 normalized scale (centimeters for sizes).
 *
 * A well-formed range satisfies lower <= min <= ideal <= max <= upper.
 */
struct Range {
    double min = 0.0;   ///< Lower bound.
    double max = 0.0;   ///< Upper bound.
    double ideal = 0.0; ///< Preferred value inside the band.

    /** @brief Builds a range from two bounds in any order, ideal at the midpoint. */
    static Range FromBounds(double a, double b) {
        const double lo = std::min(a, b);
        const double hi = std::max(a, b);
        return {lo, hi, (lo + hi) / 2.0};
    }

    /** @brief Builds a band of +/- halfWidth around a center, clamped to [lower, upper]. */
    static Range Around(double center, double halfWidth, double lower = 0.0, double upper = 100.0) {
        const double c = std::clamp(center, lower, upper);
        return {std::max(lower, c - halfWidth), std::min(upper, c + halfWidth), c};
    }

    double midpoint() const { return (min + max) / 2.0; }
    double width() const { return max - min; }
    bool contains(double value) const { return value >= min && value <= max; }

    /** @brief True when the range is ordered and lies within [lower, upper]. */
    bool isValid(double lower = 0.0, double upper = 100.0) const {
        return std::isfinite(min) && std::isfinite(max) && std::isfinite(ideal) &&
               lower <= min && min <= ideal && ideal <= max && max <= upper;
    }

    /**
     * @brief Returns an ordered copy clamped to [lower, upper] with the ideal pulled inside.
     */
    Range sanitized(double lower = 0.0, double upper = 100.0) const {
        Range r = FromBounds(std::clamp(min, lower, upper), std::clamp(max, lower, upper));
        r.ideal = std::isfinite(ideal) ? std::clamp(ideal, r.min, r.max) : r.midpoint();
        return r;
    }

    /** @brief Widens both bounds by amount (clamped), keeping the ideal. */
    Range widened(double amount, double lower = 0.0, double upper = 100.0) const {
        return {std::max(lower, min - amount), std::min(upper, max + amount), ideal};
    }

    bool operator==(const Range& other) const {
        return min == other.min && max == other.max && ideal == other.ideal;
    }
    bool operator!=(const Range& other) const { return !(*this == other); }
};

} // namespace terrascope::domain
