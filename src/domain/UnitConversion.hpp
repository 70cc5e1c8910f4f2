/**
 * @file UnitConversion.hpp
 * @brief Linear conversions from physical units onto the 0-100 normalized scale.
 */

#pragma once

#include <algorithm>

namespace terrascope::domain::units {

inline double ClampPercent(double value) {
    return std::clamp(value, 0.0, 100.0);
}

/** @brief General hardness: 0 dGH = 0%, 30 dGH = 100%. */
inline double HardnessDghToPercent(double dgh) {
    return ClampPercent(dgh / 30.0 * 100.0);
}

/** @brief Salinity: 0 ppt = 0%, 40 ppt = 100%. */
inline double SalinityPptToPercent(double ppt) {
    return ClampPercent(ppt / 40.0 * 100.0);
}

/** @brief Specific gravity: 1.000 = 0%, 1.030 = 100%. */
inline double SpecificGravityToPercent(double sg) {
    return ClampPercent((sg - 1.0) / 0.030 * 100.0);
}

/** @brief pH 0 = 0%, pH 14 = 100%. */
inline double PhToPercent(double ph) {
    return ClampPercent(ph / 14.0 * 100.0);
}

/** @brief 0 degC = 0%, 50 degC = 100%. */
inline double CelsiusToPercent(double celsius) {
    return ClampPercent(celsius / 50.0 * 100.0);
}

// Half-widths of the band built around a single parsed value.
constexpr double kPhBand = 3.0;
constexpr double kHardnessBand = 5.0;
constexpr double kTemperatureBand = 5.0;

} // namespace terrascope::domain::units
