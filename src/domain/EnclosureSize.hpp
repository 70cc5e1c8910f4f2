/**
 * @file EnclosureSize.hpp
 * @brief Enclosure size categories and their height bands.
 */

#pragma once

#include <optional>
#include <string>

namespace terrascope::domain {

/**
 * @enum EnclosureCategory
 * @brief Minimum enclosure height class, ordered from smallest to unbounded.
 */
enum class EnclosureCategory {
    Tiny,   ///< Up to 5 cm.
    Small,  ///< Up to 15 cm.
    Medium, ///< Up to 30 cm.
    Large,  ///< Up to 60 cm.
    XLarge, ///< Up to 180 cm.
    Open    ///< Beyond any enclosure.
};

inline std::string CategoryToString(EnclosureCategory category) {
    switch (category) {
        case EnclosureCategory::Tiny: return "tiny";
        case EnclosureCategory::Small: return "small";
        case EnclosureCategory::Medium: return "medium";
        case EnclosureCategory::Large: return "large";
        case EnclosureCategory::XLarge: return "xlarge";
        case EnclosureCategory::Open: return "open";
    }
    return "small";
}

inline std::optional<EnclosureCategory> ParseCategory(const std::string& value) {
    if (value == "tiny") return EnclosureCategory::Tiny;
    if (value == "small") return EnclosureCategory::Small;
    if (value == "medium") return EnclosureCategory::Medium;
    if (value == "large") return EnclosureCategory::Large;
    if (value == "xlarge") return EnclosureCategory::XLarge;
    if (value == "open") return EnclosureCategory::Open;
    return std::nullopt;
}

/** @brief Display label of the height band a category covers. */
inline std::string HeightBand(EnclosureCategory category) {
    switch (category) {
        case EnclosureCategory::Tiny: return "0-5 cm";
        case EnclosureCategory::Small: return "5-15 cm";
        case EnclosureCategory::Medium: return "15-30 cm";
        case EnclosureCategory::Large: return "30-60 cm";
        case EnclosureCategory::XLarge: return "60-180 cm";
        case EnclosureCategory::Open: return "180+ cm";
    }
    return "5-15 cm";
}

/**
 * @struct EnclosureEstimate
 * @brief Result of sizing a plant's enclosure from its size string.
 */
struct EnclosureEstimate {
    EnclosureCategory category = EnclosureCategory::Small;
    std::string heightBand = HeightBand(EnclosureCategory::Small);
    double juvenileSizeCm = 0.0;
    double requiredHeightCm = 0.0;
    bool parsed = false; ///< False when the size string had no usable measurement.
};

} // namespace terrascope::domain
