/**
 * @file EnclosureSizeEstimator.hpp
 * @brief Derives the minimum enclosure height class from a plant's size string.
 */

#pragma once

#include <string>
#include "domain/EnclosureSize.hpp"

namespace terrascope::application {

/**
 * @class EnclosureSizeEstimator
 * @brief Sizes an enclosure for the juvenile (smallest quoted) plant size.
 *
 * Substrate takes 30% of the height, so the plant gets 70% of it, plus 20%
 * padding (at least 2 cm).
 */
class EnclosureSizeEstimator {
public:
    static constexpr double kUsableHeightFraction = 0.70;
    static constexpr double kPaddingFraction = 0.20;
    static constexpr double kMinimumPaddingCm = 2.0;

    /** @brief Unparseable strings yield a Small estimate with parsed == false. */
    domain::EnclosureEstimate estimate(const std::string& size) const;

    static double RequiredHeightCm(double juvenileSizeCm);
    static domain::EnclosureCategory CategoryForHeight(double requiredHeightCm);
};

} // namespace terrascope::application
