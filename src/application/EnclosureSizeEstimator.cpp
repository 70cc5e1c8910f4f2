/**
 * @file EnclosureSizeEstimator.cpp
 * @brief Implementation of EnclosureSizeEstimator.
 */

#include "application/EnclosureSizeEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

#include "domain/TextUtils.hpp"

namespace terrascope::application {

using domain::EnclosureCategory;
using domain::EnclosureEstimate;

double EnclosureSizeEstimator::RequiredHeightCm(double juvenileSizeCm) {
    const double padding = std::max(juvenileSizeCm * kPaddingFraction, kMinimumPaddingCm);
    return juvenileSizeCm / kUsableHeightFraction + padding;
}

EnclosureCategory EnclosureSizeEstimator::CategoryForHeight(double requiredHeightCm) {
    if (requiredHeightCm <= 5) return EnclosureCategory::Tiny;
    if (requiredHeightCm <= 15) return EnclosureCategory::Small;
    if (requiredHeightCm <= 30) return EnclosureCategory::Medium;
    if (requiredHeightCm <= 60) return EnclosureCategory::Large;
    if (requiredHeightCm <= 180) return EnclosureCategory::XLarge;
    return EnclosureCategory::Open;
}

EnclosureEstimate EnclosureSizeEstimator::estimate(const std::string& size) const {
    static const std::regex kNumber(R"(\d+(?:\.\d+)?|\.\d+)");
    // "1m", "1-2m" and "2 m" all count as meters.
    static const std::regex kMeters(R"(\d\s*m\b|\bm\b|meter|metre)");

    EnclosureEstimate result;
    const std::string text = domain::TextUtils::Normalize(size);

    std::smatch number;
    if (!std::regex_search(text, number, kNumber)) {
        return result;
    }

    double juvenile = std::strtod(number.str().c_str(), nullptr);
    if (text.find("cm") == std::string::npos) {
        if (!std::regex_search(text, kMeters)) {
            return result;
        }
        juvenile *= 100.0;
    }
    if (!std::isfinite(juvenile)) {
        return result;
    }

    result.juvenileSizeCm = juvenile;
    result.requiredHeightCm = RequiredHeightCm(juvenile);
    result.category = CategoryForHeight(result.requiredHeightCm);
    result.heightBand = domain::HeightBand(result.category);
    result.parsed = true;
    return result;
}

} // namespace terrascope::application
