/**
 * @file ScoringRules.hpp
 * @brief Weights, credits and penalty coefficients of the compatibility scorer.
 */

#pragma once

namespace terrascope::domain {

/**
 * @struct DimensionRule
 * @brief Scoring parameters of one overlap-scored dimension.
 *
 * weight accumulates into the profile's maximum score; credit is what a
 * sufficient overlap earns before the ideal-distance penalty. The penalty is
 * |overlap midpoint - profile ideal| * k, capped at credit * cap.
 */
struct DimensionRule {
    double weight = 0.0;
    double credit = 0.0;
    double k = 0.0;
    double cap = 0.0;
};

/**
 * @struct ScoringRules
 * @brief Full rule set. Default-constructed values are the stock tuning.
 */
struct ScoringRules {
    DimensionRule humidity{25, 20, 0.15, 0.25};
    DimensionRule light{15, 15, 0.10, 0.20};
    DimensionRule airCirculation{15, 15, 0.10, 0.20};
    DimensionRule waterNeeds{10, 10, 0.08, 0.15};
    DimensionRule temperature{5, 5, 0.03, 0.15};
    DimensionRule soilPh{5, 5, 0.03, 0.15};

    DimensionRule waterCirculation{5, 5, 0.05, 0.15};
    DimensionRule waterTemperature{3, 3, 0.02, 0.15};
    DimensionRule waterPh{3, 3, 0.02, 0.15};
    DimensionRule waterHardness{2, 2, 0.01, 0.15};
    DimensionRule salinity{2, 2, 0.01, 0.15};

    double substrateWeight = 20.0;

    double specialNeedsWeight = 10.0;
    double specialNeedsMatch = 10.0;
    double specialNeedsRelated = 8.0;
    double specialNeedsNone = 5.0;

    /** Overlap below this fraction earns proportional credit only. */
    double minimumOverlap = 0.3;

    double qualifyThreshold = 70.0; ///< Percent a profile needs to be listed.
    double fallbackThreshold = 50.0; ///< Percent a fallback candidate needs.
};

} // namespace terrascope::domain
