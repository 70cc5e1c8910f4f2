/**
 * @file NormalizedInputs.hpp
 * @brief Canonical numeric view of a plant, produced by the attribute normalizer.
 */

#pragma once

#include <optional>
#include "domain/PlantTraits.hpp"
#include "domain/Range.hpp"

namespace terrascope::domain {

/**
 * @struct NormalizedInputs
 * @brief One range per dimension on the 0-100 scale plus categorical traits.
 *
 * The water* ranges and salinity are populated only for aquatic plants.
 */
struct NormalizedInputs {
    Range humidity;
    Range light;
    Range airCirculation;
    Range waterNeeds;
    Range temperature;
    Range soilPh;
    Range difficulty;
    Range growthRate;

    std::optional<Range> waterCirculation;
    std::optional<Range> waterTemperature;
    std::optional<Range> waterPh;
    std::optional<Range> waterHardness;
    std::optional<Range> salinity;

    Substrate substrate = Substrate::Moist;
    SpecialNeeds specialNeeds = SpecialNeeds::None;
    double maxSize = 30.0; ///< Centimeters.

    bool isAquatic() const {
        return substrate == Substrate::Aquatic || specialNeeds == SpecialNeeds::Aquatic;
    }

    bool isEpiphytic() const {
        return substrate == Substrate::Epiphytic || specialNeeds == SpecialNeeds::Epiphytic;
    }

    bool operator==(const NormalizedInputs& other) const {
        return humidity == other.humidity && light == other.light &&
               airCirculation == other.airCirculation && waterNeeds == other.waterNeeds &&
               temperature == other.temperature && soilPh == other.soilPh &&
               difficulty == other.difficulty && growthRate == other.growthRate &&
               waterCirculation == other.waterCirculation &&
               waterTemperature == other.waterTemperature && waterPh == other.waterPh &&
               waterHardness == other.waterHardness && salinity == other.salinity &&
               substrate == other.substrate && specialNeeds == other.specialNeeds &&
               maxSize == other.maxSize;
    }
};

} // namespace terrascope::domain
