/**
 * @file PlantTraits.hpp
 * @brief Categorical plant traits: substrate class and special needs.
 */

#pragma once

#include <optional>
#include <string>

namespace terrascope::domain {

/**
 * @enum Substrate
 * @brief Growing-medium class of a plant.
 */
enum class Substrate {
    Dry,
    Moist,
    Wet,
    Epiphytic,
    Aquatic
};

/**
 * @enum SpecialNeeds
 * @brief Husbandry family that earns a profile affinity bonus.
 */
enum class SpecialNeeds {
    None,
    Carnivorous,
    Epiphytic,
    Aquatic,
    Succulent,
    Bromeliad,
    Orchid
};

inline std::string SubstrateToString(Substrate substrate) {
    switch (substrate) {
        case Substrate::Dry: return "dry";
        case Substrate::Moist: return "moist";
        case Substrate::Wet: return "wet";
        case Substrate::Epiphytic: return "epiphytic";
        case Substrate::Aquatic: return "aquatic";
    }
    return "moist";
}

/**
 * @brief Parses a canonical substrate name (case-sensitive, as stored in the dataset).
 * @return std::nullopt for anything that is not one of the five classes.
 */
inline std::optional<Substrate> ParseSubstrate(const std::string& value) {
    if (value == "dry") return Substrate::Dry;
    if (value == "moist") return Substrate::Moist;
    if (value == "wet") return Substrate::Wet;
    if (value == "epiphytic") return Substrate::Epiphytic;
    if (value == "aquatic") return Substrate::Aquatic;
    return std::nullopt;
}

inline std::string SpecialNeedsToString(SpecialNeeds needs) {
    switch (needs) {
        case SpecialNeeds::None: return "none";
        case SpecialNeeds::Carnivorous: return "carnivorous";
        case SpecialNeeds::Epiphytic: return "epiphytic";
        case SpecialNeeds::Aquatic: return "aquatic";
        case SpecialNeeds::Succulent: return "succulent";
        case SpecialNeeds::Bromeliad: return "bromeliad";
        case SpecialNeeds::Orchid: return "orchid";
    }
    return "none";
}

inline std::optional<SpecialNeeds> ParseSpecialNeeds(const std::string& value) {
    if (value == "none") return SpecialNeeds::None;
    if (value == "carnivorous") return SpecialNeeds::Carnivorous;
    if (value == "epiphytic") return SpecialNeeds::Epiphytic;
    if (value == "aquatic") return SpecialNeeds::Aquatic;
    if (value == "succulent") return SpecialNeeds::Succulent;
    if (value == "bromeliad") return SpecialNeeds::Bromeliad;
    if (value == "orchid") return SpecialNeeds::Orchid;
    return std::nullopt;
}

} // namespace terrascope::domain
