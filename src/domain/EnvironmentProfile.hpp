/**
 * @file EnvironmentProfile.hpp
 * @brief Value Object describing one vivarium archetype and its target ranges.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include "domain/PlantTraits.hpp"
#include "domain/Range.hpp"

namespace terrascope::domain {

/**
 * @enum ProfileGate
 * @brief Physical requirement that excludes a profile outright.
 */
enum class ProfileGate {
    None,
    RequiresAquatic,  ///< Plant must be aquatic (substrate or special needs).
    RequiresEpiphytic ///< Plant must be epiphytic (substrate or special needs).
};

/**
 * @enum WaterBodyRole
 * @brief How a profile's water body changes which dimensions are scored.
 */
enum class WaterBodyRole {
    None,      ///< No water body; water dimensions are satisfied by default.
    Submerged, ///< Fully aquatic environment; terrestrial dimensions are moot.
    Margin     ///< Land plus water; terrestrial dimensions are moot only for aquatic plants.
};

/**
 * @struct EnvironmentProfile
 * @brief Static configuration of a vivarium type.
 */
struct EnvironmentProfile {
    std::string key;     ///< Stable identifier ("open-terrarium").
    std::string name;    ///< Display name ("Open Terrarium").
    std::string summary; ///< One-line description for badges and tooltips.

    Range humidity;
    Range light;
    Range airCirculation;
    Range waterNeeds;
    Range temperature;
    Range difficulty;
    Range soilPh;
    std::optional<Range> growthRate;

    std::set<Substrate> substrates; ///< Substrate classes the profile can host.

    bool waterBody = false;
    WaterBodyRole waterRole = WaterBodyRole::None;
    std::optional<Range> waterCirculation;
    std::optional<Range> waterTemperature;
    std::optional<Range> waterPh;
    std::optional<Range> waterHardness;
    std::optional<Range> salinity;

    ProfileGate gate = ProfileGate::None;
    std::set<SpecialNeeds> matchingNeeds; ///< Exact special-needs affinity.
    std::set<SpecialNeeds> relatedNeeds;  ///< Related-family affinity.

    bool accepts(Substrate substrate) const {
        return substrates.find(substrate) != substrates.end();
    }
};

} // namespace terrascope::domain
