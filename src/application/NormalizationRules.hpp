/**
 * @file NormalizationRules.hpp
 * @brief Ordered keyword rule lists used by the attribute normalizer.
 *
 * Every list is most-specific-first; the first matching rule wins. Text
 * subjects are expected to be lower-cased already.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/KeywordRules.hpp"
#include "domain/PlantTraits.hpp"

namespace terrascope::application::rules {

using TextRules = domain::KeywordRules<std::string, std::string>;

/** @brief A dimension's own field text plus description/care-tip context. */
struct FieldAndContext {
    std::string field;
    std::string context;
};

struct WateringEvidence {
    std::string text;
    bool aquaticSubstrate = false;
};

/** @brief Lower-cased record fields the substrate heuristics look at. */
struct SubstrateEvidence {
    std::string substrate;
    std::string growthHabit;
    std::vector<std::string> categories;
    std::string name;
    std::string description;
    std::string scientificName;
    std::string humidity;

    bool hasCategory(const std::string& category) const;
};

struct NeedsEvidence {
    std::vector<std::string> categories;
    domain::Substrate substrate = domain::Substrate::Moist;

    bool hasCategory(const std::string& category) const;
};

const TextRules& HumidityRules();
const TextRules& LightRules();

/** @brief Rules over the airCirculation field itself. */
const TextRules& AirCirculationFieldRules();

/** @brief Rules over description and care tips, used when the field is silent. */
const TextRules& AirCirculationContextRules();

const domain::KeywordRules<WateringEvidence, std::string>& WaterNeedsRules();
const domain::KeywordRules<FieldAndContext, std::string>& WaterCirculationRules();
const TextRules& GrowthRateRules();
const TextRules& DifficultyRules();
const TextRules& WaterHardnessRules();
const TextRules& SalinityRules();

const domain::KeywordRules<SubstrateEvidence, domain::Substrate>& SubstrateRules();
const domain::KeywordRules<NeedsEvidence, domain::SpecialNeeds>& SpecialNeedsRules();

} // namespace terrascope::application::rules
