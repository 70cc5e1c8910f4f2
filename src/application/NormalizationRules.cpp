/**
 * @file NormalizationRules.cpp
 * @brief Keyword tables for every text-parsed dimension.
 */

#include "application/NormalizationRules.hpp"

#include <algorithm>

namespace terrascope::application::rules {

using domain::ContainsAny;
using domain::KeywordRules;
using domain::SpecialNeeds;
using domain::Substrate;
using domain::TextHasAny;

namespace {

bool HasCategory(const std::vector<std::string>& categories, const std::string& category) {
    return std::find(categories.begin(), categories.end(), category) != categories.end();
}

// "direct" on its own, not as part of "indirect".
bool MentionsDirectSun(const std::string& text) {
    size_t pos = text.find("direct");
    while (pos != std::string::npos) {
        if (pos < 2 || text.compare(pos - 2, 2, "in") != 0) return true;
        pos = text.find("direct", pos + 1);
    }
    return false;
}

} // namespace

bool SubstrateEvidence::hasCategory(const std::string& category) const {
    return HasCategory(categories, category);
}

bool NeedsEvidence::hasCategory(const std::string& category) const {
    return HasCategory(categories, category);
}

const TextRules& HumidityRules() {
    static const TextRules rules{
        {"very-high", TextHasAny({"very high", "very-high", "70-90", "80-100", "85-100"}), "very-high"},
        {"high", TextHasAny({"high", "60-80", "70-80"}), "high"},
        {"very-low", TextHasAny({"very low", "very-low", "20-30"}), "very-low"},
        {"moderate", TextHasAny({"moderate", "50-70", "40-60"}), "moderate"},
        {"low", TextHasAny({"low", "40-50", "30-40"}), "low"},
        {"aquatic", TextHasAny({"submerged", "aquatic"}), "aquatic"},
    };
    return rules;
}

const TextRules& LightRules() {
    static const TextRules rules{
        {"very-bright",
         [](const std::string& t) {
             return ContainsAny(t, {"very bright", "very-bright", "full sun"}) || MentionsDirectSun(t);
         },
         "very-bright"},
        {"very-low", TextHasAny({"very low", "very-low", "deep shade"}), "very-low"},
        {"bright", TextHasAny({"bright"}), "bright"},
        {"moderate", TextHasAny({"moderate", "medium"}), "moderate"},
        {"low", TextHasAny({"low", "shade"}), "low"},
    };
    return rules;
}

const TextRules& AirCirculationFieldRules() {
    static const TextRules rules{
        {"very-high", TextHasAny({"very high", "very-high", "open air", "outdoor"}), "very-high"},
        {"high", TextHasAny({"high", "well-ventilated", "good air flow"}), "high"},
        {"moderate", TextHasAny({"moderate", "ventilated", "air circulation"}), "moderate"},
        {"low", TextHasAny({"low", "semi-closed", "partially open"}), "low"},
        {"minimal", TextHasAny({"minimal", "closed", "sealed", "self-contained"}), "minimal"},
    };
    return rules;
}

const TextRules& AirCirculationContextRules() {
    static const TextRules rules{
        {"low", TextHasAny({"semi-closed", "partially open"}), "low"},
        {"minimal", TextHasAny({"closed", "sealed", "self-contained"}), "minimal"},
        {"very-high", TextHasAny({"open air", "outdoor"}), "very-high"},
        {"high", TextHasAny({"well-ventilated", "good air flow", "open"}), "high"},
        {"moderate", TextHasAny({"ventilated", "air circulation"}), "moderate"},
    };
    return rules;
}

const KeywordRules<WateringEvidence, std::string>& WaterNeedsRules() {
    static const KeywordRules<WateringEvidence, std::string> rules{
        {"semi-aquatic",
         [](const WateringEvidence& e) { return ContainsAny(e.text, {"semi-aquatic"}); },
         "high"},
        {"constant",
         [](const WateringEvidence& e) {
             return ContainsAny(e.text, {"constantly", "always moist", "always wet"});
         },
         "constant"},
        {"aquatic",
         [](const WateringEvidence& e) {
             return e.aquaticSubstrate && e.text.find("semi") == std::string::npos;
         },
         "constant"},
        {"high",
         [](const WateringEvidence& e) { return ContainsAny(e.text, {"frequently", "keep moist", "high"}); },
         "high"},
        {"moderate",
         [](const WateringEvidence& e) { return ContainsAny(e.text, {"moderate", "regular"}); },
         "moderate"},
        {"low",
         [](const WateringEvidence& e) { return ContainsAny(e.text, {"infrequent", "low"}); },
         "low"},
        {"minimal",
         [](const WateringEvidence& e) { return ContainsAny(e.text, {"minimal", "drought"}); },
         "minimal"},
    };
    return rules;
}

const KeywordRules<FieldAndContext, std::string>& WaterCirculationRules() {
    static const KeywordRules<FieldAndContext, std::string> rules{
        {"very-high",
         [](const FieldAndContext& s) {
             return ContainsAny(s.field, {"very high", "strong current", "fast flow"}) ||
                    ContainsAny(s.context, {"strong current", "fast flow"});
         },
         "very-high"},
        {"high",
         [](const FieldAndContext& s) {
             return ContainsAny(s.field, {"high", "good flow", "moderate current"}) ||
                    ContainsAny(s.context, {"good flow", "moderate current"});
         },
         "high"},
        {"moderate",
         [](const FieldAndContext& s) {
             return ContainsAny(s.field, {"moderate", "gentle flow"}) ||
                    ContainsAny(s.context, {"gentle flow"});
         },
         "moderate"},
        {"low",
         [](const FieldAndContext& s) {
             return ContainsAny(s.field, {"low", "still", "stagnant"}) ||
                    ContainsAny(s.context, {"still water", "stagnant"});
         },
         "low"},
        {"none",
         [](const FieldAndContext& s) { return ContainsAny(s.field, {"none", "no flow"}); },
         "none"},
    };
    return rules;
}

const TextRules& GrowthRateRules() {
    static const TextRules rules{
        {"very-fast", TextHasAny({"very fast", "extremely fast"}), "very-fast"},
        {"moderate-fast",
         TextHasAny({"fast to moderate", "moderate to fast", "fast-moderate", "moderate-fast"}),
         "moderate-fast"},
        {"fast", TextHasAny({"fast"}), "fast"},
        {"slow-moderate",
         TextHasAny({"moderate to slow", "slow to moderate", "moderate-slow", "slow-moderate"}),
         "slow-moderate"},
        {"moderate", TextHasAny({"moderate"}), "moderate"},
        {"very-slow", TextHasAny({"very slow"}), "very-slow"},
        {"slow", TextHasAny({"slow"}), "slow"},
    };
    return rules;
}

const TextRules& DifficultyRules() {
    static const TextRules rules{
        {"easy", TextHasAny({"easy"}), "easy"},
        {"moderate", TextHasAny({"moderate"}), "moderate"},
        {"hard", TextHasAny({"hard"}), "hard"},
    };
    return rules;
}

const TextRules& WaterHardnessRules() {
    static const TextRules rules{
        {"very-soft", TextHasAny({"very soft", "extremely soft"}), "very-soft"},
        {"soft", TextHasAny({"soft"}), "soft"},
        {"moderate", TextHasAny({"moderately hard", "moderate hardness"}), "moderate"},
        {"very-hard", TextHasAny({"very hard"}), "very-hard"},
        {"hard", TextHasAny({"hard"}), "hard"},
    };
    return rules;
}

const TextRules& SalinityRules() {
    static const TextRules rules{
        {"marine", TextHasAny({"marine", "saltwater", "seawater"}), "marine"},
        {"brackish", TextHasAny({"brackish"}), "brackish"},
        {"freshwater", TextHasAny({"freshwater", "fresh water"}), "freshwater"},
    };
    return rules;
}

const KeywordRules<SubstrateEvidence, Substrate>& SubstrateRules() {
    static const KeywordRules<SubstrateEvidence, Substrate> rules{
        {"aquatic",
         [](const SubstrateEvidence& e) {
             const bool waterName = e.name.find("water") != std::string::npos &&
                                    ContainsAny(e.name, {"plant", "fern", "moss"});
             return e.substrate.find("aquatic") != std::string::npos ||
                    e.growthHabit == "aquatic" ||
                    e.hasCategory("aquatic") ||
                    e.humidity.find("submerged") != std::string::npos ||
                    e.name.find("aquatic") != std::string::npos ||
                    waterName ||
                    ContainsAny(e.description, {"fully aquatic", "submerged", "underwater", "aquarium plant"}) ||
                    e.scientificName.find("aquatic") != std::string::npos;
         },
         Substrate::Aquatic},
        {"epiphytic",
         [](const SubstrateEvidence& e) {
             return e.growthHabit == "epiphytic" ||
                    e.substrate.find("epiphytic") != std::string::npos ||
                    e.hasCategory("epiphytic") || e.hasCategory("air-plant") || e.hasCategory("bromeliad");
         },
         Substrate::Epiphytic},
        {"dry",
         [](const SubstrateEvidence& e) {
             return ContainsAny(e.substrate, {"dry", "well-draining", "sand"}) ||
                    e.hasCategory("succulent") || e.hasCategory("cactus");
         },
         Substrate::Dry},
        {"wet",
         [](const SubstrateEvidence& e) { return ContainsAny(e.substrate, {"wet", "waterlogged", "bog"}); },
         Substrate::Wet},
    };
    return rules;
}

const KeywordRules<NeedsEvidence, SpecialNeeds>& SpecialNeedsRules() {
    static const KeywordRules<NeedsEvidence, SpecialNeeds> rules{
        {"carnivorous", [](const NeedsEvidence& e) { return e.hasCategory("carnivorous"); },
         SpecialNeeds::Carnivorous},
        {"epiphytic",
         [](const NeedsEvidence& e) { return e.hasCategory("epiphytic") || e.hasCategory("air-plant"); },
         SpecialNeeds::Epiphytic},
        {"aquatic",
         [](const NeedsEvidence& e) { return e.hasCategory("aquatic") || e.substrate == Substrate::Aquatic; },
         SpecialNeeds::Aquatic},
        {"succulent",
         [](const NeedsEvidence& e) { return e.hasCategory("succulent") || e.hasCategory("cactus"); },
         SpecialNeeds::Succulent},
        {"bromeliad", [](const NeedsEvidence& e) { return e.hasCategory("bromeliad"); },
         SpecialNeeds::Bromeliad},
        {"orchid", [](const NeedsEvidence& e) { return e.hasCategory("orchid"); },
         SpecialNeeds::Orchid},
    };
    return rules;
}

} // namespace terrascope::application::rules
