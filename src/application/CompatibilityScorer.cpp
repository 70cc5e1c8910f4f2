/**
 * @file CompatibilityScorer.cpp
 * @brief Implementation of CompatibilityScorer.
 */

#include "application/CompatibilityScorer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "domain/TextUtils.hpp"

namespace terrascope::application {

using domain::DimensionRule;
using domain::EnvironmentProfile;
using domain::NormalizedInputs;
using domain::PlantRecord;
using domain::ProfileGate;
using domain::Range;
using domain::SpecialNeeds;
using domain::Substrate;
using domain::WaterBodyRole;
namespace names = domain::profile_names;

namespace {

constexpr double kLowAirCirculationIdeal = 30.0;

bool HasCategory(const PlantRecord& record, const std::string& wanted) {
    for (const auto& category : record.category) {
        if (domain::TextUtils::Normalize(category) == wanted) return true;
    }
    return false;
}

bool IsDesertPlant(const PlantRecord& record, const NormalizedInputs& inputs) {
    return inputs.substrate == Substrate::Dry || inputs.specialNeeds == SpecialNeeds::Succulent ||
           HasCategory(record, "succulent") || HasCategory(record, "cactus");
}

// The safety net works from normalized traits only, so a cactus category alone is not enough.
bool IsSucculentPlant(const PlantRecord& record, const NormalizedInputs& inputs) {
    return inputs.substrate == Substrate::Dry || inputs.specialNeeds == SpecialNeeds::Succulent ||
           HasCategory(record, "succulent");
}

/** Scores at or above the threshold, best first, catalog order on ties. */
std::vector<ScoreResult> Qualifying(const std::vector<ScoreResult>& scores, double threshold) {
    std::vector<ScoreResult> ranked;
    for (const auto& score : scores) {
        if (score.score >= threshold) ranked.push_back(score);
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoreResult& a, const ScoreResult& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.catalogOrder < b.catalogOrder;
    });
    return ranked;
}

/** Accumulates score and attainable maximum for one profile. */
class Tally {
public:
    void full(const DimensionRule& rule) {
        m_max += rule.weight;
        m_score += rule.weight;
    }

    void overlap(const Range& plant, const Range& target, const DimensionRule& rule, double minimumOverlap) {
        m_max += rule.weight;
        m_score += CompatibilityScorer::OverlapScore(plant, target, rule, minimumOverlap);
    }

    void optionalOverlap(const std::optional<Range>& plant, const std::optional<Range>& target,
                         const DimensionRule& rule, double minimumOverlap) {
        m_max += rule.weight;
        if (plant && target) {
            m_score += CompatibilityScorer::OverlapScore(*plant, *target, rule, minimumOverlap);
        }
    }

    void add(double weight, double earned) {
        m_max += weight;
        m_score += earned;
    }

    double score() const { return m_score; }
    double max() const { return m_max; }

private:
    double m_score = 0.0;
    double m_max = 0.0;
};

} // namespace

std::string SourceToString(ClassificationSource source) {
    switch (source) {
        case ClassificationSource::Ranked: return "ranked";
        case ClassificationSource::Fallback: return "fallback";
        case ClassificationSource::SafetyNet: return "safety-net";
    }
    return "ranked";
}

CompatibilityScorer::CompatibilityScorer(std::shared_ptr<const domain::EnvironmentProfileCatalog> catalog,
                                         domain::ScoringRules rules,
                                         std::shared_ptr<const domain::ScaleTable> scale)
    : m_catalog(std::move(catalog)), m_rules(rules), m_normalizer(std::move(scale)) {
    if (!m_catalog) {
        throw std::invalid_argument("CompatibilityScorer requires a profile catalog");
    }
}

bool CompatibilityScorer::PassesGates(const EnvironmentProfile& profile, const NormalizedInputs& inputs) {
    switch (profile.gate) {
        case ProfileGate::RequiresAquatic: return inputs.isAquatic();
        case ProfileGate::RequiresEpiphytic: return inputs.isEpiphytic();
        case ProfileGate::None: return true;
    }
    return true;
}

double CompatibilityScorer::OverlapScore(const Range& plant, const Range& target,
                                         const DimensionRule& rule, double minimumOverlap) {
    const double overlapMin = std::max(plant.min, target.min);
    const double overlapMax = std::min(plant.max, target.max);
    if (overlapMin > overlapMax) {
        return 0.0;
    }

    const double plantWidth = plant.width();
    const double overlapPct = plantWidth > 0.0 ? (overlapMax - overlapMin) / plantWidth : 1.0;
    const double base = overlapPct >= minimumOverlap ? rule.credit : overlapPct * rule.credit;

    const double distance = std::abs((overlapMin + overlapMax) / 2.0 - target.ideal);
    const double penalty = std::min(distance * rule.k, base * rule.cap);
    return std::max(0.0, base - penalty);
}

double CompatibilityScorer::scoreProfile(const EnvironmentProfile& profile, const NormalizedInputs& inputs) const {
    const double minOverlap = m_rules.minimumOverlap;
    const bool submerged = profile.waterRole == WaterBodyRole::Submerged;
    const bool aquaticMargin = profile.waterRole == WaterBodyRole::Margin && inputs.substrate == Substrate::Aquatic;
    // Inside the water the terrestrial dimensions are moot and water chemistry decides.
    const bool waterDriven = submerged || aquaticMargin;

    Tally tally;

    if (waterDriven) {
        tally.full(m_rules.humidity);
        tally.full(m_rules.airCirculation);
        tally.full(m_rules.waterNeeds);
        tally.full(m_rules.temperature);
    } else {
        tally.overlap(inputs.humidity, profile.humidity, m_rules.humidity, minOverlap);
        tally.overlap(inputs.airCirculation, profile.airCirculation, m_rules.airCirculation, minOverlap);
        tally.overlap(inputs.waterNeeds, profile.waterNeeds, m_rules.waterNeeds, minOverlap);
        tally.overlap(inputs.temperature, profile.temperature, m_rules.temperature, minOverlap);
    }

    tally.overlap(inputs.light, profile.light, m_rules.light, minOverlap);
    tally.add(m_rules.substrateWeight, profile.accepts(inputs.substrate) ? m_rules.substrateWeight : 0.0);

    // An aquatic plant at a water margin has no soil to measure.
    if (!aquaticMargin) {
        tally.overlap(inputs.soilPh, profile.soilPh, m_rules.soilPh, minOverlap);
    }

    if (waterDriven) {
        const auto target = [&profile](const std::optional<Range>& range) -> std::optional<Range> {
            if (!profile.waterBody) return std::nullopt;
            return range;
        };
        tally.optionalOverlap(inputs.waterCirculation, target(profile.waterCirculation), m_rules.waterCirculation, minOverlap);
        tally.optionalOverlap(inputs.waterTemperature, target(profile.waterTemperature), m_rules.waterTemperature, minOverlap);
        tally.optionalOverlap(inputs.waterPh, target(profile.waterPh), m_rules.waterPh, minOverlap);
        tally.optionalOverlap(inputs.waterHardness, target(profile.waterHardness), m_rules.waterHardness, minOverlap);
        tally.optionalOverlap(inputs.salinity, target(profile.salinity), m_rules.salinity, minOverlap);
    } else {
        tally.full(m_rules.waterCirculation);
        tally.full(m_rules.waterTemperature);
        tally.full(m_rules.waterPh);
        tally.full(m_rules.waterHardness);
        tally.full(m_rules.salinity);
    }

    double needs = 0.0;
    if (inputs.specialNeeds == SpecialNeeds::None) {
        needs = m_rules.specialNeedsNone;
    } else if (profile.matchingNeeds.count(inputs.specialNeeds)) {
        needs = m_rules.specialNeedsMatch;
    } else if (profile.relatedNeeds.count(inputs.specialNeeds)) {
        needs = m_rules.specialNeedsRelated;
    }
    tally.add(m_rules.specialNeedsWeight, needs);

    if (!(tally.max() > 0.0)) {
        throw std::domain_error("Profile '" + profile.name + "' has no attainable score");
    }
    return tally.score() / tally.max() * 100.0;
}

std::vector<ScoreResult> CompatibilityScorer::scoreProfiles(const NormalizedInputs& inputs) const {
    std::vector<ScoreResult> results;
    const auto& profiles = m_catalog->profiles();
    for (size_t i = 0; i < profiles.size(); ++i) {
        if (!PassesGates(profiles[i], inputs)) continue;
        results.push_back({profiles[i].name, scoreProfile(profiles[i], inputs), i});
    }
    return results;
}

std::vector<ScoreResult> CompatibilityScorer::rankProfiles(const NormalizedInputs& inputs) const {
    return Qualifying(scoreProfiles(inputs), m_rules.qualifyThreshold);
}

Classification CompatibilityScorer::classify(const PlantRecord& record) const {
    Classification result;
    try {
        const NormalizedInputs inputs = m_normalizer.normalize(record);
        const auto scores = scoreProfiles(inputs);

        const auto ranked = Qualifying(scores, m_rules.qualifyThreshold);

        if (!ranked.empty()) {
            for (const auto& score : ranked) result.profiles.push_back(score.profileName);
            result.source = ClassificationSource::Ranked;
        } else {
            result.profiles.push_back(fallbackProfile(record, inputs, scores));
            result.source = ClassificationSource::Fallback;
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[CompatibilityScorer] Scoring failed for '" << record.name << "': " << e.what() << std::endl;
    }

    result.profiles = {safetyNetProfile(record)};
    result.source = ClassificationSource::SafetyNet;
    return result;
}

std::string CompatibilityScorer::fallbackProfile(const PlantRecord& record,
                                                 const NormalizedInputs& inputs,
                                                 const std::vector<ScoreResult>& scores) const {
    const auto scoreOf = [&scores](const std::string& name) -> std::optional<double> {
        for (const auto& s : scores) {
            if (s.profileName == name) return s.score;
        }
        return std::nullopt;
    };
    const auto reaches = [&](const std::string& name) {
        auto score = scoreOf(name);
        return score && *score >= m_rules.fallbackThreshold;
    };

    // Desert plants never fall back to a humid terrarium.
    if (IsDesertPlant(record, inputs)) {
        return reaches(names::kDeserterium) ? names::kDeserterium : names::kIndoor;
    }
    if (inputs.isEpiphytic() && reaches(names::kAerarium)) {
        return names::kAerarium;
    }
    return terrariumByAirCirculation(inputs);
}

std::string CompatibilityScorer::safetyNetProfile(const PlantRecord& record) const {
    try {
        const NormalizedInputs inputs = m_normalizer.normalize(record);
        if (inputs.isAquatic()) return names::kAquarium;
        if (IsSucculentPlant(record, inputs)) return names::kDeserterium;
        if (inputs.isEpiphytic()) return names::kAerarium;
        return terrariumByAirCirculation(inputs);
    } catch (const std::exception& e) {
        std::cerr << "[CompatibilityScorer] Safety net failed for '" << record.name << "': " << e.what() << std::endl;
    }
    return names::kOpenTerrarium;
}

std::string CompatibilityScorer::terrariumByAirCirculation(const NormalizedInputs& inputs) const {
    const auto low = m_normalizer.scale().find(domain::ScaleDimension::AirCirculation, "low");
    const double limit = low ? low->ideal : kLowAirCirculationIdeal;
    return inputs.airCirculation.ideal <= limit ? names::kClosedTerrarium : names::kOpenTerrarium;
}

} // namespace terrascope::application
