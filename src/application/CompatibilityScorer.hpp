/**
 * @file CompatibilityScorer.hpp
 * @brief Ranks vivarium profiles for a plant by weighted range overlap.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/AttributeNormalizer.hpp"
#include "domain/EnvironmentProfileCatalog.hpp"
#include "domain/ScoringRules.hpp"

namespace terrascope::application {

/** @brief Percentage score of one profile. */
struct ScoreResult {
    std::string profileName;
    double score = 0.0;      ///< 0-100.
    size_t catalogOrder = 0; ///< Position in the catalog, breaks ties.
};

enum class ClassificationSource {
    Ranked,   ///< At least one profile reached the qualify threshold.
    Fallback, ///< Deterministic pick by plant traits.
    SafetyNet ///< Scoring faulted; answered from traits alone.
};

std::string SourceToString(ClassificationSource source);

struct Classification {
    std::vector<std::string> profiles; ///< Never empty.
    ClassificationSource source = ClassificationSource::Ranked;
};

/**
 * @class CompatibilityScorer
 * @brief Scores every eligible catalog profile against a plant's normalized inputs.
 *
 * Stateless after construction; safe to share between threads.
 */
class CompatibilityScorer {
public:
    explicit CompatibilityScorer(
        std::shared_ptr<const domain::EnvironmentProfileCatalog> catalog = domain::EnvironmentProfileCatalog::Standard(),
        domain::ScoringRules rules = {},
        std::shared_ptr<const domain::ScaleTable> scale = domain::ScaleTable::Standard());

    /**
     * @brief Profile names the plant fits, best first, or a single fallback name.
     *
     * Never throws: scoring faults are logged and answered by the safety net.
     */
    Classification classify(const domain::PlantRecord& record) const;

    /** @brief Scores of every profile that passes the hard gates, in catalog order. */
    std::vector<ScoreResult> scoreProfiles(const domain::NormalizedInputs& inputs) const;

    /** @brief Profiles at or above the qualify threshold, by score then catalog order. */
    std::vector<ScoreResult> rankProfiles(const domain::NormalizedInputs& inputs) const;

    /**
     * @brief Percentage score of one profile.
     * @throws std::domain_error if the rules give the profile no attainable score.
     */
    double scoreProfile(const domain::EnvironmentProfile& profile, const domain::NormalizedInputs& inputs) const;

    /** @brief Trait-based pick used when nothing qualifies. */
    std::string fallbackProfile(const domain::PlantRecord& record,
                                const domain::NormalizedInputs& inputs,
                                const std::vector<ScoreResult>& scores) const;

    /** @brief Aquarium, Deserterium, Aerarium or a terrarium, from traits alone. */
    std::string safetyNetProfile(const domain::PlantRecord& record) const;

    /** @brief Physical exclusions: Aquarium needs an aquatic plant, Aerarium an epiphytic one. */
    static bool PassesGates(const domain::EnvironmentProfile& profile, const domain::NormalizedInputs& inputs);

    /**
     * @brief Credit earned by a plant range against a profile target.
     *
     * Zero when the ranges are disjoint. A point plant range inside the target
     * counts as full overlap.
     */
    static double OverlapScore(const domain::Range& plant, const domain::Range& target,
                               const domain::DimensionRule& rule, double minimumOverlap);

    const domain::ScoringRules& rules() const { return m_rules; }
    const domain::EnvironmentProfileCatalog& catalog() const { return *m_catalog; }
    const AttributeNormalizer& normalizer() const { return m_normalizer; }

private:
    std::string terrariumByAirCirculation(const domain::NormalizedInputs& inputs) const;

    std::shared_ptr<const domain::EnvironmentProfileCatalog> m_catalog;
    domain::ScoringRules m_rules;
    AttributeNormalizer m_normalizer;
};

} // namespace terrascope::application
