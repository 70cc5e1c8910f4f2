/**
 * @file PlantFilterService.hpp
 * @brief Advanced catalog filters evaluated over normalized inputs and classifications.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "application/CompatibilityScorer.hpp"
#include "application/EnclosureSizeEstimator.hpp"
#include "domain/EnclosureSize.hpp"
#include "domain/NormalizedInputs.hpp"
#include "domain/PlantRecord.hpp"

namespace terrascope::application {

/**
 * @struct RangeFilter
 * @brief Optional bounds on one dimension. A plant passes when its range intersects them.
 */
struct RangeFilter {
    std::optional<double> min;
    std::optional<double> max;

    bool active() const { return min.has_value() || max.has_value(); }

    /** @brief Inactive filters admit everything; active ones reject missing ranges. */
    bool admits(const std::optional<domain::Range>& range) const;
};

struct TaxonomyFilter {
    std::string rank; ///< kingdom, phylum, class, order, family, genus or species.
    std::string name;

    bool active() const { return !rank.empty() && !name.empty(); }
};

struct AdvancedFilters {
    RangeFilter humidity;
    RangeFilter light;
    RangeFilter temperature;
    RangeFilter airCirculation;
    RangeFilter waterNeeds;
    RangeFilter difficulty;
    RangeFilter growthRate;
    RangeFilter soilPh;
    RangeFilter waterTemperature;
    RangeFilter waterPh;
    RangeFilter waterHardness;
    RangeFilter salinity;
    RangeFilter waterCirculation;

    std::set<std::string> vivariumTypes;              ///< Profile names; any match passes.
    std::set<domain::EnclosureCategory> enclosureSizes; ///< Any match passes.
    TaxonomyFilter taxonomy;
};

/**
 * @class PlantFilterService
 * @brief Applies AdvancedFilters to a plant list, memoizing engine outputs per plant id (or content, for records without one).
 *
 * The memo lives as long as the service; clearCache() drops it when the
 * underlying records change. Not thread-safe.
 */
class PlantFilterService {
public:
    explicit PlantFilterService(std::shared_ptr<const CompatibilityScorer> scorer = std::make_shared<const CompatibilityScorer>());

    /** @brief Plants passing every active filter, in input order. */
    std::vector<domain::PlantRecord> apply(const std::vector<domain::PlantRecord>& plants, const AdvancedFilters& filters);

    bool matches(const domain::PlantRecord& plant, const AdvancedFilters& filters);

    const domain::NormalizedInputs& inputsFor(const domain::PlantRecord& plant);
    const Classification& classificationFor(const domain::PlantRecord& plant);
    domain::EnclosureEstimate enclosureFor(const domain::PlantRecord& plant) const;

    void clearCache();
    size_t cachedCount() const { return m_inputs.size(); }

    /** @brief Case-insensitive taxonomy match; species falls back to the scientific name. */
    static bool BelongsToTaxonomy(const domain::PlantRecord& plant, const std::string& rank, const std::string& name);

private:
    static std::string CacheKey(const domain::PlantRecord& plant);

    std::shared_ptr<const CompatibilityScorer> m_scorer;
    EnclosureSizeEstimator m_estimator;
    std::map<std::string, domain::NormalizedInputs> m_inputs;
    std::map<std::string, Classification> m_classifications;
};

} // namespace terrascope::application
