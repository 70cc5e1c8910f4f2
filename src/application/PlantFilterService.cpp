/**
 * @file PlantFilterService.cpp
 * @brief Implementation of PlantFilterService.
 */

#include "application/PlantFilterService.hpp"

#include <sstream>
#include <stdexcept>

#include "domain/TextUtils.hpp"

namespace terrascope::application {

using domain::NormalizedInputs;
using domain::PlantRecord;
using domain::TextUtils;

namespace {

// Length-prefixed so adjacent fields cannot run into each other.
void AppendField(std::ostringstream& out, const std::string& value) {
    out << value.size() << ':' << value << '|';
}

void AppendField(std::ostringstream& out, const std::optional<std::string>& value) {
    if (value) {
        AppendField(out, *value);
    } else {
        out << "-|";
    }
}

void AppendField(std::ostringstream& out, const domain::DimensionValue& value) {
    if (const auto* structured = domain::StructuredOf(value)) {
        out << "r" << structured->min << ',' << structured->max << ',';
        if (structured->ideal) out << *structured->ideal;
        out << '|';
    } else if (std::holds_alternative<domain::RawText>(value)) {
        out << 't';
        AppendField(out, domain::TextOf(value));
    } else {
        out << "-|";
    }
}

void AppendFields(std::ostringstream& out, const std::vector<std::string>& values) {
    out << values.size() << '[';
    for (const auto& value : values) AppendField(out, value);
    out << ']';
}

bool AdmitsRanges(const NormalizedInputs& in, const AdvancedFilters& f) {
    return f.humidity.admits(in.humidity) &&
           f.light.admits(in.light) &&
           f.temperature.admits(in.temperature) &&
           f.airCirculation.admits(in.airCirculation) &&
           f.waterNeeds.admits(in.waterNeeds) &&
           f.difficulty.admits(in.difficulty) &&
           f.growthRate.admits(in.growthRate) &&
           f.soilPh.admits(in.soilPh) &&
           f.waterTemperature.admits(in.waterTemperature) &&
           f.waterPh.admits(in.waterPh) &&
           f.waterHardness.admits(in.waterHardness) &&
           f.salinity.admits(in.salinity) &&
           f.waterCirculation.admits(in.waterCirculation);
}

} // namespace

bool RangeFilter::admits(const std::optional<domain::Range>& range) const {
    if (!active()) return true;
    if (!range) return false;
    if (min && range->max < *min) return false;
    if (max && range->min > *max) return false;
    return true;
}

PlantFilterService::PlantFilterService(std::shared_ptr<const CompatibilityScorer> scorer)
    : m_scorer(std::move(scorer)) {
    if (!m_scorer) {
        throw std::invalid_argument("PlantFilterService requires a scorer");
    }
}

std::vector<PlantRecord> PlantFilterService::apply(const std::vector<PlantRecord>& plants,
                                                   const AdvancedFilters& filters) {
    std::vector<PlantRecord> result;
    for (const auto& plant : plants) {
        if (matches(plant, filters)) {
            result.push_back(plant);
        }
    }
    return result;
}

bool PlantFilterService::matches(const PlantRecord& plant, const AdvancedFilters& filters) {
    if (filters.taxonomy.active() && !BelongsToTaxonomy(plant, filters.taxonomy.rank, filters.taxonomy.name)) {
        return false;
    }

    if (!AdmitsRanges(inputsFor(plant), filters)) {
        return false;
    }

    if (!filters.vivariumTypes.empty()) {
        const auto& classification = classificationFor(plant);
        bool any = false;
        for (const auto& name : classification.profiles) {
            if (filters.vivariumTypes.count(name)) {
                any = true;
                break;
            }
        }
        if (!any) return false;
    }

    if (!filters.enclosureSizes.empty() && !filters.enclosureSizes.count(enclosureFor(plant).category)) {
        return false;
    }
    return true;
}

const NormalizedInputs& PlantFilterService::inputsFor(const PlantRecord& plant) {
    const std::string key = CacheKey(plant);
    auto it = m_inputs.find(key);
    if (it == m_inputs.end()) {
        it = m_inputs.emplace(key, m_scorer->normalizer().normalize(plant)).first;
    }
    return it->second;
}

const Classification& PlantFilterService::classificationFor(const PlantRecord& plant) {
    const std::string key = CacheKey(plant);
    auto it = m_classifications.find(key);
    if (it == m_classifications.end()) {
        it = m_classifications.emplace(key, m_scorer->classify(plant)).first;
    }
    return it->second;
}

domain::EnclosureEstimate PlantFilterService::enclosureFor(const PlantRecord& plant) const {
    return m_estimator.estimate(plant.size);
}

void PlantFilterService::clearCache() {
    m_inputs.clear();
    m_classifications.clear();
}

bool PlantFilterService::BelongsToTaxonomy(const PlantRecord& plant, const std::string& rank, const std::string& name) {
    const auto& taxonomy = plant.taxonomy;
    std::string value;
    if (rank == "kingdom") value = taxonomy.kingdom;
    else if (rank == "phylum") value = taxonomy.phylum;
    else if (rank == "class") value = taxonomy.className;
    else if (rank == "order") value = taxonomy.order;
    else if (rank == "family") value = taxonomy.family;
    else if (rank == "genus") value = taxonomy.genus;
    else if (rank == "species") value = taxonomy.species.empty() ? plant.scientificName : taxonomy.species;

    if (value.empty()) return false;
    return TextUtils::Normalize(value) == TextUtils::Normalize(name);
}

std::string PlantFilterService::CacheKey(const PlantRecord& plant) {
    if (!plant.id.empty()) {
        return plant.id;
    }
    // Records without an id are keyed by their whole content: two of them share
    // an entry only when they would normalize identically.
    std::ostringstream key;
    key.precision(17);
    key << "content:";
    AppendField(key, plant.name);
    AppendField(key, plant.scientificName);
    AppendField(key, plant.description);
    AppendFields(key, plant.careTips);
    AppendFields(key, plant.category);
    AppendField(key, plant.growthHabit);
    for (const auto* dimension : {&plant.humidity, &plant.light, &plant.airCirculation, &plant.waterNeeds,
                                  &plant.waterCirculation, &plant.temperature, &plant.growthRate}) {
        AppendField(key, *dimension);
    }
    AppendField(key, plant.substrateType);
    AppendField(key, plant.substrate);
    AppendField(key, plant.specialNeeds);
    AppendField(key, plant.size);
    AppendField(key, plant.difficulty);
    const auto& taxonomy = plant.taxonomy;
    for (const auto* rank : {&taxonomy.kingdom, &taxonomy.phylum, &taxonomy.className, &taxonomy.order,
                             &taxonomy.family, &taxonomy.genus, &taxonomy.species}) {
        AppendField(key, *rank);
    }
    return key.str();
}

} // namespace terrascope::application
