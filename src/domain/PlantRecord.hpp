/**
 * @file PlantRecord.hpp
 * @brief Domain entity for a raw, semi-structured plant attribute record.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace terrascope::domain {

/**
 * @struct StructuredRange
 * @brief A pre-normalized range supplied by the data store.
 */
struct StructuredRange {
    double min = 0.0;
    double max = 0.0;
    std::optional<double> ideal; ///< Midpoint is used when absent.
};

/** @brief Free-text description of a dimension ("70-90%", "bright indirect", ...). */
struct RawText {
    std::string text;
};

/**
 * @brief One environmental dimension as it arrives from the store.
 *
 * Either nothing, a structured range to trust, or free text to parse.
 */
using DimensionValue = std::variant<std::monostate, StructuredRange, RawText>;

/** @brief Returns the free text of a dimension, empty for structured or missing values. */
inline const std::string& TextOf(const DimensionValue& value) {
    static const std::string kEmpty;
    if (const auto* raw = std::get_if<RawText>(&value)) {
        return raw->text;
    }
    return kEmpty;
}

/** @brief Returns the structured range of a dimension, if one was supplied. */
inline const StructuredRange* StructuredOf(const DimensionValue& value) {
    return std::get_if<StructuredRange>(&value);
}

/**
 * @struct Taxonomy
 * @brief Linnean ranks carried along for filtering collaborators.
 */
struct Taxonomy {
    std::string kingdom;
    std::string phylum;
    std::string className; ///< "class" in the store.
    std::string order;
    std::string family;
    std::string genus;
    std::string species;
};

/**
 * @struct PlantRecord
 * @brief Plant entry as loaded by the data layer. Never mutated by the engine.
 */
struct PlantRecord {
    std::string id;             ///< Identity used as the memoization key.
    std::string name;
    std::string scientificName;
    std::string description;
    std::vector<std::string> careTips;
    std::vector<std::string> category;
    std::string growthHabit;

    DimensionValue humidity;
    DimensionValue light;
    DimensionValue airCirculation;
    DimensionValue waterNeeds;       ///< "watering" text or waterNeedsRange.
    DimensionValue waterCirculation; ///< Aquatic plants only.
    DimensionValue temperature;
    DimensionValue growthRate;

    std::optional<std::string> substrateType; ///< Canonical class when curated.
    std::string substrate;                    ///< Free-text growing medium.
    std::optional<std::string> specialNeeds;  ///< Canonical value when curated.

    std::string size;
    std::string difficulty;
    Taxonomy taxonomy;
};

} // namespace terrascope::domain
