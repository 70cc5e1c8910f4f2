/**
 * @file ScaleTable.hpp
 * @brief Immutable lookup of qualitative buckets to numeric ranges per dimension.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include "domain/Range.hpp"

namespace terrascope::domain {

/**
 * @enum ScaleDimension
 * @brief Dimensions that own a bucket scale.
 */
enum class ScaleDimension {
    Humidity,
    Light,
    AirCirculation,
    WaterNeeds,
    WaterCirculation,
    WaterHardness,
    Salinity,
    Difficulty,
    GrowthRate,
    Temperature,
    SoilPh,
    WaterPh,
    WaterTemperature
};

std::string DimensionToString(ScaleDimension dimension);

/**
 * @class ScaleTable
 * @brief Maps bucket names ("low", "moderate", ...) to {min, max, ideal} ranges.
 *
 * Instances are immutable once built and are shared by the services that use them.
 */
class ScaleTable {
public:
    using Buckets = std::map<std::string, Range>;

    /**
     * @brief Builds a table from per-dimension buckets and default bucket names.
     * @throws std::invalid_argument if a range is malformed or a default bucket is missing.
     */
    ScaleTable(std::map<ScaleDimension, Buckets> buckets,
               std::map<ScaleDimension, std::string> defaults);

    /** @brief The stock scale shared by the whole engine. */
    static std::shared_ptr<const ScaleTable> Standard();

    /** @brief Exact bucket lookup. */
    std::optional<Range> find(ScaleDimension dimension, const std::string& bucket) const;

    /** @brief Bucket lookup that falls back to the dimension's default bucket. */
    Range bucket(ScaleDimension dimension, const std::string& bucket) const;

    /** @brief Default range of a dimension. */
    Range fallback(ScaleDimension dimension) const;

    /** @brief Name of the default bucket of a dimension. */
    const std::string& defaultBucket(ScaleDimension dimension) const;

    const Buckets& buckets(ScaleDimension dimension) const;

private:
    std::map<ScaleDimension, Buckets> m_buckets;
    std::map<ScaleDimension, std::string> m_defaults;
};

} // namespace terrascope::domain
