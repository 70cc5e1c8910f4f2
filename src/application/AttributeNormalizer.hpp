/**
 * @file AttributeNormalizer.hpp
 * @brief Service that turns a raw plant record into canonical numeric ranges.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/NormalizedInputs.hpp"
#include "domain/PlantRecord.hpp"
#include "domain/ScaleTable.hpp"

namespace terrascope::application {

/**
 * @class AttributeNormalizer
 * @brief Total mapping PlantRecord -> NormalizedInputs.
 *
 * Per dimension: a structured range is trusted (ordered and clamped), else
 * numeric ranges are parsed out of the text, else the dimension's keyword
 * rules apply, else the scale's default bucket. Malformed or missing fields
 * never raise.
 */
class AttributeNormalizer {
public:
    explicit AttributeNormalizer(std::shared_ptr<const domain::ScaleTable> scale = domain::ScaleTable::Standard());

    /**
     * @brief Normalizes a record. Pure: the record is not touched and equal
     *        records produce equal outputs.
     */
    domain::NormalizedInputs normalize(const domain::PlantRecord& record) const;

    /** @brief Largest size in centimeters named by a size string, 30 if none. */
    static double ParseMaxSize(const std::string& size);

    const domain::ScaleTable& scale() const { return *m_scale; }

private:
    domain::Substrate resolveSubstrate(const domain::PlantRecord& record) const;
    domain::SpecialNeeds resolveSpecialNeeds(const domain::PlantRecord& record, domain::Substrate substrate) const;

    domain::Range resolveHumidity(const domain::PlantRecord& record, bool aquatic) const;
    domain::Range resolveLight(const domain::PlantRecord& record) const;
    domain::Range resolveAirCirculation(const domain::PlantRecord& record, const std::string& context,
                                        const domain::Range& humidity) const;
    domain::Range resolveWaterNeeds(const domain::PlantRecord& record, domain::Substrate substrate) const;
    domain::Range resolveTemperature(const domain::PlantRecord& record) const;
    domain::Range resolveSoilPh(const std::string& context) const;
    domain::Range resolveDifficulty(const domain::PlantRecord& record) const;
    domain::Range resolveGrowthRate(const domain::PlantRecord& record) const;

    domain::Range resolveWaterCirculation(const domain::PlantRecord& record, const std::string& context) const;
    domain::Range resolveWaterHardness(const std::string& context) const;
    domain::Range resolveSalinity(const std::string& context) const;
    domain::Range resolveWaterTemperature(const domain::PlantRecord& record) const;
    domain::Range resolveWaterPh(const std::string& context) const;

    std::shared_ptr<const domain::ScaleTable> m_scale;
};

} // namespace terrascope::application
