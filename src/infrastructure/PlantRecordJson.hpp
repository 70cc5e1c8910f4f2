/**
 * @file PlantRecordJson.hpp
 * @brief Mapping between the JSON plant store and the engine's types.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/CompatibilityScorer.hpp"
#include "domain/EnclosureSize.hpp"
#include "domain/NormalizedInputs.hpp"
#include "domain/PlantRecord.hpp"

namespace terrascope::infrastructure {

/**
 * @class PlantRecordJson
 * @brief Static codec for plant records and engine outputs.
 *
 * Parsing is lenient: a field of the wrong JSON type is treated as absent.
 */
class PlantRecordJson {
public:
    /** @brief Maps one plant object. Non-objects yield an empty record. */
    static domain::PlantRecord Parse(const nlohmann::json& j);

    /** @brief Accepts an array of plants or an object with a "plants" array. */
    static std::vector<domain::PlantRecord> ParseAll(const nlohmann::json& j);

    /**
     * @brief Reads a plant file (array or { "plants": [...] }).
     * @return Empty list on I/O or parse failure; the failure is logged.
     */
    static std::vector<domain::PlantRecord> LoadFile(const std::string& path);

    /**
     * @brief Reads a split store: directory/index.json lists one plant file per entry
     *        under "plants". Missing or unreadable entries are skipped.
     */
    static std::vector<domain::PlantRecord> LoadIndexedDirectory(const std::string& directory);

    static nlohmann::json ToJson(const domain::Range& range);
    static nlohmann::json ToJson(const domain::NormalizedInputs& inputs);
    static nlohmann::json ToJson(const application::Classification& classification);
    static nlohmann::json ToJson(const domain::EnclosureEstimate& estimate);
};

} // namespace terrascope::infrastructure
