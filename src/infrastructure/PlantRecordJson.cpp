/**
 * @file PlantRecordJson.cpp
 * @brief Implementation of PlantRecordJson.
 */

#include "infrastructure/PlantRecordJson.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace terrascope::infrastructure {

using domain::DimensionValue;
using domain::PlantRecord;

namespace {

std::string StringField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Lists may arrive as a single string in older entries.
std::vector<std::string> StringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    const auto& value = j[key];
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string IdField(const json& j) {
    if (!j.contains("id")) return {};
    const auto& id = j["id"];
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    if (id.is_number()) return id.dump();
    return {};
}

std::string ScientificName(const json& j) {
    if (!j.contains("scientificName")) return {};
    const auto& value = j["scientificName"];
    if (value.is_string()) return value.get<std::string>();
    if (value.is_object()) {
        std::string name = StringField(value, "scientificName");
        return name.empty() ? StringField(value, "name") : name;
    }
    return {};
}

/** A structured {min,max[,ideal]} range wins over the free-text field. */
DimensionValue Dimension(const json& j, const char* textKey, const char* rangeKey) {
    if (j.contains(rangeKey) && j[rangeKey].is_object()) {
        const auto& r = j[rangeKey];
        if (r.contains("min") && r["min"].is_number() && r.contains("max") && r["max"].is_number()) {
            domain::StructuredRange range;
            range.min = r["min"].get<double>();
            range.max = r["max"].get<double>();
            if (r.contains("ideal") && r["ideal"].is_number()) {
                range.ideal = r["ideal"].get<double>();
            }
            return range;
        }
    }
    if (j.contains(textKey) && j[textKey].is_string()) {
        return domain::RawText{j[textKey].get<std::string>()};
    }
    return std::monostate{};
}

} // namespace

PlantRecord PlantRecordJson::Parse(const json& j) {
    PlantRecord record;
    if (!j.is_object()) return record;

    record.id = IdField(j);
    record.name = StringField(j, "name");
    record.scientificName = ScientificName(j);
    record.description = StringField(j, "description");
    record.careTips = StringList(j, "careTips");
    record.category = StringList(j, "category");
    record.growthHabit = StringField(j, "growthHabit");

    record.humidity = Dimension(j, "humidity", "humidityRange");
    record.light = Dimension(j, "lightRequirements", "lightRange");
    record.airCirculation = Dimension(j, "airCirculation", "airCirculationRange");
    record.waterNeeds = Dimension(j, "watering", "waterNeedsRange");
    record.waterCirculation = Dimension(j, "waterCirculation", "waterCirculationRange");
    record.temperature = Dimension(j, "temperature", "temperatureRange");
    record.growthRate = Dimension(j, "growthRate", "growthRateRange");

    record.substrateType = OptionalString(j, "substrateType");
    record.substrate = StringField(j, "substrate");
    record.specialNeeds = OptionalString(j, "specialNeeds");

    record.size = StringField(j, "size");
    record.difficulty = StringField(j, "difficulty");

    if (j.contains("taxonomy") && j["taxonomy"].is_object()) {
        const auto& t = j["taxonomy"];
        record.taxonomy.kingdom = StringField(t, "kingdom");
        record.taxonomy.phylum = StringField(t, "phylum");
        record.taxonomy.className = StringField(t, "class");
        record.taxonomy.order = StringField(t, "order");
        record.taxonomy.family = StringField(t, "family");
        record.taxonomy.genus = StringField(t, "genus");
        record.taxonomy.species = StringField(t, "species");
    }
    return record;
}

std::vector<PlantRecord> PlantRecordJson::ParseAll(const json& j) {
    const json* plants = &j;
    if (j.is_object() && j.contains("plants")) {
        plants = &j["plants"];
    }

    std::vector<PlantRecord> records;
    if (!plants->is_array()) return records;
    for (const auto& item : *plants) {
        if (item.is_object()) {
            records.push_back(Parse(item));
        }
    }
    return records;
}

std::vector<PlantRecord> PlantRecordJson::LoadFile(const std::string& path) {
    if (!fs::exists(path)) {
        std::cerr << "[PlantRecordJson] File not found: " << path << std::endl;
        return {};
    }

    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[PlantRecordJson] Could not open " << path << std::endl;
            return {};
        }
        json j = json::parse(f);
        auto records = ParseAll(j);
        std::cout << "[PlantRecordJson] Loaded " << records.size() << " plants from " << path << std::endl;
        return records;
    } catch (const std::exception& e) {
        std::cerr << "[PlantRecordJson] Error reading " << path << ": " << e.what() << std::endl;
    }
    return {};
}

std::vector<PlantRecord> PlantRecordJson::LoadIndexedDirectory(const std::string& directory) {
    const fs::path indexPath = fs::path(directory) / "index.json";
    std::vector<PlantRecord> records;
    if (!fs::exists(indexPath)) {
        std::cerr << "[PlantRecordJson] No index.json in " << directory << std::endl;
        return records;
    }

    json index;
    try {
        std::ifstream f(indexPath);
        index = json::parse(f);
    } catch (const std::exception& e) {
        std::cerr << "[PlantRecordJson] Error reading " << indexPath.string() << ": " << e.what() << std::endl;
        return records;
    }

    size_t skipped = 0;
    for (const auto& entry : StringList(index, "plants")) {
        const fs::path plantPath = fs::path(directory) / entry;
        try {
            std::ifstream f(plantPath);
            if (!f.is_open()) {
                ++skipped;
                continue;
            }
            json j = json::parse(f);
            if (!j.is_object()) {
                ++skipped;
                continue;
            }
            records.push_back(Parse(j));
        } catch (const std::exception& e) {
            std::cerr << "[PlantRecordJson] Skipping " << plantPath.string() << ": " << e.what() << std::endl;
            ++skipped;
        }
    }

    std::cout << "[PlantRecordJson] Loaded " << records.size() << " plants from " << directory;
    if (skipped > 0) std::cout << " (" << skipped << " skipped)";
    std::cout << std::endl;
    return records;
}

json PlantRecordJson::ToJson(const domain::Range& range) {
    return {{"min", range.min}, {"max", range.max}, {"ideal", range.ideal}};
}

json PlantRecordJson::ToJson(const domain::NormalizedInputs& inputs) {
    json j = {
        {"humidityRange", ToJson(inputs.humidity)},
        {"lightRange", ToJson(inputs.light)},
        {"airCirculationRange", ToJson(inputs.airCirculation)},
        {"waterNeedsRange", ToJson(inputs.waterNeeds)},
        {"temperatureRange", ToJson(inputs.temperature)},
        {"soilPhRange", ToJson(inputs.soilPh)},
        {"difficultyRange", ToJson(inputs.difficulty)},
        {"growthRateRange", ToJson(inputs.growthRate)},
        {"substrate", domain::SubstrateToString(inputs.substrate)},
        {"specialNeeds", domain::SpecialNeedsToString(inputs.specialNeeds)},
        {"maxSize", inputs.maxSize}
    };
    const auto addOptional = [&j](const char* key, const std::optional<domain::Range>& range) {
        if (range) j[key] = ToJson(*range);
    };
    addOptional("waterCirculationRange", inputs.waterCirculation);
    addOptional("waterTemperatureRange", inputs.waterTemperature);
    addOptional("waterPhRange", inputs.waterPh);
    addOptional("waterHardnessRange", inputs.waterHardness);
    addOptional("salinityRange", inputs.salinity);
    return j;
}

json PlantRecordJson::ToJson(const application::Classification& classification) {
    return {
        {"vivariumTypes", classification.profiles},
        {"source", application::SourceToString(classification.source)}
    };
}

json PlantRecordJson::ToJson(const domain::EnclosureEstimate& estimate) {
    json j = {
        {"size", domain::CategoryToString(estimate.category)},
        {"height", estimate.heightBand},
        {"parsed", estimate.parsed}
    };
    if (estimate.parsed) {
        j["juvenileSizeCm"] = estimate.juvenileSizeCm;
        j["requiredHeightCm"] = estimate.requiredHeightCm;
    }
    return j;
}

} // namespace terrascope::infrastructure
