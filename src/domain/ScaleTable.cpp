/**
 * @file ScaleTable.cpp
 * @brief Stock bucket scales and lookup logic.
 */

#include "domain/ScaleTable.hpp"

#include <stdexcept>

namespace terrascope::domain {

std::string DimensionToString(ScaleDimension dimension) {
    switch (dimension) {
        case ScaleDimension::Humidity: return "humidity";
        case ScaleDimension::Light: return "light";
        case ScaleDimension::AirCirculation: return "airCirculation";
        case ScaleDimension::WaterNeeds: return "waterNeeds";
        case ScaleDimension::WaterCirculation: return "waterCirculation";
        case ScaleDimension::WaterHardness: return "waterHardness";
        case ScaleDimension::Salinity: return "salinity";
        case ScaleDimension::Difficulty: return "difficulty";
        case ScaleDimension::GrowthRate: return "growthRate";
        case ScaleDimension::Temperature: return "temperature";
        case ScaleDimension::SoilPh: return "soilPh";
        case ScaleDimension::WaterPh: return "waterPh";
        case ScaleDimension::WaterTemperature: return "waterTemperature";
    }
    return "unknown";
}

ScaleTable::ScaleTable(std::map<ScaleDimension, Buckets> buckets,
                       std::map<ScaleDimension, std::string> defaults)
    : m_buckets(std::move(buckets)), m_defaults(std::move(defaults)) {
    for (const auto& [dimension, table] : m_buckets) {
        for (const auto& [name, range] : table) {
            if (!range.isValid()) {
                throw std::invalid_argument("Malformed range for bucket '" + name + "' in " +
                                            DimensionToString(dimension));
            }
        }
        auto it = m_defaults.find(dimension);
        if (it == m_defaults.end() || table.find(it->second) == table.end()) {
            throw std::invalid_argument("Missing default bucket for " + DimensionToString(dimension));
        }
    }
    for (const auto& [dimension, name] : m_defaults) {
        if (m_buckets.find(dimension) == m_buckets.end()) {
            throw std::invalid_argument("Default bucket '" + name + "' names an empty scale: " +
                                        DimensionToString(dimension));
        }
    }
}

std::shared_ptr<const ScaleTable> ScaleTable::Standard() {
    static const std::shared_ptr<const ScaleTable> standard = std::make_shared<const ScaleTable>(
        std::map<ScaleDimension, Buckets>{
            // 0% = very dry, 100% = fully submerged
            {ScaleDimension::Humidity, {
                {"very-low", {20, 35, 25}},
                {"low", {35, 50, 40}},
                {"moderate", {50, 70, 60}},
                {"high", {70, 90, 80}},
                {"very-high", {90, 100, 95}},
                {"aquatic", {100, 100, 100}}}},
            // 0% = darkness, 100% = direct sun
            {ScaleDimension::Light, {
                {"very-low", {0, 20, 10}},
                {"low", {20, 40, 30}},
                {"moderate", {40, 60, 50}},
                {"bright", {60, 80, 70}},
                {"very-bright", {80, 100, 90}}}},
            // 0% = sealed, 100% = open air
            {ScaleDimension::AirCirculation, {
                {"minimal", {0, 20, 10}},
                {"low", {20, 40, 30}},
                {"moderate", {40, 60, 50}},
                {"high", {60, 80, 70}},
                {"very-high", {80, 100, 90}}}},
            {ScaleDimension::WaterNeeds, {
                {"minimal", {0, 20, 10}},
                {"low", {20, 40, 30}},
                {"moderate", {40, 60, 50}},
                {"high", {60, 80, 70}},
                {"constant", {80, 100, 90}}}},
            {ScaleDimension::WaterCirculation, {
                {"none", {0, 10, 5}},
                {"low", {10, 30, 20}},
                {"moderate", {30, 60, 45}},
                {"high", {60, 80, 70}},
                {"very-high", {80, 100, 90}}}},
            // 0-30 dGH
            {ScaleDimension::WaterHardness, {
                {"very-soft", {0, 6.67, 3.33}},
                {"soft", {6.67, 20, 13.33}},
                {"moderate", {20, 40, 30}},
                {"hard", {40, 66.67, 53.33}},
                {"very-hard", {66.67, 100, 83.33}},
                {"default", {6.67, 40, 23.33}}}},
            // 0-40 ppt
            {ScaleDimension::Salinity, {
                {"freshwater", {0, 5, 2.5}},
                {"brackish", {12.5, 75, 43.75}},
                {"marine", {75, 100, 87.5}}}},
            {ScaleDimension::Difficulty, {
                {"easy", {0, 30, 15}},
                {"moderate", {40, 60, 50}},
                {"hard", {70, 100, 85}}}},
            {ScaleDimension::GrowthRate, {
                {"very-slow", {0, 20, 10}},
                {"slow", {20, 40, 30}},
                {"slow-moderate", {30, 50, 40}},
                {"moderate", {40, 60, 50}},
                {"moderate-fast", {50, 80, 65}},
                {"fast", {60, 80, 70}},
                {"very-fast", {80, 100, 90}}}},
            // 0-50 degC; 20-25 degC
            {ScaleDimension::Temperature, {{"default", {40, 50, 45}}}},
            // pH 6.0-7.0
            {ScaleDimension::SoilPh, {{"default", {42.9, 50, 46.4}}}},
            // pH 7.0-8.0
            {ScaleDimension::WaterPh, {{"default", {50, 57.1, 53.6}}}},
            // 22-26 degC
            {ScaleDimension::WaterTemperature, {{"default", {44, 52, 48}}}}},
        std::map<ScaleDimension, std::string>{
            {ScaleDimension::Humidity, "moderate"},
            {ScaleDimension::Light, "moderate"},
            {ScaleDimension::AirCirculation, "moderate"},
            {ScaleDimension::WaterNeeds, "moderate"},
            {ScaleDimension::WaterCirculation, "moderate"},
            {ScaleDimension::WaterHardness, "default"},
            {ScaleDimension::Salinity, "freshwater"},
            {ScaleDimension::Difficulty, "moderate"},
            {ScaleDimension::GrowthRate, "moderate"},
            {ScaleDimension::Temperature, "default"},
            {ScaleDimension::SoilPh, "default"},
            {ScaleDimension::WaterPh, "default"},
            {ScaleDimension::WaterTemperature, "default"}});
    return standard;
}

std::optional<Range> ScaleTable::find(ScaleDimension dimension, const std::string& bucket) const {
    auto table = m_buckets.find(dimension);
    if (table == m_buckets.end()) return std::nullopt;
    auto it = table->second.find(bucket);
    if (it == table->second.end()) return std::nullopt;
    return it->second;
}

Range ScaleTable::bucket(ScaleDimension dimension, const std::string& bucket) const {
    if (auto range = find(dimension, bucket)) {
        return *range;
    }
    return fallback(dimension);
}

Range ScaleTable::fallback(ScaleDimension dimension) const {
    return buckets(dimension).at(defaultBucket(dimension));
}

const std::string& ScaleTable::defaultBucket(ScaleDimension dimension) const {
    auto it = m_defaults.find(dimension);
    if (it == m_defaults.end()) {
        throw std::out_of_range("No scale for " + DimensionToString(dimension));
    }
    return it->second;
}

const ScaleTable::Buckets& ScaleTable::buckets(ScaleDimension dimension) const {
    auto it = m_buckets.find(dimension);
    if (it == m_buckets.end()) {
        throw std::out_of_range("No scale for " + DimensionToString(dimension));
    }
    return it->second;
}

} // namespace terrascope::domain
