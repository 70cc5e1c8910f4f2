/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace terrascope::infrastructure {

namespace {

constexpr const char* kQualifyKey = "qualify_threshold";
constexpr const char* kFallbackKey = "fallback_threshold";

bool ValidThreshold(const nlohmann::json& value) {
    if (!value.is_number()) return false;
    const double v = value.get<double>();
    return v >= 0.0 && v <= 100.0;
}

} // namespace

domain::ScoringRules ConfigLoader::LoadScoringRules(const std::string& projectRoot) {
    domain::ScoringRules rules;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return rules;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains(kQualifyKey)) {
            if (ValidThreshold(j[kQualifyKey])) {
                rules.qualifyThreshold = j[kQualifyKey].get<double>();
            } else {
                std::cerr << "[ConfigLoader] Ignoring invalid " << kQualifyKey << std::endl;
            }
        }
        if (j.contains(kFallbackKey)) {
            if (ValidThreshold(j[kFallbackKey])) {
                rules.fallbackThreshold = j[kFallbackKey].get<double>();
            } else {
                std::cerr << "[ConfigLoader] Ignoring invalid " << kFallbackKey << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return rules;
}

bool ConfigLoader::SaveScoringThresholds(const std::string& projectRoot, const domain::ScoringRules& rules) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Keep unrelated settings; a corrupt file is replaced.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j[kQualifyKey] = rules.qualifyThreshold;
    j[kFallbackKey] = rules.fallbackThreshold;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath.string() << std::endl;
        return false;
    }
    f << j.dump(4);
    return f.good();
}

} // namespace terrascope::infrastructure
