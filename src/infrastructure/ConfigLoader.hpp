/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Keeps the JSON handling of scoring overrides in one place instead of
 * scattering it across the services that consume ScoringRules.
 */

#pragma once

#include <string>
#include "domain/ScoringRules.hpp"

namespace terrascope::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads 'qualify_threshold' and 'fallback_threshold' from settings.json.
     * @param projectRoot Directory holding settings.json.
     * @return Stock ScoringRules with any numeric overrides applied. A missing or
     *         unreadable file leaves the defaults in place.
     */
    static domain::ScoringRules LoadScoringRules(const std::string& projectRoot);

    /**
     * @brief Writes both thresholds to settings.json, preserving other keys.
     * @return false if the file could not be written.
     */
    static bool SaveScoringThresholds(const std::string& projectRoot, const domain::ScoringRules& rules);
};

} // namespace terrascope::infrastructure
