/**
 * @file EnvironmentProfileCatalog.hpp
 * @brief Immutable, ordered catalog of vivarium archetypes.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/EnvironmentProfile.hpp"

namespace terrascope::domain {

namespace profile_names {
inline constexpr const char* kOpenTerrarium = "Open Terrarium";
inline constexpr const char* kClosedTerrarium = "Closed Terrarium";
inline constexpr const char* kPaludarium = "Paludarium";
inline constexpr const char* kAerarium = "Aerarium";
inline constexpr const char* kDeserterium = "Deserterium";
inline constexpr const char* kAquarium = "Aquarium";
inline constexpr const char* kRiparium = "Riparium";
inline constexpr const char* kIndoor = "Indoor";
inline constexpr const char* kOutdoor = "Outdoor";
} // namespace profile_names

/**
 * @class EnvironmentProfileCatalog
 * @brief Holds the profiles in declaration order; that order breaks score ties.
 */
class EnvironmentProfileCatalog {
public:
    /**
     * @throws std::invalid_argument on malformed ranges, an empty substrate set,
     *         or duplicate names/keys.
     */
    explicit EnvironmentProfileCatalog(std::vector<EnvironmentProfile> profiles);

    /** @brief The nine stock vivarium types. */
    static std::shared_ptr<const EnvironmentProfileCatalog> Standard();

    const std::vector<EnvironmentProfile>& profiles() const { return m_profiles; }
    size_t size() const { return m_profiles.size(); }

    /** @brief Finds a profile by display name, nullptr if absent. */
    const EnvironmentProfile* findByName(const std::string& name) const;

    /** @brief Finds a profile by key, nullptr if absent. */
    const EnvironmentProfile* findByKey(const std::string& key) const;

private:
    std::vector<EnvironmentProfile> m_profiles;
};

} // namespace terrascope::domain
