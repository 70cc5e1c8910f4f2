/**
 * @file EnvironmentProfileCatalog.cpp
 * @brief Stock vivarium profiles and catalog validation.
 */

#include "domain/EnvironmentProfileCatalog.hpp"

#include <stdexcept>
#include <unordered_set>

namespace terrascope::domain {

namespace {

void RequireValid(const EnvironmentProfile& profile, const std::optional<Range>& range, const char* field) {
    if (range && !range->isValid()) {
        throw std::invalid_argument("Profile '" + profile.name + "' has a malformed " + field + " range");
    }
}

void Validate(const EnvironmentProfile& profile) {
    if (profile.name.empty() || profile.key.empty()) {
        throw std::invalid_argument("Profile without a name or key");
    }
    RequireValid(profile, profile.humidity, "humidity");
    RequireValid(profile, profile.light, "light");
    RequireValid(profile, profile.airCirculation, "airCirculation");
    RequireValid(profile, profile.waterNeeds, "waterNeeds");
    RequireValid(profile, profile.temperature, "temperature");
    RequireValid(profile, profile.difficulty, "difficulty");
    RequireValid(profile, profile.soilPh, "soilPh");
    RequireValid(profile, profile.growthRate, "growthRate");
    RequireValid(profile, profile.waterCirculation, "waterCirculation");
    RequireValid(profile, profile.waterTemperature, "waterTemperature");
    RequireValid(profile, profile.waterPh, "waterPh");
    RequireValid(profile, profile.waterHardness, "waterHardness");
    RequireValid(profile, profile.salinity, "salinity");
    if (profile.substrates.empty()) {
        throw std::invalid_argument("Profile '" + profile.name + "' accepts no substrate");
    }
    if (profile.waterRole != WaterBodyRole::None && !profile.waterBody) {
        throw std::invalid_argument("Profile '" + profile.name + "' has a water role but no water body");
    }
}

// Shared by every water-body profile.
void AddStandardWaterChemistry(EnvironmentProfile& p, Range circulation) {
    p.waterBody = true;
    p.waterCirculation = circulation;
    p.waterTemperature = Range{40, 50, 45};
    p.waterPh = Range{46.4, 53.6, 50};
    p.waterHardness = Range{0, 50, 25};
    p.salinity = Range{0, 5, 0};
}

std::vector<EnvironmentProfile> BuildStandardProfiles() {
    using namespace profile_names;
    const Range kTropicalTemperature{36, 50, 42};
    const Range kNeutralSoil{35.7, 57.1, 46.4};

    std::vector<EnvironmentProfile> profiles;

    {
        EnvironmentProfile p;
        p.key = "open-terrarium";
        p.name = kOpenTerrarium;
        p.summary = "Partially open glass enclosure: high humidity with gentle air exchange.";
        p.humidity = {70, 100, 85};
        p.light = {20, 80, 50};
        p.airCirculation = {40, 60, 50};
        p.substrates = {Substrate::Moist, Substrate::Wet, Substrate::Epiphytic};
        p.waterNeeds = {40, 100, 70};
        p.temperature = kTropicalTemperature;
        p.difficulty = {30, 70, 50};
        p.soilPh = kNeutralSoil;
        p.matchingNeeds = {SpecialNeeds::Epiphytic, SpecialNeeds::Carnivorous};
        p.relatedNeeds = {SpecialNeeds::Bromeliad, SpecialNeeds::Orchid};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "closed-terrarium";
        p.name = kClosedTerrarium;
        p.summary = "Sealed self-sustaining enclosure: still, saturated air.";
        p.humidity = {60, 100, 80};
        p.light = {20, 70, 40};
        p.airCirculation = {0, 30, 20};
        p.substrates = {Substrate::Moist, Substrate::Wet, Substrate::Epiphytic};
        p.waterNeeds = {40, 100, 70};
        p.temperature = kTropicalTemperature;
        p.difficulty = {20, 50, 35};
        p.soilPh = kNeutralSoil;
        p.matchingNeeds = {SpecialNeeds::Epiphytic, SpecialNeeds::Carnivorous};
        p.relatedNeeds = {SpecialNeeds::Bromeliad, SpecialNeeds::Orchid};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "paludarium";
        p.name = kPaludarium;
        p.summary = "Land and a permanent water body side by side.";
        p.humidity = {70, 100, 90};
        p.light = {20, 100, 60};
        p.airCirculation = {20, 60, 50};
        p.substrates = {Substrate::Wet, Substrate::Aquatic, Substrate::Moist, Substrate::Epiphytic};
        p.waterNeeds = {40, 100, 80};
        p.temperature = kTropicalTemperature;
        p.difficulty = {50, 90, 70};
        p.soilPh = kNeutralSoil;
        AddStandardWaterChemistry(p, {10, 30, 20});
        p.waterRole = WaterBodyRole::Margin;
        p.matchingNeeds = {SpecialNeeds::Aquatic, SpecialNeeds::Carnivorous};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "aerarium";
        p.name = kAerarium;
        p.summary = "Open, breezy mount display for epiphytes without soil.";
        p.humidity = {50, 90, 70};
        p.light = {40, 100, 70};
        p.airCirculation = {60, 100, 80};
        p.substrates = {Substrate::Epiphytic};
        p.waterNeeds = {20, 60, 40};
        p.temperature = kTropicalTemperature;
        p.difficulty = {50, 90, 70};
        p.soilPh = kNeutralSoil;
        p.gate = ProfileGate::RequiresEpiphytic;
        p.matchingNeeds = {SpecialNeeds::Epiphytic};
        p.relatedNeeds = {SpecialNeeds::Bromeliad, SpecialNeeds::Orchid};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "deserterium";
        p.name = kDeserterium;
        p.summary = "Dry, bright, ventilated enclosure for succulents and cacti.";
        p.humidity = {20, 50, 30};
        p.light = {60, 100, 90};
        p.airCirculation = {60, 100, 80};
        p.substrates = {Substrate::Dry};
        p.waterNeeds = {0, 30, 15};
        p.temperature = {40, 60, 50};
        p.difficulty = {30, 60, 45};
        p.soilPh = {42.9, 64.3, 53.6};
        p.matchingNeeds = {SpecialNeeds::Succulent};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "aquarium";
        p.name = kAquarium;
        p.summary = "Fully submerged planted tank.";
        p.humidity = {100, 100, 100};
        p.light = {20, 70, 50};
        p.airCirculation = {0, 30, 20};
        p.substrates = {Substrate::Aquatic};
        p.waterNeeds = {80, 100, 90};
        p.temperature = kTropicalTemperature;
        p.difficulty = {50, 90, 70};
        p.soilPh = kNeutralSoil;
        AddStandardWaterChemistry(p, {0, 100, 50});
        p.waterRole = WaterBodyRole::Submerged;
        p.gate = ProfileGate::RequiresAquatic;
        p.matchingNeeds = {SpecialNeeds::Aquatic};
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "riparium";
        p.name = kRiparium;
        p.summary = "Shallow moving water with emergent foliage in open air.";
        p.humidity = {70, 100, 85};
        p.light = {20, 70, 50};
        p.airCirculation = {60, 100, 80};
        p.substrates = {Substrate::Wet, Substrate::Aquatic, Substrate::Moist, Substrate::Epiphytic};
        p.waterNeeds = {60, 100, 80};
        p.temperature = kTropicalTemperature;
        p.difficulty = {50, 90, 70};
        p.soilPh = kNeutralSoil;
        AddStandardWaterChemistry(p, {30, 80, 55});
        p.waterRole = WaterBodyRole::Margin;
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "indoor";
        p.name = kIndoor;
        p.summary = "Potted houseplant in ordinary room conditions.";
        p.humidity = {30, 70, 50};
        p.light = {40, 100, 70};
        p.airCirculation = {60, 100, 80};
        p.substrates = {Substrate::Moist, Substrate::Dry};
        p.waterNeeds = {20, 60, 40};
        p.temperature = kTropicalTemperature;
        p.difficulty = {20, 60, 40};
        p.growthRate = Range{0, 100, 50};
        p.soilPh = kNeutralSoil;
        profiles.push_back(std::move(p));
    }
    {
        EnvironmentProfile p;
        p.key = "outdoor";
        p.name = kOutdoor;
        p.summary = "Garden bed or patio exposed to weather.";
        p.humidity = {20, 80, 50};
        p.light = {60, 100, 90};
        p.airCirculation = {80, 100, 95};
        p.substrates = {Substrate::Moist, Substrate::Dry, Substrate::Wet};
        p.waterNeeds = {10, 70, 40};
        p.temperature = {20, 80, 50};
        p.difficulty = {20, 60, 40};
        p.soilPh = {28.6, 64.3, 46.4};
        profiles.push_back(std::move(p));
    }

    return profiles;
}

} // namespace

EnvironmentProfileCatalog::EnvironmentProfileCatalog(std::vector<EnvironmentProfile> profiles)
    : m_profiles(std::move(profiles)) {
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> keys;
    for (const auto& profile : m_profiles) {
        Validate(profile);
        if (!names.insert(profile.name).second || !keys.insert(profile.key).second) {
            throw std::invalid_argument("Duplicate profile '" + profile.name + "'");
        }
    }
}

std::shared_ptr<const EnvironmentProfileCatalog> EnvironmentProfileCatalog::Standard() {
    static const std::shared_ptr<const EnvironmentProfileCatalog> standard =
        std::make_shared<const EnvironmentProfileCatalog>(BuildStandardProfiles());
    return standard;
}

const EnvironmentProfile* EnvironmentProfileCatalog::findByName(const std::string& name) const {
    for (const auto& profile : m_profiles) {
        if (profile.name == name) return &profile;
    }
    return nullptr;
}

const EnvironmentProfile* EnvironmentProfileCatalog::findByKey(const std::string& key) const {
    for (const auto& profile : m_profiles) {
        if (profile.key == key) return &profile;
    }
    return nullptr;
}

} // namespace terrascope::domain
