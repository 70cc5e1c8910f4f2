#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/EnvironmentProfileCatalog.hpp"
#include "domain/ScaleTable.hpp"

using namespace terrascope::domain;

static void TestStandardBuckets() {
    auto scale = ScaleTable::Standard();
    assert(scale == ScaleTable::Standard() && "Standard table is shared.");

    assert(scale->bucket(ScaleDimension::Humidity, "high") == (Range{70, 90, 80}));
    assert(scale->bucket(ScaleDimension::Humidity, "aquatic") == (Range{100, 100, 100}));
    assert(scale->bucket(ScaleDimension::Light, "very-bright") == (Range{80, 100, 90}));
    assert(scale->bucket(ScaleDimension::WaterCirculation, "none") == (Range{0, 10, 5}));
    assert(scale->bucket(ScaleDimension::GrowthRate, "moderate-fast") == (Range{50, 80, 65}));
    assert(scale->bucket(ScaleDimension::Salinity, "brackish") == (Range{12.5, 75, 43.75}));

    // Unknown buckets fall back to the dimension default.
    assert(!scale->find(ScaleDimension::Light, "blinding"));
    assert(scale->bucket(ScaleDimension::Light, "blinding") == (Range{40, 60, 50}));
    assert(scale->fallback(ScaleDimension::WaterHardness) == (Range{6.67, 40, 23.33}));
    assert(scale->defaultBucket(ScaleDimension::Salinity) == "freshwater");
    assert(scale->fallback(ScaleDimension::WaterTemperature) == (Range{44, 52, 48}));

    for (auto dimension : {ScaleDimension::Humidity, ScaleDimension::Light, ScaleDimension::AirCirculation,
                           ScaleDimension::WaterNeeds, ScaleDimension::WaterCirculation,
                           ScaleDimension::WaterHardness, ScaleDimension::Salinity, ScaleDimension::Difficulty,
                           ScaleDimension::GrowthRate, ScaleDimension::Temperature, ScaleDimension::SoilPh,
                           ScaleDimension::WaterPh, ScaleDimension::WaterTemperature}) {
        for (const auto& [name, range] : scale->buckets(dimension)) {
            assert(range.isValid() && "Every stock bucket satisfies the range invariant.");
        }
    }
}

static void TestBrokenTablesAreRejected() {
    bool threw = false;
    try {
        ScaleTable broken({{ScaleDimension::Light, {{"low", {40, 20, 30}}}}},
                          {{ScaleDimension::Light, "low"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "Inverted range must be rejected.");

    threw = false;
    try {
        ScaleTable missingDefault({{ScaleDimension::Light, {{"low", {20, 40, 30}}}}},
                                  {{ScaleDimension::Light, "moderate"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "Default must name an existing bucket.");

    ScaleTable lightOnly({{ScaleDimension::Light, {{"low", {20, 40, 30}}}}}, {{ScaleDimension::Light, "low"}});
    threw = false;
    try {
        lightOnly.fallback(ScaleDimension::Humidity);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw && "Missing dimensions are reported.");
}

static void TestCatalog() {
    auto catalog = EnvironmentProfileCatalog::Standard();
    assert(catalog->size() == 9);

    const char* expectedOrder[] = {
        profile_names::kOpenTerrarium, profile_names::kClosedTerrarium, profile_names::kPaludarium,
        profile_names::kAerarium, profile_names::kDeserterium, profile_names::kAquarium,
        profile_names::kRiparium, profile_names::kIndoor, profile_names::kOutdoor};
    for (size_t i = 0; i < catalog->size(); ++i) {
        assert(catalog->profiles()[i].name == expectedOrder[i]);
    }

    const auto* aquarium = catalog->findByName("Aquarium");
    assert(aquarium && aquarium->gate == ProfileGate::RequiresAquatic);
    assert(aquarium->waterRole == WaterBodyRole::Submerged && aquarium->waterBody);
    assert(aquarium->waterCirculation && *aquarium->waterCirculation == (Range{0, 100, 50}));

    const auto* aerarium = catalog->findByKey("aerarium");
    assert(aerarium && aerarium->gate == ProfileGate::RequiresEpiphytic);
    assert(aerarium->accepts(Substrate::Epiphytic) && !aerarium->accepts(Substrate::Moist));

    const auto* riparium = catalog->findByKey("riparium");
    assert(riparium && riparium->waterRole == WaterBodyRole::Margin);
    assert(riparium->matchingNeeds.empty());

    const auto* indoor = catalog->findByName("Indoor");
    assert(indoor && indoor->growthRate && !indoor->waterBody);

    assert(catalog->findByName("Greenhouse") == nullptr);

    std::vector<EnvironmentProfile> duplicated{catalog->profiles()[0], catalog->profiles()[0]};
    bool threw = false;
    try {
        EnvironmentProfileCatalog dup(duplicated);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "Duplicate profile names are rejected.");

    EnvironmentProfile noSubstrate = catalog->profiles()[0];
    noSubstrate.substrates.clear();
    threw = false;
    try {
        EnvironmentProfileCatalog bad({noSubstrate});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "A profile must accept some substrate.");
}

int main() {
    std::cout << "[Test] Starting ScaleTable / Catalog Test..." << std::endl;
    TestStandardBuckets();
    TestBrokenTablesAreRejected();
    TestCatalog();
    std::cout << "[PASS] ScaleTable / Catalog Test." << std::endl;
    return 0;
}
