#include <cassert>
#include <iostream>
#include <stdexcept>
#include <memory>

#include "application/PlantFilterService.hpp"

using namespace terrascope::domain;
using terrascope::application::AdvancedFilters;
using terrascope::application::CompatibilityScorer;
using terrascope::application::PlantFilterService;
namespace names = terrascope::domain::profile_names;

static std::vector<PlantRecord> SamplePlants() {
    PlantRecord fern;
    fern.id = "fern";
    fern.name = "Button Fern";
    fern.humidity = RawText{"70-90%"};
    fern.light = RawText{"bright"};
    fern.substrate = "moist";
    fern.waterNeeds = RawText{"moderate"};
    fern.temperature = RawText{"20-25°C"};
    fern.size = "8-25 cm";
    fern.taxonomy.family = "Polypodiaceae";

    PlantRecord stem;
    stem.id = "stem";
    stem.name = "Submersed Stem";
    stem.substrateType = "aquatic";
    stem.size = "45-90 cm";

    PlantRecord echeveria;
    echeveria.id = "echeveria";
    echeveria.name = "Echeveria";
    echeveria.scientificName = "Echeveria elegans";
    echeveria.category = {"succulent"};
    echeveria.substrate = "well-draining sand";
    echeveria.humidity = RawText{"low"};
    echeveria.light = RawText{"very-bright"};
    echeveria.size = "10 cm";
    echeveria.taxonomy.genus = "Echeveria";

    return {fern, stem, echeveria};
}

static std::vector<std::string> Ids(const std::vector<PlantRecord>& plants) {
    std::vector<std::string> ids;
    for (const auto& p : plants) ids.push_back(p.id);
    return ids;
}

int main() {
    std::cout << "[Test] Starting PlantFilterService Test..." << std::endl;

    bool threw = false;
    try {
        PlantFilterService broken(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    PlantFilterService service;
    const auto plants = SamplePlants();

    // 1. No active filter passes everything through in order.
    std::cout << "  - Empty filters" << std::endl;
    assert(Ids(service.apply(plants, AdvancedFilters{})) == (std::vector<std::string>{"fern", "stem", "echeveria"}));
    assert(service.cachedCount() == 3);

    // 2. Range filters overlap-test the normalized range.
    std::cout << "  - Range filters" << std::endl;
    AdvancedFilters humid;
    humid.humidity.min = 60;
    assert(Ids(service.apply(plants, humid)) == (std::vector<std::string>{"fern", "stem"}));

    AdvancedFilters dim;
    dim.light.max = 75;
    assert(Ids(service.apply(plants, dim)) == (std::vector<std::string>{"fern", "stem"}));

    // Water dimensions exist only for aquatic plants.
    AdvancedFilters water;
    water.waterPh.min = 0;
    assert(Ids(service.apply(plants, water)) == std::vector<std::string>{"stem"});

    // 3. Vivarium types match any classified profile.
    std::cout << "  - Vivarium filter" << std::endl;
    AdvancedFilters aquarium;
    aquarium.vivariumTypes = {names::kAquarium};
    assert(Ids(service.apply(plants, aquarium)) == std::vector<std::string>{"stem"});

    AdvancedFilters houseplants;
    houseplants.vivariumTypes = {names::kIndoor, names::kPaludarium};
    assert(Ids(service.apply(plants, houseplants)) == (std::vector<std::string>{"fern", "stem", "echeveria"}));

    // 4. Enclosure size.
    std::cout << "  - Enclosure filter" << std::endl;
    AdvancedFilters small;
    small.enclosureSizes = {EnclosureCategory::Small};
    assert(Ids(service.apply(plants, small)) == std::vector<std::string>{"fern"});
    assert(service.enclosureFor(plants[2]).category == EnclosureCategory::Medium);
    assert(service.enclosureFor(plants[1]).category == EnclosureCategory::XLarge);

    // 5. Taxonomy, case-insensitive; species falls back to the scientific name.
    std::cout << "  - Taxonomy filter" << std::endl;
    AdvancedFilters family;
    family.taxonomy = {"family", "polypodiaceae"};
    assert(Ids(service.apply(plants, family)) == std::vector<std::string>{"fern"});
    assert(PlantFilterService::BelongsToTaxonomy(plants[2], "species", "ECHEVERIA ELEGANS"));
    assert(PlantFilterService::BelongsToTaxonomy(plants[2], "genus", "echeveria"));
    assert(!PlantFilterService::BelongsToTaxonomy(plants[2], "order", "echeveria"));
    assert(!PlantFilterService::BelongsToTaxonomy(plants[2], "clade", "echeveria"));

    // 6. Combined filters must all pass.
    AdvancedFilters combined;
    combined.humidity.min = 60;
    combined.enclosureSizes = {EnclosureCategory::XLarge};
    assert(Ids(service.apply(plants, combined)) == std::vector<std::string>{"stem"});

    // 7. Memoization is per id and survives until cleared.
    std::cout << "  - Memoization" << std::endl;
    const auto& first = service.classificationFor(plants[0]);
    const auto& again = service.classificationFor(plants[0]);
    assert(&first == &again);
    assert(first.profiles.front() == names::kClosedTerrarium);

    PlantRecord anonymous = plants[0];
    anonymous.id.clear();
    service.inputsFor(anonymous);
    assert(service.cachedCount() == 4);

    // Records with neither id nor name are told apart by content.
    PlantRecord dryNameless;
    dryNameless.category = {"succulent"};
    dryNameless.humidity = RawText{"low"};
    PlantRecord wetNameless;
    wetNameless.substrateType = "aquatic";

    assert(service.inputsFor(dryNameless).specialNeeds == SpecialNeeds::Succulent);
    assert(service.inputsFor(wetNameless).isAquatic());
    assert(!service.inputsFor(dryNameless).isAquatic());
    assert(service.cachedCount() == 6);
    assert(service.classificationFor(wetNameless).profiles.front() == names::kAquarium);

    PlantRecord sameContent = wetNameless;
    assert(&service.inputsFor(sameContent) == &service.inputsFor(wetNameless));
    assert(service.cachedCount() == 6);

    service.clearCache();
    assert(service.cachedCount() == 0);
    assert(service.inputsFor(plants[1]).isAquatic());
    assert(service.cachedCount() == 1);

    auto sharedScorer = std::make_shared<const CompatibilityScorer>();
    PlantFilterService withShared(sharedScorer);
    assert(withShared.inputsFor(plants[2]).specialNeeds == SpecialNeeds::Succulent);

    std::cout << "[PASS] PlantFilterService Test." << std::endl;
    return 0;
}
