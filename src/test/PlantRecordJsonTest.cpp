#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "application/CompatibilityScorer.hpp"
#include "application/EnclosureSizeEstimator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PlantRecordJson.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace terrascope::domain;
using terrascope::application::CompatibilityScorer;
using terrascope::application::EnclosureSizeEstimator;
using terrascope::infrastructure::ConfigLoader;
using terrascope::infrastructure::PlantRecordJson;

static void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

static void TestLenientParse() {
    std::cout << "  - Lenient parsing" << std::endl;
    json j = {
        {"id", 42},
        {"name", "Pitcher Plant"},
        {"scientificName", {{"scientificName", "Nepenthes ventricosa"}}},
        {"category", "carnivorous"},
        {"careTips", {"Use rainwater", 7, "Bright light"}},
        {"humidity", "70-90%"},
        {"humidityRange", {{"min", 60}, {"max", 95}}},
        {"lightRequirements", "bright indirect"},
        {"watering", 12},
        {"temperatureRange", {{"min", 40}, {"max", 50}, {"ideal", 44}}},
        {"substrateType", "moist"},
        {"size", "20-40 cm"},
        {"taxonomy", {{"class", "Magnoliopsida"}, {"genus", "Nepenthes"}}}
    };

    PlantRecord record = PlantRecordJson::Parse(j);
    assert(record.id == "42");
    assert(record.scientificName == "Nepenthes ventricosa");
    assert(record.category == std::vector<std::string>{"carnivorous"});
    assert(record.careTips.size() == 2 && "Non-string tips are dropped.");

    const auto* humidity = StructuredOf(record.humidity);
    assert(humidity && humidity->min == 60 && humidity->max == 95 && !humidity->ideal);
    assert(TextOf(record.light) == "bright indirect");
    assert(std::holds_alternative<std::monostate>(record.waterNeeds) && "Wrong type reads as absent.");
    const auto* temperature = StructuredOf(record.temperature);
    assert(temperature && temperature->ideal && *temperature->ideal == 44);

    assert(record.substrateType && *record.substrateType == "moist");
    assert(!record.specialNeeds);
    assert(record.taxonomy.className == "Magnoliopsida");
    assert(record.taxonomy.genus == "Nepenthes");

    PlantRecord empty = PlantRecordJson::Parse(json::array());
    assert(empty.name.empty() && empty.id.empty());

    json nameObject = {{"name", "X"}, {"scientificName", {{"name", "Xus yus"}}}};
    assert(PlantRecordJson::Parse(nameObject).scientificName == "Xus yus");
}

static void TestParseAll() {
    std::cout << "  - ParseAll shapes" << std::endl;
    json list = json::parse(R"([{"name": "A"}, "noise", {"name": "B"}])");
    assert(PlantRecordJson::ParseAll(list).size() == 2);

    json wrapped = {{"plants", list}};
    auto records = PlantRecordJson::ParseAll(wrapped);
    assert(records.size() == 2 && records[1].name == "B");

    assert(PlantRecordJson::ParseAll(json{{"plants", 3}}).empty());
}

static void TestLoading(const fs::path& root) {
    std::cout << "  - Loading from disk" << std::endl;
    WriteFile(root / "plants.json", R"({"plants": [{"id": "a", "name": "Moss"}, {"id": "b", "name": "Fern"}]})");
    auto records = PlantRecordJson::LoadFile((root / "plants.json").string());
    assert(records.size() == 2 && records[0].name == "Moss");

    WriteFile(root / "broken.json", "{ not json");
    assert(PlantRecordJson::LoadFile((root / "broken.json").string()).empty());
    assert(PlantRecordJson::LoadFile((root / "missing.json").string()).empty());

    const fs::path store = root / "store";
    fs::create_directories(store);
    WriteFile(store / "index.json", R"({"plants": ["moss.json", "bad.json", "gone.json", "fern.json"]})");
    WriteFile(store / "moss.json", R"({"id": "moss", "name": "Cushion Moss"})");
    WriteFile(store / "bad.json", "[1, 2");
    WriteFile(store / "fern.json", R"({"id": "fern", "name": "Maidenhair Fern", "substrateType": "wet"})");

    records = PlantRecordJson::LoadIndexedDirectory(store.string());
    assert(records.size() == 2);
    assert(records[0].id == "moss" && records[1].id == "fern");

    assert(PlantRecordJson::LoadIndexedDirectory((root / "nowhere").string()).empty());
}

static void TestSerialization() {
    std::cout << "  - Serialization" << std::endl;
    CompatibilityScorer scorer;
    PlantRecord plant;
    plant.name = "Hornwort";
    plant.substrateType = "aquatic";
    plant.size = "45-90 cm";

    json inputs = PlantRecordJson::ToJson(scorer.normalizer().normalize(plant));
    assert(inputs["substrate"] == "aquatic");
    assert(inputs["specialNeeds"] == "aquatic");
    assert(inputs["humidityRange"]["ideal"] == 100.0);
    assert(inputs.contains("waterPhRange") && inputs.contains("salinityRange"));

    plant.substrateType = "moist";
    json terrestrial = PlantRecordJson::ToJson(scorer.normalizer().normalize(plant));
    assert(!terrestrial.contains("waterPhRange"));

    plant.substrateType = "aquatic";
    json classification = PlantRecordJson::ToJson(scorer.classify(plant));
    assert(classification["source"] == "ranked");
    assert(classification["vivariumTypes"][0] == profile_names::kAquarium);

    EnclosureSizeEstimator estimator;
    json size = PlantRecordJson::ToJson(estimator.estimate(plant.size));
    assert(size["size"] == "xlarge" && size["height"] == "60-180 cm");
    assert(size["parsed"] == true && size.contains("requiredHeightCm"));

    json unknown = PlantRecordJson::ToJson(estimator.estimate("hand-sized"));
    assert(unknown["size"] == "small" && !unknown.contains("juvenileSizeCm"));
}

static void TestConfig(const fs::path& root) {
    std::cout << "  - Threshold config" << std::endl;
    const fs::path project = root / "project";
    fs::create_directories(project);

    ScoringRules defaults = ConfigLoader::LoadScoringRules(project.string());
    assert(defaults.qualifyThreshold == 70.0 && defaults.fallbackThreshold == 50.0);

    WriteFile(project / "settings.json", R"({"theme": "dark", "qualify_threshold": 65, "fallback_threshold": "high"})");
    ScoringRules loaded = ConfigLoader::LoadScoringRules(project.string());
    assert(loaded.qualifyThreshold == 65.0);
    assert(loaded.fallbackThreshold == 50.0 && "Non-numeric override is ignored.");

    loaded.fallbackThreshold = 40.0;
    assert(ConfigLoader::SaveScoringThresholds(project.string(), loaded));
    ScoringRules reloaded = ConfigLoader::LoadScoringRules(project.string());
    assert(reloaded.qualifyThreshold == 65.0 && reloaded.fallbackThreshold == 40.0);

    std::ifstream f(project / "settings.json");
    json saved = json::parse(f);
    assert(saved["theme"] == "dark" && "Unrelated settings survive a save.");

    WriteFile(project / "settings.json", R"({"qualify_threshold": 250})");
    assert(ConfigLoader::LoadScoringRules(project.string()).qualifyThreshold == 70.0);

    WriteFile(project / "settings.json", "garbage");
    assert(ConfigLoader::LoadScoringRules(project.string()).qualifyThreshold == 70.0);
    assert(ConfigLoader::SaveScoringThresholds(project.string(), ScoringRules{}));
}

int main() {
    std::cout << "[Test] Starting PlantRecordJson / ConfigLoader Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "terrascope_json_test";
    if (fs::exists(root)) fs::remove_all(root);
    fs::create_directories(root);

    TestLenientParse();
    TestParseAll();
    TestLoading(root);
    TestSerialization();
    TestConfig(root);

    fs::remove_all(root);
    std::cout << "[PASS] PlantRecordJson / ConfigLoader Test." << std::endl;
    return 0;
}
