/**
 * @file AttributeNormalizer.cpp
 * @brief Implementation of AttributeNormalizer.
 */

#include "application/AttributeNormalizer.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "application/NormalizationRules.hpp"
#include "domain/TextUtils.hpp"
#include "domain/UnitConversion.hpp"

namespace terrascope::application {

using domain::DimensionValue;
using domain::NormalizedInputs;
using domain::PlantRecord;
using domain::Range;
using domain::ScaleDimension;
using domain::SpecialNeeds;
using domain::Substrate;
using domain::TextUtils;
namespace units = domain::units;

namespace {

constexpr double kDefaultMaxSizeCm = 30.0;
constexpr double kAirCirculationSpread = 10.0;

std::string ContextOf(const PlantRecord& record) {
    std::string tips;
    for (const auto& tip : record.careTips) {
        if (!tips.empty()) tips += ' ';
        tips += tip;
    }
    return TextUtils::Normalize(record.description + " " + tips);
}

// strtod instead of stod: an absurdly long digit run saturates rather than throws.
double ParseNumber(const std::string& token) {
    return std::strtod(token.c_str(), nullptr);
}

/** Trusts a structured range, ordered and clamped. Non-finite bounds are ignored. */
std::optional<Range> TrustStructured(const DimensionValue& value) {
    const auto* structured = domain::StructuredOf(value);
    if (!structured || !std::isfinite(structured->min) || !std::isfinite(structured->max)) {
        return std::nullopt;
    }
    const double ideal = structured->ideal.value_or((structured->min + structured->max) / 2.0);
    return Range{structured->min, structured->max, ideal}.sanitized();
}

// Regex fragments. The en dash is matched as a byte sequence, not a bracket member.
const std::string kNum = R"((\d+(?:\.\d+)?))";
const std::string kDash = R"(\s*(?:-|–)\s*)";
const std::string kCelsius = R"(\s*(?:°)?\s*c(?:elsius)?\b)";

std::regex Pattern(const std::string& expr) {
    return std::regex(expr, std::regex::ECMAScript | std::regex::icase);
}

struct Patterns {
    std::regex numericRange = Pattern(kNum + kDash + kNum);

    std::regex temperatureRange = Pattern(kNum + kDash + kNum + kCelsius);
    std::regex temperatureSingle = Pattern(kNum + kCelsius);

    std::vector<std::regex> soilPhRanges{
        Pattern(R"(soil\s+ph\s+)" + kNum + kDash + kNum),
        Pattern(R"(\bph\s+)" + kNum + kDash + kNum + R"(\s*\(soil\))")};
    std::vector<std::regex> soilPhSingles{Pattern(R"(soil\s+ph\s+)" + kNum)};

    std::vector<std::regex> hardnessRanges{
        Pattern(kNum + kDash + kNum + R"(\s*dgh\b)"),
        Pattern(R"(hardness\s+)" + kNum + kDash + kNum),
        Pattern(kNum + kDash + kNum + R"(\s*gh\b)")};
    std::vector<std::regex> hardnessSingles{
        Pattern(kNum + R"(\s*dgh\b)"),
        Pattern(R"(hardness\s+)" + kNum),
        Pattern(kNum + R"(\s*gh\b)")};

    std::vector<std::regex> specificGravityRanges{
        Pattern(R"(salinity\s+(1\.\d{3}))" + kDash + R"((1\.\d{3}))"),
        Pattern(R"((1\.\d{3}))" + kDash + R"((1\.\d{3})\s*salinity)")};
    std::vector<std::regex> pptRanges{Pattern(kNum + kDash + kNum + R"(\s*ppt\b)")};

    std::vector<std::regex> waterPhRanges{
        Pattern(R"(water\s+ph\s+)" + kNum + kDash + kNum),
        Pattern(R"(\bph\s+)" + kNum + kDash + kNum + R"(\s*\(water\))"),
        Pattern(R"(\bph\s+)" + kNum + kDash + kNum)};
    std::vector<std::regex> waterPhSingles{
        Pattern(R"(water\s+ph\s+)" + kNum),
        Pattern(R"(\bph\s+)" + kNum)};

    std::regex sizeRange = Pattern(kNum + kDash + kNum + R"(\s*cm\b)");
    std::regex sizeSingle = Pattern(kNum + R"(\s*cm\b)");
};

const Patterns& GetPatterns() {
    static const Patterns patterns;
    return patterns;
}

std::optional<std::pair<double, double>> MatchPair(const std::string& text, const std::regex& re) {
    std::smatch match;
    if (std::regex_search(text, match, re)) {
        return std::make_pair(ParseNumber(match[1].str()), ParseNumber(match[2].str()));
    }
    return std::nullopt;
}

std::optional<std::pair<double, double>> FirstPair(const std::string& text, const std::vector<std::regex>& patterns) {
    for (const auto& re : patterns) {
        if (auto pair = MatchPair(text, re)) return pair;
    }
    return std::nullopt;
}

std::optional<double> FirstSingle(const std::string& text, const std::vector<std::regex>& patterns) {
    for (const auto& re : patterns) {
        std::smatch match;
        if (std::regex_search(text, match, re)) {
            return ParseNumber(match[1].str());
        }
    }
    return std::nullopt;
}

template <typename Convert>
Range ConvertedRange(const std::pair<double, double>& bounds, Convert convert) {
    return Range::FromBounds(convert(bounds.first), convert(bounds.second));
}

} // namespace

AttributeNormalizer::AttributeNormalizer(std::shared_ptr<const domain::ScaleTable> scale)
    : m_scale(std::move(scale)) {
    if (!m_scale) {
        throw std::invalid_argument("AttributeNormalizer requires a scale table");
    }
}

NormalizedInputs AttributeNormalizer::normalize(const PlantRecord& record) const {
    NormalizedInputs inputs;
    const std::string context = ContextOf(record);

    inputs.substrate = resolveSubstrate(record);
    inputs.specialNeeds = resolveSpecialNeeds(record, inputs.substrate);

    inputs.humidity = resolveHumidity(record, inputs.isAquatic());
    inputs.light = resolveLight(record);
    inputs.airCirculation = resolveAirCirculation(record, context, inputs.humidity);
    inputs.waterNeeds = resolveWaterNeeds(record, inputs.substrate);
    inputs.temperature = resolveTemperature(record);
    inputs.soilPh = resolveSoilPh(context);

    if (inputs.isAquatic()) {
        inputs.waterCirculation = resolveWaterCirculation(record, context);
        inputs.waterHardness = resolveWaterHardness(context);
        inputs.salinity = resolveSalinity(context);
        inputs.waterTemperature = resolveWaterTemperature(record);
        inputs.waterPh = resolveWaterPh(context);
    }

    inputs.maxSize = ParseMaxSize(record.size);
    inputs.difficulty = resolveDifficulty(record);
    inputs.growthRate = resolveGrowthRate(record);
    return inputs;
}

double AttributeNormalizer::ParseMaxSize(const std::string& size) {
    const auto& patterns = GetPatterns();
    if (auto bounds = MatchPair(size, patterns.sizeRange)) {
        return bounds->second;
    }
    std::smatch match;
    if (std::regex_search(size, match, patterns.sizeSingle)) {
        return ParseNumber(match[1].str());
    }
    return kDefaultMaxSizeCm;
}

Substrate AttributeNormalizer::resolveSubstrate(const PlantRecord& record) const {
    if (record.substrateType) {
        if (auto explicitType = domain::ParseSubstrate(TextUtils::Normalize(*record.substrateType))) {
            return *explicitType;
        }
    }

    rules::SubstrateEvidence evidence;
    evidence.substrate = TextUtils::Normalize(record.substrate);
    evidence.growthHabit = TextUtils::Normalize(record.growthHabit);
    evidence.categories = TextUtils::NormalizeAll(record.category);
    evidence.name = TextUtils::Normalize(record.name);
    evidence.description = TextUtils::Normalize(record.description);
    evidence.scientificName = TextUtils::Normalize(record.scientificName);
    evidence.humidity = TextUtils::Normalize(domain::TextOf(record.humidity));

    return rules::SubstrateRules().firstMatch(evidence).value_or(Substrate::Moist);
}

SpecialNeeds AttributeNormalizer::resolveSpecialNeeds(const PlantRecord& record, Substrate substrate) const {
    if (record.specialNeeds) {
        if (auto explicitNeeds = domain::ParseSpecialNeeds(TextUtils::Normalize(*record.specialNeeds))) {
            return *explicitNeeds;
        }
    }

    rules::NeedsEvidence evidence;
    evidence.categories = TextUtils::NormalizeAll(record.category);
    evidence.substrate = substrate;
    return rules::SpecialNeedsRules().firstMatch(evidence).value_or(SpecialNeeds::None);
}

Range AttributeNormalizer::resolveHumidity(const PlantRecord& record, bool aquatic) const {
    if (auto structured = TrustStructured(record.humidity)) {
        return *structured;
    }

    const std::string text = TextUtils::Normalize(domain::TextOf(record.humidity));
    if (auto bounds = MatchPair(text, GetPatterns().numericRange)) {
        Range range = Range::FromBounds(bounds->first, bounds->second);
        range.ideal = std::round((bounds->first + bounds->second) / 2.0);
        return range.sanitized();
    }

    if (auto bucket = rules::HumidityRules().firstMatch(text)) {
        return m_scale->bucket(ScaleDimension::Humidity, *bucket);
    }
    return aquatic ? m_scale->bucket(ScaleDimension::Humidity, "aquatic")
                   : m_scale->fallback(ScaleDimension::Humidity);
}

Range AttributeNormalizer::resolveLight(const PlantRecord& record) const {
    if (auto structured = TrustStructured(record.light)) {
        return *structured;
    }
    const std::string text = TextUtils::Normalize(domain::TextOf(record.light));
    if (auto bucket = rules::LightRules().firstMatch(text)) {
        return m_scale->bucket(ScaleDimension::Light, *bucket);
    }
    return m_scale->fallback(ScaleDimension::Light);
}

Range AttributeNormalizer::resolveAirCirculation(const PlantRecord& record, const std::string& context,
                                                 const Range& humidity) const {
    if (auto structured = TrustStructured(record.airCirculation)) {
        return *structured;
    }

    const std::string field = TextUtils::Normalize(domain::TextOf(record.airCirculation));
    auto bucket = rules::AirCirculationFieldRules().firstMatch(field);
    if (!bucket) {
        bucket = rules::AirCirculationContextRules().firstMatch(context);
    }
    if (!bucket) {
        // Damp plants are assumed to live in still air.
        const double mid = humidity.midpoint();
        const bool submerged =
            TextUtils::Normalize(domain::TextOf(record.humidity)).find("submerged") != std::string::npos;
        if (mid >= 90 && !submerged) {
            bucket = "minimal";
        } else if (mid >= 70) {
            bucket = "low";
        } else if (mid >= 50) {
            bucket = "moderate";
        } else {
            bucket = "high";
        }
    }
    return m_scale->bucket(ScaleDimension::AirCirculation, *bucket).widened(kAirCirculationSpread);
}

Range AttributeNormalizer::resolveWaterNeeds(const PlantRecord& record, Substrate substrate) const {
    if (auto structured = TrustStructured(record.waterNeeds)) {
        return *structured;
    }
    rules::WateringEvidence evidence;
    evidence.text = TextUtils::Normalize(domain::TextOf(record.waterNeeds));
    evidence.aquaticSubstrate = substrate == Substrate::Aquatic;
    if (auto bucket = rules::WaterNeedsRules().firstMatch(evidence)) {
        return m_scale->bucket(ScaleDimension::WaterNeeds, *bucket);
    }
    return m_scale->fallback(ScaleDimension::WaterNeeds);
}

Range AttributeNormalizer::resolveTemperature(const PlantRecord& record) const {
    if (auto structured = TrustStructured(record.temperature)) {
        return *structured;
    }

    const auto& patterns = GetPatterns();
    const std::string& text = domain::TextOf(record.temperature);
    if (auto bounds = MatchPair(text, patterns.temperatureRange)) {
        return ConvertedRange(*bounds, units::CelsiusToPercent);
    }
    std::smatch match;
    if (std::regex_search(text, match, patterns.temperatureSingle)) {
        return Range::Around(units::CelsiusToPercent(ParseNumber(match[1].str())), units::kTemperatureBand);
    }
    return m_scale->fallback(ScaleDimension::Temperature);
}

Range AttributeNormalizer::resolveSoilPh(const std::string& context) const {
    const auto& patterns = GetPatterns();
    if (auto bounds = FirstPair(context, patterns.soilPhRanges)) {
        return ConvertedRange(*bounds, units::PhToPercent);
    }
    if (auto ph = FirstSingle(context, patterns.soilPhSingles)) {
        return Range::Around(units::PhToPercent(*ph), units::kPhBand);
    }
    return m_scale->fallback(ScaleDimension::SoilPh);
}

Range AttributeNormalizer::resolveDifficulty(const PlantRecord& record) const {
    if (auto bucket = rules::DifficultyRules().firstMatch(TextUtils::Normalize(record.difficulty))) {
        return m_scale->bucket(ScaleDimension::Difficulty, *bucket);
    }
    return m_scale->fallback(ScaleDimension::Difficulty);
}

Range AttributeNormalizer::resolveGrowthRate(const PlantRecord& record) const {
    if (auto structured = TrustStructured(record.growthRate)) {
        return *structured;
    }
    if (auto bucket = rules::GrowthRateRules().firstMatch(TextUtils::Normalize(domain::TextOf(record.growthRate)))) {
        return m_scale->bucket(ScaleDimension::GrowthRate, *bucket);
    }
    return m_scale->fallback(ScaleDimension::GrowthRate);
}

Range AttributeNormalizer::resolveWaterCirculation(const PlantRecord& record, const std::string& context) const {
    if (auto structured = TrustStructured(record.waterCirculation)) {
        return *structured;
    }
    rules::FieldAndContext subject{TextUtils::Normalize(domain::TextOf(record.waterCirculation)), context};
    if (auto bucket = rules::WaterCirculationRules().firstMatch(subject)) {
        return m_scale->bucket(ScaleDimension::WaterCirculation, *bucket);
    }
    return m_scale->fallback(ScaleDimension::WaterCirculation);
}

Range AttributeNormalizer::resolveWaterHardness(const std::string& context) const {
    const auto& patterns = GetPatterns();
    if (auto bounds = FirstPair(context, patterns.hardnessRanges)) {
        return ConvertedRange(*bounds, units::HardnessDghToPercent);
    }
    if (auto dgh = FirstSingle(context, patterns.hardnessSingles)) {
        return Range::Around(units::HardnessDghToPercent(*dgh), units::kHardnessBand);
    }
    if (auto bucket = rules::WaterHardnessRules().firstMatch(context)) {
        return m_scale->bucket(ScaleDimension::WaterHardness, *bucket);
    }
    return m_scale->fallback(ScaleDimension::WaterHardness);
}

Range AttributeNormalizer::resolveSalinity(const std::string& context) const {
    const auto& patterns = GetPatterns();
    if (auto gravity = FirstPair(context, patterns.specificGravityRanges)) {
        return ConvertedRange(*gravity, units::SpecificGravityToPercent);
    }
    if (auto ppt = FirstPair(context, patterns.pptRanges)) {
        return ConvertedRange(*ppt, units::SalinityPptToPercent);
    }
    if (auto bucket = rules::SalinityRules().firstMatch(context)) {
        return m_scale->bucket(ScaleDimension::Salinity, *bucket);
    }
    return m_scale->fallback(ScaleDimension::Salinity);
}

Range AttributeNormalizer::resolveWaterTemperature(const PlantRecord& record) const {
    if (auto bounds = MatchPair(domain::TextOf(record.temperature), GetPatterns().temperatureRange)) {
        return ConvertedRange(*bounds, units::CelsiusToPercent);
    }
    if (auto structured = TrustStructured(record.temperature)) {
        return *structured;
    }
    return m_scale->fallback(ScaleDimension::WaterTemperature);
}

Range AttributeNormalizer::resolveWaterPh(const std::string& context) const {
    const auto& patterns = GetPatterns();
    if (auto bounds = FirstPair(context, patterns.waterPhRanges)) {
        return ConvertedRange(*bounds, units::PhToPercent);
    }
    if (auto ph = FirstSingle(context, patterns.waterPhSingles)) {
        return Range::Around(units::PhToPercent(*ph), units::kPhBand);
    }
    return m_scale->fallback(ScaleDimension::WaterPh);
}

} // namespace terrascope::application
