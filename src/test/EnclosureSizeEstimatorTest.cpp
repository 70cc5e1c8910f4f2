#include <cassert>
#include <cmath>
#include <iostream>

#include "application/EnclosureSizeEstimator.hpp"

using namespace terrascope::domain;
using terrascope::application::EnclosureSizeEstimator;

static bool Near(double a, double b, double eps = 0.01) {
    return std::fabs(a - b) < eps;
}

int main() {
    std::cout << "[Test] Starting EnclosureSizeEstimator Test..." << std::endl;
    EnclosureSizeEstimator estimator;

    auto e = estimator.estimate("8-25 cm");
    assert(e.parsed);
    assert(Near(e.juvenileSizeCm, 8));
    assert(Near(e.requiredHeightCm, 13.43));
    assert(e.category == EnclosureCategory::Small);
    assert(e.heightBand == "5-15 cm");

    e = estimator.estimate("45-90 CM tall");
    assert(e.parsed && Near(e.requiredHeightCm, 73.29));
    assert(e.category == EnclosureCategory::XLarge);

    e = estimator.estimate("1.5 m");
    assert(e.parsed && Near(e.juvenileSizeCm, 150));
    assert(Near(e.requiredHeightCm, 244.29));
    assert(e.category == EnclosureCategory::Open);
    assert(e.heightBand == "180+ cm");

    e = estimator.estimate("up to 2 meters");
    assert(e.parsed && Near(e.juvenileSizeCm, 200));

    // Meter suffix written directly after the number.
    e = estimator.estimate("1m");
    assert(e.parsed && Near(e.juvenileSizeCm, 100));
    assert(Near(e.requiredHeightCm, 162.86));
    assert(e.category == EnclosureCategory::XLarge);

    e = estimator.estimate("0.5m");
    assert(e.parsed && Near(e.juvenileSizeCm, 50));
    assert(Near(e.requiredHeightCm, 81.43));
    assert(e.category == EnclosureCategory::XLarge);

    e = estimator.estimate("1-2m");
    assert(e.parsed && Near(e.juvenileSizeCm, 100));
    assert(e.category == EnclosureCategory::XLarge);

    e = estimator.estimate("10 mm");
    assert(!e.parsed);

    // Small plants still get the minimum padding.
    e = estimator.estimate("2 cm");
    assert(Near(e.requiredHeightCm, 2 / 0.7 + 2));
    assert(e.category == EnclosureCategory::Tiny);

    for (const char* unparsed : {"tiny", "", "grows 12 inches"}) {
        e = estimator.estimate(unparsed);
        assert(!e.parsed);
        assert(e.category == EnclosureCategory::Small);
        assert(e.heightBand == "5-15 cm");
    }

    assert(EnclosureSizeEstimator::CategoryForHeight(5) == EnclosureCategory::Tiny);
    assert(EnclosureSizeEstimator::CategoryForHeight(30) == EnclosureCategory::Medium);
    assert(EnclosureSizeEstimator::CategoryForHeight(60.5) == EnclosureCategory::XLarge);
    assert(ParseCategory(CategoryToString(EnclosureCategory::Large)) == EnclosureCategory::Large);
    assert(!ParseCategory("huge"));

    std::cout << "[PASS] EnclosureSizeEstimator Test." << std::endl;
    return 0;
}
