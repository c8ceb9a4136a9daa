/// @file test_adaptive_radius.cpp
/// @brief Unit tests for waymark::trust::AdaptiveRadiusAdvisor and LocationQualityAssessor.
///
/// The advisory radius is guidance only; the gating threshold is covered
/// by test_discovery_validator.cpp.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "trust/adaptive_radius.hpp"
#include "trust/location_quality.hpp"
#include "location/poi_type.hpp"

#include "test_support.hpp"

#include <optional>
#include <string>

using namespace waymark;
using namespace waymark::trust;
using location::PoiType;

namespace
{

location::LocationSample with_accuracy(f64 accuracy_m)
{
    return test::make_sample(test::kOrigin, accuracy_m, test::fixed_now());
}

} // anonymous namespace

// =================================================================
// Radius formula
// =================================================================

TEST_CASE("10 m accuracy adds 10 m to the 50 m base")
{
    const AdaptiveRadiusAdvisor advisor;

    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Library) == doctest::Approx(60.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), std::nullopt) == doctest::Approx(60.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Park) == doctest::Approx(90.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Landmark) == doctest::Approx(78.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Station) == doctest::Approx(72.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Cafe) == doctest::Approx(48.0));
    CHECK(advisor.suggested_radius(with_accuracy(10.0), PoiType::Restaurant) == doctest::Approx(48.0));
}

TEST_CASE("Unlisted POI types use modifier 1.0")
{
    CHECK(AdaptiveRadiusAdvisor::poi_modifier(PoiType::Shop) == 1.0);
    CHECK(AdaptiveRadiusAdvisor::poi_modifier(PoiType::Hospital) == 1.0);
    CHECK(AdaptiveRadiusAdvisor::poi_modifier(std::nullopt) == 1.0);
}

TEST_CASE("Accuracy factor is capped at 2")
{
    const AdaptiveRadiusAdvisor advisor;

    // 50 + min(2, 4.5) x 10 = 70
    CHECK(advisor.suggested_radius(with_accuracy(45.0), PoiType::Library) == doctest::Approx(70.0));
    CHECK(advisor.suggested_radius(with_accuracy(95.0), PoiType::Library) == doctest::Approx(70.0));
}

TEST_CASE("Result is clamped to [20, 100]")
{
    const AdaptiveRadiusAdvisor advisor;

    // 70 x 1.5 = 105
    CHECK(advisor.suggested_radius(with_accuracy(50.0), PoiType::Park) == doctest::Approx(100.0));

    const AdaptiveRadiusAdvisor tight({.base_radius_m = 10.0});
    // 10 x 0.8 = 8
    CHECK(tight.suggested_radius(with_accuracy(0.0), PoiType::Cafe) == doctest::Approx(20.0));

    const PoiType types[] = {PoiType::Restaurant, PoiType::Park, PoiType::Landmark, PoiType::Cafe,
                             PoiType::Station, PoiType::Library, PoiType::School};
    for (f64 accuracy : {0.0, 0.5, 3.0, 12.0, 27.0, 80.0, 100.0})
    {
        for (PoiType type : types)
        {
            const f64 r = advisor.suggested_radius(with_accuracy(accuracy), type);
            CHECK(r >= 20.0);
            CHECK(r <= 100.0);
        }
    }
}

// =================================================================
// POI type names
// =================================================================

TEST_CASE("POI type parsing")
{
    CHECK(location::parse_poi_type("park") == PoiType::Park);
    CHECK(location::parse_poi_type("library") == PoiType::Library);
    CHECK_FALSE(location::parse_poi_type("Park").has_value());
    CHECK_FALSE(location::parse_poi_type("stadium").has_value());
    CHECK(std::string(location::poi_type_name(PoiType::Station)) == "station");
}

TEST_CASE("POI type hints")
{
    CHECK(std::string(location::poi_type_hint(PoiType::Cafe)) == "Follow the smell of coffee.");
    CHECK(location::poi_type_hint(PoiType::Library) == nullptr);
    CHECK(location::poi_type_hint(PoiType::Hospital) == nullptr);
}

// =================================================================
// Location quality report
// =================================================================

TEST_CASE("Quality levels follow accuracy bands")
{
    const AdaptiveRadiusAdvisor advisor;
    const LocationQualityAssessor assessor(advisor);
    const Timestamp now = test::fixed_now();

    CHECK(assessor.assess(with_accuracy(4.0), now).level == QualityLevel::Excellent);
    CHECK(assessor.assess(with_accuracy(8.0), now).level == QualityLevel::Good);
    CHECK(assessor.assess(with_accuracy(20.0), now).level == QualityLevel::Fair);
    CHECK(assessor.assess(with_accuracy(40.0), now).level == QualityLevel::Poor);
    CHECK(std::string(quality_level_name(QualityLevel::Fair)) == "fair");
}

TEST_CASE("Reliability needs acceptable accuracy and a fix under 30 s old")
{
    const AdaptiveRadiusAdvisor advisor;
    const LocationQualityAssessor assessor(advisor);
    const Timestamp now = test::fixed_now();

    const auto fresh = assessor.assess(with_accuracy(10.0), now);
    CHECK(fresh.is_high_accuracy);
    CHECK(fresh.is_acceptable_accuracy);
    CHECK(fresh.is_reliable);
    CHECK(fresh.recommended_radius_m == doctest::Approx(60.0));

    const auto old = assessor.assess(
        test::make_sample(test::kOrigin, 10.0, test::seconds_after(now, -45.0)), now);
    CHECK_FALSE(old.is_reliable);

    const auto coarse = assessor.assess(with_accuracy(60.0), now);
    CHECK_FALSE(coarse.is_high_accuracy);
    CHECK_FALSE(coarse.is_acceptable_accuracy);
    CHECK_FALSE(coarse.is_reliable);
}
