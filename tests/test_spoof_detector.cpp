/// @file test_spoof_detector.cpp
/// @brief Unit tests for waymark::trust::SpoofDetector.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "trust/spoof_detector.hpp"
#include "trust/player_history.hpp"
#include "core/logger.hpp"

#include "test_support.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace waymark;
using namespace waymark::trust;
using location::Provider;

int main(int argc, char** argv)
{
    waymark::core::Logger::init("test_spoof_detector.log");
    const int result = doctest::Context(argc, argv).run();
    waymark::core::Logger::shutdown();
    return result;
}

// =================================================================
// Single-fix indicators
// =================================================================

TEST_CASE("Sub-meter accuracy is suspicious")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);

    const auto result = detector.assess(test::make_sample(test::kOrigin, 0.5, test::fixed_now()), "p1");

    CHECK(result.is_likely_spoofed);
    CHECK(result.indicators.suspicious_accuracy);
    CHECK(result.indicators.count() == 1);
    CHECK(result.risk_score == doctest::Approx(0.25));
}

TEST_CASE("First ordinary fix is clean and reports no history")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);

    const auto result = detector.assess(test::make_sample(test::kOrigin, 8.0, test::fixed_now()), "p1");

    CHECK_FALSE(result.is_likely_spoofed);
    CHECK(result.risk_score == 0.0);
    CHECK(result.movement.kind == MovementCheck::Kind::NoHistory);
    CHECK(result.movement.is_valid);
}

// =================================================================
// Movement indicators
// =================================================================

TEST_CASE("500 m in 2 s is a jump and impossible movement")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    CHECK_FALSE(detector.assess(test::make_sample(test::kOrigin, 8.0, t0), "p1").is_likely_spoofed);

    const auto result = detector.assess(
        test::make_sample(test::north_of(test::kOrigin, 500.0), 8.0, test::seconds_after(t0, 2.0)), "p1");

    CHECK(result.is_likely_spoofed);
    CHECK(result.indicators.location_jump);
    CHECK(result.indicators.impossible_movement);
    CHECK_FALSE(result.indicators.suspicious_accuracy);
    CHECK(result.risk_score == doctest::Approx(0.5));
    CHECK(result.movement.kind == MovementCheck::Kind::Checked);
    CHECK(result.movement.implied_speed_mps == doctest::Approx(250.0));
}

TEST_CASE("500 m in 60 s is plausible but above walking pace")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    (void)detector.assess(test::make_sample(test::kOrigin, 8.0, t0), "p1");
    const auto result = detector.assess(
        test::make_sample(test::north_of(test::kOrigin, 500.0), 8.0, test::seconds_after(t0, 60.0)), "p1");

    CHECK_FALSE(result.is_likely_spoofed);
    CHECK(result.movement.kind == MovementCheck::Kind::Checked);
    CHECK_FALSE(result.movement.is_valid);
    CHECK(result.movement.distance_moved_m == doctest::Approx(500.0).epsilon(0.001));
    CHECK(result.movement.time_delta_s == doctest::Approx(60.0));
}

TEST_CASE("Non-increasing timestamps raise no movement indicator")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    (void)detector.assess(test::make_sample(test::kOrigin, 8.0, t0), "p1");

    SUBCASE("same instant")
    {
        const auto result = detector.assess(
            test::make_sample(test::north_of(test::kOrigin, 5'000.0), 8.0, t0), "p1");
        CHECK_FALSE(result.indicators.impossible_movement);
        CHECK_FALSE(result.indicators.location_jump);
        CHECK(result.movement.kind == MovementCheck::Kind::InvalidTime);
        CHECK_FALSE(result.movement.is_valid);
    }

    SUBCASE("older fix")
    {
        const auto result = detector.assess(
            test::make_sample(test::north_of(test::kOrigin, 5'000.0), 8.0, test::seconds_after(t0, -10.0)), "p1");
        CHECK_FALSE(result.is_likely_spoofed);
        CHECK(result.movement.kind == MovementCheck::Kind::InvalidTime);
    }
}

// =================================================================
// Provider consistency
// =================================================================

TEST_CASE("gps mixed with network in recent history is inconsistent")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    const std::vector<location::LocationSample> mixed = {
        test::make_sample(test::kOrigin, 8.0, t0, Provider::Gps),
        test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 30.0), Provider::Network),
    };
    const auto current = test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 60.0));

    const auto result = detector.evaluate(current, mixed);
    CHECK(result.indicators.provider_inconsistency);
    CHECK(result.is_likely_spoofed);
    CHECK(history.player_count() == 0);
}

TEST_CASE("Uniform or non-gps providers are consistent")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();
    const auto current = test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 60.0), Provider::Gps);

    SUBCASE("all network")
    {
        const std::vector<location::LocationSample> past = {
            test::make_sample(test::kOrigin, 8.0, t0, Provider::Network),
            test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 30.0), Provider::Network),
        };
        CHECK_FALSE(detector.evaluate(current, past).indicators.provider_inconsistency);
    }

    SUBCASE("network and passive without gps")
    {
        const std::vector<location::LocationSample> past = {
            test::make_sample(test::kOrigin, 8.0, t0, Provider::Network),
            test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 30.0), Provider::Passive),
        };
        CHECK_FALSE(detector.evaluate(current, past).indicators.provider_inconsistency);
    }

    SUBCASE("older mix falls outside the last three")
    {
        const std::vector<location::LocationSample> past = {
            test::make_sample(test::kOrigin, 8.0, t0, Provider::Network),
            test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 10.0), Provider::Gps),
            test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 20.0), Provider::Gps),
            test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 30.0), Provider::Gps),
        };
        CHECK_FALSE(detector.evaluate(current, past).indicators.provider_inconsistency);
    }
}

// =================================================================
// History bookkeeping
// =================================================================

TEST_CASE("Every assessment is recorded, spoofed or not")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    (void)detector.assess(test::make_sample(test::kOrigin, 8.0, t0), "p1");
    (void)detector.assess(test::make_sample(test::kOrigin, 0.2, test::seconds_after(t0, 10.0)), "p1");
    (void)detector.assess(test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 20.0)), "p2");

    CHECK(history.size("p1") == 2);
    CHECK(history.size("p2") == 1);
}

TEST_CASE("Unusable fixes are not recorded and cannot mask a teleport")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    (void)detector.assess(test::make_sample(test::kOrigin, 8.0, t0), "p1");

    auto junk = test::make_sample(test::kOrigin, 8.0, test::seconds_after(t0, 1.0));
    junk.coordinate.lat = std::numeric_limits<f64>::quiet_NaN();
    (void)detector.assess(junk, "p1");

    auto out_of_range = test::make_sample({95.0, 0.0}, 8.0, test::seconds_after(t0, 1.5));
    (void)detector.assess(out_of_range, "p1");

    auto no_accuracy = test::make_sample(test::kOrigin, std::numeric_limits<f64>::infinity(),
                                         test::seconds_after(t0, 1.8));
    (void)detector.assess(no_accuracy, "p1");

    CHECK(history.size("p1") == 1);

    // Still measured against the last good fix: 500 m in 2 s
    const auto result = detector.assess(
        test::make_sample(test::north_of(test::kOrigin, 500.0), 8.0, test::seconds_after(t0, 2.0)), "p1");
    CHECK(result.is_likely_spoofed);
    CHECK(result.indicators.location_jump);
    CHECK(result.indicators.impossible_movement);
    CHECK(history.size("p1") == 2);
}

TEST_CASE("Unmeasurable displacement counts as impossible movement")
{
    PlayerHistoryStore history;
    SpoofDetector detector(history);
    const Timestamp t0 = test::fixed_now();

    auto poisoned = test::make_sample(test::kOrigin, 8.0, t0);
    poisoned.coordinate.lng = std::numeric_limits<f64>::quiet_NaN();
    const std::vector<location::LocationSample> past = {poisoned};

    const auto result = detector.evaluate(
        test::make_sample(test::north_of(test::kOrigin, 500.0), 8.0, test::seconds_after(t0, 1.0)), past);
    CHECK(result.is_likely_spoofed);
    CHECK(result.indicators.impossible_movement);
    CHECK(result.indicators.location_jump);
}

TEST_CASE("movement_check_kind_name")
{
    CHECK(std::string(movement_check_kind_name(MovementCheck::Kind::NoHistory)) == "no_history");
    CHECK(std::string(movement_check_kind_name(MovementCheck::Kind::InvalidTime)) == "invalid_time");
}
