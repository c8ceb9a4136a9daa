/// @file test_game_session.cpp
/// @brief Unit tests for waymark::game::GameSession and InMemorySessionStore.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "game/game_session.hpp"
#include "game/session_store.hpp"
#include "core/logger.hpp"

#include "test_support.hpp"

#include <string>

using namespace waymark;
using namespace waymark::game;

int main(int argc, char** argv)
{
    waymark::core::Logger::init("test_game_session.log");
    const int result = doctest::Context(argc, argv).run();
    waymark::core::Logger::shutdown();
    return result;
}

namespace
{

GameSession three_items()
{
    GameSession s;
    s.game_id = "g1";
    s.player_id = "p1";
    s.evidence_list = {
        {"a", "Letter", "Old Library",
         {test::kOrigin, location::PoiType::Library, location::Importance::Critical}, {}},
        {"b", "Umbrella", "Corner Cafe",
         {test::north_of(test::kOrigin, 40.0), location::PoiType::Cafe, location::Importance::Important}, {}},
        {"c", "Map", "Riverside Park",
         {test::north_of(test::kOrigin, 300.0), location::PoiType::Park, location::Importance::Background}, {}},
    };
    return s;
}

} // anonymous namespace

// =================================================================
// Discovery state
// =================================================================

TEST_CASE("Fresh session has nothing discovered")
{
    const auto s = three_items();
    const auto p = s.progress();

    CHECK(s.status == GameStatus::Active);
    CHECK(p.total_evidence == 3);
    CHECK(p.discovered_count == 0);
    CHECK(p.remaining() == 3);
    CHECK(p.completion_rate == 0.0);
    CHECK_FALSE(p.all_found());
}

TEST_CASE("mark_discovered is one-way and idempotent")
{
    auto s = three_items();
    const Timestamp t0 = test::fixed_now();

    CHECK(s.mark_discovered("b", t0));
    CHECK_FALSE(s.mark_discovered("b", test::seconds_after(t0, 60.0)));
    CHECK_FALSE(s.mark_discovered("zzz", t0));

    CHECK(s.is_discovered("b"));
    CHECK(s.discovered_evidence.size() == 1);
    REQUIRE(s.find_evidence("b") != nullptr);
    CHECK(s.find_evidence("b")->is_discovered());
    CHECK(s.find_evidence("b")->discovered_at == t0);

    const auto remaining = s.remaining_evidence();
    REQUIRE(remaining.size() == 2);
    CHECK(remaining[0]->evidence_id == "a");
    CHECK(remaining[1]->evidence_id == "c");
}

TEST_CASE("Progress reaches completion")
{
    auto s = three_items();
    const Timestamp t0 = test::fixed_now();

    (void)s.mark_discovered("a", t0);
    CHECK(s.progress().completion_rate == doctest::Approx(1.0 / 3.0));

    (void)s.mark_discovered("b", t0);
    (void)s.mark_discovered("c", t0);
    CHECK(s.progress().all_found());
    CHECK(s.progress().completion_rate == doctest::Approx(1.0));
    CHECK(s.remaining_evidence().empty());
}

TEST_CASE("Empty session reports zero completion")
{
    const GameSession s;
    CHECK(s.progress().completion_rate == 0.0);
    CHECK(s.progress().all_found());
}

TEST_CASE("nearby_evidence lists undiscovered items within the radius")
{
    auto s = three_items();

    auto nearby = s.nearby_evidence(test::north_of(test::kOrigin, 20.0));
    REQUIRE(nearby.size() == 2);
    CHECK(nearby[0]->evidence_id == "a");
    CHECK(nearby[1]->evidence_id == "b");

    (void)s.mark_discovered("a", test::fixed_now());
    nearby = s.nearby_evidence(test::north_of(test::kOrigin, 20.0));
    REQUIRE(nearby.size() == 1);
    CHECK(nearby[0]->evidence_id == "b");

    s.discovery_radius_m = 500.0;
    CHECK(s.nearby_evidence(test::kOrigin).size() == 2);
}

TEST_CASE("game_status_name")
{
    CHECK(std::string(game_status_name(GameStatus::Expired)) == "expired");
    CHECK(std::string(game_status_name(GameStatus::Abandoned)) == "abandoned");
}

// =================================================================
// In-memory store
// =================================================================

TEST_CASE("InMemorySessionStore hands out snapshots")
{
    InMemorySessionStore store;
    CHECK_FALSE(store.get("g1").has_value());

    store.put(three_items());

    auto copy = store.get("g1");
    REQUIRE(copy.has_value());
    (void)copy->mark_discovered("a", test::fixed_now());

    // Not visible until written back
    CHECK_FALSE(store.get("g1")->is_discovered("a"));

    CHECK(store.update("g1", *copy));
    CHECK(store.get("g1")->is_discovered("a"));
}

TEST_CASE("InMemorySessionStore refuses updates for unknown games")
{
    InMemorySessionStore store;
    CHECK_FALSE(store.update("ghost", three_items()));
    CHECK_FALSE(store.get("ghost").has_value());
}
