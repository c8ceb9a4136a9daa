// src/main.cpp - Waymark location-trust engine demo
//
// Replays a scripted walk through a small mystery game:
//  1. Load engine settings (defaults + WAYMARK_* environment)
//  2. Wire the engine: history store, guard, advisor, detector, validator
//  3. Seed an in-memory game session with three evidence items
//  4. Submit fixes: too far, teleport, arrival, duplicate, remaining items
//  5. Print each outcome and the final progress

#include "core/logger.hpp"
#include "core/types.hpp"
#include "game/discovery_coordinator.hpp"
#include "game/game_session.hpp"
#include "game/session_store.hpp"
#include "location/location_sample.hpp"
#include "trust/adaptive_radius.hpp"
#include "trust/discovery_validator.hpp"
#include "trust/engine_config.hpp"
#include "trust/location_quality.hpp"
#include "trust/player_history.hpp"
#include "trust/reading_guard.hpp"
#include "trust/spoof_detector.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace waymark;

namespace {

// Fixed scenario clock so the walk is reproducible
Timestamp g_now = Timestamp{} + std::chrono::hours(24 * 365 * 55);

location::LocationSample fix(double lat, double lng, double accuracy_m,
                             location::Provider provider = location::Provider::Gps) {
    location::LocationSample s;
    s.coordinate = {lat, lng};
    s.accuracy.horizontal_accuracy_m = accuracy_m;
    s.accuracy.captured_at = g_now;
    s.accuracy.provider = provider;
    return s;
}

void advance(int seconds) { g_now += std::chrono::seconds(seconds); }

void print(const std::string& step, const game::DiscoveryOutcome& o) {
    std::cout << std::left << std::setw(28) << step
              << std::setw(20) << game::discovery_status_name(o.status)
              << "+" << std::setw(5) << o.bonus_points
              << o.message << "\n";
    if (o.next_clue) std::cout << std::setw(28) << "" << "clue: " << *o.next_clue << "\n";
}

} // namespace

int main() {
    core::Logger::init();

    std::cout << "================================================================\n"
              << "  WAYMARK - location-trust engine demo\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------------
    // 1-2. Engine wiring
    // -----------------------------------------------------------------------
    const auto config = trust::EngineConfig::from_environment();

    trust::PlayerHistoryStore history(config.history);
    trust::ReadingGuard guard(config.guard);
    trust::AdaptiveRadiusAdvisor advisor(config.advisory);
    trust::SpoofDetector detector(history, config.spoof);
    trust::DiscoveryValidator validator(guard, advisor, config.validator,
                                        [] { return g_now; });
    trust::LocationQualityAssessor quality(advisor);

    game::InMemorySessionStore store;
    game::DiscoveryCoordinator coordinator(detector, validator, store);

    // -----------------------------------------------------------------------
    // 3. Game session around Shin-Yokohama station
    // -----------------------------------------------------------------------
    game::GameSession session;
    session.game_id = "demo-game";
    session.player_id = "detective-1";
    session.discovery_radius_m = config.validator.discovery_radius_m;
    session.evidence_list = {
        {"ev-1", "Torn train ticket", "Shin-Yokohama Station",
         {{35.50690, 139.61750}, location::PoiType::Station, location::Importance::Critical}, {}},
        {"ev-2", "Coffee receipt", "Station Cafe",
         {{35.50800, 139.61600}, location::PoiType::Cafe, location::Importance::Important}, {}},
        {"ev-3", "Dropped glove", "Kohoku Park",
         {{35.50950, 139.61900}, location::PoiType::Park, location::Importance::Background}, {}},
    };
    store.put(session);
    std::cout << "Game " << session.game_id << ": " << session.evidence_list.size()
              << " evidence items, discovery radius "
              << config.validator.discovery_radius_m << " m\n\n";

    // -----------------------------------------------------------------------
    // 4. Scripted walk
    // -----------------------------------------------------------------------
    const PlayerId player = session.player_id;

    auto start = fix(35.50600, 139.61750, 8.0);
    const auto q = quality.assess(start, g_now);
    std::cout << "Signal: " << trust::quality_level_name(q.level)
              << " (" << q.accuracy_m << " m, " << location::provider_name(q.provider)
              << "), recommended radius " << q.recommended_radius_m << " m\n\n";

    print("approach (100 m away)", coordinator.discover(session.game_id, player, "ev-1", start));

    advance(2);
    print("teleport to far cafe", coordinator.discover(session.game_id, player, "ev-2",
                                                       fix(35.52800, 139.61600, 5.0)));

    advance(600);
    print("arrive at station", coordinator.discover(session.game_id, player, "ev-1",
                                                    fix(35.50692, 139.61752, 5.0)));

    advance(3);
    print("duplicate request", coordinator.discover(session.game_id, player, "ev-1",
                                                    fix(35.50692, 139.61752, 5.0)));

    advance(120);
    print("arrive at cafe", coordinator.discover(session.game_id, player, "ev-2",
                                                 fix(35.50805, 139.61605, 6.0)));

    advance(120);
    print("arrive at park", coordinator.discover(session.game_id, player, "ev-3",
                                                 fix(35.50940, 139.61890, 12.0)));

    // -----------------------------------------------------------------------
    // 5. Final progress
    // -----------------------------------------------------------------------
    if (const auto final_state = store.get(session.game_id)) {
        const auto p = final_state->progress();
        std::cout << "\nProgress: " << p.discovered_count << "/" << p.total_evidence
                  << " found, discovery bonus " << final_state->discovery_bonus_total << "\n";
    }

    core::Logger::shutdown();
    return 0;
}
