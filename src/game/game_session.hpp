#pragma once

/// @file game_session.hpp
/// @brief Mystery-game session state as seen by the discovery engine.

#include "geo/coordinate.hpp"
#include "location/target_point.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace waymark::game
{
    enum class GameStatus
    {
        Active,
        Completed,
        Abandoned,
        Expired,
    };

    [[nodiscard]] const char* game_status_name(GameStatus status);

    /// @brief One evidence item hidden at a real-world POI.
    struct Evidence
    {
        EvidenceId evidence_id;
        std::string name;
        std::string poi_name;
        location::TargetPoint target;
        std::optional<Timestamp> discovered_at;

        [[nodiscard]] bool is_discovered() const { return discovered_at.has_value(); }
    };

    struct GameProgress
    {
        std::size_t total_evidence = 0;
        std::size_t discovered_count = 0;
        f64 completion_rate = 0.0;      ///< [0, 1]; 0 for a session without evidence

        [[nodiscard]] std::size_t remaining() const { return total_evidence - discovered_count; }
        [[nodiscard]] bool all_found() const { return discovered_count >= total_evidence; }
    };

    /// @brief A player's game: evidence list and which items were found.
    ///
    /// UNDISCOVERED -> DISCOVERED is one-way; mark_discovered() on an item
    /// already in discovered_evidence is a no-op.
    struct GameSession
    {
        GameId game_id;
        PlayerId player_id;
        GameStatus status = GameStatus::Active;
        std::vector<Evidence> evidence_list;
        std::vector<EvidenceId> discovered_evidence;   ///< In discovery order
        i64 discovery_bonus_total = 0;
        f64 discovery_radius_m = 50.0;                  ///< Game rule used for proximity listings

        [[nodiscard]] bool is_discovered(const EvidenceId& evidence_id) const;

        [[nodiscard]] const Evidence* find_evidence(const EvidenceId& evidence_id) const;
        [[nodiscard]] Evidence* find_evidence(const EvidenceId& evidence_id);

        /// @brief Record a discovery. Returns false if already discovered or unknown.
        bool mark_discovered(const EvidenceId& evidence_id, Timestamp when);

        /// @brief Evidence not yet discovered, in list order.
        [[nodiscard]] std::vector<const Evidence*> remaining_evidence() const;

        /// @brief Undiscovered evidence within discovery_radius_m of a position.
        [[nodiscard]] std::vector<const Evidence*> nearby_evidence(const geo::Coordinate& position) const;

        [[nodiscard]] GameProgress progress() const;
    };

} // namespace waymark::game
