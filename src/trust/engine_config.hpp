#pragma once

/// @file engine_config.hpp
/// @brief Tunable thresholds of the location-trust engine.
///
/// Every struct is an aggregate with the production defaults, so callers
/// can override single fields with designated initializers:
///   ReadingGuard guard({.max_horizontal_accuracy_m = 80.0});

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace waymark::trust
{
    /// @brief Limits applied to a raw fix before any scoring.
    struct ReadingGuardConfig
    {
        f64 max_horizontal_accuracy_m = 100.0;
        f64 max_fix_age_s = 300.0;              ///< Applies to past and future-dated fixes
        f64 max_speed_mps = 50.0;
    };

    /// @brief Bounds of the player-facing "get within X m" radius.
    struct AdvisoryRadiusConfig
    {
        f64 base_radius_m = 50.0;
        f64 min_radius_m = 20.0;
        f64 max_radius_m = 100.0;
    };

    /// @brief Spoofing heuristics.
    struct SpoofDetectorConfig
    {
        f64 suspicious_accuracy_m = 1.0;        ///< Fixes better than this are implausible
        f64 impossible_speed_mps = 28.0;        ///< ~100 km/h between consecutive fixes
        f64 jump_window_s = 5.0;
        f64 jump_distance_m = 100.0;
        f64 walking_speed_mps = 5.0;            ///< Informational movement check only
        std::size_t movement_lookback = 5;
        std::size_t provider_lookback = 3;
    };

    /// @brief Per-player sample history bounds.
    struct PlayerHistoryConfig
    {
        std::size_t capacity = 10;              ///< Samples kept per player
        std::size_t max_players = 10'000;       ///< Least recently touched player is evicted beyond this
    };

    /// @brief Accept/reject thresholds of a discovery.
    struct DiscoveryValidatorConfig
    {
        f64 discovery_radius_m = 50.0;          ///< Gating threshold on accuracy-adjusted distance
        f64 min_confidence = 0.7;
    };

    /// @brief All engine settings.
    struct EngineConfig
    {
        ReadingGuardConfig guard;
        AdvisoryRadiusConfig advisory;
        SpoofDetectorConfig spoof;
        PlayerHistoryConfig history;
        DiscoveryValidatorConfig validator;

        /// @brief Defaults overlaid with WAYMARK_* environment variables.
        ///
        /// Recognized: WAYMARK_DISCOVERY_RADIUS, WAYMARK_MIN_CONFIDENCE,
        /// WAYMARK_MAX_ACCURACY, WAYMARK_MAX_FIX_AGE, WAYMARK_MAX_SPEED,
        /// WAYMARK_HISTORY_CAPACITY, WAYMARK_HISTORY_MAX_PLAYERS.
        /// Malformed or out-of-range values are logged and ignored.
        [[nodiscard]] static EngineConfig from_environment();
    };

    namespace detail
    {
        /// @brief Parse a whole string_view as a finite double.
        [[nodiscard]] std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a whole string_view as an unsigned size.
        [[nodiscard]] std::optional<std::size_t> parse_size(std::string_view sv);
    }

} // namespace waymark::trust
