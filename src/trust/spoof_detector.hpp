#pragma once

/// @file spoof_detector.hpp
/// @brief Heuristic detection of fabricated location fixes.

#include "location/location_sample.hpp"
#include "trust/engine_config.hpp"
#include "trust/player_history.hpp"
#include "core/types.hpp"

#include <vector>

namespace waymark::trust
{
    /// @brief Independent anomaly flags raised against a fix.
    struct SpoofIndicators
    {
        bool suspicious_accuracy = false;       ///< Implausibly perfect fix
        bool impossible_movement = false;       ///< Faster than a car since the previous fix
        bool location_jump = false;             ///< Large displacement within a few seconds
        bool provider_inconsistency = false;    ///< gps mixed with other providers recently

        [[nodiscard]] int count() const
        {
            return static_cast<int>(suspicious_accuracy) + static_cast<int>(impossible_movement)
                 + static_cast<int>(location_jump) + static_cast<int>(provider_inconsistency);
        }

        static constexpr int kIndicatorCount = 4;
    };

    /// @brief Informational walking-pace check against the previous fix.
    ///
    /// Attached to diagnostics only; it does not gate a discovery.
    struct MovementCheck
    {
        enum class Kind
        {
            NoHistory,      ///< First fix for this player
            InvalidTime,    ///< Fix not newer than the previous one
            Checked,
        };

        Kind kind = Kind::NoHistory;
        bool is_valid = true;
        f64 implied_speed_mps = 0.0;
        f64 time_delta_s = 0.0;
        f64 distance_moved_m = 0.0;
    };

    [[nodiscard]] const char* movement_check_kind_name(MovementCheck::Kind kind);

    struct SpoofingAssessment
    {
        bool is_likely_spoofed = false;
        SpoofIndicators indicators;
        f64 risk_score = 0.0;           ///< Fraction of indicators raised, in [0, 1]
        MovementCheck movement;
    };

    /// @brief Inspects a fix against the player's recent history.
    ///
    /// Every usable fix is recorded in the player's history, whatever the
    /// verdict. Fixes with an out-of-range coordinate or non-finite accuracy
    /// are evaluated but never recorded. The verdict is a soft signal:
    /// callers reject the attempt but take no action against the account.
    class SpoofDetector
    {
    public:
        SpoofDetector(PlayerHistoryStore& history, const SpoofDetectorConfig& config = {});

        [[nodiscard]] SpoofingAssessment assess(const location::LocationSample& sample,
                                                const PlayerId& player_id);

        /// @brief Pure evaluation against an explicit history (oldest first).
        [[nodiscard]] SpoofingAssessment evaluate(const location::LocationSample& sample,
                                                  const std::vector<location::LocationSample>& history) const;

        [[nodiscard]] const SpoofDetectorConfig& config() const { return m_config; }

    private:
        [[nodiscard]] MovementCheck check_movement(const location::LocationSample& previous,
                                                   const location::LocationSample& current) const;

        PlayerHistoryStore& m_history;
        SpoofDetectorConfig m_config;
    };

} // namespace waymark::trust
