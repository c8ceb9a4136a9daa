#pragma once

/// @file discovery_validator.hpp
/// @brief Accept/reject decision for a location-gated discovery.

#include "location/location_sample.hpp"
#include "location/target_point.hpp"
#include "trust/adaptive_radius.hpp"
#include "trust/engine_config.hpp"
#include "trust/reading_guard.hpp"
#include "trust/spoof_detector.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace waymark::trust
{
    /// @brief Why a fix was not accepted.
    enum class RejectionReason
    {
        None,
        InvalidReading,     ///< Failed the reading guard (range, freshness, speed)
        LowAccuracy,        ///< Error radius above the guard limit
        InvalidTarget,      ///< Target data unusable; fails closed
        TooFar,             ///< Accuracy-adjusted distance beyond the discovery radius
        LowConfidence,      ///< Close enough, but the fix is not trustworthy enough
    };

    [[nodiscard]] const char* rejection_reason_name(RejectionReason reason);

    /// @brief Supporting data for the response builder and for logs.
    struct ValidationDiagnostics
    {
        GuardVerdict guard_verdict = GuardVerdict::Ok;
        f64 raw_distance_m = 0.0;
        f64 gps_accuracy_m = 0.0;
        f64 seconds_since_fix = 0.0;
        bool high_accuracy = false;                 ///< Accuracy <= 10 m
        location::Provider provider = location::Provider::Unknown;
        f64 advisory_radius_m = 0.0;                ///< Guidance only, never gates
        std::optional<MovementCheck> movement;      ///< Present when a player history was consulted
    };

    struct ValidationResult
    {
        bool is_valid = false;
        f64 confidence_score = 0.0;                 ///< [0, 1]
        f64 distance_to_target_m = 0.0;
        f64 accuracy_adjusted_distance_m = 0.0;     ///< max(0, distance - accuracy)
        RejectionReason rejection = RejectionReason::None;
        std::string reason;                         ///< Empty when valid
        ValidationDiagnostics diagnostics;
    };

    /// @brief Combines the reading guard, confidence score and distance
    /// into one decision.
    ///
    /// A fix is accepted when
    ///   accuracy_adjusted_distance <= discovery_radius (50 m)
    ///   and confidence_score >= min_confidence (0.7).
    /// The adaptive radius is reported in diagnostics for player guidance
    /// and never takes part in the decision.
    ///
    /// Pure computation: no I/O, no locks, no player state.
    class DiscoveryValidator
    {
    public:
        DiscoveryValidator(const ReadingGuard& guard,
                           const AdaptiveRadiusAdvisor& advisor,
                           const DiscoveryValidatorConfig& config = {},
                           Clock clock = system_now);

        /// @brief Validate against the current time of the injected clock.
        [[nodiscard]] ValidationResult validate(const location::LocationSample& sample,
                                                const location::TargetPoint& target) const;

        /// @brief Validate against an explicit server time.
        [[nodiscard]] ValidationResult validate_at(const location::LocationSample& sample,
                                                   const location::TargetPoint& target,
                                                   Timestamp now) const;

        [[nodiscard]] Timestamp now() const { return m_clock(); }

        [[nodiscard]] const DiscoveryValidatorConfig& config() const { return m_config; }
        [[nodiscard]] const AdaptiveRadiusAdvisor& advisor() const { return m_advisor; }

    private:
        const ReadingGuard& m_guard;
        const AdaptiveRadiusAdvisor& m_advisor;
        DiscoveryValidatorConfig m_config;
        Clock m_clock;
    };

} // namespace waymark::trust
