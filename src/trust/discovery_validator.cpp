/// @file discovery_validator.cpp
/// @brief Implementation of the discovery decision function.

#include "trust/discovery_validator.hpp"

#include "trust/confidence_scorer.hpp"
#include "geo/geo_math.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace waymark::trust
{

const char* rejection_reason_name(RejectionReason reason)
{
    switch (reason)
    {
        case RejectionReason::None:           return "none";
        case RejectionReason::InvalidReading: return "invalid_reading";
        case RejectionReason::LowAccuracy:    return "low_accuracy";
        case RejectionReason::InvalidTarget:  return "invalid_target";
        case RejectionReason::TooFar:         return "too_far";
        case RejectionReason::LowConfidence:  return "low_confidence";
    }
    return "unknown";
}

DiscoveryValidator::DiscoveryValidator(const ReadingGuard& guard,
                                       const AdaptiveRadiusAdvisor& advisor,
                                       const DiscoveryValidatorConfig& config,
                                       Clock clock)
    : m_guard(guard)
    , m_advisor(advisor)
    , m_config(config)
    , m_clock(clock ? std::move(clock) : Clock{system_now})
{
}

ValidationResult DiscoveryValidator::validate(const location::LocationSample& sample,
                                              const location::TargetPoint& target) const
{
    return validate_at(sample, target, m_clock());
}

// -----------------------------------------------------------------
// Decision pipeline
//
// 1. Reading guard; any failure returns immediately
// 2. Raw haversine distance to the target
// 3. Confidence score
// 4. Accuracy-adjusted distance = max(0, distance - accuracy)
// 5. valid = adjusted <= discovery radius AND confidence >= minimum
// -----------------------------------------------------------------

ValidationResult DiscoveryValidator::validate_at(const location::LocationSample& sample,
                                                 const location::TargetPoint& target,
                                                 Timestamp now) const
{
    ValidationResult result;
    auto& diag = result.diagnostics;

    diag.gps_accuracy_m = sample.accuracy.horizontal_accuracy_m;
    diag.provider = sample.accuracy.provider;
    diag.seconds_since_fix = seconds_between(sample.accuracy.captured_at, now);

    // 1. Reading guard
    const GuardResult guard = m_guard.check(sample, now);
    diag.guard_verdict = guard.verdict;
    if (!guard.ok())
    {
        result.rejection = (guard.verdict == GuardVerdict::AccuracyTooLow)
            ? RejectionReason::LowAccuracy
            : RejectionReason::InvalidReading;
        result.reason = guard.reason;
        return result;
    }

    diag.high_accuracy = sample.accuracy.horizontal_accuracy_m <= 10.0;
    diag.advisory_radius_m = m_advisor.suggested_radius(sample, target.poi_type);

    if (!geo::is_valid(target.coordinate))
    {
        WMK_CORE_ERROR("DiscoveryValidator: Target coordinate out of range ({}, {})",
                       target.coordinate.lat, target.coordinate.lng);
        result.rejection = RejectionReason::InvalidTarget;
        result.reason = "Target location is invalid";
        return result;
    }

    // 2. Distance
    const f64 distance = geo::GeoMath::distance(sample.coordinate, target.coordinate);
    if (!std::isfinite(distance))
    {
        WMK_CORE_ERROR("DiscoveryValidator: Non-finite distance to target");
        result.rejection = RejectionReason::InvalidTarget;
        result.reason = "Distance to target could not be computed";
        return result;
    }
    result.distance_to_target_m = distance;
    diag.raw_distance_m = distance;

    // 3. Confidence
    result.confidence_score = ConfidenceScorer::score(sample, distance, now);

    // 4. Accuracy-adjusted (best case for the player)
    result.accuracy_adjusted_distance_m =
        std::max(0.0, distance - sample.accuracy.horizontal_accuracy_m);

    // 5. Decision
    const bool within_radius = result.accuracy_adjusted_distance_m <= m_config.discovery_radius_m;
    const bool confident = result.confidence_score >= m_config.min_confidence;
    result.is_valid = within_radius && confident;

    if (!within_radius)
    {
        result.rejection = RejectionReason::TooFar;
        result.reason = "Too far from the target";
    }
    else if (!confident)
    {
        result.rejection = RejectionReason::LowConfidence;
        result.reason = "Location confidence too low";
    }

    return result;
}

} // namespace waymark::trust
