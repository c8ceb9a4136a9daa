/// @file spoof_detector.cpp
/// @brief Implementation of the spoofing heuristics.

#include "trust/spoof_detector.hpp"

#include "geo/geo_math.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace waymark::trust
{

const char* movement_check_kind_name(MovementCheck::Kind kind)
{
    switch (kind)
    {
        case MovementCheck::Kind::NoHistory:   return "no_history";
        case MovementCheck::Kind::InvalidTime: return "invalid_time";
        case MovementCheck::Kind::Checked:     return "movement_check";
    }
    return "unknown";
}

SpoofDetector::SpoofDetector(PlayerHistoryStore& history, const SpoofDetectorConfig& config)
    : m_history(history)
    , m_config(config)
{
}

SpoofingAssessment SpoofDetector::assess(const location::LocationSample& sample,
                                         const PlayerId& player_id)
{
    const std::size_t lookback = std::max(m_config.movement_lookback, m_config.provider_lookback);

    // An unusable fix must never become the reference point for the next one
    const bool usable = geo::is_valid(sample.coordinate)
                     && std::isfinite(sample.accuracy.horizontal_accuracy_m);
    const auto history = usable
        ? m_history.exchange(player_id, sample, lookback)
        : m_history.recent(player_id, lookback);

    if (!usable)
    {
        WMK_CORE_WARN("SpoofDetector: Not recording unusable fix from player {} ({}, {}, accuracy {})",
                      player_id, sample.coordinate.lat, sample.coordinate.lng,
                      sample.accuracy.horizontal_accuracy_m);
    }

    auto assessment = evaluate(sample, history);
    if (assessment.is_likely_spoofed)
    {
        WMK_CORE_DEBUG("SpoofDetector: player {} risk {:.2f} (accuracy={} movement={} jump={} provider={})",
                       player_id, assessment.risk_score,
                       assessment.indicators.suspicious_accuracy,
                       assessment.indicators.impossible_movement,
                       assessment.indicators.location_jump,
                       assessment.indicators.provider_inconsistency);
    }
    return assessment;
}

// -----------------------------------------------------------------
// Indicators
//
// suspicious_accuracy    horizontal accuracy < 1 m
// impossible_movement    distance / Δt > 28 m/s against the previous fix,
//                        or a displacement that is not finite
// location_jump          Δt < 5 s and distance > 100 m
// provider_inconsistency the last 3 history fixes use more than one
//                        provider and at least one of them is gps
//
// Δt <= 0 (replayed or reordered fix) raises no movement indicator.
// -----------------------------------------------------------------

SpoofingAssessment SpoofDetector::evaluate(const location::LocationSample& sample,
                                           const std::vector<location::LocationSample>& history) const
{
    SpoofingAssessment result;
    SpoofIndicators& ind = result.indicators;

    ind.suspicious_accuracy = sample.accuracy.horizontal_accuracy_m < m_config.suspicious_accuracy_m;

    if (!history.empty())
    {
        const auto& previous = history.back();
        const f64 dt = seconds_between(previous.accuracy.captured_at, sample.accuracy.captured_at);

        if (dt > 0.0)
        {
            const f64 moved = geo::GeoMath::distance(previous.coordinate, sample.coordinate);
            const f64 speed = geo::GeoMath::implied_speed(moved, dt);

            // A displacement that cannot be measured fails closed
            const bool measurable = std::isfinite(moved) && std::isfinite(speed);
            ind.impossible_movement = !measurable || speed > m_config.impossible_speed_mps;
            ind.location_jump = dt < m_config.jump_window_s
                             && (!measurable || moved > m_config.jump_distance_m);
        }

        const std::size_t window = std::min(m_config.provider_lookback, history.size());
        std::set<location::Provider> providers;
        for (auto it = history.end() - static_cast<std::ptrdiff_t>(window); it != history.end(); ++it)
        {
            providers.insert(it->accuracy.provider);
        }
        ind.provider_inconsistency = providers.size() > 1 && providers.count(location::Provider::Gps) > 0;

        result.movement = check_movement(previous, sample);
    }

    result.risk_score = static_cast<f64>(ind.count()) / SpoofIndicators::kIndicatorCount;
    result.is_likely_spoofed = ind.count() > 0;
    return result;
}

// TODO: decide whether exceeding walking pace should gate discoveries;
// today it is reported in diagnostics only.
MovementCheck SpoofDetector::check_movement(const location::LocationSample& previous,
                                            const location::LocationSample& current) const
{
    MovementCheck check;
    check.time_delta_s = seconds_between(previous.accuracy.captured_at, current.accuracy.captured_at);

    if (check.time_delta_s <= 0.0)
    {
        check.kind = MovementCheck::Kind::InvalidTime;
        check.is_valid = false;
        return check;
    }

    check.kind = MovementCheck::Kind::Checked;
    check.distance_moved_m = geo::GeoMath::distance(previous.coordinate, current.coordinate);
    check.implied_speed_mps = geo::GeoMath::implied_speed(check.distance_moved_m, check.time_delta_s);
    check.is_valid = check.implied_speed_mps <= m_config.walking_speed_mps;
    return check;
}

} // namespace waymark::trust
