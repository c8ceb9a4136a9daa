/// @file reading_guard.cpp
/// @brief Implementation of the raw-fix sanity checks.

#include "trust/reading_guard.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace waymark::trust
{

const char* guard_verdict_name(GuardVerdict verdict)
{
    switch (verdict)
    {
        case GuardVerdict::Ok:               return "ok";
        case GuardVerdict::InvalidLatitude:  return "invalid_latitude";
        case GuardVerdict::InvalidLongitude: return "invalid_longitude";
        case GuardVerdict::InvalidAccuracy:  return "invalid_accuracy";
        case GuardVerdict::AccuracyTooLow:   return "accuracy_too_low";
        case GuardVerdict::StaleTimestamp:   return "stale_timestamp";
        case GuardVerdict::ImplausibleSpeed: return "implausible_speed";
    }
    return "unknown";
}

ReadingGuard::ReadingGuard(const ReadingGuardConfig& config)
    : m_config(config)
{
}

GuardResult ReadingGuard::check(const location::LocationSample& sample, Timestamp now) const
{
    const auto reject = [](GuardVerdict verdict, std::string reason)
    {
        WMK_CORE_WARN("ReadingGuard: {} ({})", reason, guard_verdict_name(verdict));
        return GuardResult{.verdict = verdict, .reason = std::move(reason)};
    };

    const f64 lat = sample.coordinate.lat;
    const f64 lng = sample.coordinate.lng;

    if (!std::isfinite(lat) || std::abs(lat) > geo_constants::kMaxLatitude)
    {
        return reject(GuardVerdict::InvalidLatitude, fmt::format("Invalid latitude: {}", lat));
    }

    if (!std::isfinite(lng) || std::abs(lng) > geo_constants::kMaxLongitude)
    {
        return reject(GuardVerdict::InvalidLongitude, fmt::format("Invalid longitude: {}", lng));
    }

    const f64 accuracy = sample.accuracy.horizontal_accuracy_m;
    if (!std::isfinite(accuracy) || accuracy < 0.0)
    {
        return reject(GuardVerdict::InvalidAccuracy,
                      fmt::format("Invalid horizontal accuracy: {}", accuracy));
    }

    if (accuracy > m_config.max_horizontal_accuracy_m)
    {
        return reject(GuardVerdict::AccuracyTooLow,
                      fmt::format("GPS accuracy too low: {:.1f}m (limit {:.0f}m)",
                                  accuracy, m_config.max_horizontal_accuracy_m));
    }

    // Future-dated fixes are as suspect as stale ones
    const f64 age_s = seconds_between(sample.accuracy.captured_at, now);
    if (std::abs(age_s) > m_config.max_fix_age_s)
    {
        return reject(GuardVerdict::StaleTimestamp,
                      fmt::format("GPS fix timestamp out of window: {:.0f}s from server time", age_s));
    }

    if (sample.speed_mps)
    {
        const f64 speed = *sample.speed_mps;
        if (!std::isfinite(speed) || speed > m_config.max_speed_mps)
        {
            return reject(GuardVerdict::ImplausibleSpeed,
                          fmt::format("Implausible movement speed: {:.1f}m/s", speed));
        }
    }

    return GuardResult{};
}

} // namespace waymark::trust
