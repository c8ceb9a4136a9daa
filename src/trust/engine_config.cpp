/// @file engine_config.cpp
/// @brief Environment overlay for EngineConfig.

#include "trust/engine_config.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace waymark::trust
{

namespace
{

std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// Overlay a positive real-valued setting; leaves target untouched on failure.
void overlay_positive(const char* name, f64& target)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr)
    {
        return;
    }

    const auto value = detail::parse_f64(trim(raw));
    if (!value || *value <= 0.0)
    {
        WMK_CORE_WARN("EngineConfig: Ignoring malformed {}='{}', keeping {}", name, raw, target);
        return;
    }

    target = *value;
    WMK_CORE_INFO("EngineConfig: {} = {}", name, target);
}

void overlay_unit_interval(const char* name, f64& target)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr)
    {
        return;
    }

    const auto value = detail::parse_f64(trim(raw));
    if (!value || *value < 0.0 || *value > 1.0)
    {
        WMK_CORE_WARN("EngineConfig: Ignoring malformed {}='{}', keeping {}", name, raw, target);
        return;
    }

    target = *value;
    WMK_CORE_INFO("EngineConfig: {} = {}", name, target);
}

void overlay_count(const char* name, std::size_t& target)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr)
    {
        return;
    }

    const auto value = detail::parse_size(trim(raw));
    if (!value || *value == 0)
    {
        WMK_CORE_WARN("EngineConfig: Ignoring malformed {}='{}', keeping {}", name, raw, target);
        return;
    }

    target = *value;
    WMK_CORE_INFO("EngineConfig: {} = {}", name, target);
}

} // anonymous namespace

EngineConfig EngineConfig::from_environment()
{
    EngineConfig config;

    overlay_positive("WAYMARK_DISCOVERY_RADIUS", config.validator.discovery_radius_m);
    overlay_unit_interval("WAYMARK_MIN_CONFIDENCE", config.validator.min_confidence);
    overlay_positive("WAYMARK_MAX_ACCURACY", config.guard.max_horizontal_accuracy_m);
    overlay_positive("WAYMARK_MAX_FIX_AGE", config.guard.max_fix_age_s);
    overlay_positive("WAYMARK_MAX_SPEED", config.guard.max_speed_mps);
    overlay_count("WAYMARK_HISTORY_CAPACITY", config.history.capacity);
    overlay_count("WAYMARK_HISTORY_MAX_PLAYERS", config.history.max_players);

    return config;
}

// -----------------------------------------------------------------
// Utility: parse f64 / size from string_view
// -----------------------------------------------------------------

std::optional<f64> detail::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

std::optional<std::size_t> detail::parse_size(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace waymark::trust
