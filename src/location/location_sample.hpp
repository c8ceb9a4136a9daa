#pragma once

/// @file location_sample.hpp
/// @brief A single player-submitted location fix and its accuracy metadata.

#include "geo/coordinate.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace waymark::location
{
    /// @brief Positioning source reported by the device.
    enum class Provider
    {
        Gps,
        Network,
        Passive,
        Unknown,
    };

    /// @brief Lowercase wire name of a provider ("gps", "network", ...).
    [[nodiscard]] const char* provider_name(Provider provider);

    /// @brief Case-insensitive provider lookup; unrecognized names map to Unknown.
    [[nodiscard]] Provider parse_provider(std::string_view name);

    /// @brief Device-reported accuracy of a fix.
    struct AccuracyReport
    {
        f64 horizontal_accuracy_m = 0.0;                ///< 1-sigma horizontal error radius
        std::optional<f64> vertical_accuracy_m;         ///< Vertical error, if reported
        Timestamp captured_at{};                        ///< Device time of the fix
        Provider provider = Provider::Unknown;
    };

    /// @brief One location fix submitted with a discovery attempt.
    ///
    /// Treated as an immutable value; it lives only for the duration of the
    /// attempt, except for the copy retained in the player's history.
    struct LocationSample
    {
        geo::Coordinate coordinate{};
        AccuracyReport accuracy;
        std::optional<f64> speed_mps;       ///< Device-reported ground speed
        std::optional<f64> bearing_deg;     ///< Course over ground, 0 = north
        std::optional<f64> altitude_m;
    };

} // namespace waymark::location
