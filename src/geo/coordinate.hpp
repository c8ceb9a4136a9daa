#pragma once

/// @file coordinate.hpp
/// @brief WGS-84 geographic coordinate in decimal degrees.

#include "core/types.hpp"

#include <cmath>

namespace waymark::geo
{
    /// @brief Geographic coordinate (decimal degrees, WGS-84).
    struct Coordinate
    {
        f64 lat;    ///< Latitude (degrees, -90..+90, north positive)
        f64 lng;    ///< Longitude (degrees, -180..+180, east positive)
    };

    /// @brief True when both components are finite and inside their ranges.
    [[nodiscard]] inline bool is_valid(const Coordinate& c)
    {
        return std::isfinite(c.lat) && std::isfinite(c.lng)
            && std::abs(c.lat) <= geo_constants::kMaxLatitude
            && std::abs(c.lng) <= geo_constants::kMaxLongitude;
    }

} // namespace waymark::geo
