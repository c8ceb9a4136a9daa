#pragma once

/// @file geo_math.hpp
/// @brief Great-circle distance on a spherical Earth.

#include "geo/coordinate.hpp"
#include "core/types.hpp"

namespace waymark::geo
{
    /// @brief Static utility class for geodetic computations.
    ///
    /// All inputs are in decimal degrees, all distances in meters.
    /// The Earth is modelled as a sphere of radius 6,371,000 m.
    class GeoMath
    {
    public:
        GeoMath() = delete;

        /// @brief Haversine great-circle distance between two coordinates.
        /// @return Distance in meters. Symmetric; zero for identical points.
        [[nodiscard]] static f64 distance(const Coordinate& a, const Coordinate& b);

        /// @brief Implied ground speed between two fixes.
        /// @param meters Distance travelled.
        /// @param seconds Elapsed time; must be positive.
        /// @return Speed in m/s, or 0 when seconds <= 0.
        [[nodiscard]] static f64 implied_speed(f64 meters, f64 seconds);
    };

} // namespace waymark::geo
