/// @file geo_math.cpp
/// @brief Implementation of geodetic distance computations.

#include "geo/geo_math.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace waymark::geo
{

// -----------------------------------------------------------------
// Haversine distance
//
// a = sin²(Δφ/2) + cos(φ1) × cos(φ2) × sin²(Δλ/2)
// c = 2 × atan2(√a, √(1−a))
// d = R × c
//
// a is clamped to [0, 1] so rounding near antipodal points cannot
// push sqrt(1 - a) into NaN.
// -----------------------------------------------------------------

f64 GeoMath::distance(const Coordinate& a, const Coordinate& b)
{
    const f64 lat1 = glm::radians(a.lat);
    const f64 lat2 = glm::radians(b.lat);
    const f64 delta_lat = glm::radians(b.lat - a.lat);
    const f64 delta_lng = glm::radians(b.lng - a.lng);

    const f64 sin_dlat = std::sin(delta_lat * 0.5);
    const f64 sin_dlng = std::sin(delta_lng * 0.5);

    const f64 h = std::clamp(
        sin_dlat * sin_dlat + std::cos(lat1) * std::cos(lat2) * sin_dlng * sin_dlng,
        0.0, 1.0);
    const f64 c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return geo_constants::kEarthRadiusMeters * c;
}

f64 GeoMath::implied_speed(f64 meters, f64 seconds)
{
    if (seconds <= 0.0)
    {
        return 0.0;
    }
    return meters / seconds;
}

} // namespace waymark::geo
