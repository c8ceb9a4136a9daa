#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace waymark
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Opaque identifiers handed in by the request layer
    using PlayerId   = std::string;
    using GameId     = std::string;
    using EvidenceId = std::string;

    // Wall-clock time of a fix or of a server decision
    using Timestamp = std::chrono::system_clock::time_point;
    using Clock     = std::function<Timestamp()>;

    /// @brief Default clock: the system wall clock.
    [[nodiscard]] inline Timestamp system_now()
    {
        return std::chrono::system_clock::now();
    }

    /// @brief Signed difference (later - earlier) in seconds.
    [[nodiscard]] inline f64 seconds_between(Timestamp earlier, Timestamp later)
    {
        return std::chrono::duration<f64>(later - earlier).count();
    }

    // Geodetic constants
    namespace geo_constants
    {
        constexpr f64 kPi               = glm::pi<f64>();
        constexpr f64 kEarthRadiusMeters = 6'371'000.0;  // Mean radius, haversine model
        constexpr f64 kMaxLatitude      = 90.0;
        constexpr f64 kMaxLongitude     = 180.0;
    }
}
