#pragma once

/// @file adaptive_radius.hpp
/// @brief Player-facing "get within X m" guidance radius.

#include "location/location_sample.hpp"
#include "location/poi_type.hpp"
#include "trust/engine_config.hpp"
#include "core/types.hpp"

#include <optional>

namespace waymark::trust
{
    /// @brief Computes a POI- and accuracy-aware suggested capture radius.
    ///
    /// The value is advisory only. It is shown to the player and never used
    /// as the accept/reject threshold, which stays the fixed discovery radius
    /// of DiscoveryValidator.
    ///
    ///   radius = (base + min(2, accuracy / 10) x 10) x poi_modifier
    ///   clamped to [min_radius, max_radius]
    class AdaptiveRadiusAdvisor
    {
    public:
        explicit AdaptiveRadiusAdvisor(const AdvisoryRadiusConfig& config = {});

        /// @param poi_type Category of the target, or nullopt when unknown.
        [[nodiscard]] f64 suggested_radius(const location::LocationSample& sample,
                                           std::optional<location::PoiType> poi_type) const;

        /// @brief park 1.5, landmark 1.3, station 1.2, cafe/restaurant 0.8, otherwise 1.0.
        [[nodiscard]] static f64 poi_modifier(std::optional<location::PoiType> poi_type);

        [[nodiscard]] const AdvisoryRadiusConfig& config() const { return m_config; }

    private:
        AdvisoryRadiusConfig m_config;
    };

} // namespace waymark::trust
