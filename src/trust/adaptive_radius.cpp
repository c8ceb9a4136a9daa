/// @file adaptive_radius.cpp
/// @brief Implementation of the advisory capture radius.

#include "trust/adaptive_radius.hpp"

#include <algorithm>
#include <cmath>

namespace waymark::trust
{

namespace
{

constexpr f64 kAccuracyFactorCap = 2.0;
constexpr f64 kAccuracyStepMeters = 10.0;   // One factor unit per 10 m of error
constexpr f64 kRadiusPerFactor = 10.0;

} // anonymous namespace

AdaptiveRadiusAdvisor::AdaptiveRadiusAdvisor(const AdvisoryRadiusConfig& config)
    : m_config(config)
{
}

f64 AdaptiveRadiusAdvisor::suggested_radius(const location::LocationSample& sample,
                                            std::optional<location::PoiType> poi_type) const
{
    f64 accuracy = sample.accuracy.horizontal_accuracy_m;
    if (!std::isfinite(accuracy) || accuracy < 0.0)
    {
        accuracy = 0.0;
    }

    const f64 accuracy_factor = std::min(kAccuracyFactorCap, accuracy / kAccuracyStepMeters);
    const f64 radius = (m_config.base_radius_m + accuracy_factor * kRadiusPerFactor)
                     * poi_modifier(poi_type);

    return std::clamp(radius, m_config.min_radius_m, m_config.max_radius_m);
}

f64 AdaptiveRadiusAdvisor::poi_modifier(std::optional<location::PoiType> poi_type)
{
    if (!poi_type)
    {
        return 1.0;
    }

    switch (*poi_type)
    {
        case location::PoiType::Park:       return 1.5;  // Large open areas
        case location::PoiType::Landmark:   return 1.3;
        case location::PoiType::Station:    return 1.2;
        case location::PoiType::Library:    return 1.0;
        case location::PoiType::Cafe:
        case location::PoiType::Restaurant: return 0.8;  // Small storefronts
        default:                            return 1.0;
    }
}

} // namespace waymark::trust
