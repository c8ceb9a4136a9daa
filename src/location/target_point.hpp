#pragma once

/// @file target_point.hpp
/// @brief Server-held location a player must reach to discover evidence.

#include "geo/coordinate.hpp"
#include "location/poi_type.hpp"

#include <optional>

namespace waymark::location
{
    /// @brief Narrative weight of an evidence item; drives the discovery bonus.
    enum class Importance
    {
        Critical,
        Important,
        Misleading,
        Background,
    };

    [[nodiscard]] inline const char* importance_name(Importance importance)
    {
        switch (importance)
        {
            case Importance::Critical:   return "critical";
            case Importance::Important:  return "important";
            case Importance::Misleading: return "misleading";
            case Importance::Background: return "background";
        }
        return "background";
    }

    /// @brief Read-only view of where an evidence item sits.
    struct TargetPoint
    {
        geo::Coordinate coordinate{};
        std::optional<PoiType> poi_type;    ///< nullopt when the POI category is not known
        Importance importance = Importance::Background;
    };

} // namespace waymark::location
