#pragma once
// location/poi_type.hpp - Point-of-interest categories used to place evidence

#include <optional>
#include <string_view>

namespace waymark::location {

enum class PoiType {
    Restaurant,
    Park,
    Landmark,
    Cafe,
    Station,
    Shop,
    Office,
    School,
    Hospital,
    Library,
};

inline const char* poi_type_name(PoiType type) {
    switch (type) {
        case PoiType::Restaurant: return "restaurant";
        case PoiType::Park:       return "park";
        case PoiType::Landmark:   return "landmark";
        case PoiType::Cafe:       return "cafe";
        case PoiType::Station:    return "station";
        case PoiType::Shop:       return "shop";
        case PoiType::Office:     return "office";
        case PoiType::School:     return "school";
        case PoiType::Hospital:   return "hospital";
        case PoiType::Library:    return "library";
    }
    return "unknown";
}

/// Exact lowercase match against poi_type_name(); nullopt for anything else.
inline std::optional<PoiType> parse_poi_type(std::string_view name) {
    constexpr PoiType kAll[] = {
        PoiType::Restaurant, PoiType::Park,   PoiType::Landmark, PoiType::Cafe,
        PoiType::Station,    PoiType::Shop,   PoiType::Office,   PoiType::School,
        PoiType::Hospital,   PoiType::Library,
    };
    for (PoiType t : kAll) {
        if (name == poi_type_name(t)) return t;
    }
    return std::nullopt;
}

/// Short flavour text describing the kind of place; nullptr for types without one.
inline const char* poi_type_hint(PoiType type) {
    switch (type) {
        case PoiType::Restaurant: return "It smells of good food around there.";
        case PoiType::Cafe:       return "Follow the smell of coffee.";
        case PoiType::Park:       return "Look somewhere green and quiet.";
        case PoiType::Station:    return "Crowds pass through there all day.";
        case PoiType::Landmark:   return "Everyone around here knows the place.";
        case PoiType::Shop:       return "Somewhere you can do some shopping.";
        default:                  return nullptr;
    }
}

} // namespace waymark::location
