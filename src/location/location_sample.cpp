/// @file location_sample.cpp
/// @brief Provider name mapping.

#include "location/location_sample.hpp"

#include <cctype>

namespace waymark::location
{

const char* provider_name(Provider provider)
{
    switch (provider)
    {
        case Provider::Gps:     return "gps";
        case Provider::Network: return "network";
        case Provider::Passive: return "passive";
        case Provider::Unknown: return "unknown";
    }
    return "unknown";
}

Provider parse_provider(std::string_view name)
{
    const auto equals_ignore_case = [name](std::string_view expected)
    {
        if (name.size() != expected.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < name.size(); ++i)
        {
            const auto c = static_cast<unsigned char>(name[i]);
            if (std::tolower(c) != expected[i])
            {
                return false;
            }
        }
        return true;
    };

    if (equals_ignore_case("gps"))     return Provider::Gps;
    if (equals_ignore_case("network")) return Provider::Network;
    if (equals_ignore_case("passive")) return Provider::Passive;
    return Provider::Unknown;
}

} // namespace waymark::location
