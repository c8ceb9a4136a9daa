#pragma once

/// @file confidence_scorer.hpp
/// @brief Trust score of a fix from its accuracy, distance, age and provider.

#include "location/location_sample.hpp"
#include "core/types.hpp"

namespace waymark::trust
{
    /// @brief Maps fix metadata to a confidence in [0, 1].
    ///
    /// score = 1
    ///       - 0.01  x max(0, accuracy - 10 m)
    ///       - 0.01  x max(0, distance - 20 m)
    ///       - 0.001 x max(0, age - 10 s)
    /// then multiplied by the provider factor and clamped to [0, 1].
    class ConfidenceScorer
    {
    public:
        ConfidenceScorer() = delete;

        static constexpr f64 kAccuracyFreeMeters  = 10.0;
        static constexpr f64 kAccuracyPenalty     = 0.01;   ///< Per meter beyond the free allowance
        static constexpr f64 kDistanceFreeMeters  = 20.0;
        static constexpr f64 kDistancePenalty     = 0.01;
        static constexpr f64 kAgeFreeSeconds      = 10.0;
        static constexpr f64 kAgePenalty          = 0.001;

        /// @param distance_m Raw distance from the fix to the target.
        /// @param now Server time used to age the fix.
        [[nodiscard]] static f64 score(const location::LocationSample& sample,
                                       f64 distance_m, Timestamp now);

        /// gps 1.0, network 0.8, passive 0.6, unknown 0.5
        [[nodiscard]] static f64 provider_factor(location::Provider provider);
    };

} // namespace waymark::trust
