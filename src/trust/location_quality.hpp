#pragma once

/// @file location_quality.hpp
/// @brief Player-facing summary of how good a fix is.

#include "location/location_sample.hpp"
#include "trust/adaptive_radius.hpp"
#include "core/types.hpp"

namespace waymark::trust
{
    enum class QualityLevel
    {
        Excellent,  ///< <= 5 m
        Good,       ///< <= 10 m
        Fair,       ///< <= 25 m
        Poor,
    };

    [[nodiscard]] const char* quality_level_name(QualityLevel level);

    struct LocationQualityReport
    {
        QualityLevel level = QualityLevel::Poor;
        f64 accuracy_m = 0.0;
        location::Provider provider = location::Provider::Unknown;
        bool is_high_accuracy = false;        ///< <= 10 m
        bool is_acceptable_accuracy = false;  ///< <= 50 m
        bool is_reliable = false;             ///< Acceptable accuracy and younger than 30 s
        f64 recommended_radius_m = 0.0;       ///< Advisory radius for an unspecified POI
    };

    /// @brief Grades a fix for the "signal quality" indicator shown to players.
    class LocationQualityAssessor
    {
    public:
        static constexpr f64 kExcellentMeters = 5.0;
        static constexpr f64 kGoodMeters = 10.0;
        static constexpr f64 kFairMeters = 25.0;
        static constexpr f64 kAcceptableMeters = 50.0;
        static constexpr f64 kReliableAgeSeconds = 30.0;

        explicit LocationQualityAssessor(const AdaptiveRadiusAdvisor& advisor)
            : m_advisor(advisor) {}

        [[nodiscard]] LocationQualityReport assess(const location::LocationSample& sample,
                                                   Timestamp now) const;

    private:
        const AdaptiveRadiusAdvisor& m_advisor;
    };

} // namespace waymark::trust
