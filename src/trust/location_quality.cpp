/// @file location_quality.cpp
/// @brief Fix quality grading.

#include "trust/location_quality.hpp"

#include <optional>

namespace waymark::trust
{

const char* quality_level_name(QualityLevel level)
{
    switch (level)
    {
        case QualityLevel::Excellent: return "excellent";
        case QualityLevel::Good:      return "good";
        case QualityLevel::Fair:      return "fair";
        case QualityLevel::Poor:      return "poor";
    }
    return "poor";
}

LocationQualityReport LocationQualityAssessor::assess(const location::LocationSample& sample,
                                                      Timestamp now) const
{
    const f64 accuracy = sample.accuracy.horizontal_accuracy_m;

    QualityLevel level = QualityLevel::Poor;
    if (accuracy <= kExcellentMeters)
    {
        level = QualityLevel::Excellent;
    }
    else if (accuracy <= kGoodMeters)
    {
        level = QualityLevel::Good;
    }
    else if (accuracy <= kFairMeters)
    {
        level = QualityLevel::Fair;
    }

    const bool acceptable = accuracy <= kAcceptableMeters;
    const f64 age_s = seconds_between(sample.accuracy.captured_at, now);

    return LocationQualityReport{
        .level                  = level,
        .accuracy_m             = accuracy,
        .provider               = sample.accuracy.provider,
        .is_high_accuracy       = accuracy <= kGoodMeters,
        .is_acceptable_accuracy = acceptable,
        .is_reliable            = acceptable && age_s < kReliableAgeSeconds,
        .recommended_radius_m   = m_advisor.suggested_radius(sample, std::nullopt),
    };
}

} // namespace waymark::trust
