// trust/confidence_scorer.cpp
#include "trust/confidence_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace waymark::trust {

f64 ConfidenceScorer::score(const location::LocationSample& sample,
                            f64 distance_m, Timestamp now) {
    f64 score = 1.0;

    const f64 accuracy = sample.accuracy.horizontal_accuracy_m;
    score -= kAccuracyPenalty * std::max(0.0, accuracy - kAccuracyFreeMeters);
    score -= kDistancePenalty * std::max(0.0, distance_m - kDistanceFreeMeters);

    const f64 age_s = seconds_between(sample.accuracy.captured_at, now);
    score -= kAgePenalty * std::max(0.0, age_s - kAgeFreeSeconds);

    score *= provider_factor(sample.accuracy.provider);

    // NaN inputs must not leak out as a passing score
    if (!std::isfinite(score)) return 0.0;
    return std::clamp(score, 0.0, 1.0);
}

f64 ConfidenceScorer::provider_factor(location::Provider provider) {
    switch (provider) {
        case location::Provider::Gps:     return 1.0;
        case location::Provider::Network: return 0.8;
        case location::Provider::Passive: return 0.6;
        case location::Provider::Unknown: return 0.5;
    }
    return 0.5;
}

} // namespace waymark::trust
