#pragma once

/// @file reading_guard.hpp
/// @brief Basic sanity checks on a raw location fix.

#include "location/location_sample.hpp"
#include "trust/engine_config.hpp"
#include "core/types.hpp"

#include <string>

namespace waymark::trust
{
    /// @brief Outcome of the sanity check. Only Ok lets a fix through.
    enum class GuardVerdict
    {
        Ok,
        InvalidLatitude,
        InvalidLongitude,
        InvalidAccuracy,        ///< Negative or non-finite accuracy
        AccuracyTooLow,         ///< Error radius above the configured maximum
        StaleTimestamp,         ///< Too old or too far in the future
        ImplausibleSpeed,
    };

    [[nodiscard]] const char* guard_verdict_name(GuardVerdict verdict);

    struct GuardResult
    {
        GuardVerdict verdict = GuardVerdict::Ok;
        std::string reason;     ///< Human readable; empty when Ok

        [[nodiscard]] bool ok() const { return verdict == GuardVerdict::Ok; }
    };

    /// @brief Rejects fixes that cannot be trusted at all.
    ///
    /// Fails closed: the first failing check short-circuits and no further
    /// computation happens on the sample.
    class ReadingGuard
    {
    public:
        explicit ReadingGuard(const ReadingGuardConfig& config = {});

        /// @brief Check range, accuracy, freshness and speed of a fix.
        /// @param now Server time used for the freshness window.
        [[nodiscard]] GuardResult check(const location::LocationSample& sample, Timestamp now) const;

        [[nodiscard]] const ReadingGuardConfig& config() const { return m_config; }

    private:
        ReadingGuardConfig m_config;
    };

} // namespace waymark::trust
