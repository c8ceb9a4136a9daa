#pragma once

/// @file discovery_coordinator.hpp
/// @brief Applies a location-validated discovery to a game session.

#include "game/game_session.hpp"
#include "game/session_store.hpp"
#include "location/location_sample.hpp"
#include "trust/discovery_validator.hpp"
#include "trust/spoof_detector.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace waymark::game
{
    enum class DiscoveryStatus
    {
        Discovered,
        AlreadyDiscovered,  ///< Benign idempotent no-op
        NotFound,           ///< Unknown game or evidence id
        GameNotActive,
        PlayerMismatch,     ///< Player does not own the session
        LikelySpoofed,      ///< Soft anti-abuse rejection
        InvalidReading,
        LowAccuracy,
        TooFar,
        InvalidTarget,
        StoreUnavailable,   ///< Session update refused; nothing was awarded
    };

    [[nodiscard]] const char* discovery_status_name(DiscoveryStatus status);

    struct DiscoveryOutcome
    {
        DiscoveryStatus status = DiscoveryStatus::NotFound;
        bool success = false;                   ///< True for Discovered and AlreadyDiscovered
        i64 bonus_points = 0;
        std::optional<std::string> next_clue;
        std::string message;
        f64 distance_m = 0.0;                   ///< Raw distance, 0 when not computed
        std::optional<trust::ValidationResult> validation;
        std::optional<trust::SpoofingAssessment> spoofing;
    };

    /// @brief Gates evidence discovery on location trust and awards the bonus.
    ///
    /// Discovery is at-most-once per evidence item: session mutations are
    /// serialized per game id, so two concurrent requests for the same item
    /// yield one Discovered and one AlreadyDiscovered.
    class DiscoveryCoordinator
    {
    public:
        DiscoveryCoordinator(trust::SpoofDetector& spoof_detector,
                             const trust::DiscoveryValidator& validator,
                             SessionStore& store);

        DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
        DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

        /// @brief Try to discover evidence in a session the caller holds.
        ///
        /// The caller is responsible for the ACTIVE precondition and for
        /// persisting the session afterwards.
        [[nodiscard]] DiscoveryOutcome attempt_discovery(GameSession& session,
                                                         const EvidenceId& evidence_id,
                                                         const location::LocationSample& sample,
                                                         const PlayerId& player_id);

        /// @brief Load, check, apply and persist a discovery through the session store.
        [[nodiscard]] DiscoveryOutcome discover(const GameId& game_id,
                                                const PlayerId& player_id,
                                                const EvidenceId& evidence_id,
                                                const location::LocationSample& sample);

        /// @brief Drop the serialization lock of a game nobody is using.
        ///
        /// Called after every request, so only games with a request in
        /// flight keep an entry. Returns false while any request holds or
        /// waits on the lock, or when the game has no entry.
        bool release_game(const GameId& game_id);

        /// @brief Number of games with a live serialization lock.
        [[nodiscard]] std::size_t tracked_game_count() const;

        /// critical 50, important 30, misleading 20, background 10
        [[nodiscard]] static i64 base_points(location::Importance importance);

        /// Percent multiplier: <=10 m 150, <=30 m 120, <=50 m 100, else 80
        [[nodiscard]] static i64 distance_multiplier_percent(f64 distance_m);

        [[nodiscard]] static i64 bonus_points(location::Importance importance, f64 distance_m);

        /// @brief Hint toward the remaining evidence; nullopt when more than 3 remain.
        ///
        /// The clue for the last item adds a flavour line for its POI type.
        [[nodiscard]] static std::optional<std::string> next_clue(const GameSession& session);

    private:
        DiscoveryOutcome apply(GameSession& session,
                               const EvidenceId& evidence_id,
                               const location::LocationSample& sample,
                               const PlayerId& player_id);

        DiscoveryOutcome load_apply_persist(const GameId& game_id,
                                            const PlayerId& player_id,
                                            const EvidenceId& evidence_id,
                                            const location::LocationSample& sample);

        std::shared_ptr<std::mutex> game_lock(const GameId& game_id);

        trust::SpoofDetector& m_spoof_detector;
        const trust::DiscoveryValidator& m_validator;
        SessionStore& m_store;

        mutable std::mutex m_locks_mutex;
        std::unordered_map<GameId, std::shared_ptr<std::mutex>> m_game_locks;
    };

} // namespace waymark::game
