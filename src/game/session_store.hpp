#pragma once

/// @file session_store.hpp
/// @brief Persistence boundary for game sessions.

#include "game/game_session.hpp"
#include "core/types.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace waymark::game
{
    /// @brief Session collaborator consumed by DiscoveryCoordinator.
    ///
    /// Implementations may be I/O bound; retry policy belongs to the caller.
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        /// @brief Snapshot of a session, or nullopt when the game does not exist.
        [[nodiscard]] virtual std::optional<GameSession> get(const GameId& game_id) const = 0;

        /// @brief Replace the stored state of an existing session.
        /// @return false when the game is unknown or the write failed.
        [[nodiscard]] virtual bool update(const GameId& game_id, const GameSession& session) = 0;
    };

    /// @brief Process-local store used by the demo and the tests.
    class InMemorySessionStore final : public SessionStore
    {
    public:
        /// @brief Insert or replace a session under its own game_id.
        void put(const GameSession& session);

        [[nodiscard]] std::optional<GameSession> get(const GameId& game_id) const override;
        [[nodiscard]] bool update(const GameId& game_id, const GameSession& session) override;

    private:
        mutable std::mutex m_mutex;
        std::unordered_map<GameId, GameSession> m_sessions;
    };

} // namespace waymark::game
