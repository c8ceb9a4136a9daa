/// @file session_store.cpp
/// @brief In-memory session store.

#include "game/session_store.hpp"

#include "core/logger.hpp"

namespace waymark::game
{

void InMemorySessionStore::put(const GameSession& session)
{
    std::lock_guard lock(m_mutex);
    m_sessions.insert_or_assign(session.game_id, session);
}

std::optional<GameSession> InMemorySessionStore::get(const GameId& game_id) const
{
    std::lock_guard lock(m_mutex);
    const auto it = m_sessions.find(game_id);
    if (it == m_sessions.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionStore::update(const GameId& game_id, const GameSession& session)
{
    std::lock_guard lock(m_mutex);
    const auto it = m_sessions.find(game_id);
    if (it == m_sessions.end())
    {
        WMK_CORE_WARN("InMemorySessionStore: Update for unknown game {}", game_id);
        return false;
    }
    it->second = session;
    return true;
}

} // namespace waymark::game
