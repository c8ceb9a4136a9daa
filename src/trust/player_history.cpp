/// @file player_history.cpp
/// @brief Implementation of the per-player fix history store.

#include "trust/player_history.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace waymark::trust
{

PlayerHistoryStore::PlayerHistoryStore(const PlayerHistoryConfig& config)
    : m_config(config)
{
    m_config.capacity = std::max<std::size_t>(1, m_config.capacity);
    m_config.max_players = std::max<std::size_t>(1, m_config.max_players);
}

std::vector<location::LocationSample> PlayerHistoryStore::recent(const PlayerId& player_id,
                                                                 std::size_t count) const
{
    const auto entry = find(player_id);
    if (!entry)
    {
        return {};
    }

    std::lock_guard lock(entry->mutex);
    return tail(entry->samples, count);
}

void PlayerHistoryStore::append(const PlayerId& player_id, const location::LocationSample& sample)
{
    const auto entry = acquire(player_id);

    std::lock_guard lock(entry->mutex);
    entry->samples.push_back(sample);
    while (entry->samples.size() > m_config.capacity)
    {
        entry->samples.pop_front();
    }
}

std::vector<location::LocationSample> PlayerHistoryStore::exchange(const PlayerId& player_id,
                                                                   const location::LocationSample& sample,
                                                                   std::size_t count)
{
    const auto entry = acquire(player_id);

    std::lock_guard lock(entry->mutex);
    auto previous = tail(entry->samples, count);

    entry->samples.push_back(sample);
    while (entry->samples.size() > m_config.capacity)
    {
        entry->samples.pop_front();
    }

    return previous;
}

std::size_t PlayerHistoryStore::size(const PlayerId& player_id) const
{
    const auto entry = find(player_id);
    if (!entry)
    {
        return 0;
    }

    std::lock_guard lock(entry->mutex);
    return entry->samples.size();
}

std::size_t PlayerHistoryStore::player_count() const
{
    std::lock_guard lock(m_map_mutex);
    return m_entries.size();
}

bool PlayerHistoryStore::forget(const PlayerId& player_id)
{
    std::lock_guard lock(m_map_mutex);
    const auto it = m_entries.find(player_id);
    if (it == m_entries.end())
    {
        return false;
    }

    m_lru.erase(it->second->lru_position);
    m_entries.erase(it);
    return true;
}

void PlayerHistoryStore::clear()
{
    std::lock_guard lock(m_map_mutex);
    m_entries.clear();
    m_lru.clear();
}

// -----------------------------------------------------------------
// Entry lookup
//
// Evicted entries may still be referenced by an in-flight call through
// its shared_ptr; that call finishes on the detached buffer and the
// player simply starts a fresh history next time.
// -----------------------------------------------------------------

std::shared_ptr<PlayerHistoryStore::Entry> PlayerHistoryStore::acquire(const PlayerId& player_id)
{
    std::lock_guard lock(m_map_mutex);

    const auto it = m_entries.find(player_id);
    if (it != m_entries.end())
    {
        m_lru.splice(m_lru.begin(), m_lru, it->second->lru_position);
        return it->second;
    }

    while (m_entries.size() >= m_config.max_players && !m_lru.empty())
    {
        const PlayerId& victim = m_lru.back();
        WMK_CORE_DEBUG("PlayerHistoryStore: Evicting history of player {}", victim);
        m_entries.erase(victim);
        m_lru.pop_back();
    }

    auto entry = std::make_shared<Entry>();
    m_lru.push_front(player_id);
    entry->lru_position = m_lru.begin();
    m_entries.emplace(player_id, entry);
    return entry;
}

std::shared_ptr<PlayerHistoryStore::Entry> PlayerHistoryStore::find(const PlayerId& player_id) const
{
    std::lock_guard lock(m_map_mutex);
    const auto it = m_entries.find(player_id);
    if (it == m_entries.end())
    {
        return nullptr;
    }
    return it->second;
}

std::vector<location::LocationSample> PlayerHistoryStore::tail(const std::deque<location::LocationSample>& samples,
                                                               std::size_t count)
{
    const std::size_t n = std::min(count, samples.size());
    return {samples.end() - static_cast<std::ptrdiff_t>(n), samples.end()};
}

} // namespace waymark::trust
