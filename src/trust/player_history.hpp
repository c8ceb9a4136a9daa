#pragma once

/// @file player_history.hpp
/// @brief Bounded, thread-safe store of each player's recent location fixes.

#include "location/location_sample.hpp"
#include "trust/engine_config.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace waymark::trust
{
    /// @brief Per-player FIFO of the most recent fixes, oldest first.
    ///
    /// Each player has its own lock, so requests for different players never
    /// contend beyond the short map lookup. The number of tracked players is
    /// bounded; the least recently touched player is dropped first.
    ///
    /// Owned by whoever wires the engine together and injected by reference.
    /// Non-copyable.
    class PlayerHistoryStore
    {
    public:
        explicit PlayerHistoryStore(const PlayerHistoryConfig& config = {});

        PlayerHistoryStore(const PlayerHistoryStore&) = delete;
        PlayerHistoryStore& operator=(const PlayerHistoryStore&) = delete;
        PlayerHistoryStore(PlayerHistoryStore&&) = delete;
        PlayerHistoryStore& operator=(PlayerHistoryStore&&) = delete;

        /// @brief The last `count` fixes of a player, oldest first. Empty for unknown players.
        [[nodiscard]] std::vector<location::LocationSample> recent(const PlayerId& player_id,
                                                                   std::size_t count) const;

        /// @brief Append a fix, evicting the oldest one when the buffer is full.
        void append(const PlayerId& player_id, const location::LocationSample& sample);

        /// @brief Atomically read the last `count` fixes and append `sample`.
        ///
        /// Two concurrent calls for the same player are serialized: the second
        /// one sees the first one's sample in its returned history.
        [[nodiscard]] std::vector<location::LocationSample> exchange(const PlayerId& player_id,
                                                                     const location::LocationSample& sample,
                                                                     std::size_t count);

        /// @brief Number of fixes currently held for a player.
        [[nodiscard]] std::size_t size(const PlayerId& player_id) const;

        /// @brief Number of players currently tracked.
        [[nodiscard]] std::size_t player_count() const;

        /// @brief Drop a player's history. Returns false if none was held.
        bool forget(const PlayerId& player_id);

        /// @brief Drop every player's history.
        void clear();

        [[nodiscard]] const PlayerHistoryConfig& config() const { return m_config; }

    private:
        struct Entry
        {
            std::mutex mutex;
            std::deque<location::LocationSample> samples;
            std::list<PlayerId>::iterator lru_position;
        };

        /// Find or lazily create the entry; marks it most recently used.
        std::shared_ptr<Entry> acquire(const PlayerId& player_id);

        /// Find without creating; nullptr when the player is unknown.
        std::shared_ptr<Entry> find(const PlayerId& player_id) const;

        static std::vector<location::LocationSample> tail(const std::deque<location::LocationSample>& samples,
                                                          std::size_t count);

        PlayerHistoryConfig m_config;

        // Guards m_entries and m_lru only; sample buffers use Entry::mutex
        mutable std::mutex m_map_mutex;
        std::unordered_map<PlayerId, std::shared_ptr<Entry>> m_entries;
        std::list<PlayerId> m_lru;  ///< Most recently used at the front
    };

} // namespace waymark::trust
