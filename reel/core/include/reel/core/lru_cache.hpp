/**
 * @file lru_cache.hpp
 * @brief Bounded loading cache with LRU (Least Recently Used) eviction
 *
 * Used for caching decoded frames which are slow to produce and likely
 * to be requested again (scrubbing, frame triplets, replays).
 *
 * Features:
 * - Values are produced on demand by a user supplied loader
 * - Fixed number of slots, chosen at construction (minimum 1)
 * - Deterministic eviction: the least recently used slot, lowest slot
 *   position first among slots never used
 * - A failed load leaves the cache exactly as it was
 *
 * The cache is not synchronised. Owners that share it between threads
 * must serialise get() together with whatever state the loader touches.
 */

#pragma once

#include <reel/core/result.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace reel {

/**
 * @brief LRU cache filled by a loader function
 *
 * @tparam Key Key type (must be equality comparable)
 * @tparam Value Value type (copied out on get, so should be cheap to copy)
 *
 * Usage:
 * @code
 *   LRUCache<int64_t, Frame> cache(
 *       [&](const int64_t& n) { return source.read(n); }, 3);
 *
 *   auto frame = cache.get(42);   // loads
 *   frame = cache.get(42);        // hit, no load
 * @endcode
 */
template<typename Key, typename Value>
class LRUCache {
public:
    using Loader = std::function<Result<Value, Error>(const Key&)>;
    using EvictionCallback = std::function<void(const Key&, Value&)>;

    /**
     * @brief Cache statistics
     */
    struct Stats {
        size_t size = 0;
        size_t capacity = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t loadFailures = 0;
        uint64_t evictions = 0;

        [[nodiscard]] double hitRate() const {
            uint64_t total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / total : 0.0;
        }
    };

    /**
     * @brief Construct cache with a loader and a slot count
     *
     * @param loader Produces the value for a key on a miss
     * @param capacity Number of slots, values below 1 are raised to 1
     * @param onEvict Optional callback when a resident value is replaced
     */
    explicit LRUCache(Loader loader, size_t capacity = 1, EvictionCallback onEvict = nullptr)
        : m_loader(std::move(loader))
        , m_slots(std::max<size_t>(capacity, 1))
        , m_onEvict(std::move(onEvict))
    {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;
    LRUCache(LRUCache&&) = default;
    LRUCache& operator=(LRUCache&&) = default;

    /**
     * @brief Get the value for a key, loading it on a miss
     *
     * A hit marks the slot as most recently used. A miss loads into the
     * least recently used slot; the slot is only overwritten once the
     * loader has succeeded.
     *
     * @param key Key to look up
     * @return The cached or freshly loaded value, or the loader's error
     */
    Result<Value, Error> get(const Key& key) {
        auto hit = findSlot(key);
        if (hit != m_slots.end()) {
            hit->useRank = ++m_counter;
            ++m_hits;
            return *hit->value;
        }

        auto victim = std::min_element(m_slots.begin(), m_slots.end(),
            [](const Slot& a, const Slot& b) { return a.useRank < b.useRank; });

        auto loaded = m_loader(key);
        if (!loaded) {
            ++m_loadFailures;
            return loaded.error();
        }

        if (victim->key) {
            if (m_onEvict) {
                m_onEvict(*victim->key, *victim->value);
            }
            ++m_evictions;
        }

        victim->key = key;
        victim->value = std::move(loaded).value();
        victim->useRank = ++m_counter;
        ++m_misses;
        return *victim->value;
    }

    /**
     * @brief Get a pointer to a resident value without touching recency
     *
     * @return Pointer to value, or nullptr if not resident
     *
     * @warning The pointer is invalidated by the next get() or clear().
     */
    [[nodiscard]] const Value* peek(const Key& key) const {
        auto it = findSlot(key);
        return it != m_slots.end() ? &*it->value : nullptr;
    }

    /**
     * @brief Check if a key is resident
     *
     * Does not affect LRU ordering.
     */
    [[nodiscard]] bool contains(const Key& key) const {
        return findSlot(key) != m_slots.end();
    }

    /**
     * @brief Drop every resident value
     *
     * The eviction callback is invoked for each of them. Statistics are kept.
     */
    void clear() {
        for (auto& slot : m_slots) {
            if (slot.key && m_onEvict) {
                m_onEvict(*slot.key, *slot.value);
            }
            slot = Slot{};
        }
        m_counter = 0;
    }

    /// Number of occupied slots
    [[nodiscard]] size_t size() const {
        return static_cast<size_t>(std::count_if(m_slots.begin(), m_slots.end(),
            [](const Slot& s) { return s.key.has_value(); }));
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    [[nodiscard]] size_t capacity() const {
        return m_slots.size();
    }

    [[nodiscard]] Stats stats() const {
        return {size(), capacity(), m_hits, m_misses, m_loadFailures, m_evictions};
    }

private:
    struct Slot {
        std::optional<Key> key;
        std::optional<Value> value;
        uint64_t useRank = 0;
    };

    typename std::vector<Slot>::iterator findSlot(const Key& key) {
        return std::find_if(m_slots.begin(), m_slots.end(),
            [&](const Slot& s) { return s.key && *s.key == key; });
    }

    typename std::vector<Slot>::const_iterator findSlot(const Key& key) const {
        return std::find_if(m_slots.begin(), m_slots.end(),
            [&](const Slot& s) { return s.key && *s.key == key; });
    }

    Loader m_loader;
    std::vector<Slot> m_slots;
    EvictionCallback m_onEvict;
    uint64_t m_counter = 0;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_loadFailures = 0;
    uint64_t m_evictions = 0;
};

} // namespace reel
