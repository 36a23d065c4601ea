#pragma once
/**
 * @file range_cache.hpp
 * @brief Bounded LRU cache of resolved range locations.
 *
 * Entries are indexed by range end key, so the range containing a key is the
 * first entry whose end key is greater than the key, provided its start key
 * is not greater than the key. An entry without an end key sorts last.
 *
 * Inserting a range evicts every cached range it overlaps: after a split or
 * merge the old boundaries are stale by definition.
 *
 * Entries can be stale without overlapping anything (the range moved to other
 * replicas). The router handles that by calling invalidate() when dispatch to
 * the cached replicas fails.
 *
 * Thread-safe; every operation takes one internal mutex.
 */

#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>

#include "kv/types.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT RangeLocationCache
{
  public:
    explicit RangeLocationCache(size_t capacity);

    RangeLocationCache(const RangeLocationCache &) = delete;
    RangeLocationCache &operator=(const RangeLocationCache &) = delete;

    /**
     * @brief Cached locations of the range containing @p key; marks it most
     *        recently used.
     */
    [[nodiscard]] std::optional<RangeLocations> lookup(std::string_view key);

    /**
     * @brief Caches @p locations, replacing overlapping entries and evicting
     *        the least recently used entry when full.
     */
    void insert(const RangeLocations &locations);

    /**
     * @brief Drops the entry whose range contains @p key.
     * @return true if an entry was removed.
     */
    bool invalidate(std::string_view key);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

  private:
    // nullopt (unbounded) sorts after every key.
    struct EndKeyLess
    {
        using is_transparent = void;
        bool operator()(const std::optional<Key> &a, const std::optional<Key> &b) const noexcept
        {
            if (!a)
                return false;
            return !b || *a < *b;
        }
        bool operator()(std::string_view a, const std::optional<Key> &b) const noexcept
        {
            return !b || a < std::string_view(*b);
        }
        bool operator()(const std::optional<Key> &a, std::string_view b) const noexcept
        {
            return a && std::string_view(*a) < b;
        }
    };

    using LruList = std::list<RangeLocations>;
    using Index = std::map<std::optional<Key>, LruList::iterator, EndKeyLess>;

    // Caller holds mutex_.
    Index::iterator find_containing(std::string_view key);
    void erase(Index::iterator it);

    const size_t capacity_;
    mutable std::mutex mutex_;
    LruList lru_; ///< Front = most recently used.
    Index by_end_key_;
};

} // namespace rangekv::kv
