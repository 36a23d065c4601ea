#include "kv/range_cache.hpp"

#include <stdexcept>

namespace rangekv::kv
{

RangeLocationCache::RangeLocationCache(size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0)
    {
        throw std::invalid_argument("RangeLocationCache: capacity must be > 0");
    }
}

RangeLocationCache::Index::iterator RangeLocationCache::find_containing(std::string_view key)
{
    auto it = by_end_key_.upper_bound(key);
    if (it == by_end_key_.end() || !it->second->contains(key))
    {
        return by_end_key_.end();
    }
    return it;
}

void RangeLocationCache::erase(Index::iterator it)
{
    lru_.erase(it->second);
    by_end_key_.erase(it);
}

std::optional<RangeLocations> RangeLocationCache::lookup(std::string_view key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_containing(key);
    if (it == by_end_key_.end())
    {
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    return *it->second;
}

void RangeLocationCache::insert(const RangeLocations &locations)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Remove every cached range overlapping [start_key, end_key).
    auto it = by_end_key_.upper_bound(std::string_view(locations.start_key));
    while (it != by_end_key_.end())
    {
        const RangeLocations &cached = *it->second;
        const bool starts_before_end =
            !locations.end_key || cached.start_key < *locations.end_key;
        if (!starts_before_end)
            break;
        auto next = std::next(it);
        erase(it);
        it = next;
    }

    lru_.push_front(locations);
    by_end_key_.emplace(locations.end_key, lru_.begin());

    while (lru_.size() > capacity_)
    {
        by_end_key_.erase(lru_.back().end_key);
        lru_.pop_back();
    }
}

bool RangeLocationCache::invalidate(std::string_view key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_containing(key);
    if (it == by_end_key_.end())
    {
        return false;
    }
    erase(it);
    return true;
}

void RangeLocationCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    by_end_key_.clear();
    lru_.clear();
}

size_t RangeLocationCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

} // namespace rangekv::kv
