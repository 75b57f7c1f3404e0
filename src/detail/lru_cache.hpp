//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_SRC_DETAIL_LRU_CACHE_HPP
#define PATHMATCH_SRC_DETAIL_LRU_CACHE_HPP

#include <pathmatch/detail/config.hpp>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace pathmatch {
namespace detail {

/** A bounded map which evicts the least recently used entry

    All member functions may be called concurrently.
    A capacity of zero stores nothing.
*/
template<class Key, class Value>
class lru_cache
{
public:
    explicit
    lru_cache(std::size_t capacity) noexcept
        : capacity_(capacity)
    {
    }

    lru_cache(lru_cache const&) = delete;
    lru_cache& operator=(lru_cache const&) = delete;

    /** Return a copy of the value for a key, if present

        A hit makes the entry the most recently used.
    */
    std::optional<Value>
    get(Key const& key)
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = map_.find(key);
        if(it == map_.end())
            return std::nullopt;
        list_.splice(
            list_.begin(), list_, it->second.second);
        return it->second.first;
    }

    /** Insert or replace the value for a key

        @return `true` if an entry was evicted
        to make room.
    */
    bool
    put(Key const& key, Value value)
    {
        std::lock_guard<std::mutex> lock(m_);
        if(capacity_ == 0)
            return false;
        auto it = map_.find(key);
        if(it != map_.end())
        {
            list_.splice(
                list_.begin(), list_, it->second.second);
            it->second.first = std::move(value);
            return false;
        }
        bool evicted = false;
        if(map_.size() >= capacity_)
        {
            map_.erase(list_.back());
            list_.pop_back();
            evicted = true;
        }
        list_.push_front(key);
        map_.emplace(key, std::make_pair(
            std::move(value), list_.begin()));
        return evicted;
    }

    std::size_t
    size() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return map_.size();
    }

private:
    using list_type = std::list<Key>;

    mutable std::mutex m_;
    std::size_t const capacity_;
    list_type list_;
    std::unordered_map<Key, std::pair<
        Value, typename list_type::iterator>> map_;
};

} // detail
} // pathmatch

#endif
