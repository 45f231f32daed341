// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace torlink {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded std::map / std::unordered_map
 *
 * Every operation takes the lock once. Callback-based access (Read, Upsert,
 * ForEach) runs the callback under the lock, so callbacks must be
 * short and must not call back into the same map.
 *
 * Usage:
 *   ThreadSafeMap<PeerId, std::vector<Multiaddr>> addrs_;
 *   addrs_.Upsert(peer, [&](std::vector<Multiaddr>& v) { v.push_back(a); });
 *   addrs_.Read(peer, [&](const std::vector<Multiaddr>& v) { out = v; });
 */
template <typename Key, typename Value,
          template <typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;

    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Calls reader(const Value&) under lock; false if the key is absent
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return false;
        }
        reader(it->second);
        return true;
    }

    // Default-constructs the value if needed, then calls modifier(Value&)
    template <typename Func>
    decltype(auto) Upsert(const Key& key, Func&& modifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        return modifier(map_[key]);
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    // Remove every entry for which pred(key, value) holds; returns the count
    template <typename Pred>
    size_t EraseIf(Pred&& pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();) {
            if (pred(it->first, it->second)) {
                it = map_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    // Lock held for the whole iteration; keep callbacks fast
    template <typename Func>
    void ForEach(Func&& callback) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : map_) {
            callback(key, value);
        }
    }

    std::vector<Key> Keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, value] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

    // Atomically swap out the contents
    std::vector<std::pair<Key, Value>> TakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<Key, Value>> out(map_.begin(), map_.end());
        map_.clear();
        return out;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace torlink
