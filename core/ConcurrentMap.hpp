#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace fleetalert {

/**
 * @brief Thread-safe keyed state owned by a single evaluator instance
 *
 * Readers share the lock; writers and read-modify-write callbacks take it
 * exclusively, so a check-and-set on one key is atomic with respect to every
 * other caller.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ConcurrentMap {
public:
    std::optional<Value> get(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(const Key& key, Value value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = std::move(value);
    }

    void erase(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.erase(key);
    }

    template <typename Predicate>
    void eraseIf(Predicate predicate) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = map_.begin(); it != map_.end();) {
            if (predicate(it->first, it->second)) {
                it = map_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * @brief Atomic read-modify-write of one entry
     * @param fn Receives std::optional<Value>& holding the current entry;
     *           leaving it empty removes the key
     * @return Whatever fn returns
     */
    template <typename Fn>
    auto update(const Key& key, Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        std::optional<Value> current;
        if (it != map_.end()) {
            current = it->second;
        }
        auto result = fn(current);
        if (current) {
            map_[key] = std::move(*current);
        } else if (it != map_.end()) {
            map_.erase(it);
        }
        return result;
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Value, Hash> map_;
};

} // namespace fleetalert
