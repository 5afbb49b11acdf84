/** \file model_cache.hpp
 *  \brief Thread-safe LRU cache of loaded calibrators, owned by one registry instance.
 */

#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "calibet/calibration/calibrator.hpp"

namespace calibet::registry {

/** \brief Counters for cache monitoring. */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t inserts{0};
};

/**
 * \brief LRU map from "name/version_id" to an immutable calibrator.
 *
 * Entries never go stale because registry versions are write-once; eviction is
 * purely by capacity. A capacity of 0 disables caching.
 */
class ModelCache {
public:
    using Value = std::shared_ptr<const calibration::Calibrator>;

    explicit ModelCache(std::size_t capacity) : capacity_(capacity) {}

    ModelCache(const ModelCache&) = delete;
    ModelCache& operator=(const ModelCache&) = delete;

    [[nodiscard]] auto get(const std::string& key) -> std::optional<Value> {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses++;
            return std::nullopt;
        }
        if (it->second != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        }
        stats_.hits++;
        return it->second->second;
    }

    auto put(const std::string& key, Value value) -> void {
        if (capacity_ == 0) return;
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            if (it->second != lru_list_.begin()) {
                lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
            }
            return;
        }
        while (index_.size() >= capacity_ && !lru_list_.empty()) {
            index_.erase(lru_list_.back().first);
            lru_list_.pop_back();
            stats_.evictions++;
        }
        lru_list_.emplace_front(key, std::move(value));
        index_[key] = lru_list_.begin();
        stats_.inserts++;
    }

    [[nodiscard]] auto stats() const -> CacheStats {
        std::lock_guard lock(mutex_);
        return stats_;
    }

private:
    using Entry = std::pair<std::string, Value>;
    using ListIterator = std::list<Entry>::iterator;

    mutable std::mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<std::string, ListIterator> index_;
    std::size_t capacity_;
    CacheStats stats_;
};

} // namespace calibet::registry
