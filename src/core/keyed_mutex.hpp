/**
 * @file keyed_mutex.hpp
 * @brief One mutex per key: same-key callers serialize, different keys
 *        proceed in parallel.
 */

#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace fleet_orchestrator {

/**
 * @brief Lazily-created per-key mutexes.
 *
 * Entries are never erased, so a mutex handed out stays valid for the
 * lifetime of the KeyedMutex. Key cardinality (users, nodes, instances) is
 * bounded by the fleet, which keeps the map small.
 */
template <typename Key>
class KeyedMutex {
public:
    [[nodiscard]] std::unique_lock<std::mutex> lock(const Key& key) {
        return std::unique_lock<std::mutex>(mutex_for(key));
    }

private:
    std::mutex& mutex_for(const Key& key) {
        {
            std::shared_lock read(map_mutex_);
            auto it = mutexes_.find(key);
            if (it != mutexes_.end()) return *it->second;
        }
        std::unique_lock write(map_mutex_);
        auto& slot = mutexes_[key];
        if (!slot) slot = std::make_unique<std::mutex>();
        return *slot;
    }

    std::shared_mutex map_mutex_;
    std::unordered_map<Key, std::unique_ptr<std::mutex>> mutexes_;
};

}  // namespace fleet_orchestrator
