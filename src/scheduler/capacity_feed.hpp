/**
 * @file capacity_feed.hpp
 * @brief Source of live per-node headroom consumed by the scheduler.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// ICapacityFeed (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Point-in-time snapshot of available cpu/memory keyed by node
 *        address. An error result means the feed is unavailable.
 */
class ICapacityFeed {
public:
    virtual ~ICapacityFeed() = default;

    [[nodiscard]] virtual Result<std::vector<CapacityEntry>> list_available() const = 0;
};

/**
 * @brief Feed with explicitly set entries. Used by tests and by deployments
 *        where an operator pushes capacity figures in.
 */
class StaticCapacityFeed : public ICapacityFeed {
public:
    StaticCapacityFeed() = default;
    explicit StaticCapacityFeed(std::vector<CapacityEntry> entries)
        : entries_(std::move(entries)) {}

    [[nodiscard]] Result<std::vector<CapacityEntry>> list_available() const override {
        std::lock_guard lock(mutex_);
        if (unavailable_reason_) {
            return Error{ErrorCode::Internal, "Capacity feed unavailable: " + *unavailable_reason_};
        }
        return entries_;
    }

    void set_entries(std::vector<CapacityEntry> entries) {
        std::lock_guard lock(mutex_);
        entries_ = std::move(entries);
    }

    /// Make subsequent list_available() calls fail with `reason`.
    void mark_unavailable(std::string reason) {
        std::lock_guard lock(mutex_);
        unavailable_reason_ = std::move(reason);
    }

    void mark_available() {
        std::lock_guard lock(mutex_);
        unavailable_reason_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::vector<CapacityEntry> entries_;
    std::optional<std::string> unavailable_reason_;
};

}  // namespace fleet_orchestrator
