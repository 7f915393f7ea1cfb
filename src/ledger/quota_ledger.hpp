/**
 * @file quota_ledger.hpp
 * @brief Per-user resource usage counters.
 *
 * Each account carries its own mutex; the account map itself is guarded by a
 * shared_mutex and only taken exclusively when a user is registered. Two
 * different users never contend on anything but the map read lock.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "ledger/quota_policy.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace fleet_orchestrator {

class QuotaLedger {
public:
    explicit QuotaLedger(std::unique_ptr<IQuotaPolicy> policy = std::make_unique<UsageBasedPolicy>());

    QuotaLedger(const QuotaLedger&) = delete;
    QuotaLedger& operator=(const QuotaLedger&) = delete;

    /// Create an account, or update the declared limits of an existing one.
    void register_user(const UserId& user, QuotaLimits limits = {});

    [[nodiscard]] bool has_user(const UserId& user) const;

    /**
     * @brief Ask the policy whether (cpu, memory_gb) may be admitted.
     *
     * Unknown users are evaluated against default limits and zero usage,
     * so the usage-based policy admits them too.
     */
    [[nodiscard]] Result<void> check(const UserId& user, uint32_t cpu, uint32_t memory_gb) const;

    /**
     * @brief Record one more instance of (cpu, memory_gb) against the user.
     *
     * The policy is re-evaluated under the account lock so a capping policy
     * cannot be raced past. NotFound if the user has no account.
     */
    Result<void> allocate(const UserId& user, uint32_t cpu, uint32_t memory_gb);

    /// Inverse of allocate, clamped at zero. No-op for unknown users.
    void release(const UserId& user, uint32_t cpu, uint32_t memory_gb);

    [[nodiscard]] Result<QuotaCounters> usage(const UserId& user) const;
    [[nodiscard]] Result<QuotaSummary> summary(const UserId& user) const;

    [[nodiscard]] std::vector<UserId> users() const;
    [[nodiscard]] const IQuotaPolicy& policy() const noexcept { return *policy_; }

private:
    struct Account {
        mutable std::mutex mutex;
        QuotaLimits limits;
        QuotaCounters counters;
    };

    Account* find(const UserId& user) const;

    std::unique_ptr<IQuotaPolicy> policy_;
    mutable std::shared_mutex accounts_mutex_;
    std::unordered_map<UserId, std::unique_ptr<Account>> accounts_;
};

}  // namespace fleet_orchestrator
