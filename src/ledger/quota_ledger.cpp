/**
 * @file quota_ledger.cpp
 * @brief QuotaLedger implementation.
 */

#include "ledger/quota_ledger.hpp"

#include <algorithm>
#include <cmath>

namespace fleet_orchestrator {

namespace {

uint32_t saturating_sub(uint32_t value, uint32_t amount) noexcept {
    return value > amount ? value - amount : 0;
}

QuotaDimension make_dimension(uint32_t used, uint32_t max) {
    QuotaDimension dim;
    dim.used = used;
    dim.max = max;
    dim.available = saturating_sub(max, used);
    if (max > 0) {
        double percent = static_cast<double>(used) / static_cast<double>(max) * 100.0;
        dim.usage_percent = std::round(percent * 10.0) / 10.0;
    }
    return dim;
}

}  // anonymous namespace

QuotaLedger::QuotaLedger(std::unique_ptr<IQuotaPolicy> policy)
    : policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = std::make_unique<UsageBasedPolicy>();
    }
}

void QuotaLedger::register_user(const UserId& user, QuotaLimits limits) {
    std::unique_lock lock(accounts_mutex_);
    auto& slot = accounts_[user];
    if (!slot) {
        slot = std::make_unique<Account>();
    }
    std::lock_guard account_lock(slot->mutex);
    slot->limits = limits;
}

bool QuotaLedger::has_user(const UserId& user) const {
    return find(user) != nullptr;
}

QuotaLedger::Account* QuotaLedger::find(const UserId& user) const {
    std::shared_lock lock(accounts_mutex_);
    auto it = accounts_.find(user);
    return it == accounts_.end() ? nullptr : it->second.get();
}

Result<void> QuotaLedger::check(const UserId& user, uint32_t cpu, uint32_t memory_gb) const {
    auto* account = find(user);
    if (account == nullptr) {
        return policy_->admit(QuotaLimits{}, QuotaCounters{}, cpu, memory_gb);
    }
    std::lock_guard lock(account->mutex);
    return policy_->admit(account->limits, account->counters, cpu, memory_gb);
}

Result<void> QuotaLedger::allocate(const UserId& user, uint32_t cpu, uint32_t memory_gb) {
    auto* account = find(user);
    if (account == nullptr) {
        return Error{ErrorCode::NotFound, "Unknown quota account: " + user};
    }

    std::lock_guard lock(account->mutex);
    if (auto admitted = policy_->admit(account->limits, account->counters, cpu, memory_gb);
        !admitted) {
        return admitted.error();
    }
    account->counters.used_instances += 1;
    account->counters.used_cpu += cpu;
    account->counters.used_memory_gb += memory_gb;
    return Result<void>{};
}

void QuotaLedger::release(const UserId& user, uint32_t cpu, uint32_t memory_gb) {
    auto* account = find(user);
    if (account == nullptr) return;

    std::lock_guard lock(account->mutex);
    auto& counters = account->counters;
    counters.used_instances = saturating_sub(counters.used_instances, 1);
    counters.used_cpu = saturating_sub(counters.used_cpu, cpu);
    counters.used_memory_gb = saturating_sub(counters.used_memory_gb, memory_gb);
}

Result<QuotaCounters> QuotaLedger::usage(const UserId& user) const {
    auto* account = find(user);
    if (account == nullptr) {
        return Error{ErrorCode::NotFound, "Unknown quota account: " + user};
    }
    std::lock_guard lock(account->mutex);
    return account->counters;
}

Result<QuotaSummary> QuotaLedger::summary(const UserId& user) const {
    auto* account = find(user);
    if (account == nullptr) {
        return Error{ErrorCode::NotFound, "Unknown quota account: " + user};
    }

    std::lock_guard lock(account->mutex);
    const auto& used = account->counters;
    const auto& limits = account->limits;

    QuotaSummary result;
    result.user_id = user;
    result.instances = make_dimension(used.used_instances, limits.max_instances);
    result.cpu = make_dimension(used.used_cpu, limits.max_cpu);
    result.memory_gb = make_dimension(used.used_memory_gb, limits.max_memory_gb);
    return result;
}

std::vector<UserId> QuotaLedger::users() const {
    std::shared_lock lock(accounts_mutex_);
    std::vector<UserId> ids;
    ids.reserve(accounts_.size());
    for (const auto& [id, account] : accounts_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace fleet_orchestrator
