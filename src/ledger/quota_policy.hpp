/**
 * @file quota_policy.hpp
 * @brief Admission policies consulted by the quota ledger.
 *
 * The ledger always records usage; the policy decides whether a request may
 * be admitted at all. Swapping the policy changes admission without touching
 * any caller of QuotaLedger.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// IQuotaPolicy (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

class IQuotaPolicy {
public:
    virtual ~IQuotaPolicy() = default;

    /// Decide whether one more instance of (cpu, memory_gb) may be admitted.
    [[nodiscard]] virtual Result<void> admit(const QuotaLimits& limits,
                                             const QuotaCounters& used,
                                             uint32_t cpu,
                                             uint32_t memory_gb) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Usage-based accounting: every request is admitted and only
 *        recorded. Declared limits are reported, never enforced.
 */
class UsageBasedPolicy : public IQuotaPolicy {
public:
    [[nodiscard]] Result<void> admit(const QuotaLimits& /*limits*/,
                                     const QuotaCounters& /*used*/,
                                     uint32_t /*cpu*/,
                                     uint32_t /*memory_gb*/) const override {
        return Result<void>{};
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "usage_based"; }
};

/**
 * @brief Rejects a request with QuotaExceeded when it would push any counter
 *        past the user's declared limit.
 */
class HardCapPolicy : public IQuotaPolicy {
public:
    [[nodiscard]] Result<void> admit(const QuotaLimits& limits,
                                     const QuotaCounters& used,
                                     uint32_t cpu,
                                     uint32_t memory_gb) const override {
        if (used.used_instances + 1 > limits.max_instances) {
            return Error{ErrorCode::QuotaExceeded,
                         "Instance limit reached (" + std::to_string(limits.max_instances) + ")"};
        }
        if (used.used_cpu + cpu > limits.max_cpu) {
            return Error{ErrorCode::QuotaExceeded,
                         "CPU quota exceeded: " + std::to_string(used.used_cpu) + " + "
                         + std::to_string(cpu) + " > " + std::to_string(limits.max_cpu)};
        }
        if (used.used_memory_gb + memory_gb > limits.max_memory_gb) {
            return Error{ErrorCode::QuotaExceeded,
                         "Memory quota exceeded: " + std::to_string(used.used_memory_gb) + " + "
                         + std::to_string(memory_gb) + " > "
                         + std::to_string(limits.max_memory_gb) + " GB"};
        }
        return Result<void>{};
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "hard_cap"; }
};

}  // namespace fleet_orchestrator
