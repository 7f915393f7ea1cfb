/**
 * @file result.hpp
 * @brief Monadic error handling type for FleetOrchestrator.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Expected
 * outcomes (no capacity, unknown instance, failed deployment) travel as typed
 * Error values; exceptions are reserved for genuine faults and are converted
 * at collaborator boundaries.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Internal,
    NotFound,               ///< Node, instance or user absent (or not owned)
    InvalidArgument,
    InvalidState,           ///< Lifecycle transition not permitted
    InsufficientCapacity,   ///< No worker can host the request
    QuotaExceeded,          ///< Rejected by a capping quota policy
    ResourceExhausted,      ///< Port range on a node is full
    DeploymentFailure,      ///< Deployment driver failed (after rollback)
    PersistenceFailure,     ///< Instance store read/write failed; retryable
    ConfigError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:             return "internal";
        case ErrorCode::NotFound:             return "not_found";
        case ErrorCode::InvalidArgument:      return "invalid_argument";
        case ErrorCode::InvalidState:         return "invalid_state";
        case ErrorCode::InsufficientCapacity: return "insufficient_capacity";
        case ErrorCode::QuotaExceeded:        return "quota_exceeded";
        case ErrorCode::ResourceExhausted:    return "resource_exhausted";
        case ErrorCode::DeploymentFailure:    return "deployment_failure";
        case ErrorCode::PersistenceFailure:   return "persistence_failure";
        case ErrorCode::ConfigError:          return "config_error";
    }
    return "unknown";
}

/**
 * @brief Requested versus largest single-node headroom, attached to
 *        InsufficientCapacity errors so callers can explain the shortfall.
 */
struct CapacityShortfall {
    uint32_t requested_cpu{0};
    uint32_t requested_memory_gb{0};
    uint32_t max_cpu_available{0};
    uint32_t max_memory_available_gb{0};
};

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::optional<CapacityShortfall> shortfall;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    /// Whether the caller may simply retry the same operation.
    [[nodiscard]] bool retryable() const noexcept {
        return code == ErrorCode::PersistenceFailure
            || code == ErrorCode::ResourceExhausted;
    }
};

/**
 * @brief Result<T, E> — a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

/// Build an InsufficientCapacity error with its shortfall attached.
inline Error insufficient_capacity(const CapacityShortfall& shortfall) {
    Error err{ErrorCode::InsufficientCapacity,
              "Requested " + std::to_string(shortfall.requested_cpu) + " vCPU and "
              + std::to_string(shortfall.requested_memory_gb)
              + " GB RAM, but max available is "
              + std::to_string(shortfall.max_cpu_available) + " vCPU and "
              + std::to_string(shortfall.max_memory_available_gb) + " GB RAM"};
    err.shortfall = shortfall;
    return err;
}

}  // namespace fleet_orchestrator
