/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for FleetOrchestrator interfaces.
 *
 * The probe transport is called once per node per probe round from many
 * worker threads, so it is bound statically instead of through a vtable.
 * Collaborators configured once at startup (registry, capacity feed,
 * deployment driver, store) use virtual interfaces instead.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <cstdint>
#include <string>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// ProbeTransportLike
// ─────────────────────────────────────────────

/**
 * @concept ProbeTransportLike
 * @brief Constrains types that can attempt a bounded TCP handshake.
 *
 * Implementations must be safe to call concurrently from several threads
 * and must report refusal separately from timeout.
 */
template <typename T>
concept ProbeTransportLike = requires(
    const T transport,
    const std::string& address,
    uint16_t port,
    uint32_t timeout_ms
) {
    { transport.connect_probe(address, port, timeout_ms) } -> std::same_as<ProbeOutcome>;
};

}  // namespace fleet_orchestrator
