/**
 * @file tcp_probe.hpp
 * @brief Bounded-time TCP handshake used as the node reachability check.
 *
 * Opens a non-blocking socket, waits for the handshake with poll() and
 * classifies the result. Refusal (RST) is reported separately from timeout:
 * a refusing host is alive, a silent one is not.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace fleet_orchestrator {

class TcpProbe {
public:
    /**
     * @brief Attempt a TCP handshake to address:port within timeout_ms.
     *
     * Accepts dotted IPv4 literals only, so the whole call stays inside the
     * timeout; anything else is a TransportError. Stateless: safe to call
     * concurrently.
     */
    [[nodiscard]] ProbeOutcome connect_probe(const std::string& address,
                                             uint16_t port,
                                             uint32_t timeout_ms) const;
};

static_assert(ProbeTransportLike<TcpProbe>);

}  // namespace fleet_orchestrator
