/**
 * @file tcp_probe.cpp
 * @brief TcpProbe implementation: non-blocking connect with poll() timeout.
 */

#include "network/tcp_probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fleet_orchestrator {

namespace {

/**
 * @brief Owns a socket descriptor for the duration of one probe.
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

private:
    int fd_;
};

/// Only dotted-quad literals are accepted; name resolution has no deadline.
bool parse_ipv4(const std::string& address, in_addr& out) {
    return ::inet_pton(AF_INET, address.c_str(), &out) == 1;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    return std::round(static_cast<double>(us) / 10.0) / 100.0;
}

ProbeOutcome classify_errno(int err, std::chrono::steady_clock::time_point start) {
    if (err == ECONNREFUSED) {
        return {ProbeOutcome::Kind::Refused, elapsed_ms(start), std::strerror(err)};
    }
    if (err == ETIMEDOUT) {
        return {ProbeOutcome::Kind::TimedOut, elapsed_ms(start), std::strerror(err)};
    }
    return {ProbeOutcome::Kind::TransportError, elapsed_ms(start), std::strerror(err)};
}

}  // anonymous namespace

ProbeOutcome TcpProbe::connect_probe(const std::string& address,
                                     uint16_t port,
                                     uint32_t timeout_ms) const {
    auto start = std::chrono::steady_clock::now();

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    if (!parse_ipv4(address, target.sin_addr)) {
        return {ProbeOutcome::Kind::TransportError, elapsed_ms(start),
                "Invalid address: " + address};
    }

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (sock.get() < 0) {
        return {ProbeOutcome::Kind::TransportError, elapsed_ms(start),
                "Failed to create socket: " + std::string(std::strerror(errno))};
    }

    int ret = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&target), sizeof(target));
    if (ret == 0) {
        return {ProbeOutcome::Kind::Connected, elapsed_ms(start), {}};
    }
    if (errno != EINPROGRESS) {
        return classify_errno(errno, start);
    }

    // Wait for the handshake, restarting poll() on EINTR with the remaining budget
    auto deadline = start + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return {ProbeOutcome::Kind::TimedOut, elapsed_ms(start), "Connect timed out"};
        }

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready == 0) {
            return {ProbeOutcome::Kind::TimedOut, elapsed_ms(start), "Connect timed out"};
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            return classify_errno(errno, start);
        }
        break;
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return classify_errno(errno, start);
    }
    if (err != 0) {
        return classify_errno(err, start);
    }

    ::shutdown(sock.get(), SHUT_RDWR);
    return {ProbeOutcome::Kind::Connected, elapsed_ms(start), {}};
}

}  // namespace fleet_orchestrator
