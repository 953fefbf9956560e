#pragma once

#include "amisync/client.hpp"
#include "amisync/errors.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"
#include "common/types.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <optional>
#include <system_error>

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace amisync::detail {

/**
 * Writes the whole buffer, waiting for the socket to drain while the peer is slow. A peer that stops reading for longer
 * than `timeout` is reported as `write_timeout`: part of a block may already be on the wire, so the session is over.
 */
[[nodiscard]] inline std::optional<disconnect_reason> send_all(common::valid_fd_t fd, const char *buf, size_t len,
                                                               std::chrono::milliseconds timeout) noexcept {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    size_t sent = 0;
    while (sent < len) {
        const ssize_t n = send(common::ts::get(fd), buf + sent, len - sent, MSG_NOSIGNAL | MSG_DONTWAIT);

        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }

            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return disconnect_reason::write_timeout;
                }

                const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
                pollfd pfd{ .fd = common::ts::get(fd), .events = POLLOUT, .revents = 0 };
                if (poll(&pfd, 1, static_cast<int>(remaining.count())) == -1 && errno != EINTR) {
                    PANIC("unexpected error: {}", std::strerror(errno));
                }
                continue;
            }

            if (errno == ECONNRESET || errno == EPIPE || errno == ETIMEDOUT || errno == EHOSTUNREACH) {
                return disconnect_reason::abrupt_tcp_disconnect;
            }

            if (errno == ENOMEM || errno == ENOBUFS) {
                PANIC("out of memory.");
            }

            PANIC("unexpected error: {}", std::strerror(errno));
        }

        DEBUG_ASSERT(n > 0);
        sent += n;
    }

    return std::nullopt;
}

/**
 * Waits up to `timeout` for the socket to become readable and then reads what is available. A quiet socket is not an
 * error: `read` is left at zero.
 */
[[nodiscard]] inline std::optional<disconnect_reason> recv_some(common::valid_fd_t fd, char *buf, size_t len,
                                                                std::chrono::milliseconds timeout,
                                                                size_t &read) noexcept {
    read = 0;

    pollfd pfd{ .fd = common::ts::get(fd), .events = POLLIN, .revents = 0 };
    const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == -1) {
        if (errno == EINTR) {
            return std::nullopt;
        }

        PANIC("unexpected error: {}", std::strerror(errno));
    }

    if (ready == 0) {
        return std::nullopt;
    }

    while (true) {
        const ssize_t n = recv(common::ts::get(fd), buf, len, MSG_DONTWAIT);

        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }

            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::nullopt;
            }

            if (errno == ECONNRESET || errno == ETIMEDOUT || errno == EHOSTUNREACH) {
                return disconnect_reason::abrupt_tcp_disconnect;
            }

            if (errno == ENOMEM || errno == ENOBUFS) {
                PANIC("out of memory.");
            }

            PANIC("unexpected error: {}", std::strerror(errno));
        }

        if (n == 0) {
            return disconnect_reason::orderly_tcp_disconnect;
        }

        read = static_cast<size_t>(n);
        return std::nullopt;
    }
}

/**
 * Connects a non-blocking socket, giving up once `timeout` elapses. An empty code means connected.
 */
[[nodiscard]] inline std::error_code connect_within(int fd, const sockaddr *addr, socklen_t addrlen,
                                                    std::chrono::milliseconds timeout) noexcept {
    if (::connect(fd, addr, addrlen) == 0) {
        return {};
    }

    if (errno != EINPROGRESS && errno != EINTR) {
        return { errno, std::system_category() };
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return make_amisync_error(errc::connect_timeout);
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{ .fd = fd, .events = POLLOUT, .revents = 0 };
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }

            return { errno, std::system_category() };
        }

        if (ready > 0) {
            break;
        }
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == -1) {
        return { errno, std::system_category() };
    }

    if (error != 0) {
        return { error, std::system_category() };
    }

    return {};
}

} // namespace amisync::detail
