#include "detail/event_loop.hpp"

#include "detail/config.hpp"
#include "detail/correlator.hpp"
#include "detail/network.hpp"
#include "detail/subscribers.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"
#include "common/verify.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <new>
#include <optional>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include <unistd.h>

namespace amisync::detail {

ev_loop::ev_loop(common::valid_fd_t fd, detail::framer framer, detail::correlator &correlator,
                 const detail::subscribers &subscribers, std::chrono::milliseconds poll_interval) noexcept
    : fd_(fd), framer_(std::move(framer)), correlator_(correlator), subscribers_(subscribers),
      poll_interval_(poll_interval) {
    DEBUG_ASSERT(common::verify_fd(fd_));
    DEBUG_ASSERT(common::verify_stream_socket(fd_));
    DEBUG_ASSERT(poll_interval_.count() > 0);
}

ev_loop::~ev_loop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    if (close(common::ts::get(fd_)) == -1) {
        LOG_ERROR("failed to close connected fd: {}", std::strerror(errno));
    }
}

// ============================================================================
// Helpers.
// ============================================================================
void ev_loop::start_thread() {
    thread_ = std::jthread([this](const std::stop_token &token) { this->run(token); });
}

bool ev_loop::write(std::string_view bytes, std::chrono::milliseconds timeout) noexcept {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock lock(write_mutex_, deadline);
    if (!lock.owns_lock()) {
        LOG_WARN("gave up waiting {}ms for another writer.", timeout.count());
        return false;
    }

    if (!connected()) {
        return false;
    }

    const auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    const auto remaining = std::max(left, std::chrono::milliseconds(1));
    if (auto failed = detail::send_all(fd_, bytes.data(), bytes.size(), remaining)) {
        mark_disconnect(*failed);
        return false;
    }

    return true;
}

void ev_loop::mark_disconnect(enum disconnect_reason reason) noexcept {
    DEBUG_ASSERT(reason != disconnect_reason::none);

    auto expected = disconnect_reason::none;
    if (!disconnect_reason_.compare_exchange_strong(expected, reason, std::memory_order_relaxed)) {
        return;
    }

    const char *reason_str = [reason]() {
        switch (reason) {
        case disconnect_reason::logoff:
            return "logoff";
        case disconnect_reason::abrupt_tcp_disconnect:
            return "abrupt_tcp_disconnect";
        case disconnect_reason::orderly_tcp_disconnect:
            return "orderly_tcp_disconnect";
        case disconnect_reason::proto_excessive_length:
            return "proto_excessive_length";
        case disconnect_reason::write_timeout:
            return "write_timeout";

        case disconnect_reason::none:
            ASSERT_UNREACHABLE();
            break;
        }

        ASSERT_UNREACHABLE();
        return "unknown";
    }();

    LOG_INFO("event loop disconnecting: {}", reason_str);
}

enum disconnect_reason ev_loop::disconnect_reason() const noexcept {
    return disconnect_reason_.load(std::memory_order_relaxed);
}

bool ev_loop::connected() const noexcept { return disconnect_reason() == disconnect_reason::none; }

void ev_loop::route(record rec) noexcept {
    try {
        std::visit(
            [this](auto &&routed) {
                using routed_t = std::decay_t<decltype(routed)>;

                if constexpr (std::is_same_v<routed_t, detail::action_response>) {
                    LOG_TRACE("routing response for {}.", routed.rec.value_or(fields::action_id));
                    routed.target->push(std::move(routed.rec));
                } else if constexpr (std::is_same_v<routed_t, event>) {
                    LOG_TRACE("publishing event {}.", routed.name());
                    subscribers_.publish(routed);
                } else {
                    LOG_DEBUG("dropping unroutable record ({} fields).", routed.rec.size());
                }
            },
            correlator_.classify(std::move(rec)));
    } catch (const std::exception &e) {
        LOG_ERROR("failed to route record: {}", e.what());
    }
}

void ev_loop::drain() noexcept {
    try {
        while (auto rec = framer_.next()) {
            route(std::move(*rec));
        }
    } catch (const std::bad_alloc &) {
        PANIC("out of memory.");
    }
}

// ============================================================================
// Event loop.
// ============================================================================
void ev_loop::run(const std::stop_token &token) noexcept {
    // NOTE: Bytes that followed the login reply were buffered during the handshake.
    drain();

    std::array<char, detail::recv_chunk_size> chunk{};
    while (!token.stop_requested() && connected()) {
        // ----------------------------------------
        // (1) Receive.
        // ----------------------------------------
        size_t read = 0;
        if (auto failed = detail::recv_some(fd_, chunk.data(), chunk.size(), poll_interval_, read)) {
            mark_disconnect(*failed);
            break;
        }

        if (read == 0) {
            continue;
        }

        // ----------------------------------------
        // (2) Frame and route.
        // ----------------------------------------
        try {
            framer_.feed(std::string_view(chunk.data(), read));
        } catch (const std::bad_alloc &) {
            PANIC("out of memory.");
        }
        drain();

        if (framer_.buffered() > detail::max_buffered_bytes) {
            mark_disconnect(disconnect_reason::proto_excessive_length);
            break;
        }
    }

    // NOTE: If no error was set, then the user thread requested we log off.
    if (connected()) {
        DEBUG_ASSERT(token.stop_requested());

        static constexpr std::string_view logoff = "Action: Logoff\r\n\r\n";
        {
            std::unique_lock lock(write_mutex_, std::chrono::steady_clock::now() + detail::logoff_timeout);
            if (!lock.owns_lock()) {
                mark_disconnect(disconnect_reason::write_timeout);
                return;
            }
            if (auto failed = detail::send_all(fd_, logoff.data(), logoff.size(), detail::logoff_timeout)) {
                mark_disconnect(*failed);
                return;
            }
        }

        mark_disconnect(disconnect_reason::logoff);
    }
}

} // namespace amisync::detail
