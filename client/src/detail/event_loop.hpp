#pragma once

#include "amisync/client.hpp"

#include "detail/framer.hpp"

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

namespace amisync::detail {
class correlator;
class subscribers;

class ev_loop {
public:
    [[nodiscard]] ev_loop(common::valid_fd_t fd, detail::framer framer, detail::correlator &correlator,
                          const detail::subscribers &subscribers, std::chrono::milliseconds poll_interval) noexcept;
    ~ev_loop();

    ev_loop(const ev_loop &) = delete;
    ev_loop &operator=(const ev_loop &) = delete;
    ev_loop(ev_loop &&) = delete;
    ev_loop &operator=(ev_loop &&) = delete;

    void start_thread();

    // Serialised against every other writer and bounded by `timeout`, including the wait for the lock. False when the
    // bytes were not sent; a write that stalls mid-block ends the session.
    [[nodiscard]] bool write(std::string_view bytes, std::chrono::milliseconds timeout) noexcept;

    void mark_disconnect(disconnect_reason reason) noexcept;
    [[nodiscard]] enum disconnect_reason disconnect_reason() const noexcept;
    [[nodiscard]] bool connected() const noexcept;

    [[nodiscard]] std::jthread &thread() noexcept { return thread_; }

private:
    common::valid_fd_t fd_;
    detail::framer framer_;
    detail::correlator &correlator_;
    const detail::subscribers &subscribers_;
    std::chrono::milliseconds poll_interval_;

    std::timed_mutex write_mutex_;
    std::atomic<enum disconnect_reason> disconnect_reason_{ disconnect_reason::none };

    std::jthread thread_;

    void run(const std::stop_token &token) noexcept;
    void route(record rec) noexcept;
    void drain() noexcept;
};

} // namespace amisync::detail
