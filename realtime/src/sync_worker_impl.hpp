#pragma once

#include "amisync/mirror_store.hpp"
#include "amisync/sync_worker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>

namespace amisync {

class sync_worker::impl {
    friend class sync_worker;

public:
    [[nodiscard]] impl(worker_config config, mirror_store store) noexcept;

    impl(const impl &) = delete;
    impl &operator=(const impl &) = delete;
    impl(impl &&) = delete;
    impl &operator=(impl &&) = delete;
    ~impl();

    void start_thread();

private:
    worker_config config_;
    mirror_store store_;

    std::atomic<sync_state> state_{ sync_state::disconnected };
    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;

    // NOTE: Declared last, the thread uses every member above.
    std::jthread thread_;

    void run(const std::stop_token &token) noexcept;
    void run_session(const std::stop_token &token);

    [[nodiscard]] std::expected<connect_config, std::error_code> resolve_config() const noexcept;
    void set_state(sync_state state) noexcept;

    // False when woken by a stop request.
    [[nodiscard]] bool pause(std::chrono::milliseconds duration, const std::stop_token &token) const;
};

} // namespace amisync
