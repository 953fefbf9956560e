#pragma once

#include "amisync/client.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace amisync {

enum class sync_state : uint8_t {
    disconnected,
    connecting,
    syncing,
    live,
};

[[nodiscard]] const char *to_string(sync_state state) noexcept;

struct worker_config {
    std::string database_path;

    // Overrides the `general_settings` row when set.
    std::optional<connect_config> connection;

    std::chrono::milliseconds backoff{ 5'000 };
    std::chrono::milliseconds liveness_poll{ 1'000 };
};

/**
 * Keeps the mirror in step with the manager: connect and log in, register the event callback, run a full sync and
 * reconcile agent display names, then follow events until the session drops. Any failure returns the worker to
 * `disconnected` and it retries after `backoff`, for as long as it lives.
 *
 * At most one worker runs per process. Destroying it stops the thread and allows a new one to start.
 */
class sync_worker {
public:
    static std::expected<sync_worker, std::error_code> start(worker_config config) noexcept;

    sync_worker(const sync_worker &) = delete;
    sync_worker &operator=(const sync_worker &) = delete;
    sync_worker(sync_worker &&) noexcept;
    sync_worker &operator=(sync_worker &&) noexcept;
    ~sync_worker() noexcept;

    void stop() noexcept;

    [[nodiscard]] sync_state state() const noexcept;

    // Blocks until the worker reaches `state` or the timeout elapses.
    [[nodiscard]] bool wait_for(sync_state state, std::chrono::milliseconds timeout) const;

private:
    class impl;
    std::unique_ptr<impl> impl_;

    [[nodiscard]] explicit sync_worker(std::unique_ptr<impl>) noexcept;
};

} // namespace amisync
