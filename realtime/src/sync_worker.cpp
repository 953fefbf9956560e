#include "sync_worker_impl.hpp"

#include "amisync/client.hpp"
#include "amisync/mirror_errors.hpp"
#include "amisync/mirror_store.hpp"
#include "amisync/sync_worker.hpp"

#include "detail/sync.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <expected>
#include <memory>
#include <mutex>
#include <new>
#include <stop_token>
#include <system_error>
#include <utility>

namespace amisync {

namespace {

    // Held from a successful start() until the worker is destroyed.
    std::atomic<bool> worker_running{ false };

} // namespace

const char *to_string(sync_state state) noexcept {
    switch (state) {
    case sync_state::disconnected:
        return "disconnected";
    case sync_state::connecting:
        return "connecting";
    case sync_state::syncing:
        return "syncing";
    case sync_state::live:
        return "live";
    }

    ASSERT_UNREACHABLE();
}

// ============================================================================
// Forwarding.
// ============================================================================
sync_worker::sync_worker(std::unique_ptr<impl> pimpl) noexcept : impl_(std::move(pimpl)) {}
sync_worker::sync_worker(sync_worker &&other) noexcept = default;
sync_worker &sync_worker::operator=(sync_worker &&) noexcept = default;
sync_worker::~sync_worker() noexcept = default;

void sync_worker::stop() noexcept { impl_->thread_.request_stop(); }
sync_state sync_worker::state() const noexcept { return impl_->state_.load(std::memory_order_acquire); }

bool sync_worker::wait_for(sync_state state, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(impl_->mutex_);
    return impl_->cv_.wait_for(lock, timeout,
                               [this, state] { return impl_->state_.load(std::memory_order_acquire) == state; });
}

// ============================================================================
// Lifecycle.
// ============================================================================

std::expected<sync_worker, std::error_code> sync_worker::start(worker_config config) noexcept {
    // ----------------------------------------
    // (1) Claim the process-wide slot.
    // ----------------------------------------
    bool expected = false;
    if (!worker_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LOG_WARN("sync worker already running, refusing a second start.");
        return std::unexpected(make_mirror_error(mirror_errc::worker_already_running));
    }

    // ----------------------------------------
    // (2) Open the mirror.
    // ----------------------------------------
    auto store = mirror_store::open(config.database_path);
    if (!store) {
        worker_running.store(false, std::memory_order_release);
        return std::unexpected(store.error());
    }

    // ----------------------------------------
    // (3) Start the thread.
    // ----------------------------------------
    try {
        auto pimpl = std::make_unique<impl>(std::move(config), std::move(*store));
        pimpl->start_thread();

        return sync_worker(std::move(pimpl));
    } catch (const std::bad_alloc &) {
        PANIC("failed to allocate the sync worker.");
    } catch (const std::system_error &e) {
        LOG_ERROR("failed to start the sync worker thread: {}", e.what());
        worker_running.store(false, std::memory_order_release);
        return std::unexpected(e.code());
    }
}

sync_worker::impl::impl(worker_config config, mirror_store store) noexcept
    : config_(std::move(config)), store_(std::move(store)) {}

sync_worker::impl::~impl() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    worker_running.store(false, std::memory_order_release);
}

void sync_worker::impl::start_thread() {
    thread_ = std::jthread([this](const std::stop_token &token) { run(token); });
}

// ============================================================================
// Worker loop.
// ============================================================================

void sync_worker::impl::run(const std::stop_token &token) noexcept {
    LOG_INFO("sync worker started.");

    while (!token.stop_requested()) {
        try {
            run_session(token);
        } catch (const std::exception &e) {
            LOG_WARN("sync worker session failed: {}", e.what());
        }

        set_state(sync_state::disconnected);
        if (!pause(config_.backoff, token)) {
            break;
        }
    }

    set_state(sync_state::disconnected);
    LOG_INFO("sync worker stopped.");
}

void sync_worker::impl::run_session(const std::stop_token &token) {
    set_state(sync_state::connecting);

    // ---- (1) Connect.
    auto config = resolve_config();
    if (!config) {
        LOG_WARN("no manager settings available: {}", config.error().message());
        return;
    }

    auto cl = client::connect(*config);
    if (!cl) {
        LOG_WARN("failed to connect to {}:{}: {}", config->hostname, config->port, cl.error().message());
        return;
    }

    // ---- (2) Sync. The callback goes first so nothing that changes during the full sync is missed.
    set_state(sync_state::syncing);
    cl->on_event([this](const event &ev) { detail::apply_event(store_, ev); });

    if (auto ec = detail::full_sync(*cl, store_)) {
        LOG_WARN("full sync failed: {}", ec.message());
    }
    detail::sync_agent_mappings(*cl, store_);

    // ---- (3) Follow events until the session drops.
    set_state(sync_state::live);
    while (cl->connected() && pause(config_.liveness_poll, token)) {
    }

    if (cl->connected()) {
        cl->disconnect();
    } else {
        LOG_WARN("manager session lost, reconnecting in {}ms.", config_.backoff.count());
    }
}

std::expected<connect_config, std::error_code> sync_worker::impl::resolve_config() const noexcept {
    if (config_.connection) {
        try {
            return *config_.connection;
        } catch (const std::bad_alloc &) {
            PANIC("failed to copy the connection config.");
        }
    }

    return store_.load_connect_config();
}

void sync_worker::impl::set_state(sync_state state) noexcept {
    {
        std::lock_guard lock(mutex_);
        const auto previous = state_.exchange(state, std::memory_order_acq_rel);
        if (previous == state) {
            return;
        }

        LOG_INFO("sync worker {} -> {}.", to_string(previous), to_string(state));
    }

    cv_.notify_all();
}

bool sync_worker::impl::pause(std::chrono::milliseconds duration, const std::stop_token &token) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

} // namespace amisync
