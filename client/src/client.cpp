#include "client_impl.hpp"

#include "amisync/client.hpp"
#include "amisync/errors.hpp"

#include "detail/config.hpp"
#include "detail/framer.hpp"
#include "detail/network.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"
#include "common/util.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <memory>
#include <new>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace amisync {

// ============================================================================
// Forwarding.
// ============================================================================
client::client(std::unique_ptr<impl> pimpl) noexcept : impl_(std::move(pimpl)) {}
client::client(client &&other) noexcept = default;
client &client::operator=(client &&) noexcept = default;
client::~client() noexcept = default;

client::impl::impl(common::valid_fd_t fd, detail::framer framer, const connect_config &cfg)
    : action_timeout_(cfg.action_timeout), correlator_(detail::action_wait_slice),
      event_loop_(std::make_unique<detail::ev_loop>(fd, std::move(framer), correlator_, subscribers_,
                                                    cfg.poll_interval)) {}

std::vector<record> client::send_action(const action &act) { return impl_->send_action(act, impl_->action_timeout_); }

std::vector<record> client::send_action(const action &act, std::chrono::milliseconds timeout) {
    return impl_->send_action(act, timeout);
}

void client::on_event(event_handler handler) { impl_->subscribers_.add(std::move(handler)); }

void client::disconnect() noexcept { impl_->event_loop_->thread().request_stop(); }
bool client::connected() const noexcept { return impl_->event_loop_->connected(); }
enum disconnect_reason client::disconnect_reason() const noexcept { return impl_->event_loop_->disconnect_reason(); }
size_t client::pending_actions() const { return impl_->correlator_.pending_count(); }

// ============================================================================
// Implementation.
// ============================================================================
std::vector<record> client::impl::send_action(const action &act, std::chrono::milliseconds timeout) {
    DEBUG_ASSERT(!act.name.empty());

    if (!event_loop_->connected()) {
        LOG_DEBUG("not sending action {}, session is disconnected.", act.name);
        return {};
    }

    return correlator_.dispatch(
        act, [this, timeout](std::string_view wire) { return event_loop_->write(wire, timeout); }, timeout);
}

namespace {

    // Reads until the first complete record; whatever arrives after it stays buffered in `framer`.
    std::expected<record, std::error_code> read_login_reply(int fd, detail::framer &framer,
                                                            std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::array<char, detail::recv_chunk_size> chunk{};

        while (true) {
            if (auto rec = framer.next()) {
                return std::move(*rec);
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::unexpected(make_amisync_error(errc::login_timeout));
            }

            size_t read = 0;
            const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            if (auto failed = detail::recv_some(common::valid_fd_t(fd), chunk.data(), chunk.size(), remaining, read)) {
                return std::unexpected(make_amisync_error(errc::disconnected));
            }

            framer.feed(std::string_view(chunk.data(), read));
            if (framer.buffered() > detail::max_buffered_bytes) {
                return std::unexpected(make_amisync_error(errc::protocol));
            }
        }
    }

} // namespace

// ============================================================================
// Factory.
// ============================================================================
std::expected<client, std::error_code> client::connect(const connect_config &cfg) noexcept {
    // ----------------------------------------
    // (1) Validate.
    // ----------------------------------------
    if (cfg.hostname.empty()) {
        return std::unexpected(make_amisync_error(errc::setup_hostname_format));
    }

    if (cfg.port.empty()) {
        return std::unexpected(make_amisync_error(errc::setup_port_format));
    }

    if (cfg.username.empty()) {
        return std::unexpected(make_amisync_error(errc::setup_username_format));
    }

    if (cfg.secret.empty()) {
        return std::unexpected(make_amisync_error(errc::setup_secret_format));
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res{};
    int gai_c = getaddrinfo(cfg.hostname.c_str(), cfg.port.c_str(), &hints, &res);
    if (gai_c != 0) {
        LOG_CRITICAL("failed to resolve address.");

        if (gai_c == EAI_SYSTEM) {
            return std::unexpected(std::error_code(errno, std::system_category()));
        }

        return std::unexpected(make_gai_error(gai_c));
    }

    // ----------------------------------------
    // (2) Connect.
    // ----------------------------------------
    // NOTE: Sockets stay non-blocking; every later read and write is bounded by poll().
    const auto connect_deadline = std::chrono::steady_clock::now() + cfg.connect_timeout;
    bool timed_out = false;

    int cfd = -1;
    for (addrinfo *it = res; it != nullptr; it = it->ai_next) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= connect_deadline) {
            timed_out = true;
            break;
        }

        int fd = socket(it->ai_family, it->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, it->ai_protocol);
        if (fd == -1) {
            continue;
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(connect_deadline - now);
        if (auto ec = detail::connect_within(fd, it->ai_addr, it->ai_addrlen, remaining)) {
            LOG_DEBUG("connect attempt to {}:{} failed: {}", cfg.hostname, cfg.port, ec.message());
            timed_out = timed_out || ec == make_amisync_error(errc::connect_timeout);
            close(fd);
            continue;
        }

        cfd = fd;
        break;
    }
    freeaddrinfo(res);

    if (cfd == -1) {
        return std::unexpected(make_amisync_error(timed_out ? errc::connect_timeout : errc::setup_not_connectable));
    }

    // ----------------------------------------
    // (3) Request login and parse reply.
    // ----------------------------------------
    try {
        const record::field login_params[] = { // NOLINT(*-avoid-c-arrays)
            { "Username", cfg.username },
            { "Secret", cfg.secret },
            { "Events", cfg.events },
        };
        const std::string request = detail::encode_action("Login", {}, login_params);

        const auto failed = detail::send_all(common::valid_fd_t(cfd), request.data(), request.size(), cfg.login_timeout);
        if (failed) {
            LOG_CRITICAL("failed to send() login request.");
            common::preserving_close(cfd);
            return std::unexpected(make_amisync_error(errc::disconnected));
        }

        detail::framer framer;
        auto reply = read_login_reply(cfd, framer, cfg.login_timeout);
        if (!reply) {
            LOG_CRITICAL("failed to read login response: {}", reply.error().message());
            close(cfd);
            return std::unexpected(reply.error());
        }

        // ----------------------------------------
        // (4) Process response.
        // ----------------------------------------
        const auto response = reply->response();
        if (!response || !common::iequals(*response, "success")) {
            LOG_ERROR("login rejected for {}: {}", cfg.username, reply->value_or(fields::message, "no message"));
            close(cfd);
            return std::unexpected(make_amisync_error(errc::login_rejected));
        }

        LOG_INFO("login accepted for {}@{}:{}.", cfg.username, cfg.hostname, cfg.port);

        auto pimpl = std::make_unique<impl>(common::valid_fd_t(cfd), std::move(framer), cfg);
        try {
            pimpl->event_loop_->start_thread();
        } catch (const std::system_error &e) {
            LOG_CRITICAL("failed to start event loop thread: {}", e.what());
            pimpl->event_loop_->mark_disconnect(disconnect_reason::logoff);
            return std::unexpected(e.code());
        }

        return client(std::move(pimpl));
    } catch (const std::bad_alloc &) {
        PANIC("out of memory.");
    }
}

} // namespace amisync
