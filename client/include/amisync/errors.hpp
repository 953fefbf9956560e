#pragma once

#include "common/assert.hpp"

#include <cstdint>
#include <string>
#include <system_error>

#include <netdb.h>

namespace amisync {

// ============================================================================
// amisync errors.
// ============================================================================

// NOLINTNEXTLINE(readability-enum-initial-value)
enum class errc : uint8_t {
    setup_hostname_format = 1,
    setup_port_format,
    setup_username_format,
    setup_secret_format,
    setup_not_connectable,
    connect_timeout,
    login_rejected,
    login_timeout,
    disconnected,
    protocol,

    first_ = setup_hostname_format,
    last_ = protocol,
};

struct amisync_category_t final : std::error_category {
    [[nodiscard]] const char *name() const noexcept override { return "amisync"; }

    [[nodiscard]] std::string message(int ev) const override {
        ASSERT(ev >= static_cast<int>(errc::first_));
        ASSERT(ev <= static_cast<int>(errc::last_));

        switch (static_cast<errc>(ev)) {
        case errc::setup_hostname_format:
            return "hostname was empty";
        case errc::setup_port_format:
            return "port was empty";
        case errc::setup_username_format:
            return "username was empty";
        case errc::setup_secret_format:
            return "secret was empty";
        case errc::setup_not_connectable:
            return "no resolved address for the given host and port was connectable";
        case errc::connect_timeout:
            return "no resolved address accepted the connection before the deadline";
        case errc::login_rejected:
            return "login was rejected by the manager";
        case errc::login_timeout:
            return "no login response arrived before the deadline";
        case errc::disconnected:
            return "the connection was closed during login";
        case errc::protocol:
            return "a protocol violation occured";
        default:
            return "unknown";
        }
    }
};

inline const std::error_category &amisync_category() noexcept {
    static amisync_category_t inst;
    return inst;
}

inline std::error_code make_amisync_error(errc e) noexcept { return { static_cast<int>(e), amisync_category() }; }

// ============================================================================
// getaddrinfo() errors.
// ============================================================================

struct gai_category_t final : std::error_category {
    [[nodiscard]] const char *name() const noexcept override { return "getaddrinfo"; }

    [[nodiscard]] std::string message(int ev) const override {
        const char *s = ::gai_strerror(ev);
        if (s == nullptr) {
            return "unknown";
        }

        return s;
    }
};

inline const std::error_category &gai_category() {
    static gai_category_t inst;
    return inst;
}

inline std::error_code make_gai_error(int eai_code) { return { eai_code, gai_category() }; }

} // namespace amisync
