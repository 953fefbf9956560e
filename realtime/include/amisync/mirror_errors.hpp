#pragma once

#include "common/assert.hpp"

#include <cstdint>
#include <string>
#include <system_error>

#include <sqlite3.h>

namespace amisync {

// ============================================================================
// Mirror errors.
// ============================================================================

// NOLINTNEXTLINE(readability-enum-initial-value)
enum class mirror_errc : uint8_t {
    worker_already_running = 1,
    settings_missing,

    first_ = worker_already_running,
    last_ = settings_missing,
};

struct mirror_category_t final : std::error_category {
    [[nodiscard]] const char *name() const noexcept override { return "amisync.mirror"; }

    [[nodiscard]] std::string message(int ev) const override {
        ASSERT(ev >= static_cast<int>(mirror_errc::first_));
        ASSERT(ev <= static_cast<int>(mirror_errc::last_));

        switch (static_cast<mirror_errc>(ev)) {
        case mirror_errc::worker_already_running:
            return "a sync worker is already running in this process";
        case mirror_errc::settings_missing:
            return "no manager host is configured in general_settings";
        default:
            return "unknown";
        }
    }
};

inline const std::error_category &mirror_category() noexcept {
    static mirror_category_t inst;
    return inst;
}

inline std::error_code make_mirror_error(mirror_errc e) noexcept { return { static_cast<int>(e), mirror_category() }; }

// ============================================================================
// SQLite errors.
// ============================================================================

struct sqlite_category_t final : std::error_category {
    [[nodiscard]] const char *name() const noexcept override { return "sqlite"; }

    [[nodiscard]] std::string message(int ev) const override {
        const char *s = ::sqlite3_errstr(ev);
        if (s == nullptr) {
            return "unknown";
        }

        return s;
    }
};

inline const std::error_category &sqlite_category() noexcept {
    static sqlite_category_t inst;
    return inst;
}

inline std::error_code make_sqlite_error(int rc) noexcept { return { rc, sqlite_category() }; }

} // namespace amisync
