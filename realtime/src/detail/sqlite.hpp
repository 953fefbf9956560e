#pragma once

#include "amisync/mirror_errors.hpp"

#include "common/log.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <sqlite3.h>

namespace amisync::detail {

// ============================================================================
// Statements.
// ============================================================================

class stmt_guard {
public:
    stmt_guard() = default;
    explicit stmt_guard(sqlite3_stmt *stmt) noexcept : stmt_(stmt) {}
    ~stmt_guard() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    stmt_guard(const stmt_guard &) = delete;
    stmt_guard &operator=(const stmt_guard &) = delete;
    stmt_guard(stmt_guard &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
    stmt_guard &operator=(stmt_guard &&other) noexcept {
        if (this != &other) {
            if (stmt_ != nullptr) {
                sqlite3_finalize(stmt_);
            }
            stmt_ = other.stmt_;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    [[nodiscard]] sqlite3_stmt *get() const noexcept { return stmt_; }

    // ---- Binding.

    [[nodiscard]] int bind(int idx, std::string_view value) noexcept {
        return sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    [[nodiscard]] int bind(int idx, int64_t value) noexcept { return sqlite3_bind_int64(stmt_, idx, value); }

    [[nodiscard]] int bind(int idx, std::optional<int64_t> value) noexcept {
        return value ? bind(idx, *value) : sqlite3_bind_null(stmt_, idx);
    }

    // ---- Columns.

    [[nodiscard]] std::string text(int col) const {
        const auto *text = sqlite3_column_text(stmt_, col);
        if (text == nullptr) {
            return {};
        }

        return { reinterpret_cast<const char *>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)) };
    }

    [[nodiscard]] std::optional<std::string> nullable_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }

        return text(col);
    }

    [[nodiscard]] int64_t integer(int col) const noexcept { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3_stmt *stmt_ = nullptr;
};

// ============================================================================
// Helpers.
// ============================================================================

inline std::error_code exec(sqlite3 *db, const char *sql) noexcept {
    char *err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        LOG_WARN("sqlite exec failed: {}", err != nullptr ? err : sqlite3_errstr(rc));
        sqlite3_free(err);
        return make_sqlite_error(rc);
    }

    return {};
}

inline std::error_code prepare(sqlite3 *db, const char *sql, stmt_guard &out) noexcept {
    sqlite3_stmt *stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db));
        return make_sqlite_error(rc);
    }

    out = stmt_guard(stmt);
    return {};
}

// Steps a statement that must not yield rows.
inline std::error_code step_done(sqlite3 *db, stmt_guard &stmt) noexcept {
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        LOG_WARN("sqlite step failed: {}", sqlite3_errmsg(db));
        return make_sqlite_error(rc);
    }

    return {};
}

inline std::error_code check_bind(sqlite3 *db, int rc) noexcept {
    if (rc != SQLITE_OK) {
        LOG_WARN("sqlite bind failed: {}", sqlite3_errmsg(db));
        return make_sqlite_error(rc);
    }

    return {};
}

// Binds `args` to parameters 1..N in order.
template <typename... Args>
std::error_code bind_all(sqlite3 *db, stmt_guard &stmt, const Args &...args) noexcept {
    int idx = 0;
    int rc = SQLITE_OK;
    ((rc = (rc == SQLITE_OK) ? stmt.bind(++idx, args) : rc), ...);
    return check_bind(db, rc);
}

} // namespace amisync::detail
