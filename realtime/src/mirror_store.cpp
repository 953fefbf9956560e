#include "amisync/mirror_store.hpp"

#include "amisync/mirror_errors.hpp"

#include "detail/sqlite.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace amisync {

namespace {

    constexpr int busy_timeout_ms = 5000;

    constexpr const char *schema_sql = R"sql(
        CREATE TABLE IF NOT EXISTS queues_new (
            queuename TEXT PRIMARY KEY,
            descr TEXT
        );
        CREATE TABLE IF NOT EXISTS agents_new (
            agent TEXT PRIMARY KEY,
            name TEXT
        );
        CREATE TABLE IF NOT EXISTS queue_members (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            queue_name TEXT NOT NULL,
            interface TEXT NOT NULL,
            penalty INTEGER NOT NULL DEFAULT 0,
            paused INTEGER NOT NULL DEFAULT 0,
            member_name TEXT,
            UNIQUE (queue_name, interface)
        );
        CREATE INDEX IF NOT EXISTS idx_queue_members_queue_name ON queue_members (queue_name);
        CREATE INDEX IF NOT EXISTS idx_queue_members_interface ON queue_members (interface);
        CREATE TABLE IF NOT EXISTS agent_display_mapping (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            agent_system_name TEXT NOT NULL UNIQUE,
            agent_display_name TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS queue_display_mapping (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            queue_system_name TEXT NOT NULL UNIQUE,
            queue_display_name TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS general_settings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ami_host TEXT NOT NULL DEFAULT 'localhost',
            ami_port INTEGER NOT NULL DEFAULT 5038,
            ami_user TEXT NOT NULL DEFAULT 'admin',
            ami_password TEXT NOT NULL DEFAULT ''
        );
    )sql";

    constexpr const char *upsert_queue_sql = R"sql(
        INSERT INTO queues_new (queuename, descr) VALUES (?1, ?2)
        ON CONFLICT (queuename) DO UPDATE SET descr = excluded.descr
    )sql";

    constexpr const char *upsert_agent_sql = R"sql(
        INSERT INTO agents_new (agent, name) VALUES (?1, NULLIF(?2, ''))
        ON CONFLICT (agent) DO UPDATE SET name = COALESCE(excluded.name, agents_new.name)
    )sql";

    constexpr const char *upsert_member_sql = R"sql(
        INSERT INTO queue_members (queue_name, interface, penalty, paused, member_name)
        VALUES (?1, ?2, COALESCE(?3, 0), COALESCE(?4, 0), NULLIF(?5, ''))
        ON CONFLICT (queue_name, interface) DO UPDATE SET
            penalty = COALESCE(?3, queue_members.penalty),
            paused = COALESCE(?4, queue_members.paused),
            member_name = COALESCE(excluded.member_name, queue_members.member_name)
    )sql";

    constexpr const char *delete_member_sql = "DELETE FROM queue_members WHERE queue_name = ?1 AND interface = ?2";

    constexpr const char *insert_agent_mapping_sql =
        "INSERT OR IGNORE INTO agent_display_mapping (agent_system_name, agent_display_name) VALUES (?1, ?2)";
    constexpr const char *insert_queue_mapping_sql =
        "INSERT OR IGNORE INTO queue_display_mapping (queue_system_name, queue_display_name) VALUES (?1, ?2)";

    constexpr const char *insert_settings_sql =
        "INSERT INTO general_settings (ami_host, ami_port, ami_user, ami_password) VALUES (?1, ?2, ?3, ?4)";

    std::error_code run(sqlite3 *db, const char *sql, const auto &...args) noexcept {
        detail::stmt_guard stmt;
        if (auto ec = detail::prepare(db, sql, stmt)) {
            return ec;
        }
        if (auto ec = detail::bind_all(db, stmt, args...)) {
            return ec;
        }

        return detail::step_done(db, stmt);
    }

    template <typename Row, typename ReadRow>
    std::expected<std::vector<Row>, std::error_code> select_all(sqlite3 *db, const char *sql, ReadRow read_row,
                                                                const auto &...args) noexcept {
        detail::stmt_guard stmt;
        if (auto ec = detail::prepare(db, sql, stmt)) {
            return std::unexpected(ec);
        }
        if (auto ec = detail::bind_all(db, stmt, args...)) {
            return std::unexpected(ec);
        }

        try {
            std::vector<Row> rows;
            while (true) {
                const int rc = sqlite3_step(stmt.get());
                if (rc == SQLITE_DONE) {
                    return rows;
                }
                if (rc != SQLITE_ROW) {
                    LOG_WARN("sqlite step failed: {}", sqlite3_errmsg(db));
                    return std::unexpected(make_sqlite_error(rc));
                }

                rows.push_back(read_row(stmt));
            }
        } catch (const std::bad_alloc &) {
            PANIC("failed to allocate rows for a mirror read.");
        }
    }

    // Rolls back unless committed.
    class transaction {
    public:
        explicit transaction(sqlite3 *db) noexcept : db_(db) {}
        ~transaction() {
            if (open_) {
                if (auto ec = detail::exec(db_, "ROLLBACK;")) {
                    LOG_ERROR("failed to roll back a mirror transaction: {}", ec.message());
                }
            }
        }

        transaction(const transaction &) = delete;
        transaction &operator=(const transaction &) = delete;
        transaction(transaction &&) = delete;
        transaction &operator=(transaction &&) = delete;

        [[nodiscard]] std::error_code begin() noexcept {
            auto ec = detail::exec(db_, "BEGIN IMMEDIATE;");
            open_ = !ec;
            return ec;
        }

        [[nodiscard]] std::error_code commit() noexcept {
            auto ec = detail::exec(db_, "COMMIT;");
            open_ = static_cast<bool>(ec);
            return ec;
        }

    private:
        sqlite3 *db_;
        bool open_ = false;
    };

} // namespace

// ============================================================================
// Implementation.
// ============================================================================

class mirror_store::impl {
public:
    explicit impl(sqlite3 *db) noexcept : db_(db) {}
    ~impl() { sqlite3_close_v2(db_); }

    impl(const impl &) = delete;
    impl &operator=(const impl &) = delete;
    impl(impl &&) = delete;
    impl &operator=(impl &&) = delete;

    [[nodiscard]] sqlite3 *db() const noexcept { return db_; }
    [[nodiscard]] std::unique_lock<std::mutex> lock() const { return std::unique_lock(mutex_); }

    std::error_code upsert_queue(std::string_view name, std::string_view descr) noexcept {
        if (name.empty()) {
            return {};
        }

        return run(db_, upsert_queue_sql, name, descr.empty() ? name : descr);
    }

    std::error_code upsert_agent(std::string_view agent, std::string_view name) noexcept {
        if (agent.empty()) {
            return {};
        }

        return run(db_, upsert_agent_sql, agent, name);
    }

private:
    sqlite3 *db_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Lifecycle.
// ============================================================================

std::expected<mirror_store, std::error_code> mirror_store::open(const std::string &path) noexcept {
    sqlite3 *db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;

    if (const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr); rc != SQLITE_OK) {
        LOG_ERROR("failed to open mirror database '{}': {}", path, sqlite3_errstr(rc));
        sqlite3_close_v2(db);
        return std::unexpected(make_sqlite_error(rc));
    }

    sqlite3_busy_timeout(db, busy_timeout_ms);

    if (auto ec = detail::exec(db, schema_sql)) {
        LOG_ERROR("failed to bootstrap the mirror schema in '{}': {}", path, ec.message());
        sqlite3_close_v2(db);
        return std::unexpected(ec);
    }

    try {
        LOG_INFO("opened mirror database '{}'.", path);
        return mirror_store(std::make_unique<impl>(db));
    } catch (const std::bad_alloc &) {
        PANIC("failed to allocate the mirror store.");
    }
}

mirror_store::mirror_store(std::unique_ptr<impl> p) noexcept : impl_(std::move(p)) {}
mirror_store::mirror_store(mirror_store &&) noexcept = default;
mirror_store &mirror_store::operator=(mirror_store &&) noexcept = default;
mirror_store::~mirror_store() noexcept = default;

// ============================================================================
// Writes.
// ============================================================================

std::error_code mirror_store::upsert_queue(std::string_view name, std::string_view descr) noexcept {
    auto lock = impl_->lock();
    return impl_->upsert_queue(name, descr);
}

std::error_code mirror_store::upsert_agent(std::string_view agent, std::string_view name) noexcept {
    auto lock = impl_->lock();
    return impl_->upsert_agent(agent, name);
}

std::error_code mirror_store::upsert_member(const member_update &update) noexcept {
    if (update.queue_name.empty() || update.interface.empty()) {
        return {};
    }

    auto lock = impl_->lock();
    transaction txn(impl_->db());

    if (auto ec = txn.begin()) {
        return ec;
    }
    if (auto ec = impl_->upsert_queue(update.queue_name, update.queue_name)) {
        return ec;
    }
    if (auto ec = impl_->upsert_agent(update.interface, update.member_name)) {
        return ec;
    }

    std::optional<int64_t> paused;
    if (update.paused) {
        paused = *update.paused ? 1 : 0;
    }

    if (auto ec = run(impl_->db(), upsert_member_sql, std::string_view(update.queue_name),
                      std::string_view(update.interface), update.penalty, paused, std::string_view(update.member_name))) {
        return ec;
    }

    return txn.commit();
}

std::error_code mirror_store::delete_member(std::string_view queue_name, std::string_view interface) noexcept {
    if (queue_name.empty() || interface.empty()) {
        return {};
    }

    auto lock = impl_->lock();
    return run(impl_->db(), delete_member_sql, queue_name, interface);
}

std::error_code mirror_store::ensure_agent_mapping(std::string_view system_name,
                                                   std::string_view display_name) noexcept {
    if (system_name.empty() || display_name.empty()) {
        return {};
    }

    auto lock = impl_->lock();
    return run(impl_->db(), insert_agent_mapping_sql, system_name, display_name);
}

std::error_code mirror_store::ensure_queue_mapping(std::string_view system_name,
                                                   std::string_view display_name) noexcept {
    if (system_name.empty() || display_name.empty()) {
        return {};
    }

    auto lock = impl_->lock();
    return run(impl_->db(), insert_queue_mapping_sql, system_name, display_name);
}

std::error_code mirror_store::store_connect_config(const connect_config &config) noexcept {
    auto lock = impl_->lock();
    transaction txn(impl_->db());

    if (auto ec = txn.begin()) {
        return ec;
    }
    if (auto ec = detail::exec(impl_->db(), "DELETE FROM general_settings;")) {
        return ec;
    }
    if (auto ec = run(impl_->db(), insert_settings_sql, std::string_view(config.hostname),
                      std::string_view(config.port), std::string_view(config.username),
                      std::string_view(config.secret))) {
        return ec;
    }

    return txn.commit();
}

// ============================================================================
// Reads.
// ============================================================================

std::expected<std::vector<queue_row>, std::error_code> mirror_store::queues() const noexcept {
    auto lock = impl_->lock();
    return select_all<queue_row>(
        impl_->db(), "SELECT queuename, descr FROM queues_new ORDER BY queuename",
        [](const detail::stmt_guard &stmt) { return queue_row{ .name = stmt.text(0), .descr = stmt.text(1) }; });
}

std::expected<std::vector<agent_row>, std::error_code> mirror_store::agents() const noexcept {
    auto lock = impl_->lock();
    return select_all<agent_row>(
        impl_->db(), "SELECT agent, name FROM agents_new ORDER BY agent",
        [](const detail::stmt_guard &stmt) { return agent_row{ .agent = stmt.text(0), .name = stmt.nullable_text(1) }; });
}

std::expected<std::vector<member_row>, std::error_code> mirror_store::members() const noexcept {
    auto lock = impl_->lock();
    return select_all<member_row>(
        impl_->db(),
        "SELECT queue_name, interface, penalty, paused, member_name FROM queue_members ORDER BY queue_name, interface",
        [](const detail::stmt_guard &stmt) {
            return member_row{
                .queue_name = stmt.text(0),
                .interface = stmt.text(1),
                .penalty = stmt.integer(2),
                .paused = stmt.integer(3) != 0,
                .member_name = stmt.nullable_text(4),
            };
        });
}

std::expected<std::optional<std::string>, std::error_code>
mirror_store::agent_mapping(std::string_view system_name) const noexcept {
    auto lock = impl_->lock();
    auto rows = select_all<std::string>(
        impl_->db(), "SELECT agent_display_name FROM agent_display_mapping WHERE agent_system_name = ?1",
        [](const detail::stmt_guard &stmt) { return stmt.text(0); }, system_name);

    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->empty()) {
        return std::optional<std::string>{};
    }

    return std::optional(std::move(rows->front()));
}

std::expected<display_maps, std::error_code> mirror_store::load_display_maps() const noexcept {
    using mapping = std::pair<std::string, std::string>;
    const auto read_mapping = [](const detail::stmt_guard &stmt) { return mapping{ stmt.text(0), stmt.text(1) }; };

    auto lock = impl_->lock();

    auto agents = select_all<mapping>(
        impl_->db(), "SELECT agent_system_name, agent_display_name FROM agent_display_mapping ORDER BY id", read_mapping);
    if (!agents) {
        return std::unexpected(agents.error());
    }

    auto queues = select_all<mapping>(
        impl_->db(), "SELECT queue_system_name, queue_display_name FROM queue_display_mapping ORDER BY id", read_mapping);
    if (!queues) {
        return std::unexpected(queues.error());
    }

    try {
        display_maps maps;
        for (const auto &[system_name, display_name] : *agents) {
            maps.add_agent(system_name, display_name);
        }
        for (const auto &[system_name, display_name] : *queues) {
            maps.add_queue(system_name, display_name);
        }

        return maps;
    } catch (const std::bad_alloc &) {
        PANIC("failed to allocate display maps.");
    }
}

std::expected<connect_config, std::error_code> mirror_store::load_connect_config() const noexcept {
    auto lock = impl_->lock();
    auto rows = select_all<connect_config>(
        impl_->db(), "SELECT ami_host, ami_port, ami_user, ami_password FROM general_settings ORDER BY id LIMIT 1",
        [](const detail::stmt_guard &stmt) {
            return connect_config{
                .hostname = stmt.text(0),
                .port = stmt.text(1),
                .username = stmt.text(2),
                .secret = stmt.text(3),
            };
        });

    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->empty() || rows->front().hostname.empty()) {
        return std::unexpected(make_mirror_error(mirror_errc::settings_missing));
    }

    return std::move(rows->front());
}

} // namespace amisync
