#pragma once

#include "amisync/client.hpp"
#include "amisync/display.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace amisync {

// ============================================================================
// Rows.
// ============================================================================

struct queue_row {
    std::string name;
    std::string descr;

    bool operator==(const queue_row &) const = default;
};

struct agent_row {
    std::string agent;
    std::optional<std::string> name;

    bool operator==(const agent_row &) const = default;
};

struct member_row {
    std::string queue_name;
    std::string interface;
    int64_t penalty = 0;
    bool paused = false;
    std::optional<std::string> member_name;

    bool operator==(const member_row &) const = default;
};

/**
 * One membership observation. Absent `penalty` and `paused` leave the stored values alone (zero for a new row), and an
 * empty `member_name` never clears a stored one.
 */
struct member_update {
    std::string queue_name;
    std::string interface;
    std::optional<int64_t> penalty;
    std::optional<bool> paused;
    std::string member_name;
};

// ============================================================================
// Store.
// ============================================================================

/**
 * The relational mirror of queue state, shared with whatever reads the same database. Calls may come from any thread;
 * every call runs to completion before the next one starts.
 */
class mirror_store {
public:
    // Opens or creates the database and bootstraps any missing table.
    static std::expected<mirror_store, std::error_code> open(const std::string &path) noexcept;

    mirror_store(const mirror_store &) = delete;
    mirror_store &operator=(const mirror_store &) = delete;
    mirror_store(mirror_store &&) noexcept;
    mirror_store &operator=(mirror_store &&) noexcept;
    ~mirror_store() noexcept;

    // ---- Writes.

    // An empty `descr` stores the queue name as its description. Empty names are ignored.
    [[nodiscard]] std::error_code upsert_queue(std::string_view name, std::string_view descr = {}) noexcept;
    [[nodiscard]] std::error_code upsert_agent(std::string_view agent, std::string_view name = {}) noexcept;

    // Also upserts the member's queue and agent, all in one transaction.
    [[nodiscard]] std::error_code upsert_member(const member_update &update) noexcept;
    [[nodiscard]] std::error_code delete_member(std::string_view queue_name, std::string_view interface) noexcept;

    // Inserts when no mapping exists for the system name; an existing one is never replaced.
    [[nodiscard]] std::error_code ensure_agent_mapping(std::string_view system_name,
                                                       std::string_view display_name) noexcept;
    [[nodiscard]] std::error_code ensure_queue_mapping(std::string_view system_name,
                                                       std::string_view display_name) noexcept;

    // Replaces the stored manager settings with a single row.
    [[nodiscard]] std::error_code store_connect_config(const connect_config &config) noexcept;

    // ---- Reads.

    [[nodiscard]] std::expected<std::vector<queue_row>, std::error_code> queues() const noexcept;
    [[nodiscard]] std::expected<std::vector<agent_row>, std::error_code> agents() const noexcept;
    [[nodiscard]] std::expected<std::vector<member_row>, std::error_code> members() const noexcept;
    [[nodiscard]] std::expected<std::optional<std::string>, std::error_code>
    agent_mapping(std::string_view system_name) const noexcept;

    [[nodiscard]] std::expected<display_maps, std::error_code> load_display_maps() const noexcept;

    // Reads the first `general_settings` row; `settings_missing` when there is none or its host is empty.
    [[nodiscard]] std::expected<connect_config, std::error_code> load_connect_config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> impl_;

    [[nodiscard]] explicit mirror_store(std::unique_ptr<impl>) noexcept;
};

} // namespace amisync
