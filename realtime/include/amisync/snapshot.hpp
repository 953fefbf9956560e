#pragma once

#include "amisync/client.hpp"
#include "amisync/display.hpp"
#include "amisync/record.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace amisync {

// ============================================================================
// Channel ranking.
// ============================================================================

struct channel_rank {
    int app_priority = 0;
    int known_parties = 0;
    int64_t duration = 0;

    auto operator<=>(const channel_rank &) const = default;
};

// Digits are seconds, `HH:MM:SS` is converted; anything else is zero.
[[nodiscard]] int64_t duration_to_seconds(std::string_view value) noexcept;

[[nodiscard]] channel_rank rank_channel(const record &row) noexcept;

/**
 * Collapses the legs of each call into one row. Only `CoreShowChannel` rows take part and `Message/` channels are
 * dropped. Rows are grouped by `Linkedid`, falling back to the bridge id; a row with neither is a group of its own.
 * Each group keeps its highest ranked row, and groups come out in order of first appearance.
 */
[[nodiscard]] std::vector<record> dedupe_channels(std::span<const record> rows);

// ============================================================================
// Snapshot.
// ============================================================================

struct snapshot_filters {
    std::vector<std::string> queues;
    std::string channel;
    std::string caller;
};

struct queue_summary_row {
    std::string queue;
    std::string queue_display;
    std::string logged_in;
    std::string available;
    std::string callers;
    std::string hold_time;
    std::string longest_hold;
};

struct active_call {
    std::string callid;
    std::string channel;
    std::string caller;
    std::string connected;
    std::string duration;
    std::string application;
};

struct realtime_snapshot {
    std::vector<queue_summary_row> queue_summary;
    std::vector<active_call> active_calls;
    size_t active_calls_count = 0;
    int64_t waiting_calls_count = 0;
    size_t active_operators_count = 0;
};

[[nodiscard]] realtime_snapshot build_snapshot(std::span<const record> summary, std::span<const record> channels,
                                               const display_maps &maps, const snapshot_filters &filters);

// Queries `QueueSummary` and `CoreShowChannels` over the client and builds the snapshot from the replies.
[[nodiscard]] realtime_snapshot fetch_snapshot(client &cl, const display_maps &maps, const snapshot_filters &filters);

} // namespace amisync
