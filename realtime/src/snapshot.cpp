#include "amisync/snapshot.hpp"

#include "amisync/actions.hpp"

#include "common/util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

namespace amisync {

namespace {

    constexpr std::string_view core_show_channel = "CoreShowChannel";
    constexpr std::string_view queue_summary_event = "QueueSummary";
    constexpr std::string_view message_channel_prefix = "Message/";

    // Bounds hours * 3600 well inside int64_t.
    constexpr int64_t max_duration_hours = 1'000'000;

    std::optional<int64_t> parse_int(std::string_view value) noexcept {
        value = common::trim(value);

        int64_t out = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
        if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
            return std::nullopt;
        }

        return out;
    }

    bool known_party(std::string_view value) noexcept {
        value = common::trim(value);
        return !value.empty() && !common::iequals(value, "<unknown>") && !common::iequals(value, "unknown");
    }

    std::string_view first_non_empty(const record &row, std::initializer_list<std::string_view> keys) noexcept {
        for (const auto key : keys) {
            const std::string_view value = common::trim(row.value_or(key));
            if (!value.empty()) {
                return value;
            }
        }

        return {};
    }

    std::string_view linked_id(const record &row) noexcept { return first_non_empty(row, { "Linkedid", "LinkedId" }); }

    std::string_view bridge_id(const record &row) noexcept {
        return first_non_empty(row, { "BridgeId", "BridgeID", "BridgeUniqueid" });
    }

    bool contains(std::string_view haystack, std::string_view needle) {
        return common::to_lower(haystack).find(needle) != std::string::npos;
    }

} // namespace

// ============================================================================
// Channel ranking.
// ============================================================================

int64_t duration_to_seconds(std::string_view value) noexcept {
    value = common::trim(value);
    if (value.empty()) {
        return 0;
    }
    if (common::all_digits(value)) {
        return parse_int(value).value_or(0);
    }

    // ---- (1) HH:MM:SS.
    std::array<int64_t, 3> parts{};
    size_t count = 0;

    while (true) {
        const size_t colon = value.find(':');
        const auto part = parse_int(value.substr(0, colon));
        if (!part || count == parts.size()) {
            return 0;
        }

        parts[count++] = *part;
        if (colon == std::string_view::npos) {
            break;
        }
        value.remove_prefix(colon + 1);
    }

    if (count != parts.size()) {
        return 0;
    }

    // ---- (2) Range.
    const auto [hours, minutes, seconds] = parts;
    if (hours < 0 || hours > max_duration_hours || minutes < 0 || minutes > 59 || seconds < 0 || seconds > 59) {
        return 0;
    }

    return (hours * 3600) + (minutes * 60) + seconds;
}

channel_rank rank_channel(const record &row) noexcept {
    channel_rank rank{ .app_priority = 1, .known_parties = 0, .duration = 0 };

    const std::string_view app = common::trim(row.value_or("Application"));
    if (common::iequals(app, "queue")) {
        rank.app_priority = 4;
    } else if (common::iequals(app, "dial") || common::iequals(app, "bridge")) {
        rank.app_priority = 3;
    } else if (common::iequals(app, "appqueue")) {
        rank.app_priority = 2;
    }

    rank.known_parties = static_cast<int>(known_party(row.value_or("CallerIDNum"))) +
                         static_cast<int>(known_party(row.value_or("ConnectedLineNum")));
    rank.duration = duration_to_seconds(row.value_or("Duration"));

    return rank;
}

std::vector<record> dedupe_channels(std::span<const record> rows) {
    std::vector<record> groups;
    std::unordered_map<std::string, size_t> index_of;

    for (const auto &row : rows) {
        if (row.value_or(fields::event) != core_show_channel) {
            continue;
        }
        if (row.value_or("Channel").starts_with(message_channel_prefix)) {
            continue;
        }

        std::string_view key = linked_id(row);
        if (key.empty()) {
            key = bridge_id(row);
        }
        if (key.empty()) {
            groups.push_back(row);
            continue;
        }

        auto [it, inserted] = index_of.try_emplace(std::string(key), groups.size());
        if (inserted) {
            groups.push_back(row);
        } else if (rank_channel(row) > rank_channel(groups[it->second])) {
            groups[it->second] = row;
        }
    }

    return groups;
}

// ============================================================================
// Snapshot.
// ============================================================================

realtime_snapshot build_snapshot(std::span<const record> summary, std::span<const record> channels,
                                 const display_maps &maps, const snapshot_filters &filters) {
    realtime_snapshot snap;

    const std::unordered_set<std::string> queue_filter(filters.queues.begin(), filters.queues.end());
    const std::string channel_filter = common::to_lower(common::trim(filters.channel));
    const std::string caller_filter = common::to_lower(common::trim(filters.caller));

    // ---- (1) Queue summary.
    for (const auto &row : summary) {
        if (row.value_or(fields::event) != queue_summary_event) {
            continue;
        }

        std::string queue(row.value_or("Queue"));
        if (!queue_filter.empty() && !queue_filter.contains(queue)) {
            continue;
        }

        auto &out = snap.queue_summary.emplace_back();
        out.queue_display = maps.queue(queue);
        out.queue = std::move(queue);
        out.logged_in = row.value_or("LoggedIn", "0");
        out.available = row.value_or("Available", "0");
        out.callers = row.value_or("Callers", "0");
        out.hold_time = row.value_or("HoldTime", "0");
        out.longest_hold = row.value_or("LongestHoldTime", "0");

        snap.waiting_calls_count += parse_int(out.callers).value_or(0);
    }

    // ---- (2) Active calls.
    std::unordered_set<std::string> operators;

    for (const auto &row : dedupe_channels(channels)) {
        const std::string_view channel = row.value_or("Channel");
        const std::string_view caller = row.value_or("CallerIDNum");
        const std::string_view connected = row.value_or("ConnectedLineNum");

        if (!channel_filter.empty() && !contains(channel, channel_filter)) {
            continue;
        }

        std::string caller_human = maps.human_party(caller);
        std::string connected_human = maps.human_party(connected);

        if (!caller_filter.empty()) {
            const std::string haystack = fmt::format("{} {} {} {}", caller, connected, caller_human, connected_human);
            if (!contains(haystack, caller_filter)) {
                continue;
            }
        }

        std::string_view callid = linked_id(row);
        if (callid.empty()) {
            callid = first_non_empty(row, { "BridgeId", "BridgeID" });
        }

        snap.active_calls.push_back(active_call{
            .callid = std::string(callid),
            .channel = maps.human_channel(channel),
            .caller = std::move(caller_human),
            .connected = std::move(connected_human),
            .duration = std::string(row.value_or("Duration")),
            .application = std::string(row.value_or("Application")),
        });

        for (const auto candidate : { channel, caller, connected }) {
            if (auto ext = operator_extension(candidate); !ext.empty()) {
                operators.insert(std::move(ext));
            }
        }
    }

    snap.active_calls_count = snap.active_calls.size();
    snap.active_operators_count = operators.size();
    return snap;
}

realtime_snapshot fetch_snapshot(client &cl, const display_maps &maps, const snapshot_filters &filters) {
    const auto summary = actions::queue_summary(cl);
    const auto channels = actions::core_show_channels(cl);
    return build_snapshot(summary, channels, maps, filters);
}

} // namespace amisync
