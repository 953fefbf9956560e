#include "detail/sync.hpp"

#include "amisync/actions.hpp"
#include "amisync/display.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"
#include "common/util.hpp"

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <new>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace amisync::detail {

namespace {

    constexpr std::string_view pjsip_prefix = "PJSIP/";

    std::optional<int64_t> parse_penalty(std::string_view value) noexcept {
        value = common::trim(value);

        int64_t out = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
        if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::nullopt;
        }

        return out;
    }

    std::string_view first_non_empty(const record &rec, std::string_view a, std::string_view b) noexcept {
        const std::string_view first = rec.value_or(a);
        return first.empty() ? rec.value_or(b) : first;
    }

    // Membership fields as they appear in both events and QueueStatus members.
    member_update member_from(std::string_view queue_name, std::string_view interface, const record &rec) {
        member_update update{
            .queue_name = std::string(common::trim(queue_name)),
            .interface = std::string(common::trim(interface)),
            .penalty = std::nullopt,
            .paused = std::nullopt,
            .member_name = std::string(first_non_empty(rec, "MemberName", "Name")),
        };

        if (auto penalty = rec.get("Penalty")) {
            update.penalty = parse_penalty(*penalty);
        }
        if (auto paused = rec.get("Paused")) {
            update.paused = parse_ami_bool(*paused);
        }

        return update;
    }

    bool is_member_upsert(std::string_view name) noexcept {
        return name == "QueueMember" || name == "QueueMemberAdded" || name == "QueueMemberStatus" ||
               name == "QueueMemberPause";
    }

    void ensure_mapping(mirror_store &store, std::string_view system_name, std::string_view display_name) {
        if (auto ec = store.ensure_agent_mapping(system_name, display_name)) {
            LOG_WARN("failed to store display mapping {} -> {}: {}", system_name, display_name, ec.message());
        }
    }

} // namespace

bool parse_ami_bool(std::string_view value) noexcept {
    value = common::trim(value);
    return value == "1" || common::iequals(value, "yes") || common::iequals(value, "true") ||
           common::iequals(value, "on");
}

// ============================================================================
// Mirror updates.
// ============================================================================

void apply_event(mirror_store &store, const event &ev) noexcept {
    const std::string_view name = common::trim(ev.name());
    const std::string_view queue_name = common::trim(ev.value_or("Queue"));

    std::error_code ec;

    try {
        if (name == "QueueParams" || name == "QueueSummary") {
            ec = store.upsert_queue(queue_name, queue_name);
        } else if (is_member_upsert(name)) {
            ec = store.upsert_member(member_from(queue_name, first_non_empty(ev.fields(), "Interface", "Location"),
                                                 ev.fields()));
        } else if (name == "QueueMemberRemoved") {
            const std::string_view interface = common::trim(first_non_empty(ev.fields(), "Interface", "Location"));
            ec = store.delete_member(queue_name, interface);
        } else {
            return;
        }
    } catch (const std::bad_alloc &) {
        PANIC("failed to allocate a member update.");
    }

    if (ec) {
        LOG_WARN("failed to apply {} for queue '{}': {}", name, queue_name, ec.message());
    }
}

std::error_code apply_queue_status(mirror_store &store, std::span<const actions::queue_status_entry> queues) noexcept {
    try {
        for (const auto &queue : queues) {
            const std::string_view queue_name = common::trim(queue.params.value_or("Queue"));
            if (queue_name.empty()) {
                continue;
            }

            if (auto ec = store.upsert_queue(queue_name, queue_name)) {
                return ec;
            }

            for (const auto &member : queue.members) {
                auto update = member_from(queue_name, first_non_empty(member, "Location", "Interface"), member);
                if (!update.penalty) {
                    update.penalty = 0;
                }
                if (!update.paused) {
                    update.paused = false;
                }

                if (auto ec = store.upsert_member(update)) {
                    return ec;
                }
            }
        }
    } catch (const std::bad_alloc &) {
        PANIC("failed to allocate a member update.");
    }

    return {};
}

std::error_code full_sync(client &cl, mirror_store &store) {
    const auto queues = actions::queue_status(cl);

    if (auto ec = apply_queue_status(store, queues)) {
        return ec;
    }

    size_t members = 0;
    for (const auto &queue : queues) {
        members += queue.members.size();
    }
    LOG_INFO("full sync applied {} queues and {} members.", queues.size(), members);

    return {};
}

// ============================================================================
// Agent display names.
// ============================================================================

std::string callerid_from_endpoint(std::span<const record> records) {
    constexpr std::array<std::string_view, 4> preferred = { "Callerid", "CallerID", "CallerId", "callerid" };

    for (const auto &rec : records) {
        for (const auto key : preferred) {
            if (const auto value = common::trim(rec.value_or(key)); !value.empty()) {
                return std::string(value);
            }
        }

        for (const auto &[key, value] : rec) {
            if (common::to_lower(key).find("callerid") != std::string::npos && !common::trim(value).empty()) {
                return std::string(common::trim(value));
            }
        }
    }

    return {};
}

std::string callerid_from_command(std::span<const record> records) {
    for (const auto &line : actions::command_output(records)) {
        const std::string_view trimmed = common::trim(line);
        if (trimmed.empty() || common::to_lower(trimmed).find("callerid") == std::string::npos) {
            continue;
        }

        if (auto colon = trimmed.find(':'); colon != std::string_view::npos) {
            return std::string(common::trim(trimmed.substr(colon + 1)));
        }
    }

    return {};
}

void sync_agent_mappings(client &cl, mirror_store &store) {
    std::set<std::string> endpoints;

    // ---- (1) Known agents.
    if (auto agents = store.agents()) {
        for (const auto &row : *agents) {
            if (auto endpoint = extract_endpoint_token(row.agent); !endpoint.empty()) {
                endpoints.insert(std::move(endpoint));
            }
        }
    } else {
        LOG_WARN("failed to collect endpoints from the agents table: {}", agents.error().message());
    }

    // ---- (2) Configured endpoints.
    for (const auto &rec : actions::pjsip_show_endpoints(cl)) {
        for (const auto key : { "ObjectName", "Endpoint" }) {
            if (auto endpoint = extract_endpoint_token(rec.value_or(key)); !endpoint.empty()) {
                endpoints.insert(std::move(endpoint));
            }
        }
    }

    // ---- (3) Caller ids.
    size_t mapped = 0;
    for (const auto &endpoint : endpoints) {
        std::string callerid =
            callerid_from_endpoint(actions::pjsip_show_endpoint(cl, endpoint, endpoint_lookup_timeout));
        if (callerid.empty()) {
            callerid = callerid_from_command(
                actions::command(cl, fmt::format("pjsip show endpoint {}", endpoint), endpoint_lookup_timeout));
        }

        const auto parsed = parse_callerid(callerid);
        if (!parsed) {
            LOG_DEBUG("no usable caller id for endpoint {}.", endpoint);
            continue;
        }

        const auto &[display_name, ext] = *parsed;
        ensure_mapping(store, ext, display_name);
        ensure_mapping(store, fmt::format("{}{}", pjsip_prefix, ext), display_name);
        if (endpoint != ext) {
            ensure_mapping(store, endpoint, display_name);
            ensure_mapping(store, fmt::format("{}{}", pjsip_prefix, endpoint), display_name);
        }
        mapped++;
    }

    LOG_INFO("reconciled display names for {} of {} endpoints.", mapped, endpoints.size());
}

} // namespace amisync::detail
