#pragma once

#include "amisync/client.hpp"
#include "amisync/record.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace amisync::actions {

// ============================================================================
// Results.
// ============================================================================

struct action_result {
    bool success = false;
    std::vector<record> records;
};

struct queue_status_entry {
    record params;
    std::vector<record> members;
};

[[nodiscard]] bool any_success(std::span<const record> records) noexcept;

/**
 * Replays a QueueStatus reply: `QueueParams` opens a queue, `QueueMember` attaches to the open queue and
 * `QueueStatusComplete` closes it. A queue still open at the end of the input is kept, so a truncated reply loses
 * nothing that arrived.
 */
[[nodiscard]] std::vector<queue_status_entry> reshape_queue_status(std::span<const record> records);

// ============================================================================
// Parameters.
// ============================================================================

struct queue_add_params {
    std::string queue;
    std::string interface;
    int penalty = 0;
    bool paused = false;
    std::string member_name;
    std::string state_interface;
};

struct queue_reload_params {
    std::string queue;
    bool members = true;
    bool rules = true;
    bool parameters = true;
};

struct queue_log_params {
    std::string queue;
    std::string event;
    std::string uniqueid;
    std::string interface;
    std::string message;
};

struct originate_params {
    std::string channel;
    std::string exten;
    std::string context;
    int priority = 1;
    std::string caller_id;
    std::chrono::milliseconds timeout{ 30'000 };
    bool async = false;
    std::vector<std::pair<std::string, std::string>> variables;
};

struct redirect_params {
    std::string channel;
    std::string exten;
    std::string context;
    int priority = 1;
    std::string extra_channel;
};

// ============================================================================
// Status.
// ============================================================================

action_result ping(client &cl);
std::vector<record> status(client &cl, std::string_view channel = {});
std::vector<record> core_show_channels(client &cl);
std::vector<record> command(client &cl, std::string_view command);
std::vector<record> command(client &cl, std::string_view command, std::chrono::milliseconds timeout);
std::vector<record> extension_state(client &cl, std::string_view exten, std::string_view context);
std::vector<record> mailbox_status(client &cl, std::string_view mailbox);
std::vector<record> mailbox_count(client &cl, std::string_view mailbox);

// Every `Output` line of a `Command` reply, in order.
[[nodiscard]] std::vector<std::string> command_output(std::span<const record> records);

// ============================================================================
// Queues.
// ============================================================================

std::vector<queue_status_entry> queue_status(client &cl, std::string_view queue = {}, std::string_view member = {});
std::vector<record> queue_summary(client &cl, std::string_view queue = {});
action_result queue_add(client &cl, const queue_add_params &params);
action_result queue_remove(client &cl, std::string_view queue, std::string_view interface);
action_result queue_pause(client &cl, std::string_view queue, std::string_view interface, bool paused,
                          std::string_view reason = {});
action_result queue_reload(client &cl, const queue_reload_params &params);
action_result queue_log(client &cl, const queue_log_params &params);

// ============================================================================
// Endpoints.
// ============================================================================

std::vector<record> sip_peers(client &cl);
std::vector<record> sip_show_peer(client &cl, std::string_view peer);
std::vector<record> pjsip_show_endpoints(client &cl);
std::vector<record> pjsip_show_endpoint(client &cl, std::string_view endpoint);
std::vector<record> pjsip_show_endpoint(client &cl, std::string_view endpoint, std::chrono::milliseconds timeout);

// ============================================================================
// Call control.
// ============================================================================

action_result originate(client &cl, const originate_params &params);
action_result hangup(client &cl, std::string_view channel, int cause = 16);
action_result redirect(client &cl, const redirect_params &params);
action_result bridge(client &cl, std::string_view channel1, std::string_view channel2, bool tone = true);
action_result park(client &cl, std::string_view channel, std::string_view channel2,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(45'000),
                   std::string_view parking_lot = {});
std::vector<record> parked_calls(client &cl);
action_result absolute_timeout(client &cl, std::string_view channel, std::chrono::seconds timeout);

std::optional<std::string> get_var(client &cl, std::string_view channel, std::string_view variable);
action_result set_var(client &cl, std::string_view channel, std::string_view variable, std::string_view value);

action_result monitor(client &cl, std::string_view channel, std::string_view file = {},
                      std::string_view format = "wav", bool mix = true);
action_result stop_monitor(client &cl, std::string_view channel);
action_result mixmonitor_mute(client &cl, std::string_view channel, std::string_view direction = "both",
                              bool state = true);

} // namespace amisync::actions
