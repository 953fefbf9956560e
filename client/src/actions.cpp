#include "amisync/actions.hpp"

#include "amisync/client.hpp"
#include "amisync/record.hpp"

#include "common/util.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace amisync::actions {

namespace {

    const char *yes_no(bool value) noexcept { return value ? "yes" : "no"; }
    const char *true_false(bool value) noexcept { return value ? "true" : "false"; }

    class builder {
    public:
        explicit builder(std::string name) { act_.name = std::move(name); }

        builder &add(std::string_view key, std::string_view value) {
            act_.params.emplace_back(std::string(key), std::string(value));
            return *this;
        }

        builder &add(std::string_view key, long long value) { return add(key, std::to_string(value)); }

        builder &add_if(std::string_view key, std::string_view value) {
            if (!value.empty()) {
                add(key, value);
            }
            return *this;
        }

        [[nodiscard]] const action &get() const noexcept { return act_; }

    private:
        action act_;
    };

    action_result control(client &cl, const builder &b) {
        auto records = cl.send_action(b.get());
        const bool success = any_success(records);
        return { .success = success, .records = std::move(records) };
    }

} // namespace

// ============================================================================
// Results.
// ============================================================================

bool any_success(std::span<const record> records) noexcept {
    return std::ranges::any_of(records, [](const record &rec) {
        const auto response = rec.response();
        return response && common::iequals(*response, "success");
    });
}

std::vector<queue_status_entry> reshape_queue_status(std::span<const record> records) {
    std::vector<queue_status_entry> queues;
    std::optional<queue_status_entry> current;

    for (const auto &rec : records) {
        const std::string_view name = rec.value_or(fields::event);

        if (name == "QueueParams") {
            if (current) {
                queues.push_back(std::move(*current));
            }
            current.emplace(queue_status_entry{ .params = rec, .members = {} });
        } else if (name == "QueueMember") {
            if (current) {
                current->members.push_back(rec);
            }
        } else if (name == "QueueStatusComplete") {
            if (current) {
                queues.push_back(std::move(*current));
                current.reset();
            }
        }
    }

    if (current) {
        queues.push_back(std::move(*current));
    }

    return queues;
}

// ============================================================================
// Status.
// ============================================================================

action_result ping(client &cl) {
    auto records = cl.send_action(builder("Ping").get());

    const bool pong = std::ranges::any_of(records, [](const record &rec) {
        return common::iequals(rec.value_or("Ping"), "pong");
    });
    const bool success = pong || any_success(records);
    return { .success = success, .records = std::move(records) };
}

std::vector<record> status(client &cl, std::string_view channel) {
    return cl.send_action(builder("Status").add_if("Channel", channel).get());
}

std::vector<record> core_show_channels(client &cl) { return cl.send_action(builder("CoreShowChannels").get()); }

std::vector<record> command(client &cl, std::string_view command) {
    return cl.send_action(builder("Command").add("Command", command).get());
}

std::vector<record> command(client &cl, std::string_view command, std::chrono::milliseconds timeout) {
    return cl.send_action(builder("Command").add("Command", command).get(), timeout);
}

std::vector<record> extension_state(client &cl, std::string_view exten, std::string_view context) {
    return cl.send_action(builder("ExtensionState").add("Exten", exten).add("Context", context).get());
}

std::vector<record> mailbox_status(client &cl, std::string_view mailbox) {
    return cl.send_action(builder("MailboxStatus").add("Mailbox", mailbox).get());
}

std::vector<record> mailbox_count(client &cl, std::string_view mailbox) {
    return cl.send_action(builder("MailboxCount").add("Mailbox", mailbox).get());
}

std::vector<std::string> command_output(std::span<const record> records) {
    std::vector<std::string> lines;
    for (const auto &rec : records) {
        for (const auto line : rec.get_all("Output")) {
            lines.emplace_back(line);
        }
    }

    return lines;
}

// ============================================================================
// Queues.
// ============================================================================

std::vector<queue_status_entry> queue_status(client &cl, std::string_view queue, std::string_view member) {
    const auto records = cl.send_action(builder("QueueStatus").add_if("Queue", queue).add_if("Member", member).get());
    return reshape_queue_status(records);
}

std::vector<record> queue_summary(client &cl, std::string_view queue) {
    return cl.send_action(builder("QueueSummary").add_if("Queue", queue).get());
}

action_result queue_add(client &cl, const queue_add_params &params) {
    return control(cl, builder("QueueAdd")
                           .add("Queue", params.queue)
                           .add("Interface", params.interface)
                           .add("Penalty", params.penalty)
                           .add("Paused", true_false(params.paused))
                           .add_if("MemberName", params.member_name)
                           .add_if("StateInterface", params.state_interface));
}

action_result queue_remove(client &cl, std::string_view queue, std::string_view interface) {
    return control(cl, builder("QueueRemove").add("Queue", queue).add("Interface", interface));
}

action_result queue_pause(client &cl, std::string_view queue, std::string_view interface, bool paused,
                          std::string_view reason) {
    return control(cl, builder("QueuePause")
                           .add("Queue", queue)
                           .add("Interface", interface)
                           .add("Paused", true_false(paused))
                           .add_if("Reason", reason));
}

action_result queue_reload(client &cl, const queue_reload_params &params) {
    return control(cl, builder("QueueReload")
                           .add_if("Queue", params.queue)
                           .add("Members", yes_no(params.members))
                           .add("Rules", yes_no(params.rules))
                           .add("Parameters", yes_no(params.parameters)));
}

action_result queue_log(client &cl, const queue_log_params &params) {
    return control(cl, builder("QueueLog")
                           .add("Queue", params.queue)
                           .add("Event", params.event)
                           .add_if("Uniqueid", params.uniqueid)
                           .add_if("Interface", params.interface)
                           .add_if("Message", params.message));
}

// ============================================================================
// Endpoints.
// ============================================================================

std::vector<record> sip_peers(client &cl) { return cl.send_action(builder("SIPpeers").get()); }

std::vector<record> sip_show_peer(client &cl, std::string_view peer) {
    return cl.send_action(builder("SIPshowpeer").add("Peer", peer).get());
}

std::vector<record> pjsip_show_endpoints(client &cl) { return cl.send_action(builder("PJSIPShowEndpoints").get()); }

std::vector<record> pjsip_show_endpoint(client &cl, std::string_view endpoint) {
    return cl.send_action(builder("PJSIPShowEndpoint").add("Endpoint", endpoint).get());
}

std::vector<record> pjsip_show_endpoint(client &cl, std::string_view endpoint, std::chrono::milliseconds timeout) {
    return cl.send_action(builder("PJSIPShowEndpoint").add("Endpoint", endpoint).get(), timeout);
}

// ============================================================================
// Call control.
// ============================================================================

action_result originate(client &cl, const originate_params &params) {
    builder b("Originate");
    b.add("Channel", params.channel)
        .add("Exten", params.exten)
        .add("Context", params.context)
        .add("Priority", params.priority)
        .add("Timeout", params.timeout.count())
        .add_if("CallerID", params.caller_id);

    if (params.async) {
        b.add("Async", "true");
    }

    for (const auto &[name, value] : params.variables) {
        b.add("Variable", name + "=" + value);
    }

    return control(cl, b);
}

action_result hangup(client &cl, std::string_view channel, int cause) {
    return control(cl, builder("Hangup").add("Channel", channel).add("Cause", cause));
}

action_result redirect(client &cl, const redirect_params &params) {
    return control(cl, builder("Redirect")
                           .add("Channel", params.channel)
                           .add("Exten", params.exten)
                           .add("Context", params.context)
                           .add("Priority", params.priority)
                           .add_if("ExtraChannel", params.extra_channel));
}

action_result bridge(client &cl, std::string_view channel1, std::string_view channel2, bool tone) {
    return control(cl, builder("Bridge").add("Channel1", channel1).add("Channel2", channel2).add("Tone", yes_no(tone)));
}

action_result park(client &cl, std::string_view channel, std::string_view channel2, std::chrono::milliseconds timeout,
                   std::string_view parking_lot) {
    return control(cl, builder("Park")
                           .add("Channel", channel)
                           .add("Channel2", channel2)
                           .add("Timeout", timeout.count())
                           .add_if("Parkinglot", parking_lot));
}

std::vector<record> parked_calls(client &cl) { return cl.send_action(builder("ParkedCalls").get()); }

action_result absolute_timeout(client &cl, std::string_view channel, std::chrono::seconds timeout) {
    return control(cl, builder("AbsoluteTimeout").add("Channel", channel).add("Timeout", timeout.count()));
}

std::optional<std::string> get_var(client &cl, std::string_view channel, std::string_view variable) {
    const auto records = cl.send_action(builder("Getvar").add("Channel", channel).add("Variable", variable).get());

    for (const auto &rec : records) {
        if (auto value = rec.get("Value")) {
            return std::string(*value);
        }
    }

    return std::nullopt;
}

action_result set_var(client &cl, std::string_view channel, std::string_view variable, std::string_view value) {
    return control(cl, builder("Setvar").add("Channel", channel).add("Variable", variable).add("Value", value));
}

action_result monitor(client &cl, std::string_view channel, std::string_view file, std::string_view format, bool mix) {
    return control(cl, builder("Monitor")
                           .add("Channel", channel)
                           .add("Format", format)
                           .add("Mix", true_false(mix))
                           .add_if("File", file));
}

action_result stop_monitor(client &cl, std::string_view channel) {
    return control(cl, builder("StopMonitor").add("Channel", channel));
}

action_result mixmonitor_mute(client &cl, std::string_view channel, std::string_view direction, bool state) {
    return control(cl, builder("MixMonitorMute")
                           .add("Channel", channel)
                           .add("Direction", direction)
                           .add("State", state ? "1" : "0"));
}

} // namespace amisync::actions
