#pragma once

#include "amisync/record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace amisync {

enum class disconnect_reason : uint8_t {
    none,
    logoff,
    abrupt_tcp_disconnect,
    orderly_tcp_disconnect,
    proto_excessive_length,
    write_timeout,
};

struct connect_config {
    std::string hostname;
    std::string port;
    std::string username;
    std::string secret;
    std::string events = "on";

    std::chrono::milliseconds connect_timeout{ 10'000 };
    std::chrono::milliseconds action_timeout{ 10'000 };
    std::chrono::milliseconds login_timeout{ 5'000 };
    std::chrono::milliseconds poll_interval{ 100 };
};

struct action {
    std::string name;
    std::vector<record::field> params;
};

/**
 * Handlers run on the listener thread, in registration order. A handler must not wait on an action of the same
 * client: the listener is the only reader of the socket, so such an action can only run into its deadline.
 */
using event_handler = std::function<void(const event &)>;

class client {
public:
    /**
     * Connects and logs in. On success the listener thread is running and every event the manager emits from now on
     * reaches the registered handlers.
     */
    static std::expected<client, std::error_code> connect(const connect_config &) noexcept;

    client(const client &) = delete;
    client &operator=(const client &) = delete;
    client(client &&) noexcept;
    client &operator=(client &&) noexcept;
    ~client() noexcept;

    /**
     * Sends the action and blocks until a completion record arrives or the timeout elapses. Either way, the records
     * collected for the action so far are returned; a timed out action and an empty reply look the same.
     */
    [[nodiscard]] std::vector<record> send_action(const action &act);
    [[nodiscard]] std::vector<record> send_action(const action &act, std::chrono::milliseconds timeout);

    void on_event(event_handler handler);

    void disconnect() noexcept;
    [[nodiscard]] bool connected() const noexcept;
    [[nodiscard]] enum disconnect_reason disconnect_reason() const noexcept;
    [[nodiscard]] size_t pending_actions() const;

private:
    class impl;
    std::unique_ptr<impl> impl_;

    [[nodiscard]] explicit client(std::unique_ptr<impl>) noexcept;
};

} // namespace amisync
