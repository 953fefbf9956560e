#pragma once

#include "amisync/client.hpp"
#include "amisync/record.hpp"

#include "common/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace amisync::detail {

// ============================================================================
// Routing.
// ============================================================================

class pending_action {
public:
    void push(record rec);

    // Moves every queued record into `out`. Returns false if nothing arrived within `slice`.
    bool wait_take(std::vector<record> &out, std::chrono::milliseconds slice);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<record> queue_;
};

struct action_response {
    std::shared_ptr<pending_action> target;
    record rec;
};

struct unroutable {
    record rec;
};

using inbound = std::variant<action_response, event, unroutable>;

[[nodiscard]] bool signals_completion(const record &rec) noexcept;

// ============================================================================
// Correlator.
// ============================================================================

class correlator {
public:
    // Puts the request bytes on the wire; false when the connection is gone.
    using writer = std::function<bool(std::string_view wire)>;

    [[nodiscard]] explicit correlator(std::chrono::milliseconds wait_slice) noexcept;

    correlator(const correlator &) = delete;
    correlator &operator=(const correlator &) = delete;
    correlator(correlator &&) = delete;
    correlator &operator=(correlator &&) = delete;
    ~correlator() = default;

    [[nodiscard]] std::string next_action_id();
    [[nodiscard]] inbound classify(record rec) const;

    [[nodiscard]] std::vector<record> dispatch(const action &act, const writer &write, std::chrono::milliseconds timeout);
    [[nodiscard]] size_t pending_count() const;

private:
    class registration;

    std::chrono::milliseconds wait_slice_;
    common::action_seq_t sequence_{ 0 };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<pending_action>> pending_;
};

} // namespace amisync::detail
