#include "detail/correlator.hpp"

#include "detail/config.hpp"
#include "detail/framer.hpp"

#include "common/assert.hpp"
#include "common/log.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace amisync::detail {

// ============================================================================
// Routing.
// ============================================================================

void pending_action::push(record rec) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(rec));
    }
    cv_.notify_one();
}

bool pending_action::wait_take(std::vector<record> &out, std::chrono::milliseconds slice) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, slice, [this] { return !queue_.empty(); })) {
        return false;
    }

    std::ranges::move(queue_, std::back_inserter(out));
    queue_.clear();
    return true;
}

bool signals_completion(const record &rec) noexcept {
    const auto event_list = rec.event_list();
    if (event_list && common::iequals(common::trim(*event_list), "complete")) {
        return true;
    }

    const auto event_name = rec.event_name();
    if (event_name && event_name->find("Complete") != std::string_view::npos) {
        return true;
    }

    // NOTE: A one-shot reply is a bare success; a list reply carries `EventList: start` next to it.
    const auto response = rec.response();
    return response && *response == "Success" && !event_name && !event_list;
}

// ============================================================================
// Correlator.
// ============================================================================

class correlator::registration {
public:
    registration(correlator &owner, std::string id) : owner_(owner), id_(std::move(id)) {
        std::lock_guard lock(owner_.mutex_);
        auto [it, inserted] = owner_.pending_.emplace(id_, std::make_shared<pending_action>());
        DEBUG_ASSERT(inserted);
        target_ = it->second;
    }

    registration(const registration &) = delete;
    registration &operator=(const registration &) = delete;
    registration(registration &&) = delete;
    registration &operator=(registration &&) = delete;

    ~registration() {
        std::lock_guard lock(owner_.mutex_);
        owner_.pending_.erase(id_);
    }

    [[nodiscard]] pending_action &target() noexcept { return *target_; }

private:
    correlator &owner_;
    std::string id_;
    std::shared_ptr<pending_action> target_;
};

correlator::correlator(std::chrono::milliseconds wait_slice) noexcept : wait_slice_(wait_slice) {
    DEBUG_ASSERT(wait_slice_.count() > 0);
}

std::string correlator::next_action_id() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    std::lock_guard lock(mutex_);
    ++sequence_;
    return fmt::format("{}_{}_{}", detail::action_id_prefix, sequence_, now.count());
}

inbound correlator::classify(record rec) const {
    if (const auto id = rec.action_id()) {
        std::lock_guard lock(mutex_);
        if (auto it = pending_.find(std::string(*id)); it != pending_.end()) {
            return action_response{ it->second, std::move(rec) };
        }
    }

    if (rec.event_name()) {
        return event(std::move(rec));
    }

    return unroutable{ std::move(rec) };
}

std::vector<record> correlator::dispatch(const action &act, const writer &write, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string id = next_action_id();

    // ----------------------------------------
    // (1) Register before writing.
    // ----------------------------------------
    registration reg(*this, id);

    // ----------------------------------------
    // (2) Send.
    // ----------------------------------------
    LOG_TRACE("sending action {} ({}).", act.name, id);
    if (!write(detail::encode_action(act.name, id, act.params))) {
        LOG_WARN("failed to send action {} ({}).", act.name, id);
        return {};
    }

    // ----------------------------------------
    // (3) Collect until completion or deadline.
    // ----------------------------------------
    std::vector<record> collected;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        const size_t before = collected.size();
        if (!reg.target().wait_take(collected, std::min(wait_slice_, remaining))) {
            continue;
        }

        const auto batch = std::span(collected).subspan(before);
        if (std::ranges::any_of(batch, signals_completion)) {
            return collected;
        }
    }

    LOG_WARN("timed out waiting for action {} ({}), returning {} record(s).", act.name, id, collected.size());
    return collected;
}

size_t correlator::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

} // namespace amisync::detail
