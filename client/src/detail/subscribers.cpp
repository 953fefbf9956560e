#include "detail/subscribers.hpp"

#include "common/log.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <utility>

namespace amisync::detail {

void subscribers::add(event_handler handler) {
    std::lock_guard lock(mutex_);

    auto next = std::make_shared<handler_list>(*handlers_);
    next->push_back(std::move(handler));
    handlers_ = std::move(next);
}

void subscribers::publish(const event &ev) const noexcept {
    std::shared_ptr<const handler_list> snapshot;
    {
        std::lock_guard lock(mutex_);
        snapshot = handlers_;
    }

    for (const auto &handler : *snapshot) {
        try {
            handler(ev);
        } catch (const std::exception &e) {
            LOG_ERROR("event handler failed on {}: {}", ev.name(), e.what());
        } catch (...) {
            LOG_ERROR("event handler failed on {} with a non-standard exception.", ev.name());
        }
    }
}

} // namespace amisync::detail
