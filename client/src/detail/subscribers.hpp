#pragma once

#include "amisync/client.hpp"
#include "amisync/record.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace amisync::detail {

class subscribers {
public:
    void add(event_handler handler);

    // Invokes every handler; a failing handler is logged and does not affect the others.
    void publish(const event &ev) const noexcept;

private:
    using handler_list = std::vector<event_handler>;

    mutable std::mutex mutex_;
    std::shared_ptr<const handler_list> handlers_{ std::make_shared<const handler_list>() };
};

} // namespace amisync::detail
