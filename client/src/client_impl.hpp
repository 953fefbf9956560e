#pragma once

#include "amisync/client.hpp"

#include "detail/correlator.hpp"
#include "detail/event_loop.hpp"
#include "detail/framer.hpp"
#include "detail/subscribers.hpp"

#include "common/types.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace amisync {

class client::impl {
    friend class client;

public:
    [[nodiscard]] impl(common::valid_fd_t fd, detail::framer framer, const connect_config &cfg);

    impl(const impl &) = delete;
    impl &operator=(const impl &) = delete;
    impl(impl &&) = delete;
    impl &operator=(impl &&) = delete;
    ~impl() = default;

    [[nodiscard]] std::vector<record> send_action(const action &act, std::chrono::milliseconds timeout);

private:
    std::chrono::milliseconds action_timeout_;

    detail::correlator correlator_;
    detail::subscribers subscribers_;

    // NOTE: Declared last, the loop references the members above and must be torn down first.
    std::unique_ptr<detail::ev_loop> event_loop_;
};

} // namespace amisync
