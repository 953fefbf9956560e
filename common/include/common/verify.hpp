#pragma once

#include "common/types.hpp"

#include <fcntl.h>
#include <sys/socket.h>

namespace amisync::common {

inline bool verify_fd(common::valid_fd_t fd) noexcept { return fcntl(common::ts::get(fd), F_GETFD) != -1; }

// The manager session only ever runs over a connected TCP stream.
inline bool verify_stream_socket(common::valid_fd_t fd) noexcept {
    int type = 0;
    socklen_t len = sizeof(type);
    if (getsockopt(common::ts::get(fd), SOL_SOCKET, SO_TYPE, &type, &len) == -1) {
        return false;
    }

    return type == SOCK_STREAM;
}

} // namespace amisync::common
