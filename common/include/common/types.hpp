#pragma once

#include "common/log.hpp"

#include <cstdint>
#include <utility>

#include <type_safe/strong_typedef.hpp>

namespace amisync::common {
namespace ts = type_safe;

// ============================================================================
// Strong types.
// ============================================================================
// clang-format off

// A connected socket owned by one session.

struct valid_fd_t
    : ts::strong_typedef<valid_fd_t, int>,
      ts::strong_typedef_op::output_operator<valid_fd_t>,
      ts::strong_typedef_op::equality_comparison<valid_fd_t> {
    using strong_typedef::strong_typedef;
};

// Monotonic per-session counter, the first part of every ActionID.
struct action_seq_t
    : ts::strong_typedef<action_seq_t, uint64_t>,
      ts::strong_typedef_op::equality_comparison<action_seq_t>,
      ts::strong_typedef_op::relational_comparison<action_seq_t>,
      ts::strong_typedef_op::increment<action_seq_t> {
    using strong_typedef::strong_typedef;
};

// clang-format on
} // namespace amisync::common

// ============================================================================
// Formatting.
// ============================================================================

namespace fmt {
template <typename T>
    requires type_safe::is_strong_typedef<T>::value
struct formatter<T, char> : formatter<type_safe::underlying_type<T>> {
    auto format(const T &value, format_context &ctx) const {
        return formatter<type_safe::underlying_type<T>>::format(type_safe::get(value), ctx);
    }
};
} // namespace fmt
