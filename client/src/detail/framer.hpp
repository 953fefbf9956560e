#pragma once

#include "amisync/record.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace amisync::detail {

/**
 * Splits an unbounded byte stream into records. Bytes may arrive in arbitrary fragments; a block is only parsed once
 * its blank-line terminator has been seen.
 */
class framer {
public:
    void feed(std::string_view bytes);

    // Next complete, non-empty record. Blocks without a single valid line are dropped.
    [[nodiscard]] std::optional<record> next();

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - consumed_; }

private:
    std::string buffer_;
    size_t consumed_{};
};

[[nodiscard]] record parse_block(std::string_view block);
[[nodiscard]] std::string encode_action(std::string_view name, std::string_view action_id,
                                        std::span<const record::field> params);

} // namespace amisync::detail
