#include "detail/framer.hpp"

#include "detail/config.hpp"

#include "common/util.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace amisync::detail {

void framer::feed(std::string_view bytes) {
    if (consumed_ != 0) {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }

    buffer_.append(bytes);
}

std::optional<record> framer::next() {
    while (true) {
        const std::string_view pending = std::string_view(buffer_).substr(consumed_);

        const size_t end = pending.find(detail::block_end);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }

        consumed_ += end + detail::block_end.size();

        auto rec = parse_block(pending.substr(0, end));
        if (!rec.empty()) {
            return rec;
        }
    }
}

record parse_block(std::string_view block) {
    record rec;

    while (!block.empty()) {
        const size_t eol = block.find('\n');
        const std::string_view line = block.substr(0, eol);
        block = (eol == std::string_view::npos) ? std::string_view{} : block.substr(eol + 1);

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        const std::string_view key = common::trim(line.substr(0, colon));
        if (key.empty()) {
            continue;
        }

        rec.append(std::string(key), std::string(common::trim(line.substr(colon + 1))));
    }

    return rec;
}

std::string encode_action(std::string_view name, std::string_view action_id, std::span<const record::field> params) {
    std::string out;
    out.reserve(64 + (params.size() * 32));

    auto append_line = [&out](std::string_view key, std::string_view value) {
        out.append(key);
        out.append(": ");
        out.append(value);
        out.append(detail::line_end);
    };

    append_line(fields::action, name);
    if (!action_id.empty()) {
        append_line(fields::action_id, action_id);
    }
    for (const auto &[key, value] : params) {
        append_line(key, value);
    }
    out.append(detail::line_end);

    return out;
}

} // namespace amisync::detail
