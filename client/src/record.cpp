#include "amisync/record.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace amisync {

std::optional<std::string_view> record::get(std::string_view key) const noexcept {
    for (auto it = fields_.rbegin(); it != fields_.rend(); ++it) {
        if (it->first == key) {
            return std::string_view(it->second);
        }
    }

    return std::nullopt;
}

std::string_view record::value_or(std::string_view key, std::string_view fallback) const noexcept {
    return get(key).value_or(fallback);
}

std::vector<std::string_view> record::get_all(std::string_view key) const {
    std::vector<std::string_view> values;
    for (const auto &[k, v] : fields_) {
        if (k == key) {
            values.emplace_back(v);
        }
    }

    return values;
}

} // namespace amisync
