#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace amisync {

// ============================================================================
// Agent identifiers.
// ============================================================================

/**
 * Every spelling under which an agent identifier may show up, most specific first. For `PJSIP/1001@office;x=1` that
 * is the raw value, then `1001@office;x=1`, `1001`, plus every standalone 3 to 6 digit token found in the raw value.
 * A trailing `-<digits>` channel suffix is also peeled off. Duplicates and empty entries are dropped.
 */
[[nodiscard]] std::vector<std::string> agent_aliases(std::string_view value);

// The first all-digit alias of 2 to 6 characters, or empty.
[[nodiscard]] std::string operator_extension(std::string_view value);

// The first `[A-Za-z0-9_.-]` run after an optional `tech/` prefix.
[[nodiscard]] std::string extract_endpoint_token(std::string_view value);

struct caller_id {
    std::string name;
    std::string endpoint;

    bool operator==(const caller_id &) const = default;
};

// Parses `"Name" <endpoint>`; both parts must be non-empty.
[[nodiscard]] std::optional<caller_id> parse_callerid(std::string_view value);

// ============================================================================
// Display maps.
// ============================================================================

class display_maps {
public:
    // Registers the display name under every alias of the system name. An alias that is already mapped keeps its name.
    void add_agent(std::string_view system_name, std::string_view display_name);
    void add_queue(std::string_view system_name, std::string_view display_name);

    [[nodiscard]] std::string agent(std::string_view value) const;
    [[nodiscard]] std::string queue(std::string_view value) const;

    // `Display (ext)` when the display differs from the extension, `Unknown` for a missing party.
    [[nodiscard]] std::string human_party(std::string_view value) const;

    // `Display [tech]` for a mapped channel, with the trailing hex channel suffix ignored; otherwise the raw channel.
    [[nodiscard]] std::string human_channel(std::string_view value) const;

    [[nodiscard]] size_t agent_count() const noexcept { return agents_.size(); }
    [[nodiscard]] size_t queue_count() const noexcept { return queues_.size(); }

private:
    std::unordered_map<std::string, std::string> agents_;
    std::unordered_map<std::string, std::string> queues_;
};

} // namespace amisync
