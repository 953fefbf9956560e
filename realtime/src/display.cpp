#include "amisync/display.hpp"

#include "common/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace amisync {

namespace {

    constexpr std::string_view unknown_party = "Unknown";

    bool is_word(char c) noexcept { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }
    bool is_endpoint_char(char c) noexcept { return is_word(c) || c == '.' || c == '-'; }
    bool is_hex(char c) noexcept { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

    void push_unique(std::vector<std::string> &out, std::string_view alias) {
        if (alias.empty() || std::ranges::find(out, alias) != out.end()) {
            return;
        }

        out.emplace_back(alias);
    }

} // namespace

// ============================================================================
// Agent identifiers.
// ============================================================================

std::vector<std::string> agent_aliases(std::string_view value) {
    const std::string_view raw = common::trim(value);
    if (raw.empty()) {
        return {};
    }

    std::vector<std::string> aliases;
    push_unique(aliases, raw);

    // ---- (1) Peel structural parts.
    std::string_view current = raw;

    if (auto pos = current.find('/'); pos != std::string_view::npos) {
        current = common::trim(current.substr(pos + 1));
        push_unique(aliases, current);
    }
    if (auto pos = current.find('@'); pos != std::string_view::npos) {
        current = common::trim(current.substr(0, pos));
        push_unique(aliases, current);
    }
    if (auto pos = current.find(';'); pos != std::string_view::npos) {
        current = common::trim(current.substr(0, pos));
        push_unique(aliases, current);
    }
    if (auto pos = current.rfind('-'); pos != std::string_view::npos && common::all_digits(current.substr(pos + 1))) {
        push_unique(aliases, common::trim(current.substr(0, pos)));
    }

    // ---- (2) Standalone extensions.
    size_t i = 0;
    while (i < raw.size()) {
        if (!is_word(raw[i])) {
            i++;
            continue;
        }

        const size_t start = i;
        while (i < raw.size() && is_word(raw[i])) {
            i++;
        }

        const std::string_view token = raw.substr(start, i - start);
        if (token.size() >= 3 && token.size() <= 6 && common::all_digits(token)) {
            push_unique(aliases, token);
        }
    }

    return aliases;
}

std::string operator_extension(std::string_view value) {
    for (auto &alias : agent_aliases(value)) {
        if (alias.size() >= 2 && alias.size() <= 6 && common::all_digits(alias)) {
            return alias;
        }
    }

    return {};
}

std::string extract_endpoint_token(std::string_view value) {
    std::string_view raw = common::trim(value);
    if (auto pos = raw.find('/'); pos != std::string_view::npos) {
        raw = raw.substr(pos + 1);
    }

    const auto begin = std::ranges::find_if(raw, is_endpoint_char);
    const auto end = std::find_if_not(begin, raw.end(), is_endpoint_char);
    return { begin, end };
}

std::optional<caller_id> parse_callerid(std::string_view value) {
    const std::string_view raw = common::trim(value);

    const size_t open = raw.find('<');
    if (open == std::string_view::npos) {
        return std::nullopt;
    }

    const size_t close = raw.find('>', open + 1);
    if (close == std::string_view::npos || close + 1 != raw.size() || close == open + 1) {
        return std::nullopt;
    }

    // ---- (1) Name, optionally quoted.
    std::string_view name = common::trim(raw.substr(0, open));
    if (name.starts_with('"')) {
        name.remove_prefix(1);
    }
    if (name.ends_with('"')) {
        name.remove_suffix(1);
    }
    if (name.find('"') != std::string_view::npos) {
        return std::nullopt;
    }
    name = common::trim(name);

    // ---- (2) Endpoint.
    std::string endpoint = extract_endpoint_token(raw.substr(open + 1, close - open - 1));

    if (name.empty() || endpoint.empty()) {
        return std::nullopt;
    }

    return caller_id{ .name = std::string(name), .endpoint = std::move(endpoint) };
}

// ============================================================================
// Display maps.
// ============================================================================

void display_maps::add_agent(std::string_view system_name, std::string_view display_name) {
    for (auto &alias : agent_aliases(system_name)) {
        agents_.try_emplace(std::move(alias), display_name);
    }
}

void display_maps::add_queue(std::string_view system_name, std::string_view display_name) {
    queues_.insert_or_assign(std::string(system_name), std::string(display_name));
}

std::string display_maps::agent(std::string_view value) const {
    const auto aliases = agent_aliases(value);
    for (const auto &alias : aliases) {
        if (auto it = agents_.find(alias); it != agents_.end()) {
            return it->second;
        }
    }

    return aliases.empty() ? std::string(value) : aliases.back();
}

std::string display_maps::queue(std::string_view value) const {
    if (auto it = queues_.find(std::string(value)); it != queues_.end()) {
        return it->second;
    }

    return std::string(value);
}

std::string display_maps::human_party(std::string_view value) const {
    const std::string_view raw = common::trim(value);
    if (raw.empty() || common::iequals(raw, "<unknown>") || common::iequals(raw, "unknown")) {
        return std::string(unknown_party);
    }

    std::string display = agent(raw);
    const std::string ext = operator_extension(raw);
    if (!ext.empty() && display != ext) {
        return display + " (" + ext + ")";
    }

    return display;
}

std::string display_maps::human_channel(std::string_view value) const {
    const std::string_view raw = common::trim(value);
    if (raw.empty()) {
        return {};
    }

    std::string_view tech;
    if (auto pos = raw.find('/'); pos != std::string_view::npos) {
        tech = raw.substr(0, pos);
    }

    std::string_view base = raw;
    if (auto pos = base.rfind('-'); pos != std::string_view::npos) {
        const std::string_view suffix = base.substr(pos + 1);
        if (!suffix.empty() && std::ranges::all_of(suffix, is_hex)) {
            base = base.substr(0, pos);
        }
    }

    const std::string display = agent(base);
    if (!tech.empty() && display != base) {
        return display + " [" + std::string(tech) + "]";
    }

    return std::string(raw);
}

} // namespace amisync
