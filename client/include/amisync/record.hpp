#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace amisync {

// ============================================================================
// Known fields.
// ============================================================================

namespace fields {
    inline constexpr std::string_view action = "Action";
    inline constexpr std::string_view action_id = "ActionID";
    inline constexpr std::string_view event = "Event";
    inline constexpr std::string_view event_list = "EventList";
    inline constexpr std::string_view response = "Response";
    inline constexpr std::string_view message = "Message";
} // namespace fields

// ============================================================================
// Record.
// ============================================================================

/**
 * One framed `Key: Value` block. Fields keep wire order, and repeated keys are kept: `get()` answers with the last
 * occurrence while `get_all()` returns every one of them.
 */
class record {
public:
    using field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<field>::const_iterator;

    record() = default;
    record(std::initializer_list<field> fields) : fields_(fields) {}

    void append(std::string key, std::string value) { fields_.emplace_back(std::move(key), std::move(value)); }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;
    [[nodiscard]] std::string_view value_or(std::string_view key, std::string_view fallback = {}) const noexcept;
    [[nodiscard]] std::vector<std::string_view> get_all(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return get(key).has_value(); }

    [[nodiscard]] std::optional<std::string_view> action_id() const noexcept { return get(fields::action_id); }
    [[nodiscard]] std::optional<std::string_view> event_name() const noexcept { return get(fields::event); }
    [[nodiscard]] std::optional<std::string_view> event_list() const noexcept { return get(fields::event_list); }
    [[nodiscard]] std::optional<std::string_view> response() const noexcept { return get(fields::response); }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    bool operator==(const record &) const = default;

private:
    std::vector<field> fields_;
};

// ============================================================================
// Event.
// ============================================================================

class event {
public:
    [[nodiscard]] explicit event(record fields) noexcept : fields_(std::move(fields)) {}

    [[nodiscard]] std::string_view name() const noexcept { return fields_.value_or(fields::event); }
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept { return fields_.get(key); }
    [[nodiscard]] std::string_view value_or(std::string_view key, std::string_view fallback = {}) const noexcept {
        return fields_.value_or(key, fallback);
    }
    [[nodiscard]] const record &fields() const noexcept { return fields_; }

private:
    record fields_;
};

} // namespace amisync
