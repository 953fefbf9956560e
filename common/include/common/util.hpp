#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <string>
#include <string_view>

#include <unistd.h>

namespace amisync::common {

inline void preserving_close(int fd) noexcept {
    int saved = errno;
    close(fd);
    errno = saved;
}

// ============================================================================
// Strings.
// ============================================================================

inline bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }
inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }

    return s;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

inline bool all_digits(std::string_view s) noexcept { return !s.empty() && std::ranges::all_of(s, is_digit); }

} // namespace amisync::common
