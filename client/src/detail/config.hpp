#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace amisync::detail {

inline constexpr std::string_view line_end = "\r\n";
inline constexpr std::string_view block_end = "\r\n\r\n";

inline constexpr size_t recv_chunk_size = 4096;
inline constexpr size_t max_buffered_bytes = 1024 * 1024;

inline constexpr std::string_view action_id_prefix = "amisync";
inline constexpr std::chrono::milliseconds action_wait_slice{ 500 };
inline constexpr std::chrono::milliseconds logoff_timeout{ 1'000 };

} // namespace amisync::detail
