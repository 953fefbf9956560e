#pragma once

#include "amisync/actions.hpp"
#include "amisync/client.hpp"
#include "amisync/mirror_store.hpp"
#include "amisync/record.hpp"

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace amisync::detail {

// `1`, `yes`, `true` and `on`, in any case.
[[nodiscard]] bool parse_ami_bool(std::string_view value) noexcept;

// ============================================================================
// Mirror updates.
// ============================================================================

/**
 * Applies one event to the mirror. Queue parameter and summary events upsert the queue, member
 * added/status/pause events upsert the member and member removal deletes its row. Other events are ignored.
 * Storage failures are logged, never raised.
 */
void apply_event(mirror_store &store, const event &ev) noexcept;

// Upserts every queue and member of a QueueStatus reply. Nothing is deleted.
[[nodiscard]] std::error_code apply_queue_status(mirror_store &store,
                                                 std::span<const actions::queue_status_entry> queues) noexcept;

[[nodiscard]] std::error_code full_sync(client &cl, mirror_store &store);

// ============================================================================
// Agent display names.
// ============================================================================

// Per lookup. A stale endpoint only draws an error reply, which never completes an action.
inline constexpr std::chrono::milliseconds endpoint_lookup_timeout{ 1'500 };

// The caller id of a `PJSIPShowEndpoint` reply, or empty.
[[nodiscard]] std::string callerid_from_endpoint(std::span<const record> records);

// The caller id line of `pjsip show endpoint` command output, or empty.
[[nodiscard]] std::string callerid_from_command(std::span<const record> records);

/**
 * Collects endpoints from the agents table and `PJSIPShowEndpoints`, asks the manager for each one's caller id and
 * records `"Name" <ext>` as a display mapping for the extension and its PJSIP interface. Existing mappings are never
 * touched. Failures for one endpoint are logged and do not stop the others.
 */
void sync_agent_mappings(client &cl, mirror_store &store);

} // namespace amisync::detail
