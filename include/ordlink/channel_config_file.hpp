#pragma once
/**
 * @file channel_config_file.hpp
 * @brief Validate ReliableOrderedConfig values and load them from JSON.
 *
 * @details
 * The channel itself clamps bad sizes quietly. Tools and services that take
 * settings from a file or the command line want to be told instead; that is
 * what this layer is for.
 *
 * JSON shape (every key optional; missing keys keep their defaults):
 * @code
 * {
 *   "sent_packet_buffer_size":    1024,
 *   "message_send_queue_size":    1024,
 *   "message_receive_queue_size": 1024,
 *   "max_message_per_packet":     256,
 *   "packet_budget_bytes":        null,     // or a number
 *   "message_resend_time_ms":     100
 * }
 * @endcode
 *
 * Errors are reported as short, shell-friendly reason tokens in `err`
 * (e.g. `message_send_queue_size_out_of_range`, `json_parse_error`).
 * Nothing here throws.
 */

#include <string>

#include "ordlink/reliable_ordered_channel.hpp"

namespace ordlink {

/**
 * @brief Check every field of `cfg` against its legal range.
 *
 * - queue/buffer sizes: 1..MAX_QUEUE_CAPACITY
 * - max_message_per_packet: 1..MAX_MESSAGES_PER_PACKET_LIMIT
 * - packet_budget_bytes (if set): at least Message::HEADER_BYTES
 *
 * @retval true  Valid; `err` untouched.
 * @retval false First violation found, reason token in `err`.
 */
bool validate(const ReliableOrderedConfig& cfg, std::string& err);

/**
 * @brief Overlay the keys found in JSON `text` onto `cfg`, then validate.
 *
 * `cfg` is only modified when the whole document parses and validates.
 */
bool parse_config_json(const std::string& text, ReliableOrderedConfig& cfg, std::string& err);

/// @brief Read `path` and hand it to parse_config_json().
bool load_config_json(const std::string& path, ReliableOrderedConfig& cfg, std::string& err);

/// @brief Serialize all fields of `cfg` (pretty, 2-space indent).
std::string config_to_json(const ReliableOrderedConfig& cfg);

} // namespace ordlink
