#pragma once

#include <string>

#include "tiermem/core/types.h"

namespace tiermem {
namespace memory {

/**
 * @brief Text form of a turn as stored in the cold archive
 *
 *   entities: Alice, Bob
 *   topics: career
 *
 *   <turn text>
 *
 * The header lines are whitespace-separated like the text, so archived turns
 * delta-compress and redact the same way. Labels must not contain ", ".
 */
std::string encode_turn(const core::MemoryContent& content);

/**
 * @brief Parse an archived turn
 *
 * Tolerates payloads whose header was partly redacted; anything that does
 * not parse as a header is treated as text.
 */
core::MemoryContent decode_turn(const std::string& payload);

} // namespace memory
} // namespace tiermem
