#ifndef TIERMEM_CORE_TYPES_H_
#define TIERMEM_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tiermem {
namespace core {

/**
 * @brief Identifies the user whose memory is stored; every tier is partitioned by it
 */
using OwnerId = std::string;

/**
 * @brief Identifies a conversation session of an owner
 */
using SessionId = std::string;

/**
 * @brief Unique identifier of a MemoryItem
 */
using ItemId = uint64_t;

/**
 * @brief Identifier of a warm-tier graph node (unique per store)
 */
using NodeId = uint64_t;

/**
 * @brief Identifier of a cold-tier chunk, sequential per owner starting at 1
 */
using ChunkId = uint64_t;

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Storage tier that owns a memory item
 */
enum class Tier : uint8_t {
    HOT = 0,
    WARM = 1,
    COLD = 2
};

/**
 * @brief Static per-tier behavior, looked up by Tier
 */
struct TierTraits {
    Tier tier;
    const char* name;
    double recall_bonus;   // added to the recall score of entries from this tier
    bool durable;          // survives a process restart
};

const TierTraits& tier_traits(Tier tier);
const char* tier_name(Tier tier);

/**
 * @brief The four caller-normalized inputs of the importance scorer
 */
struct ImportanceSignals {
    double semantic_novelty = 0.0;
    double sentiment_intensity = 0.0;
    double user_feedback = 0.0;
    uint32_t recurrence_count = 0;
};

/**
 * @brief Payload of a conversational turn
 */
struct MemoryContent {
    std::string text;
    std::vector<std::string> entities;  // entities mentioned in the turn
    std::vector<std::string> topics;
};

/**
 * @brief The atomic unit of conversational memory
 */
struct MemoryItem {
    ItemId id = 0;
    OwnerId owner_id;
    SessionId session_id;
    MemoryContent content;
    ImportanceSignals signals;
    double importance = 0.0;
    Timestamp created_at = 0;
    Timestamp last_referenced_at = 0;
    uint32_t access_count = 0;      // times returned by recall while hot
    Tier tier = Tier::HOT;

    // Case-insensitive match of the hint against text, entities and topics
    bool mentions(const std::string& hint) const;
};

/**
 * @brief Lowercases and trims a label so equal entities map to one node
 */
std::string normalize_label(const std::string& label);

} // namespace core
} // namespace tiermem

#endif // TIERMEM_CORE_TYPES_H_
