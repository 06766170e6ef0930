#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tiermem/core/types.h"

namespace tiermem {
namespace archive {

enum class ChunkEncoding : uint8_t {
    RAW = 0,    // segments hold the whole payload
    DELTA = 1   // segments hold the middle between copied prefix and suffix
};

const char* chunk_encoding_name(ChunkEncoding encoding);

/**
 * @brief One redactable leaf of a chunk payload
 *
 * For a segment that was never redacted, text is the original content and
 * leaf_digest is recomputed from it on verification. For a redacted segment,
 * text is the display replacement and leaf_digest is the digest of the
 * original content, committed at append time.
 */
struct Segment {
    std::string text;
    bool redacted = false;
    std::string leaf_digest;
};

/**
 * @brief Caller-supplied metadata of an archived item
 */
struct AppendMeta {
    core::ItemId item_id = 0;
    core::SessionId session_id;
    core::Timestamp timestamp = 0;
};

/**
 * @brief A link of an owner's hash chain
 */
struct ArchiveChunk {
    core::ChunkId chunk_id = 0;
    core::OwnerId owner_id;
    core::ItemId item_id = 0;
    core::SessionId session_id;
    core::Timestamp timestamp = 0;
    double importance = 0.0;

    ChunkEncoding encoding = ChunkEncoding::RAW;
    uint32_t base_prefix = 0;   // leading segments copied from the previous payload
    uint32_t base_suffix = 0;   // trailing segments copied from the previous payload
    std::vector<Segment> segments;

    /**
     * Display text of copied segments, keyed by position in this chunk's
     * payload. A copied segment is pinned here before the chunk that stores
     * it is redacted, so the redaction does not reach this payload. Pins are
     * not covered by payload_root; each must match the leaf digest of the
     * segment it stands in for.
     */
    std::map<uint32_t, Segment> pinned;

    std::string payload_root;                   // Merkle root over leaf digests
    std::optional<std::string> previous_hash;   // content_hash of chunk_id - 1
    std::string content_hash;

    bool redacted = false;      // this chunk's payload has been redacted
    uint64_t raw_size = 0;      // byte size of the payload at append

    // Bytes held in segments and pins
    uint64_t stored_size() const;

    /**
     * @brief Deterministic serialization covered by content_hash
     *
     * Covers every field except the segment texts, which are committed
     * through payload_root, the pins and the redaction flags.
     */
    std::string canonical() const;
};

} // namespace archive
} // namespace tiermem
