#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tiermem/archive/archive_chunk.h"
#include "tiermem/archive/archive_sink.h"
#include "tiermem/archive/delta_codec.h"
#include "tiermem/core/config.h"
#include "tiermem/core/result.h"
#include "tiermem/privacy/privacy_redactor.h"

namespace tiermem {
namespace archive {

/**
 * @brief A segment of a reconstructed payload and where it is stored
 */
struct ReconstructedSegment {
    std::string text;
    core::ChunkId source_chunk = 0;     // chunk whose segments hold it
    size_t leaf_index = 0;              // index within that chunk's segments, or pin position
    bool pinned = false;                // held in source_chunk's pins
};

struct ColdArchiveStats {
    uint64_t owners = 0;
    uint64_t chunks = 0;
    uint64_t raw_chunks = 0;
    uint64_t delta_chunks = 0;
    uint64_t redacted_chunks = 0;
    uint64_t raw_bytes = 0;         // payload bytes as appended
    uint64_t stored_bytes = 0;      // bytes held in segments
    uint64_t persist_retries = 0;
    uint64_t persist_failures = 0;

    // raw_bytes / stored_bytes, 1.0 when nothing is stored
    double compression_ratio() const;
};

/**
 * @brief Append-only, hash-chained, delta-compressed per-owner archive
 *
 * Each owner has an independent chain. A chunk commits to its payload through
 * a Merkle root over segment leaf digests and to its predecessor through
 * previous_hash. Redaction masks segments in place; masked segments keep the
 * leaf digest of their original content, so neither payload_root nor
 * content_hash changes and the chain still verifies. Redacting a chunk
 * changes the payload of that chunk only: other chunks that copy a masked
 * segment get its previous text pinned first.
 *
 * Chunks are persisted through the sink before they are published, so a
 * failed append leaves the chain unchanged.
 */
class ColdArchive {
public:
    ColdArchive(const core::ColdArchiveConfig& config,
                std::shared_ptr<ArchiveSink> sink,
                const std::string& placeholder = "[REDACTED]");

    ColdArchive(const ColdArchive&) = delete;
    ColdArchive& operator=(const ColdArchive&) = delete;

    /**
     * @brief Append a payload to the owner's chain
     *
     * The tail chunk is verified first; a corrupted chain is never extended.
     *
     * @return The published chunk, CHAIN_INTEGRITY if the tail does not
     *         verify, STORAGE_FAILURE if the sink failed on every attempt
     */
    core::Result<ArchiveChunk> append(const core::OwnerId& owner,
                                      const std::string& payload,
                                      double importance,
                                      const AppendMeta& meta);

    /**
     * @brief Recompute every hash of the owner's chain
     *
     * Unknown owners have an empty chain, which verifies.
     */
    bool verify_chain(const core::OwnerId& owner) const;

    /**
     * @brief Like verify_chain but names the first failing chunk
     */
    core::Result<void> check_chain(const core::OwnerId& owner) const;

    /**
     * @brief Payloads of chunks 1..up_to_chunk_id, redactions applied
     * @return NOT_FOUND for an unknown owner or chunk id
     */
    core::Result<std::vector<std::string>> reconstruct(const core::OwnerId& owner,
                                                       core::ChunkId up_to_chunk_id) const;

    /**
     * @brief Payload of a single chunk, rebuilt from the nearest raw snapshot
     */
    core::Result<std::string> reconstruct_one(const core::OwnerId& owner,
                                              core::ChunkId chunk_id) const;

    /**
     * @brief Segments of a payload with the location each is stored at
     */
    core::Result<std::vector<ReconstructedSegment>> reconstruct_segments(const core::OwnerId& owner,
                                                                         core::ChunkId chunk_id) const;

    /**
     * @brief Mask every identifier the redactor finds in a chunk's payload
     *
     * Each masked run is replaced by one placeholder. Only this chunk's
     * payload changes. The owner's log is rewritten so the identifiers are
     * not left on disk unless another payload still holds them.
     *
     * @return Number of spans masked
     */
    core::Result<size_t> redact_pii(const core::OwnerId& owner,
                                    core::ChunkId chunk_id,
                                    const privacy::PrivacyRedactor& redactor,
                                    const std::vector<std::string>& extra_terms = {});

    /**
     * @brief Replace a chunk's whole payload with the placeholder
     */
    core::Result<void> redact_chunk(const core::OwnerId& owner, core::ChunkId chunk_id);

    /**
     * @brief Rebuild every chain from the sink
     *
     * Records repeated by retried writes are skipped; a repeated chunk id with
     * a different hash, a gap in the sequence or a chain that does not verify
     * is a CHAIN_INTEGRITY error.
     */
    core::Result<void> recover();

    std::vector<ArchiveChunk> chunks(const core::OwnerId& owner) const;
    std::optional<ArchiveChunk> get_chunk(const core::OwnerId& owner, core::ChunkId chunk_id) const;
    std::optional<ArchiveChunk> find_by_item(const core::OwnerId& owner, core::ItemId item_id) const;
    std::optional<std::string> head_hash(const core::OwnerId& owner) const;
    size_t chunk_count(const core::OwnerId& owner) const;
    std::vector<core::OwnerId> owners() const;
    core::ItemId max_item_id() const;

    ColdArchiveStats stats_snapshot() const;
    std::string stats() const;

    const std::string& placeholder() const { return placeholder_; }

    /**
     * @brief Overwrite a stored segment without going through redaction
     *
     * Exists so tests can show that verify_chain detects tampering.
     */
    core::Result<void> tamper_payload_for_testing(const core::OwnerId& owner,
                                                  core::ChunkId chunk_id,
                                                  size_t segment_index,
                                                  const std::string& text);

private:
    struct OwnerChain {
        mutable std::shared_mutex mutex;
        std::vector<ArchiveChunk> chunks;   // chunks[i].chunk_id == i + 1
    };

    std::shared_ptr<OwnerChain> find_chain(const core::OwnerId& owner) const;
    std::shared_ptr<OwnerChain> get_or_create_chain(const core::OwnerId& owner);

    // Locked helpers; the caller holds the owner chain's mutex
    static core::Result<void> verify_chunk(const std::vector<ArchiveChunk>& chunks, size_t index);
    static core::Result<void> verify_all(const std::vector<ArchiveChunk>& chunks);
    static core::Result<void> advance(const ArchiveChunk& chunk,
                                      std::vector<ReconstructedSegment>& current);
    static void apply_pins(const ArchiveChunk& chunk, std::vector<ReconstructedSegment>& segments);
    static core::Result<std::vector<ReconstructedSegment>> segments_of(
        const std::vector<ArchiveChunk>& chunks, core::ChunkId chunk_id, bool with_pins);
    static core::Result<void> pin_copies(std::vector<ArchiveChunk>& chunks,
                                         const ReconstructedSegment& stored,
                                         core::ChunkId except);

    core::Result<void> persist_with_retry(const ArchiveChunk& chunk);
    core::Result<void> rewrite_with_retry(const core::OwnerId& owner,
                                          const std::vector<ArchiveChunk>& chunks);
    core::Result<void> mask_segments(const core::OwnerId& owner,
                                     OwnerChain& chain,
                                     core::ChunkId chunk_id,
                                     const std::vector<ReconstructedSegment>& segments,
                                     const std::vector<std::optional<std::string>>& replacement);

    core::ColdArchiveConfig config_;
    std::shared_ptr<ArchiveSink> sink_;
    DeltaCodec codec_;
    std::string placeholder_;

    mutable std::shared_mutex chains_mutex_;
    std::map<core::OwnerId, std::shared_ptr<OwnerChain>> chains_;

    std::atomic<uint64_t> persist_retries_{0};
    std::atomic<uint64_t> persist_failures_{0};
};

} // namespace archive
} // namespace tiermem
