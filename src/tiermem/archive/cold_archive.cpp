/**
 * @file cold_archive.cpp
 * @brief Hash-chained, delta-compressed archive for the cold tier
 *
 * Commitment scheme:
 * - leaf      = SHA256(0x00 || segment)
 * - root      = Merkle root over the leaves of the segments a chunk stores
 * - content   = SHA256(canonical chunk fields, root and previous_hash)
 *
 * Delta chunks store only the segments between a prefix and a suffix copied
 * by count from the previous chunk's reconstructed payload. Copied segments
 * are committed by the previous chunks through previous_hash.
 *
 * Redaction replaces the display text of a segment and keeps the original
 * leaf digest beside it, so recomputing the root over (redacted ? stored
 * digest : digest of text) yields the committed root.
 *
 * A stored segment may appear in the payloads of several chunks of one delta
 * run. Before it is masked for one chunk, its text is pinned on every other
 * chunk that copies it. Pins are display text only; verification checks each
 * against the committed digest of the segment it stands in for.
 */

#include "tiermem/archive/cold_archive.h"
#include "tiermem/archive/chain_hash.h"
#include "tiermem/common/logger.h"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace tiermem {
namespace archive {

namespace {

std::string committed_digest(const Segment& segment) {
    return segment.redacted ? segment.leaf_digest : chain_hash::leaf_digest(segment.text);
}

} // namespace

double ColdArchiveStats::compression_ratio() const {
    if (stored_bytes == 0) {
        return 1.0;
    }
    return static_cast<double>(raw_bytes) / static_cast<double>(stored_bytes);
}

ColdArchive::ColdArchive(const core::ColdArchiveConfig& config,
                         std::shared_ptr<ArchiveSink> sink,
                         const std::string& placeholder)
    : config_(config),
      sink_(sink ? std::move(sink) : std::make_shared<NullArchiveSink>()),
      codec_(config.delta_similarity_threshold),
      placeholder_(placeholder) {
    if (config_.max_persist_attempts == 0) {
        throw core::InvalidArgumentError("Archive max_persist_attempts must be at least 1");
    }
    if (placeholder_.empty()) {
        throw core::InvalidArgumentError("Redaction placeholder must not be empty");
    }
}

std::shared_ptr<ColdArchive::OwnerChain> ColdArchive::find_chain(const core::OwnerId& owner) const {
    std::shared_lock<std::shared_mutex> lock(chains_mutex_);
    auto it = chains_.find(owner);
    return it == chains_.end() ? nullptr : it->second;
}

std::shared_ptr<ColdArchive::OwnerChain> ColdArchive::get_or_create_chain(const core::OwnerId& owner) {
    {
        std::shared_lock<std::shared_mutex> lock(chains_mutex_);
        auto it = chains_.find(owner);
        if (it != chains_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(chains_mutex_);
    auto& chain = chains_[owner];
    if (!chain) {
        chain = std::make_shared<OwnerChain>();
    }
    return chain;
}

// ============================================================================
// VERIFICATION
// ============================================================================

core::Result<void> ColdArchive::verify_chunk(const std::vector<ArchiveChunk>& chunks, size_t index) {
    const ArchiveChunk& chunk = chunks[index];
    auto fail = [&chunk](const std::string& what) {
        return core::Result<void>::error("chunk " + std::to_string(chunk.chunk_id) + " of owner " +
                                         chunk.owner_id + ": " + what,
                                         core::Error::Code::CHAIN_INTEGRITY);
    };

    if (chunk.chunk_id != index + 1) {
        return fail("out of sequence");
    }
    if (index > 0 && chunk.owner_id != chunks[index - 1].owner_id) {
        return fail("owner does not match the chain");
    }

    std::vector<std::string> leaves;
    leaves.reserve(chunk.segments.size());
    for (const auto& segment : chunk.segments) {
        if (segment.redacted && !chain_hash::is_digest(segment.leaf_digest)) {
            return fail("redacted segment has no committed digest");
        }
        leaves.push_back(committed_digest(segment));
    }
    if (chain_hash::merkle_root(leaves) != chunk.payload_root) {
        return fail("payload does not match payload_root");
    }
    if (chain_hash::sha256_hex(chunk.canonical()) != chunk.content_hash) {
        return fail("content_hash mismatch");
    }

    if (index == 0) {
        if (chunk.previous_hash) {
            return fail("first chunk must not have a previous_hash");
        }
    } else if (!chunk.previous_hash || *chunk.previous_hash != chunks[index - 1].content_hash) {
        return fail("previous_hash does not link to chunk " + std::to_string(index));
    }
    return core::Result<void>();
}

core::Result<void> ColdArchive::verify_all(const std::vector<ArchiveChunk>& chunks) {
    std::vector<ReconstructedSegment> current;
    for (size_t i = 0; i < chunks.size(); ++i) {
        auto result = verify_chunk(chunks, i);
        if (!result.ok()) {
            return result;
        }
        const ArchiveChunk& chunk = chunks[i];
        auto fail = [&chunk](const std::string& what) {
            return core::Result<void>::error("chunk " + std::to_string(chunk.chunk_id) + " of owner " +
                                             chunk.owner_id + ": " + what,
                                             core::Error::Code::CHAIN_INTEGRITY);
        };
        if (i == 0 && chunk.encoding == ChunkEncoding::DELTA) {
            return fail("first chunk cannot be a delta");
        }
        auto step = advance(chunk, current);
        if (!step.ok()) {
            return step;
        }
        for (const auto& [position, pin] : chunk.pinned) {
            if (position >= current.size()) {
                return fail("pin at " + std::to_string(position) + " is outside the payload");
            }
            const ReconstructedSegment& copied = current[position];
            const Segment& stored = chunks[copied.source_chunk - 1].segments[copied.leaf_index];
            if (committed_digest(pin) != committed_digest(stored)) {
                return fail("pin at " + std::to_string(position) + " does not match the copied segment");
            }
        }
    }
    return core::Result<void>();
}

bool ColdArchive::verify_chain(const core::OwnerId& owner) const {
    return check_chain(owner).ok();
}

core::Result<void> ColdArchive::check_chain(const core::OwnerId& owner) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return core::Result<void>();
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    auto result = verify_all(chain->chunks);
    if (!result.ok()) {
        TIERMEM_ERROR("Chain verification failed: {}", result.error());
    }
    return result;
}

// ============================================================================
// RECONSTRUCTION
// ============================================================================

core::Result<void> ColdArchive::advance(const ArchiveChunk& chunk,
                                        std::vector<ReconstructedSegment>& current) {
    std::vector<ReconstructedSegment> own;
    own.reserve(chunk.segments.size());
    for (size_t i = 0; i < chunk.segments.size(); ++i) {
        own.push_back(ReconstructedSegment{chunk.segments[i].text, chunk.chunk_id, i});
    }

    if (chunk.encoding == ChunkEncoding::RAW) {
        current.swap(own);
        return core::Result<void>();
    }

    auto applied = DeltaCodec::apply(current, chunk.base_prefix, chunk.base_suffix, std::move(own));
    if (!applied.ok()) {
        return core::Result<void>::error("chunk " + std::to_string(chunk.chunk_id) + ": " +
                                         applied.error(),
                                         core::Error::Code::CHAIN_INTEGRITY);
    }
    current = applied.take_value();
    return core::Result<void>();
}

void ColdArchive::apply_pins(const ArchiveChunk& chunk, std::vector<ReconstructedSegment>& segments) {
    for (const auto& [position, pin] : chunk.pinned) {
        if (position < segments.size()) {
            segments[position] = ReconstructedSegment{pin.text, chunk.chunk_id, position, true};
        }
    }
}

core::Result<std::vector<ReconstructedSegment>> ColdArchive::segments_of(
    const std::vector<ArchiveChunk>& chunks, core::ChunkId chunk_id, bool with_pins) {
    using SegmentsResult = core::Result<std::vector<ReconstructedSegment>>;
    if (chunk_id == 0 || chunk_id > chunks.size()) {
        return SegmentsResult::error("chunk " + std::to_string(chunk_id) + " not found",
                                     core::Error::Code::NOT_FOUND);
    }

    // Walk back to the nearest raw snapshot
    size_t start = chunk_id - 1;
    while (start > 0 && chunks[start].encoding == ChunkEncoding::DELTA) {
        --start;
    }

    std::vector<ReconstructedSegment> current;
    for (size_t i = start; i < chunk_id; ++i) {
        auto step = advance(chunks[i], current);
        if (!step.ok()) {
            return SegmentsResult::propagate(step);
        }
    }
    if (with_pins) {
        apply_pins(chunks[chunk_id - 1], current);
    }
    return SegmentsResult(std::move(current));
}

core::Result<std::vector<ReconstructedSegment>> ColdArchive::reconstruct_segments(
    const core::OwnerId& owner, core::ChunkId chunk_id) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return core::Result<std::vector<ReconstructedSegment>>::error(
            "no archive for owner " + owner, core::Error::Code::NOT_FOUND);
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    return segments_of(chain->chunks, chunk_id, true);
}

core::Result<std::string> ColdArchive::reconstruct_one(const core::OwnerId& owner,
                                                       core::ChunkId chunk_id) const {
    auto segments = reconstruct_segments(owner, chunk_id);
    if (!segments.ok()) {
        return core::Result<std::string>::propagate(segments);
    }
    std::string payload;
    for (const auto& segment : segments.value()) {
        payload.append(segment.text);
    }
    return core::Result<std::string>(std::move(payload));
}

core::Result<std::vector<std::string>> ColdArchive::reconstruct(const core::OwnerId& owner,
                                                                core::ChunkId up_to_chunk_id) const {
    using PayloadsResult = core::Result<std::vector<std::string>>;
    auto chain = find_chain(owner);
    if (!chain) {
        return PayloadsResult::error("no archive for owner " + owner, core::Error::Code::NOT_FOUND);
    }

    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    const auto& chunks = chain->chunks;
    if (up_to_chunk_id == 0 || up_to_chunk_id > chunks.size()) {
        return PayloadsResult::error("chunk " + std::to_string(up_to_chunk_id) + " not found for owner " +
                                     owner, core::Error::Code::NOT_FOUND);
    }

    std::vector<std::string> payloads;
    payloads.reserve(up_to_chunk_id);
    std::vector<ReconstructedSegment> current;
    for (size_t i = 0; i < up_to_chunk_id; ++i) {
        auto step = advance(chunks[i], current);
        if (!step.ok()) {
            return PayloadsResult::propagate(step);
        }
        std::vector<ReconstructedSegment> shown = current;
        apply_pins(chunks[i], shown);
        std::string payload;
        for (const auto& segment : shown) {
            payload.append(segment.text);
        }
        payloads.push_back(std::move(payload));
    }
    return PayloadsResult(std::move(payloads));
}

// ============================================================================
// APPEND
// ============================================================================

core::Result<void> ColdArchive::persist_with_retry(const ArchiveChunk& chunk) {
    std::string last_error;
    for (uint32_t attempt = 1; attempt <= config_.max_persist_attempts; ++attempt) {
        auto result = sink_->persist(chunk);
        if (result.ok()) {
            return result;
        }
        last_error = result.error();
        if (attempt < config_.max_persist_attempts) {
            persist_retries_.fetch_add(1, std::memory_order_relaxed);
            TIERMEM_WARN("Persisting chunk {} of owner {} failed (attempt {}/{}): {}",
                         chunk.chunk_id, chunk.owner_id, attempt, config_.max_persist_attempts,
                         last_error);
            std::this_thread::sleep_for(config_.retry_backoff);
        }
    }
    persist_failures_.fetch_add(1, std::memory_order_relaxed);
    TIERMEM_ERROR("Giving up on chunk {} of owner {} after {} attempts: {}",
                  chunk.chunk_id, chunk.owner_id, config_.max_persist_attempts, last_error);
    return core::Result<void>::error("persisting chunk " + std::to_string(chunk.chunk_id) +
                                     " failed after " + std::to_string(config_.max_persist_attempts) +
                                     " attempts: " + last_error,
                                     core::Error::Code::STORAGE_FAILURE);
}

core::Result<void> ColdArchive::rewrite_with_retry(const core::OwnerId& owner,
                                                   const std::vector<ArchiveChunk>& chunks) {
    std::string last_error;
    for (uint32_t attempt = 1; attempt <= config_.max_persist_attempts; ++attempt) {
        auto result = sink_->rewrite(owner, chunks);
        if (result.ok()) {
            return result;
        }
        last_error = result.error();
        if (attempt < config_.max_persist_attempts) {
            persist_retries_.fetch_add(1, std::memory_order_relaxed);
            TIERMEM_WARN("Rewriting archive of owner {} failed (attempt {}/{}): {}",
                         owner, attempt, config_.max_persist_attempts, last_error);
            std::this_thread::sleep_for(config_.retry_backoff);
        }
    }
    persist_failures_.fetch_add(1, std::memory_order_relaxed);
    return core::Result<void>::error("rewriting archive of owner " + owner + " failed: " + last_error,
                                     core::Error::Code::STORAGE_FAILURE);
}

core::Result<ArchiveChunk> ColdArchive::append(const core::OwnerId& owner,
                                               const std::string& payload,
                                               double importance,
                                               const AppendMeta& meta) {
    if (owner.empty()) {
        return core::Result<ArchiveChunk>::error("owner id must not be empty",
                                                 core::Error::Code::INVALID_ARGUMENT);
    }

    auto chain = get_or_create_chain(owner);
    std::unique_lock<std::shared_mutex> lock(chain->mutex);
    auto& chunks = chain->chunks;

    if (!chunks.empty()) {
        auto tail = verify_chunk(chunks, chunks.size() - 1);
        if (!tail.ok()) {
            TIERMEM_ERROR("Refusing to extend corrupted chain: {}", tail.error());
            return core::Result<ArchiveChunk>::propagate(tail);
        }
    }

    std::vector<std::string> target = split_segments(payload);
    DeltaPlan plan;
    size_t trailing_deltas = 0;
    for (auto it = chunks.rbegin(); it != chunks.rend() && it->encoding == ChunkEncoding::DELTA; ++it) {
        ++trailing_deltas;
    }
    if (chunks.empty() || trailing_deltas >= config_.max_delta_chain) {
        plan = DeltaCodec::raw(std::move(target));
    } else {
        auto base = segments_of(chunks, chunks.size(), false);
        if (!base.ok()) {
            return core::Result<ArchiveChunk>::propagate(base);
        }
        std::vector<std::string> base_texts;
        base_texts.reserve(base.value().size());
        for (const auto& segment : base.value()) {
            base_texts.push_back(segment.text);
        }
        plan = codec_.encode(base_texts, target);
    }

    ArchiveChunk chunk;
    chunk.chunk_id = chunks.size() + 1;
    chunk.owner_id = owner;
    chunk.item_id = meta.item_id;
    chunk.session_id = meta.session_id;
    chunk.timestamp = meta.timestamp;
    chunk.importance = importance;
    chunk.encoding = plan.encoding;
    chunk.base_prefix = plan.base_prefix;
    chunk.base_suffix = plan.base_suffix;
    chunk.raw_size = payload.size();

    std::vector<std::string> leaves;
    leaves.reserve(plan.stored.size());
    for (auto& text : plan.stored) {
        Segment segment;
        segment.leaf_digest = chain_hash::leaf_digest(text);
        segment.text = std::move(text);
        leaves.push_back(segment.leaf_digest);
        chunk.segments.push_back(std::move(segment));
    }
    chunk.payload_root = chain_hash::merkle_root(leaves);
    if (!chunks.empty()) {
        chunk.previous_hash = chunks.back().content_hash;
    }
    chunk.content_hash = chain_hash::sha256_hex(chunk.canonical());

    // Built once: a retried write re-sends the same chunk
    auto persisted = persist_with_retry(chunk);
    if (!persisted.ok()) {
        return core::Result<ArchiveChunk>::propagate(persisted);
    }

    chunks.push_back(chunk);
    TIERMEM_DEBUG("Archived item {} of owner {} as chunk {} ({}, {}/{} bytes stored)",
                  chunk.item_id, owner, chunk.chunk_id, chunk_encoding_name(chunk.encoding),
                  chunk.stored_size(), chunk.raw_size);
    return core::Result<ArchiveChunk>(std::move(chunk));
}

// ============================================================================
// REDACTION
// ============================================================================

core::Result<void> ColdArchive::pin_copies(std::vector<ArchiveChunk>& chunks,
                                           const ReconstructedSegment& stored,
                                           core::ChunkId except) {
    const core::ChunkId holder = stored.source_chunk;
    auto walked = segments_of(chunks, holder, false);
    if (!walked.ok()) {
        return core::Result<void>::propagate(walked);
    }
    std::vector<ReconstructedSegment> current = walked.take_value();

    // Copies reach no further than the delta run following the holder
    for (core::ChunkId id = holder; id <= chunks.size(); ++id) {
        ArchiveChunk& chunk = chunks[id - 1];
        if (id > holder) {
            if (chunk.encoding == ChunkEncoding::RAW) {
                break;
            }
            auto step = advance(chunk, current);
            if (!step.ok()) {
                return step;
            }
        }
        if (id == except) {
            continue;
        }
        for (size_t position = 0; position < current.size(); ++position) {
            if (current[position].source_chunk == holder &&
                current[position].leaf_index == stored.leaf_index) {
                chunk.pinned.emplace(static_cast<uint32_t>(position),
                                     chunks[holder - 1].segments[stored.leaf_index]);
            }
        }
    }
    return core::Result<void>();
}

core::Result<void> ColdArchive::mask_segments(const core::OwnerId& owner,
                                              OwnerChain& chain,
                                              core::ChunkId chunk_id,
                                              const std::vector<ReconstructedSegment>& segments,
                                              const std::vector<std::optional<std::string>>& replacement) {
    std::vector<ArchiveChunk> updated = chain.chunks;
    for (size_t k = 0; k < segments.size(); ++k) {
        if (!replacement[k]) {
            continue;
        }
        Segment* segment = nullptr;
        if (segments[k].pinned) {
            segment = &updated[chunk_id - 1].pinned.at(static_cast<uint32_t>(segments[k].leaf_index));
        } else {
            auto pinned = pin_copies(updated, segments[k], chunk_id);
            if (!pinned.ok()) {
                return pinned;
            }
            segment = &updated[segments[k].source_chunk - 1].segments[segments[k].leaf_index];
        }
        if (!segment->redacted) {
            segment->leaf_digest = chain_hash::leaf_digest(segment->text);
            segment->redacted = true;
        }
        segment->text = *replacement[k];
    }
    updated[chunk_id - 1].redacted = true;

    auto rewritten = rewrite_with_retry(owner, updated);
    if (!rewritten.ok()) {
        return rewritten;
    }
    chain.chunks.swap(updated);
    return core::Result<void>();
}

core::Result<size_t> ColdArchive::redact_pii(const core::OwnerId& owner,
                                             core::ChunkId chunk_id,
                                             const privacy::PrivacyRedactor& redactor,
                                             const std::vector<std::string>& extra_terms) {
    auto chain = find_chain(owner);
    if (!chain) {
        return core::Result<size_t>::error("no archive for owner " + owner, core::Error::Code::NOT_FOUND);
    }
    std::unique_lock<std::shared_mutex> lock(chain->mutex);

    auto verified = verify_all(chain->chunks);
    if (!verified.ok()) {
        TIERMEM_ERROR("Refusing to redact corrupted chain: {}", verified.error());
        return core::Result<size_t>::propagate(verified);
    }
    auto reconstructed = segments_of(chain->chunks, chunk_id, true);
    if (!reconstructed.ok()) {
        return core::Result<size_t>::propagate(reconstructed);
    }
    const auto& segments = reconstructed.value();

    std::string text;
    std::vector<size_t> offsets;
    offsets.reserve(segments.size());
    for (const auto& segment : segments) {
        offsets.push_back(text.size());
        text.append(segment.text);
    }

    auto spans = redactor.detect(text, extra_terms);
    if (spans.empty()) {
        return core::Result<size_t>(0);
    }

    std::vector<bool> masked(text.size(), false);
    for (const auto& span : spans) {
        for (size_t i = span.offset; i < span.offset + span.length && i < text.size(); ++i) {
            masked[i] = true;
        }
    }

    // One placeholder at the start of each masked run, masked bytes dropped
    std::vector<std::optional<std::string>> replacement(segments.size());
    for (size_t k = 0; k < segments.size(); ++k) {
        const size_t begin = offsets[k];
        const size_t end = begin + segments[k].text.size();
        bool touched = false;
        std::string display;
        for (size_t i = begin; i < end; ++i) {
            if (!masked[i]) {
                display.push_back(text[i]);
                continue;
            }
            touched = true;
            if (i == 0 || !masked[i - 1]) {
                display.append(placeholder_);
            }
        }
        if (touched) {
            replacement[k] = std::move(display);
        }
    }

    auto result = mask_segments(owner, *chain, chunk_id, segments, replacement);
    if (!result.ok()) {
        return core::Result<size_t>::propagate(result);
    }
    TIERMEM_INFO("Redacted {} identifier(s) from chunk {} of owner {}", spans.size(), chunk_id, owner);
    return core::Result<size_t>(spans.size());
}

core::Result<void> ColdArchive::redact_chunk(const core::OwnerId& owner, core::ChunkId chunk_id) {
    auto chain = find_chain(owner);
    if (!chain) {
        return core::Result<void>::error("no archive for owner " + owner, core::Error::Code::NOT_FOUND);
    }
    std::unique_lock<std::shared_mutex> lock(chain->mutex);

    auto verified = verify_all(chain->chunks);
    if (!verified.ok()) {
        TIERMEM_ERROR("Refusing to redact corrupted chain: {}", verified.error());
        return verified;
    }
    auto reconstructed = segments_of(chain->chunks, chunk_id, true);
    if (!reconstructed.ok()) {
        return core::Result<void>::propagate(reconstructed);
    }
    const auto& segments = reconstructed.value();
    if (segments.empty()) {
        return core::Result<void>();
    }

    std::vector<std::optional<std::string>> replacement(segments.size(), std::string());
    replacement[0] = placeholder_;
    auto result = mask_segments(owner, *chain, chunk_id, segments, replacement);
    if (result.ok()) {
        TIERMEM_INFO("Redacted chunk {} of owner {}", chunk_id, owner);
    }
    return result;
}

// ============================================================================
// RECOVERY
// ============================================================================

core::Result<void> ColdArchive::recover() {
    std::map<core::OwnerId, std::vector<ArchiveChunk>> loaded;
    std::optional<std::string> failure;
    size_t duplicates = 0;

    auto replayed = sink_->replay([&](ArchiveChunk chunk) {
        if (failure) {
            return;
        }
        auto& chunks = loaded[chunk.owner_id];
        if (chunk.chunk_id >= 1 && chunk.chunk_id <= chunks.size()) {
            if (chunks[chunk.chunk_id - 1].content_hash == chunk.content_hash) {
                ++duplicates;
                return;
            }
            failure = "conflicting records for chunk " + std::to_string(chunk.chunk_id) +
                      " of owner " + chunk.owner_id;
            return;
        }
        if (chunk.chunk_id != chunks.size() + 1) {
            failure = "gap before chunk " + std::to_string(chunk.chunk_id) + " of owner " +
                      chunk.owner_id;
            return;
        }
        chunks.push_back(std::move(chunk));
    });
    if (!replayed.ok()) {
        return replayed;
    }
    if (failure) {
        TIERMEM_ERROR("Archive recovery failed: {}", *failure);
        return core::Result<void>::error(*failure, core::Error::Code::CHAIN_INTEGRITY);
    }

    size_t total = 0;
    for (const auto& [owner, chunks] : loaded) {
        auto verified = verify_all(chunks);
        if (!verified.ok()) {
            TIERMEM_ERROR("Archive recovery failed: {}", verified.error());
            return verified;
        }
        total += chunks.size();
    }

    std::unique_lock<std::shared_mutex> lock(chains_mutex_);
    chains_.clear();
    for (auto& [owner, chunks] : loaded) {
        auto chain = std::make_shared<OwnerChain>();
        chain->chunks = std::move(chunks);
        chains_.emplace(owner, std::move(chain));
    }
    TIERMEM_INFO("Recovered {} archive chunks for {} owners ({} duplicate records skipped)",
                 total, chains_.size(), duplicates);
    return core::Result<void>();
}

// ============================================================================
// ACCESSORS
// ============================================================================

std::vector<ArchiveChunk> ColdArchive::chunks(const core::OwnerId& owner) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return {};
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    return chain->chunks;
}

std::optional<ArchiveChunk> ColdArchive::get_chunk(const core::OwnerId& owner, core::ChunkId chunk_id) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    if (chunk_id == 0 || chunk_id > chain->chunks.size()) {
        return std::nullopt;
    }
    return chain->chunks[chunk_id - 1];
}

std::optional<ArchiveChunk> ColdArchive::find_by_item(const core::OwnerId& owner, core::ItemId item_id) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    for (const auto& chunk : chain->chunks) {
        if (chunk.item_id == item_id) {
            return chunk;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ColdArchive::head_hash(const core::OwnerId& owner) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    if (chain->chunks.empty()) {
        return std::nullopt;
    }
    return chain->chunks.back().content_hash;
}

size_t ColdArchive::chunk_count(const core::OwnerId& owner) const {
    auto chain = find_chain(owner);
    if (!chain) {
        return 0;
    }
    std::shared_lock<std::shared_mutex> lock(chain->mutex);
    return chain->chunks.size();
}

std::vector<core::OwnerId> ColdArchive::owners() const {
    std::shared_lock<std::shared_mutex> lock(chains_mutex_);
    std::vector<core::OwnerId> out;
    for (const auto& [owner, chain] : chains_) {
        out.push_back(owner);
    }
    return out;
}

core::ItemId ColdArchive::max_item_id() const {
    core::ItemId max_id = 0;
    for (const auto& owner : owners()) {
        for (const auto& chunk : chunks(owner)) {
            max_id = std::max(max_id, chunk.item_id);
        }
    }
    return max_id;
}

ColdArchiveStats ColdArchive::stats_snapshot() const {
    ColdArchiveStats stats;
    std::shared_lock<std::shared_mutex> lock(chains_mutex_);
    for (const auto& [owner, chain] : chains_) {
        std::shared_lock<std::shared_mutex> chain_lock(chain->mutex);
        if (chain->chunks.empty()) {
            continue;
        }
        ++stats.owners;
        for (const auto& chunk : chain->chunks) {
            ++stats.chunks;
            if (chunk.encoding == ChunkEncoding::RAW) {
                ++stats.raw_chunks;
            } else {
                ++stats.delta_chunks;
            }
            if (chunk.redacted) {
                ++stats.redacted_chunks;
            }
            stats.raw_bytes += chunk.raw_size;
            stats.stored_bytes += chunk.stored_size();
        }
    }
    stats.persist_retries = persist_retries_.load(std::memory_order_relaxed);
    stats.persist_failures = persist_failures_.load(std::memory_order_relaxed);
    return stats;
}

std::string ColdArchive::stats() const {
    ColdArchiveStats s = stats_snapshot();
    std::ostringstream oss;
    oss << "ColdArchive Stats:\n";
    oss << "  Owners: " << s.owners << "\n";
    oss << "  Chunks: " << s.chunks << " (" << s.raw_chunks << " raw, " << s.delta_chunks
        << " delta, " << s.redacted_chunks << " redacted)\n";
    oss << "  Bytes: " << s.raw_bytes << " raw, " << s.stored_bytes << " stored\n";
    oss << "  Compression ratio: " << std::fixed << std::setprecision(2) << s.compression_ratio() << "\n";
    oss << "  Persist retries: " << s.persist_retries << ", failures: " << s.persist_failures << "\n";
    return oss.str();
}

core::Result<void> ColdArchive::tamper_payload_for_testing(const core::OwnerId& owner,
                                                           core::ChunkId chunk_id,
                                                           size_t segment_index,
                                                           const std::string& text) {
    auto chain = find_chain(owner);
    if (!chain) {
        return core::Result<void>::error("no archive for owner " + owner, core::Error::Code::NOT_FOUND);
    }
    std::unique_lock<std::shared_mutex> lock(chain->mutex);
    if (chunk_id == 0 || chunk_id > chain->chunks.size() ||
        segment_index >= chain->chunks[chunk_id - 1].segments.size()) {
        return core::Result<void>::error("segment not found", core::Error::Code::NOT_FOUND);
    }
    chain->chunks[chunk_id - 1].segments[segment_index].text = text;
    return core::Result<void>();
}

} // namespace archive
} // namespace tiermem
