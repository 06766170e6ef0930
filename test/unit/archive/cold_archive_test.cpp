#include <gtest/gtest.h>
#include "tiermem/archive/cold_archive.h"
#include "tiermem/archive/chain_hash.h"
#include "tiermem/privacy/privacy_redactor.h"
#include "test_util/memory_sink.h"

#include <memory>
#include <thread>

namespace tiermem {
namespace archive {
namespace test {

class ColdArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<testutil::MemorySink>();
        archive_ = std::make_unique<ColdArchive>(create_test_config(), sink_);
    }

    core::ColdArchiveConfig create_test_config() {
        core::ColdArchiveConfig config = core::ColdArchiveConfig::Default();
        config.retry_backoff = std::chrono::milliseconds(0);
        return config;
    }

    core::Result<ArchiveChunk> append(const std::string& payload, const core::OwnerId& owner = "alice",
                                      core::ItemId item_id = 0) {
        AppendMeta meta;
        meta.item_id = item_id;
        meta.session_id = "s1";
        meta.timestamp = 1000;
        return archive_->append(owner, payload, 3.0, meta);
    }

    std::shared_ptr<testutil::MemorySink> sink_;
    std::unique_ptr<ColdArchive> archive_;
    privacy::PrivacyRedactor redactor_;
};

// ============================================================================
// CHAIN STRUCTURE
// ============================================================================

TEST_F(ColdArchiveTest, AppendLinksChunks) {
    auto first = append("A");
    auto second = append("B");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(first.value().chunk_id, 1u);
    EXPECT_FALSE(first.value().previous_hash.has_value());
    EXPECT_EQ(second.value().chunk_id, 2u);
    ASSERT_TRUE(second.value().previous_hash.has_value());
    EXPECT_EQ(*second.value().previous_hash, first.value().content_hash);
    EXPECT_TRUE(chain_hash::is_digest(second.value().content_hash));

    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_EQ(archive_->head_hash("alice"), second.value().content_hash);
    EXPECT_EQ(archive_->chunk_count("alice"), 2u);
    EXPECT_EQ(sink_->records().size(), 2u);
}

TEST_F(ColdArchiveTest, OwnersHaveIndependentChains) {
    append("one", "alice");
    auto bob = append("two", "bob");
    ASSERT_TRUE(bob.ok());
    EXPECT_EQ(bob.value().chunk_id, 1u);
    EXPECT_FALSE(bob.value().previous_hash.has_value());
    EXPECT_EQ(archive_->owners().size(), 2u);
}

TEST_F(ColdArchiveTest, EmptyOwnerRejected) {
    EXPECT_EQ(append("x", "").error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(ColdArchiveTest, UnknownOwnerVerifiesAndHasNoHead) {
    EXPECT_TRUE(archive_->verify_chain("nobody"));
    EXPECT_FALSE(archive_->head_hash("nobody").has_value());
    EXPECT_EQ(archive_->reconstruct("nobody", 1).error_code(), core::Error::Code::NOT_FOUND);
}

TEST_F(ColdArchiveTest, ReconstructRange) {
    append("A");
    append("B");
    auto payloads = archive_->reconstruct("alice", 2);
    ASSERT_TRUE(payloads.ok());
    EXPECT_EQ(payloads.value(), (std::vector<std::string>{"A", "B"}));

    EXPECT_EQ(archive_->reconstruct("alice", 0).error_code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(archive_->reconstruct("alice", 3).error_code(), core::Error::Code::NOT_FOUND);
}

// ============================================================================
// DELTA COMPRESSION
// ============================================================================

TEST_F(ColdArchiveTest, SimilarPayloadsStoredAsDelta) {
    const std::string first = "the quick brown fox jumps over the lazy dog";
    const std::string second = "the quick brown cat jumps over the lazy dog";
    append(first);
    auto delta = append(second);
    ASSERT_TRUE(delta.ok());
    EXPECT_EQ(delta.value().encoding, ChunkEncoding::DELTA);
    EXPECT_EQ(delta.value().segments.size(), 1u);
    EXPECT_LT(delta.value().stored_size(), delta.value().raw_size);

    auto payloads = archive_->reconstruct("alice", 2);
    ASSERT_TRUE(payloads.ok());
    EXPECT_EQ(payloads.value()[0], first);
    EXPECT_EQ(payloads.value()[1], second);

    auto one = archive_->reconstruct_one("alice", 2);
    ASSERT_TRUE(one.ok());
    EXPECT_EQ(one.value(), second);

    auto stats = archive_->stats_snapshot();
    EXPECT_EQ(stats.delta_chunks, 1u);
    EXPECT_GT(stats.compression_ratio(), 1.0);
    EXPECT_TRUE(archive_->verify_chain("alice"));
}

TEST_F(ColdArchiveTest, ReconstructedSegmentsCarryProvenance) {
    append("the quick brown fox jumps over the lazy dog");
    append("the quick brown cat jumps over the lazy dog");

    auto segments = archive_->reconstruct_segments("alice", 2);
    ASSERT_TRUE(segments.ok());
    ASSERT_EQ(segments.value().size(), 9u);
    EXPECT_EQ(segments.value()[0].source_chunk, 1u);
    EXPECT_EQ(segments.value()[3].text, "cat ");
    EXPECT_EQ(segments.value()[3].source_chunk, 2u);
    EXPECT_EQ(segments.value()[3].leaf_index, 0u);
    EXPECT_EQ(segments.value()[4].source_chunk, 1u);
    EXPECT_EQ(segments.value()[4].leaf_index, 4u);

    EXPECT_EQ(archive_->reconstruct_segments("alice", 3).error_code(), core::Error::Code::NOT_FOUND);
}

TEST_F(ColdArchiveTest, DeltaChainLengthIsBounded) {
    auto config = create_test_config();
    config.max_delta_chain = 2;
    ColdArchive archive(config, sink_);

    std::vector<ChunkEncoding> encodings;
    for (int i = 1; i <= 4; ++i) {
        AppendMeta meta;
        meta.item_id = static_cast<core::ItemId>(i);
        auto chunk = archive.append("alice", "alpha beta gamma delta v" + std::to_string(i), 1.0, meta);
        ASSERT_TRUE(chunk.ok());
        encodings.push_back(chunk.value().encoding);
    }
    EXPECT_EQ(encodings, (std::vector<ChunkEncoding>{ChunkEncoding::RAW, ChunkEncoding::DELTA,
                                                     ChunkEncoding::DELTA, ChunkEncoding::RAW}));

    auto payload = archive.reconstruct_one("alice", 3);
    ASSERT_TRUE(payload.ok());
    EXPECT_EQ(payload.value(), "alpha beta gamma delta v3");
}

// ============================================================================
// TAMPER DETECTION
// ============================================================================

TEST_F(ColdArchiveTest, TamperedPayloadDetected) {
    append("A");
    append("B");
    ASSERT_TRUE(archive_->tamper_payload_for_testing("alice", 1, 0, "X").ok());

    EXPECT_FALSE(archive_->verify_chain("alice"));
    auto checked = archive_->check_chain("alice");
    ASSERT_FALSE(checked.ok());
    EXPECT_EQ(checked.error_code(), core::Error::Code::CHAIN_INTEGRITY);
    EXPECT_NE(checked.error().find("chunk 1"), std::string::npos);
}

TEST_F(ColdArchiveTest, CorruptedTailBlocksAppend) {
    append("A");
    ASSERT_TRUE(archive_->tamper_payload_for_testing("alice", 1, 0, "Z").ok());

    auto result = append("B");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::CHAIN_INTEGRITY);
    EXPECT_EQ(archive_->chunk_count("alice"), 1u);
}

TEST_F(ColdArchiveTest, CorruptedChainBlocksRedaction) {
    append("A");
    append("B");
    archive_->tamper_payload_for_testing("alice", 1, 0, "Z");
    EXPECT_EQ(archive_->redact_chunk("alice", 2).error_code(), core::Error::Code::CHAIN_INTEGRITY);
}

// ============================================================================
// REDACTION
// ============================================================================

TEST_F(ColdArchiveTest, RedactionPreservesIntegrity) {
    append("A");
    append("B");
    ASSERT_TRUE(archive_->verify_chain("alice"));
    auto head_before = archive_->head_hash("alice");

    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());

    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_EQ(archive_->head_hash("alice"), head_before);
    auto payloads = archive_->reconstruct("alice", 2);
    ASSERT_TRUE(payloads.ok());
    EXPECT_EQ(payloads.value(), (std::vector<std::string>{"[REDACTED]", "B"}));
    EXPECT_TRUE(archive_->get_chunk("alice", 1)->redacted);
    EXPECT_FALSE(archive_->get_chunk("alice", 2)->redacted);
}

TEST_F(ColdArchiveTest, RedactionIsRewrittenToSink) {
    append("secret words here");
    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());
    EXPECT_EQ(sink_->rewrite_calls(), 1);

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    for (const auto& segment : records[0].segments) {
        EXPECT_EQ(segment.text.find("secret"), std::string::npos);
    }
}

TEST_F(ColdArchiveTest, RedactPiiChangesOnlyTheRedactedPayload) {
    append("call me at alice@example.com tomorrow");
    auto delta = append("call me at alice@example.com next week");
    ASSERT_TRUE(delta.ok());
    ASSERT_EQ(delta.value().encoding, ChunkEncoding::DELTA);

    auto masked = archive_->redact_pii("alice", 2, redactor_);
    ASSERT_TRUE(masked.ok());
    EXPECT_EQ(masked.value(), 1u);

    auto payloads = archive_->reconstruct("alice", 2);
    ASSERT_TRUE(payloads.ok());
    EXPECT_EQ(payloads.value()[0], "call me at alice@example.com tomorrow");
    EXPECT_EQ(payloads.value()[1], "call me at [REDACTED] next week");
    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_FALSE(archive_->get_chunk("alice", 1)->redacted);
    EXPECT_TRUE(archive_->get_chunk("alice", 2)->redacted);
}

TEST_F(ColdArchiveTest, RedactingBaseLeavesDeltaIntact) {
    const std::string first = "I went hiking with my sister on the long trail today";
    const std::string second = "I went hiking with my sister on the long trail yesterday";
    append(first);
    auto delta = append(second);
    ASSERT_TRUE(delta.ok());
    ASSERT_EQ(delta.value().encoding, ChunkEncoding::DELTA);
    auto head_before = archive_->head_hash("alice");

    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());

    EXPECT_EQ(archive_->reconstruct("alice", 2).value(),
              (std::vector<std::string>{"[REDACTED]", second}));
    EXPECT_EQ(archive_->reconstruct_one("alice", 2).value(), second);
    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_EQ(archive_->head_hash("alice"), head_before);

    auto segments = archive_->reconstruct_segments("alice", 2);
    ASSERT_TRUE(segments.ok());
    EXPECT_TRUE(segments.value()[0].pinned);
    EXPECT_EQ(segments.value()[0].source_chunk, 2u);
}

TEST_F(ColdArchiveTest, RedactingDeltaLeavesBaseIntact) {
    const std::string first = "I went hiking with my sister on the long trail today";
    const std::string second = "I went hiking with my sister on the long trail yesterday";
    append(first);
    append(second);

    ASSERT_TRUE(archive_->redact_chunk("alice", 2).ok());

    EXPECT_EQ(archive_->reconstruct("alice", 2).value(),
              (std::vector<std::string>{first, "[REDACTED]"}));
    EXPECT_TRUE(archive_->verify_chain("alice"));
}

TEST_F(ColdArchiveTest, RedactingEveryPayloadClearsSharedText) {
    append("I went hiking with my sister on the long trail today");
    append("I went hiking with my sister on the long trail yesterday");
    append("I went hiking with my sister on the long trail again");

    ASSERT_TRUE(archive_->redact_chunk("alice", 2).ok());
    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());
    ASSERT_TRUE(archive_->redact_chunk("alice", 3).ok());

    EXPECT_EQ(archive_->reconstruct("alice", 3).value(),
              (std::vector<std::string>{"[REDACTED]", "[REDACTED]", "[REDACTED]"}));
    EXPECT_TRUE(archive_->verify_chain("alice"));
    for (const auto& record : sink_->records()) {
        for (const auto& segment : record.segments) {
            EXPECT_EQ(segment.text.find("sister"), std::string::npos);
        }
        for (const auto& [position, pin] : record.pinned) {
            EXPECT_EQ(pin.text.find("sister"), std::string::npos);
        }
    }
}

TEST_F(ColdArchiveTest, TamperedPinIsDetectedOnRecovery) {
    append("I went hiking with my sister on the long trail today");
    append("I went hiking with my sister on the long trail yesterday");
    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 2u);
    ASSERT_FALSE(records[1].pinned.empty());
    records[1].pinned.begin()->second.text = "You ";

    auto tampered = std::make_shared<testutil::MemorySink>();
    for (const auto& record : records) {
        tampered->add_record(record);
    }
    ColdArchive restored(create_test_config(), tampered);
    auto recovered = restored.recover();
    ASSERT_FALSE(recovered.ok());
    EXPECT_EQ(recovered.error_code(), core::Error::Code::CHAIN_INTEGRITY);
}

TEST_F(ColdArchiveTest, RedactPiiWithExtraTerms) {
    append("Project Nightingale ships friday");
    auto masked = archive_->redact_pii("alice", 1, redactor_, {"nightingale"});
    ASSERT_TRUE(masked.ok());
    EXPECT_EQ(masked.value(), 1u);
    EXPECT_EQ(archive_->reconstruct_one("alice", 1).value(), "Project [REDACTED] ships friday");
    EXPECT_TRUE(archive_->verify_chain("alice"));
}

TEST_F(ColdArchiveTest, RedactPiiWithoutMatchesChangesNothing) {
    append("nothing sensitive");
    auto masked = archive_->redact_pii("alice", 1, redactor_);
    ASSERT_TRUE(masked.ok());
    EXPECT_EQ(masked.value(), 0u);
    EXPECT_EQ(sink_->rewrite_calls(), 0);
    EXPECT_FALSE(archive_->get_chunk("alice", 1)->redacted);
}

TEST_F(ColdArchiveTest, RedactingTwiceKeepsOriginalCommitment) {
    append("A");
    append("B");
    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());
    ASSERT_TRUE(archive_->redact_chunk("alice", 1).ok());
    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_EQ(archive_->get_chunk("alice", 1)->segments[0].leaf_digest, chain_hash::leaf_digest("A"));
}

TEST_F(ColdArchiveTest, AppendAfterRedaction) {
    append("A");
    archive_->redact_chunk("alice", 1);
    auto next = append("C");
    ASSERT_TRUE(next.ok());
    EXPECT_TRUE(archive_->verify_chain("alice"));
    EXPECT_EQ(archive_->reconstruct("alice", 2).value(),
              (std::vector<std::string>{"[REDACTED]", "C"}));
}

// ============================================================================
// PERSISTENCE FAILURES
// ============================================================================

TEST_F(ColdArchiveTest, TransientFailureIsRetriedOnce) {
    append("A");
    sink_->fail_next(2);
    auto result = append("B");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().chunk_id, 2u);
    EXPECT_EQ(archive_->chunk_count("alice"), 2u);
    EXPECT_EQ(sink_->records().size(), 2u);
    EXPECT_EQ(archive_->stats_snapshot().persist_retries, 2u);
    EXPECT_TRUE(archive_->verify_chain("alice"));
}

TEST_F(ColdArchiveTest, PersistentFailureLeavesChainUnchanged) {
    append("A");
    auto head = archive_->head_hash("alice");
    sink_->set_always_fail(true);

    auto result = append("B");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::STORAGE_FAILURE);
    EXPECT_EQ(archive_->chunk_count("alice"), 1u);
    EXPECT_EQ(archive_->head_hash("alice"), head);
    EXPECT_EQ(sink_->persist_calls(), 1 + 3);
    EXPECT_EQ(archive_->stats_snapshot().persist_failures, 1u);

    sink_->set_always_fail(false);
    auto retry = append("B");
    ASSERT_TRUE(retry.ok());
    EXPECT_EQ(retry.value().chunk_id, 2u);
}

TEST_F(ColdArchiveTest, FailedRewriteKeepsContent) {
    append("A");
    sink_->set_always_fail(true);
    auto result = archive_->redact_chunk("alice", 1);
    EXPECT_EQ(result.error_code(), core::Error::Code::STORAGE_FAILURE);
    EXPECT_EQ(archive_->reconstruct_one("alice", 1).value(), "A");
}

// ============================================================================
// RECOVERY
// ============================================================================

TEST_F(ColdArchiveTest, RecoverRebuildsChains) {
    append("A", "alice", 4);
    append("B", "alice", 7);
    append("hello", "bob", 9);
    archive_->redact_chunk("alice", 1);

    ColdArchive restored(create_test_config(), sink_);
    ASSERT_TRUE(restored.recover().ok());
    EXPECT_EQ(restored.chunk_count("alice"), 2u);
    EXPECT_EQ(restored.chunk_count("bob"), 1u);
    EXPECT_TRUE(restored.verify_chain("alice"));
    EXPECT_EQ(restored.head_hash("alice"), archive_->head_hash("alice"));
    EXPECT_EQ(restored.reconstruct("alice", 2).value(),
              (std::vector<std::string>{"[REDACTED]", "B"}));
    EXPECT_EQ(restored.max_item_id(), 9u);
    ASSERT_TRUE(restored.find_by_item("alice", 7).has_value());
    EXPECT_EQ(restored.find_by_item("alice", 7)->chunk_id, 2u);
}

TEST_F(ColdArchiveTest, RecoverSkipsRetriedDuplicates) {
    append("A");
    sink_->fail_next(1, true);  // written, but reported as failed
    ASSERT_TRUE(append("B").ok());
    EXPECT_EQ(sink_->records().size(), 3u);

    ColdArchive restored(create_test_config(), sink_);
    ASSERT_TRUE(restored.recover().ok());
    EXPECT_EQ(restored.chunk_count("alice"), 2u);
    EXPECT_TRUE(restored.verify_chain("alice"));
}

TEST_F(ColdArchiveTest, RecoverRejectsConflictingRecords) {
    auto first = append("A");
    ArchiveChunk forged = first.value();
    forged.content_hash = chain_hash::sha256_hex("forged");
    sink_->add_record(forged);

    ColdArchive restored(create_test_config(), sink_);
    auto result = restored.recover();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::CHAIN_INTEGRITY);
}

TEST_F(ColdArchiveTest, RecoverRejectsGaps) {
    append("A");
    append("B");
    auto records = sink_->records();
    auto gapped = std::make_shared<testutil::MemorySink>();
    gapped->add_record(records[1]);

    ColdArchive restored(create_test_config(), gapped);
    EXPECT_EQ(restored.recover().error_code(), core::Error::Code::CHAIN_INTEGRITY);
}

TEST_F(ColdArchiveTest, RecoverRejectsTamperedRecords) {
    append("A");
    auto records = sink_->records();
    records[0].segments[0].text = "Q";
    auto tampered = std::make_shared<testutil::MemorySink>();
    tampered->add_record(records[0]);

    ColdArchive restored(create_test_config(), tampered);
    EXPECT_EQ(restored.recover().error_code(), core::Error::Code::CHAIN_INTEGRITY);
}

TEST_F(ColdArchiveTest, ConcurrentAppendsToOneOwner) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i) {
                AppendMeta meta;
                meta.item_id = static_cast<core::ItemId>(t * 100 + i);
                auto result = archive_->append("alice", "turn " + std::to_string(t) + " " +
                                               std::to_string(i), 1.0, meta);
                EXPECT_TRUE(result.ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(archive_->chunk_count("alice"), 100u);
    EXPECT_TRUE(archive_->verify_chain("alice"));
}

} // namespace test
} // namespace archive
} // namespace tiermem
