#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "tiermem/archive/cold_archive.h"
#include "tiermem/privacy/privacy_redactor.h"

using namespace tiermem;
using namespace tiermem::archive;
using namespace testing;

// Mock ArchiveSink
class MockArchiveSink : public ArchiveSink {
public:
    MOCK_METHOD(core::Result<void>, persist, (const ArchiveChunk&), (override));
    MOCK_METHOD(core::Result<void>, rewrite, (const core::OwnerId&, const std::vector<ArchiveChunk>&), (override));
    MOCK_METHOD(core::Result<void>, replay, (std::function<void(ArchiveChunk)>), (override));
    MOCK_METHOD(core::Result<void>, flush, (), (override));
};

class ArchiveSinkMockTest : public Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<StrictMock<MockArchiveSink>>();
        config_ = core::ColdArchiveConfig::Default();
        config_.max_persist_attempts = 3;
        config_.retry_backoff = std::chrono::milliseconds(0);
        archive_ = std::make_unique<ColdArchive>(config_, sink_);
    }

    static AppendMeta meta(core::ItemId id) {
        AppendMeta m;
        m.item_id = id;
        m.session_id = "s1";
        m.timestamp = 1000 + static_cast<core::Timestamp>(id);
        return m;
    }

    static core::Result<void> failure() {
        return core::Result<void>::error("disk full", core::Error::Code::STORAGE_FAILURE);
    }

    std::shared_ptr<StrictMock<MockArchiveSink>> sink_;
    core::ColdArchiveConfig config_;
    std::unique_ptr<ColdArchive> archive_;
};

TEST_F(ArchiveSinkMockTest, AppendPersistsOnce) {
    EXPECT_CALL(*sink_, persist(_))
        .WillOnce(Invoke([](const ArchiveChunk& chunk) {
            EXPECT_EQ(chunk.chunk_id, 1u);
            EXPECT_EQ(chunk.owner_id, "alice");
            EXPECT_FALSE(chunk.previous_hash.has_value());
            EXPECT_FALSE(chunk.content_hash.empty());
            return core::Result<void>();
        }));

    auto appended = archive_->append("alice", "hello world", 2.5, meta(1));
    ASSERT_TRUE(appended.ok()) << appended.error();
    EXPECT_EQ(archive_->chunk_count("alice"), 1u);
    EXPECT_EQ(archive_->head_hash("alice"), appended.value().content_hash);
}

TEST_F(ArchiveSinkMockTest, TransientFailureIsRetried) {
    EXPECT_CALL(*sink_, persist(_))
        .WillOnce(Return(failure()))
        .WillOnce(Return(core::Result<void>()));

    auto appended = archive_->append("alice", "hello world", 2.5, meta(1));
    ASSERT_TRUE(appended.ok());
    EXPECT_EQ(archive_->stats_snapshot().persist_retries, 1u);
}

TEST_F(ArchiveSinkMockTest, RetriesAreBounded) {
    EXPECT_CALL(*sink_, persist(_))
        .Times(3)
        .WillRepeatedly(Return(failure()));

    auto appended = archive_->append("alice", "hello world", 2.5, meta(1));
    ASSERT_FALSE(appended.ok());
    EXPECT_EQ(appended.error_code(), core::Error::Code::STORAGE_FAILURE);
    EXPECT_THAT(appended.error(), HasSubstr("disk full"));
    EXPECT_EQ(archive_->chunk_count("alice"), 0u);
    EXPECT_EQ(archive_->stats_snapshot().persist_failures, 1u);
}

TEST_F(ArchiveSinkMockTest, RedactionRewritesOwnerLog) {
    EXPECT_CALL(*sink_, persist(_)).WillRepeatedly(Return(core::Result<void>()));
    ASSERT_TRUE(archive_->append("alice", "mail me at kim@example.net please", 3.0, meta(1)).ok());
    ASSERT_TRUE(archive_->append("alice", "nothing sensitive here", 3.0, meta(2)).ok());

    EXPECT_CALL(*sink_, rewrite(Eq("alice"), SizeIs(2)))
        .WillOnce(Invoke([](const core::OwnerId&, const std::vector<ArchiveChunk>& chunks) {
            for (const auto& segment : chunks[0].segments) {
                EXPECT_THAT(segment.text, Not(HasSubstr("kim@example.net")));
            }
            EXPECT_TRUE(chunks[0].redacted);
            return core::Result<void>();
        }));

    privacy::PrivacyRedactor redactor;
    auto redacted = archive_->redact_pii("alice", 1, redactor);
    ASSERT_TRUE(redacted.ok());
    EXPECT_EQ(redacted.value(), 1u);
}

TEST_F(ArchiveSinkMockTest, NothingToRedactSkipsRewrite) {
    EXPECT_CALL(*sink_, persist(_)).WillOnce(Return(core::Result<void>()));
    ASSERT_TRUE(archive_->append("alice", "nothing sensitive here", 3.0, meta(1)).ok());

    EXPECT_CALL(*sink_, rewrite(_, _)).Times(0);
    privacy::PrivacyRedactor redactor;
    auto redacted = archive_->redact_pii("alice", 1, redactor);
    ASSERT_TRUE(redacted.ok());
    EXPECT_EQ(redacted.value(), 0u);
}

TEST_F(ArchiveSinkMockTest, FailedRewriteKeepsChainUnchanged) {
    EXPECT_CALL(*sink_, persist(_)).WillOnce(Return(core::Result<void>()));
    ASSERT_TRUE(archive_->append("alice", "mail me at kim@example.net please", 3.0, meta(1)).ok());

    EXPECT_CALL(*sink_, rewrite(_, _))
        .Times(3)
        .WillRepeatedly(Return(failure()));

    privacy::PrivacyRedactor redactor;
    auto redacted = archive_->redact_pii("alice", 1, redactor);
    ASSERT_FALSE(redacted.ok());
    EXPECT_EQ(redacted.error_code(), core::Error::Code::STORAGE_FAILURE);

    auto payload = archive_->reconstruct_one("alice", 1);
    ASSERT_TRUE(payload.ok());
    EXPECT_THAT(payload.value(), HasSubstr("kim@example.net"));
    EXPECT_FALSE(archive_->get_chunk("alice", 1)->redacted);
}

TEST_F(ArchiveSinkMockTest, RecoverReplaysSink) {
    // Build a valid chunk with a scratch archive
    auto scratch_sink = std::make_shared<NiceMock<MockArchiveSink>>();
    ON_CALL(*scratch_sink, persist(_)).WillByDefault(Return(core::Result<void>()));
    ColdArchive scratch(config_, scratch_sink);
    auto built = scratch.append("alice", "restored payload", 4.0, meta(9));
    ASSERT_TRUE(built.ok());
    ArchiveChunk stored = built.value();

    EXPECT_CALL(*sink_, replay(_))
        .WillOnce(Invoke([stored](std::function<void(ArchiveChunk)> callback) {
            callback(stored);
            return core::Result<void>();
        }));

    ASSERT_TRUE(archive_->recover().ok());
    EXPECT_EQ(archive_->chunk_count("alice"), 1u);
    EXPECT_EQ(archive_->max_item_id(), 9u);
    EXPECT_EQ(archive_->reconstruct_one("alice", 1).value(), "restored payload");
}

TEST_F(ArchiveSinkMockTest, ReplayErrorFailsRecovery) {
    EXPECT_CALL(*sink_, replay(_)).WillOnce(Return(failure()));
    auto recovered = archive_->recover();
    ASSERT_FALSE(recovered.ok());
    EXPECT_EQ(recovered.error_code(), core::Error::Code::STORAGE_FAILURE);
}
