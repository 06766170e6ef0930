#include <gtest/gtest.h>
#include "tiermem/core/result.h"
#include "tiermem/core/error.h"
#include "tiermem/core/types.h"
#include <string>
#include <vector>

namespace tiermem {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<double> result(7.5);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());
    EXPECT_DOUBLE_EQ(result.value(), 7.5);
}

TEST(ResultTest, ErrorConstructionKeepsCode) {
    auto result = Result<double>::error("novelty out of range", Error::Code::INVALID_ARGUMENT);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), "novelty out of range");
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, OkResultReportsUnknownCode) {
    Result<int> result(1);
    EXPECT_EQ(result.error_code(), Error::Code::UNKNOWN);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, ConstructFromError) {
    ChainIntegrityError error("chunk 3 content hash mismatch");
    Result<std::string> result(error);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::CHAIN_INTEGRITY);
    EXPECT_EQ(result.error(), "chunk 3 content hash mismatch");
}

TEST(ResultTest, VectorResult) {
    std::vector<std::string> payloads = {"A", "B"};
    Result<std::vector<std::string>> result(payloads);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1], "B");
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));
    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, TakeValue) {
    MemoryItem item;
    item.id = 42;
    item.content.text = "hello";
    Result<MemoryItem> result(item);
    MemoryItem taken = result.take_value();
    EXPECT_EQ(taken.id, 42u);
    EXPECT_EQ(taken.content.text, "hello");
}

TEST(ResultTest, PropagateAcrossValueTypes) {
    auto source = Result<size_t>::error("owner alice is busy", Error::Code::OWNER_BUSY);
    auto forwarded = Result<std::string>::propagate(source);
    EXPECT_FALSE(forwarded.ok());
    EXPECT_EQ(forwarded.error_code(), Error::Code::OWNER_BUSY);
    EXPECT_EQ(forwarded.error(), "owner alice is busy");

    auto as_void = Result<void>::propagate(source);
    EXPECT_EQ(as_void.error_code(), Error::Code::OWNER_BUSY);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    auto failed = Result<void>::error("sink write failed", Error::Code::STORAGE_FAILURE);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error_code(), Error::Code::STORAGE_FAILURE);

    Result<void> copy = failed;
    EXPECT_EQ(copy.error(), "sink write failed");
}

} // namespace
} // namespace core
} // namespace tiermem
