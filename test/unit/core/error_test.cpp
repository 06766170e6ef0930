#include <gtest/gtest.h>
#include "tiermem/core/error.h"
#include <string>

namespace tiermem {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Resource not found", Error::Code::NOT_FOUND);
    Error copy(original);
    EXPECT_EQ(copy.code(), original.code());
    EXPECT_STREQ(copy.what(), original.what());
}

TEST(ErrorTest, DerivedErrorsCarryTheirCode) {
    EXPECT_EQ(InvalidArgumentError("x").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(NotFoundError("x").code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(ChainIntegrityError("x").code(), Error::Code::CHAIN_INTEGRITY);
    EXPECT_EQ(OwnerBusyError("x").code(), Error::Code::OWNER_BUSY);
    EXPECT_EQ(StorageError("x").code(), Error::Code::STORAGE_FAILURE);
    EXPECT_EQ(InternalError("x").code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, CatchAsBase) {
    try {
        throw StorageError("cannot create archive directory");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::STORAGE_FAILURE);
        EXPECT_EQ(std::string(e.what()), "cannot create archive directory");
    }
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_name(Error::Code::INVALID_ARGUMENT), "invalid_argument");
    EXPECT_STREQ(error_code_name(Error::Code::CHAIN_INTEGRITY), "chain_integrity");
    EXPECT_STREQ(error_code_name(Error::Code::OWNER_BUSY), "owner_busy");
    EXPECT_STREQ(error_code_name(Error::Code::UNKNOWN), "unknown");
}

} // namespace
} // namespace core
} // namespace tiermem
