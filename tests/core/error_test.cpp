#include "tus/core/error.hpp"
#include "tus/core/result.hpp"

#include <gtest/gtest.h>

using tus::Error;
using tus::ErrorCategory;
using tus::ErrorKind;

TEST(ErrorTest, ToStringIncludesKindStatusAndMessage) {
    Error error(ErrorKind::ChecksumMismatch, "PATCH rejected", 460);

    EXPECT_EQ(error.to_string(), "ChecksumMismatch (HTTP 460): PATCH rejected");
}

TEST(ErrorTest, ToStringOmitsMissingStatus) {
    Error error(ErrorKind::Configuration, "chunk_size must be > 0");

    EXPECT_EQ(error.to_string(), "ConfigurationError: chunk_size must be > 0");
}

TEST(ErrorTest, CategoriesGroupKinds) {
    EXPECT_EQ(tus::category_of(ErrorKind::InvalidMetadataKey), ErrorCategory::Encoding);
    EXPECT_EQ(tus::category_of(ErrorKind::MalformedMetadata), ErrorCategory::Encoding);
    EXPECT_EQ(tus::category_of(ErrorKind::Transport), ErrorCategory::Transport);
    EXPECT_EQ(tus::category_of(ErrorKind::TransferAborted), ErrorCategory::Transport);
    EXPECT_EQ(tus::category_of(ErrorKind::SessionGone), ErrorCategory::Protocol);
    EXPECT_EQ(tus::category_of(ErrorKind::RegressiveOffset), ErrorCategory::Invariant);
    EXPECT_EQ(tus::category_of(ErrorKind::SourceRead), ErrorCategory::Io);
    EXPECT_EQ(tus::category_of(ErrorKind::Cancelled), ErrorCategory::Cancelled);
}

TEST(ErrorTest, ResumableKinds) {
    EXPECT_TRUE(tus::is_resumable(Error(ErrorKind::Transport, "")));
    EXPECT_TRUE(tus::is_resumable(Error(ErrorKind::TransferAborted, "")));
    EXPECT_TRUE(tus::is_resumable(Error(ErrorKind::Cancelled, "")));
    EXPECT_TRUE(tus::is_resumable(Error(ErrorKind::SourceRead, "")));

    EXPECT_FALSE(tus::is_resumable(Error(ErrorKind::SessionGone, "")));
    EXPECT_FALSE(tus::is_resumable(Error(ErrorKind::ChecksumMismatch, "")));
    EXPECT_FALSE(tus::is_resumable(Error(ErrorKind::LengthConflict, "")));
}

TEST(ErrorTest, OnlyTransportIsRetryable) {
    EXPECT_TRUE(tus::is_retryable(Error(ErrorKind::Transport, "")));
    EXPECT_FALSE(tus::is_retryable(Error(ErrorKind::TransferAborted, "")));
    EXPECT_FALSE(tus::is_retryable(Error(ErrorKind::ProtocolRejection, "")));
    EXPECT_FALSE(tus::is_retryable(Error(ErrorKind::Cancelled, "")));
}

TEST(ResultTest, FailCarriesKindAndStatus) {
    auto result = tus::Fail<int>(ErrorKind::FileTooLarge, "too big", 413);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FileTooLarge);
    EXPECT_EQ(result.error().status_code, 413);
    EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, VoidResult) {
    tus::Result<void> ok = tus::Ok();
    EXPECT_TRUE(ok.is_ok());

    tus::Result<void> failed = tus::Err<void>(Error(ErrorKind::InvalidState, "nope"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "nope");
}
