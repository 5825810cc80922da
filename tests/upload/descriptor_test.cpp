#include "tus/upload/descriptor.hpp"

#include <gtest/gtest.h>

using tus::ErrorKind;
using tus::upload::Metadata;
using tus::upload::UploadDescriptor;

namespace {

UploadDescriptor make_descriptor(uint64_t length = 10000) {
    return UploadDescriptor("http://tus.test/files/1", "http://tus.test/files/", length,
                            Metadata{{"filename", "report.pdf"}}, "/tmp/report.pdf");
}

} // namespace

TEST(UploadDescriptorTest, StartsAtZero) {
    auto descriptor = make_descriptor();

    EXPECT_EQ(descriptor.confirmed_offset(), 0u);
    EXPECT_EQ(descriptor.remaining(), 10000u);
    EXPECT_FALSE(descriptor.is_complete());
    EXPECT_TRUE(descriptor.length_declared());
}

TEST(UploadDescriptorTest, AdvanceMovesForward) {
    auto descriptor = make_descriptor();

    ASSERT_TRUE(descriptor.advance(4096).is_ok());
    ASSERT_TRUE(descriptor.advance(4096).is_ok());  // same offset is allowed
    ASSERT_TRUE(descriptor.advance(10000).is_ok());

    EXPECT_EQ(descriptor.confirmed_offset(), 10000u);
    EXPECT_TRUE(descriptor.is_complete());
}

TEST(UploadDescriptorTest, AdvanceRejectsRegression) {
    auto descriptor = make_descriptor();
    ASSERT_TRUE(descriptor.advance(4096).is_ok());

    auto result = descriptor.advance(2048);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RegressiveOffset);
    EXPECT_EQ(descriptor.confirmed_offset(), 4096u);
}

TEST(UploadDescriptorTest, AdvanceRejectsOverflow) {
    auto descriptor = make_descriptor();

    auto result = descriptor.advance(10001);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::OffsetExceedsLength);
    EXPECT_EQ(descriptor.confirmed_offset(), 0u);
}

TEST(UploadDescriptorTest, ReconcileMayMoveBackwards) {
    auto descriptor = make_descriptor();
    ASSERT_TRUE(descriptor.advance(8192).is_ok());

    ASSERT_TRUE(descriptor.reconcile(2048).is_ok());
    EXPECT_EQ(descriptor.confirmed_offset(), 2048u);

    auto result = descriptor.reconcile(10001);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::OffsetExceedsLength);
    EXPECT_EQ(descriptor.confirmed_offset(), 2048u);
}

TEST(UploadDescriptorTest, DeferredLengthIsIncompleteUntilDeclared) {
    UploadDescriptor descriptor("http://tus.test/files/1", "http://tus.test/files/", 0, {}, {}, true);

    EXPECT_TRUE(descriptor.length_deferred());
    EXPECT_FALSE(descriptor.length_declared());
    EXPECT_FALSE(descriptor.is_complete());

    descriptor.set_length_declared(true);
    EXPECT_TRUE(descriptor.is_complete());
}

TEST(UploadDescriptorTest, JsonRoundTrip) {
    auto descriptor = make_descriptor();
    ASSERT_TRUE(descriptor.advance(4096).is_ok());

    auto restored = UploadDescriptor::from_string(descriptor.to_string());
    ASSERT_TRUE(restored.is_ok()) << restored.error().to_string();
    EXPECT_EQ(restored.value(), descriptor);
    EXPECT_EQ(restored.value().metadata().at("filename"), "report.pdf");
    EXPECT_EQ(restored.value().source_path(), "/tmp/report.pdf");
}

TEST(UploadDescriptorTest, FromJsonRejectsInvalidRecords) {
    auto json = make_descriptor().to_json();

    auto no_location = json;
    no_location["location"] = "";
    EXPECT_EQ(UploadDescriptor::from_json(no_location).error().kind, ErrorKind::Configuration);

    auto negative = json;
    negative["confirmed_offset"] = -1;
    EXPECT_EQ(UploadDescriptor::from_json(negative).error().kind, ErrorKind::Configuration);

    auto beyond = json;
    beyond["confirmed_offset"] = 20000;
    EXPECT_EQ(UploadDescriptor::from_json(beyond).error().kind, ErrorKind::OffsetExceedsLength);

    auto bad_key = json;
    bad_key["metadata"] = {{"file name", "x"}};
    EXPECT_EQ(UploadDescriptor::from_json(bad_key).error().kind, ErrorKind::InvalidMetadataKey);

    auto wrong_type = json;
    wrong_type["location"] = 42;
    EXPECT_EQ(UploadDescriptor::from_json(wrong_type).error().kind, ErrorKind::Configuration);

    EXPECT_TRUE(UploadDescriptor::from_string("{not json").is_error());
}
