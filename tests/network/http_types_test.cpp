#include "tus/network/http_types.hpp"

#include <gtest/gtest.h>

using tus::network::HttpMethod;
using tus::network::HttpRequest;
using tus::network::HttpResponse;
using tus::network::HttpStatus;

TEST(HttpTypesTest, HeaderLookupIgnoresCase) {
    HttpResponse response(HttpStatus::NO_CONTENT);
    response.headers["upload-offset"] = "4096";

    EXPECT_TRUE(response.has_header("Upload-Offset"));
    EXPECT_EQ(response.get_header("UPLOAD-OFFSET"), "4096");
    EXPECT_EQ(response.get_header("Upload-Length"), "");
    EXPECT_EQ(response.reason_phrase, "No Content");
    EXPECT_TRUE(response.is_success());
}

TEST(HttpTypesTest, SetHeaderReplacesOtherCasing) {
    HttpRequest request;
    request.set_header("tus-resumable", "0.2.2");
    request.set_header("Tus-Resumable", "1.0.0");

    EXPECT_EQ(request.headers.size(), 1u);
    EXPECT_EQ(request.get_header("tus-resumable"), "1.0.0");
}

TEST(HttpTypesTest, MethodNames) {
    EXPECT_STREQ(tus::network::to_string(HttpMethod::PATCH), "PATCH");
    EXPECT_STREQ(tus::network::to_string(HttpMethod::DELETE_METHOD), "DELETE");
    EXPECT_STREQ(tus::network::reason_phrase(HttpStatus::CHECKSUM_MISMATCH), "Checksum Mismatch");
}
