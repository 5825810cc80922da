#include "tus/io/file_source.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <type_traits>

namespace fs = std::filesystem;
using tus::ErrorKind;
using tus::io::LocalFileSource;
using tus::io::MemorySource;

class LocalFileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("tuscpp_source_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        path_ = dir_ / "payload.bin";
        std::ofstream out(path_, std::ios::binary);
        out << "0123456789";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(LocalFileSourceTest, ReportsSizeAndReadsRanges) {
    auto source = LocalFileSource::open(path_);
    ASSERT_TRUE(source.is_ok()) << source.error().to_string();

    auto& file = *source.value();
    EXPECT_EQ(file.size(), 10u);
    EXPECT_EQ(file.describe(), path_.string());

    auto middle = file.read(3, 4);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(std::string(middle.value().begin(), middle.value().end()), "3456");
}

TEST_F(LocalFileSourceTest, ReadAtEndIsShort) {
    auto source = LocalFileSource::open(path_);
    ASSERT_TRUE(source.is_ok());

    auto tail = source.value()->read(8, 100);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(std::string(tail.value().begin(), tail.value().end()), "89");

    auto empty = source.value()->read(10, 4);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(LocalFileSourceTest, ReadPastEndFails) {
    auto source = LocalFileSource::open(path_);
    ASSERT_TRUE(source.is_ok());

    auto result = source.value()->read(11, 1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SourceRead);
}

TEST_F(LocalFileSourceTest, RereadsEarlierRanges) {
    auto source = LocalFileSource::open(path_);
    ASSERT_TRUE(source.is_ok());

    ASSERT_TRUE(source.value()->read(0, 10).is_ok());
    auto again = source.value()->read(2, 2);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(std::string(again.value().begin(), again.value().end()), "23");
}

TEST_F(LocalFileSourceTest, OpenFailures) {
    auto missing = LocalFileSource::open(dir_ / "missing.bin");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::SourceRead);

    auto directory = LocalFileSource::open(dir_);
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error().kind, ErrorKind::SourceRead);
}

TEST_F(LocalFileSourceTest, OpenIsTheOnlyWayIn) {
    static_assert(!std::is_constructible_v<LocalFileSource, fs::path, std::ifstream, uint64_t>);

    auto source = LocalFileSource::open(path_);
    ASSERT_TRUE(source.is_ok());
    std::unique_ptr<tus::io::FileSource> owned = std::move(source.value());
    ASSERT_NE(owned, nullptr);

    auto tail = owned->read(8, 16);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(std::string(tail.value().begin(), tail.value().end()), "89");
}

TEST(MemorySourceTest, ReadsRanges) {
    MemorySource source(std::string("abcdef"), "buffer");

    EXPECT_EQ(source.size(), 6u);
    EXPECT_EQ(source.describe(), "buffer");

    auto chunk = source.read(4, 10);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(std::string(chunk.value().begin(), chunk.value().end()), "ef");

    EXPECT_TRUE(source.read(7, 1).is_error());
}
