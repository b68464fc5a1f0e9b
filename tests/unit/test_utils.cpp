#include <gtest/gtest.h>
#include "peerdrop/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto parts = StringUtils::split("localhost:7070", ':');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "localhost");
    EXPECT_EQ(parts[1], "7070");
    
    EXPECT_TRUE(StringUtils::split("", ',').empty());
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  value \t\n"), "value");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim("x"), "x");
}

TEST_F(StringUtilsTest, LowerAndPrefix) {
    EXPECT_EQ(StringUtils::to_lower("IMAGE.PNG"), "image.png");
    EXPECT_TRUE(StringUtils::starts_with("--password", "--"));
    EXPECT_FALSE(StringUtils::starts_with("-", "--"));
}

TEST_F(StringUtilsTest, LowerLeavesNonAsciiBytesAlone) {
    EXPECT_EQ(StringUtils::to_lower("R\xC3\x89SUM\xC3\x89.PDF"), "r\xC3\x89sum\xC3\x89.pdf");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(512), "512.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(256 * 1024), "256.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(3ULL * 1024 * 1024 * 1024), "3.00 GB");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "peerdrop_utils_test";
        std::filesystem::remove_all(dir_);
        ASSERT_TRUE(FileUtils::create_directories(dir_));
    }
    
    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
    
    std::filesystem::path dir_;
};

TEST_F(FileUtilsTest, WriteAndInspect) {
    auto path = dir_ / "data.bin";
    std::vector<std::uint8_t> content(1500, 0x5A);
    
    ASSERT_TRUE(FileUtils::write_binary_file(path, content));
    
    EXPECT_TRUE(FileUtils::exists(path));
    EXPECT_TRUE(FileUtils::is_file(path));
    EXPECT_FALSE(FileUtils::is_file(dir_));
    EXPECT_EQ(FileUtils::file_size(path), 1500u);
    EXPECT_FALSE(FileUtils::file_size(dir_ / "missing").has_value());
}

TEST_F(FileUtilsTest, WriteIntoMissingDirectoryFails) {
    std::vector<std::uint8_t> content = {1};
    EXPECT_FALSE(FileUtils::write_binary_file(dir_ / "no" / "such" / "file", content));
}

TEST_F(FileUtilsTest, GuessMimeType) {
    EXPECT_EQ(FileUtils::guess_mime_type("card.PNG"), "image/png");
    EXPECT_EQ(FileUtils::guess_mime_type("character.charx"), "application/zip");
    EXPECT_EQ(FileUtils::guess_mime_type("notes.json"), "application/json");
    EXPECT_EQ(FileUtils::guess_mime_type("archive.xyz"), "application/octet-stream");
    EXPECT_EQ(FileUtils::guess_mime_type("README"), "application/octet-stream");
}

TEST_F(FileUtilsTest, UniquePathAvoidsCollisions) {
    auto path = dir_ / "card.png";
    EXPECT_EQ(FileUtils::unique_path(path), path);
    
    std::ofstream(path) << "x";
    EXPECT_EQ(FileUtils::unique_path(path), dir_ / "card (1).png");
    
    std::ofstream(dir_ / "card (1).png") << "x";
    EXPECT_EQ(FileUtils::unique_path(path), dir_ / "card (2).png");
}

TEST(SystemUtilsTest, OsNameIsNotEmpty) {
    EXPECT_FALSE(SystemUtils::os_name().empty());
}
