#include <gtest/gtest.h>
#include "peerdrop/transfer/file_source.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::transfer;

TEST(MemoryFileSourceTest, ReportsInfo) {
    MemoryFileSource source("card.png", std::vector<std::uint8_t>(1000, 1), "image/png");
    
    EXPECT_EQ(source.info().name, "card.png");
    EXPECT_EQ(source.info().size, 1000u);
    EXPECT_EQ(source.info().mime_type, "image/png");
    
    MemoryFileSource untyped("blob", {});
    EXPECT_EQ(untyped.info().mime_type, DEFAULT_MIME_TYPE);
}

TEST(MemoryFileSourceTest, ReadsBoundedChunks) {
    std::vector<std::uint8_t> content(1000);
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>(i);
    }
    MemoryFileSource source("data", content);
    std::vector<std::uint8_t> data;
    
    ASSERT_TRUE(source.read(0, 400, data));
    EXPECT_EQ(data.size(), 400u);
    
    ASSERT_TRUE(source.read(800, 400, data));
    ASSERT_EQ(data.size(), 200u);
    EXPECT_EQ(data.front(), static_cast<std::uint8_t>(800));
    
    ASSERT_TRUE(source.read(1000, 400, data));
    EXPECT_TRUE(data.empty());
    
    EXPECT_EQ(source.read(1001, 1, data).error, TransferError::INVALID_ARGUMENT);
}

class DiskFileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "peerdrop_file_source_test";
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "Card.JSON";
        
        std::ofstream file(path_, std::ios::binary);
        for (int i = 0; i < 5000; ++i) {
            file.put(static_cast<char>(i % 251));
        }
    }
    
    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
    
    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST_F(DiskFileSourceTest, OpenReadsMetadata) {
    DiskFileSource source(path_);
    ASSERT_TRUE(source.open());
    
    EXPECT_TRUE(source.is_open());
    EXPECT_EQ(source.info().name, "Card.JSON");
    EXPECT_EQ(source.info().size, 5000u);
    EXPECT_EQ(source.info().mime_type, "application/json");
}

TEST_F(DiskFileSourceTest, PositionalReads) {
    DiskFileSource source(path_);
    ASSERT_TRUE(source.open());
    std::vector<std::uint8_t> data;
    
    ASSERT_TRUE(source.read(4096, 4096, data));
    ASSERT_EQ(data.size(), 904u);
    EXPECT_EQ(data[0], 4096 % 251);
    
    // Out of order reads are fine.
    ASSERT_TRUE(source.read(251, 2, data));
    EXPECT_EQ(data, (std::vector<std::uint8_t>{0, 1}));
    
    ASSERT_TRUE(source.read(5000, 10, data));
    EXPECT_TRUE(data.empty());
    EXPECT_FALSE(source.read(5001, 10, data));
}

TEST_F(DiskFileSourceTest, OpenFailures) {
    DiskFileSource missing(dir_ / "missing.bin");
    auto result = missing.open();
    EXPECT_EQ(result.error, TransferError::FILE_ERROR);
    EXPECT_FALSE(missing.is_open());
    
    DiskFileSource directory(dir_);
    EXPECT_FALSE(directory.open());
}

TEST_F(DiskFileSourceTest, ReadBeforeOpenFails) {
    DiskFileSource source(path_);
    std::vector<std::uint8_t> data;
    EXPECT_EQ(source.read(0, 10, data).error, TransferError::FILE_ERROR);
}

TEST_F(DiskFileSourceTest, TruncatedFileIsAShortRead) {
    DiskFileSource source(path_);
    ASSERT_TRUE(source.open());
    
    std::filesystem::resize_file(path_, 100);
    
    std::vector<std::uint8_t> data;
    auto result = source.read(0, 1000, data);
    EXPECT_EQ(result.error, TransferError::FILE_ERROR);
    EXPECT_TRUE(data.empty());
}
