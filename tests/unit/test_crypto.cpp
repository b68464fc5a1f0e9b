#include <gtest/gtest.h>
#include "peerdrop/crypto/hash.hpp"
#include "peerdrop/crypto/challenge_auth.hpp"
#include <filesystem>
#include <fstream>

namespace peerdrop::crypto::test {

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ChallengeAuth::initialize());
    }
};

TEST_F(CryptoTest, Sha256KnownVectors) {
    EXPECT_EQ(hash_utils::hash_to_hex(hash_utils::hash_string("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash_utils::hash_to_hex(hash_utils::hash_string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(CryptoTest, IncrementalHashMatchesOneShot) {
    std::string text = "The quick brown fox jumps over the lazy dog";
    std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(bytes.first(10)));
    ASSERT_TRUE(hasher.update(bytes.subspan(10)));
    auto incremental = hasher.finalize();
    
    EXPECT_EQ(incremental, Sha256Hasher::hash(bytes));
}

TEST_F(CryptoTest, HasherRequiresInitialization) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> data = {1, 2, 3};
    
    auto result = hasher.update(data);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, CryptoError::NOT_INITIALIZED);
    
    ASSERT_TRUE(hasher.initialize());
    Sha256Hash output;
    ASSERT_TRUE(hasher.finalize(std::span(output)));
    EXPECT_EQ(hasher.update(data).error, CryptoError::NOT_INITIALIZED);
}

TEST_F(CryptoTest, FinalizeRejectsSmallBuffer) {
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    std::array<std::uint8_t, 16> small{};
    EXPECT_EQ(hasher.finalize(std::span(small)).error, CryptoError::BUFFER_TOO_SMALL);
}

TEST_F(CryptoTest, HashFile) {
    auto path = std::filesystem::temp_directory_path() / "peerdrop_hash_test.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file << "abc";
    }
    
    Sha256Hash digest;
    ASSERT_TRUE(Sha256Hasher::hash_file(path, digest));
    EXPECT_EQ(digest, hash_utils::hash_string("abc"));
    std::filesystem::remove(path);
    
    EXPECT_EQ(Sha256Hasher::hash_file(path, digest).error, CryptoError::FILE_READ_ERROR);
}

TEST_F(CryptoTest, HexConversion) {
    auto digest = hash_utils::hash_string("peerdrop");
    auto hex = hash_utils::hash_to_hex(digest);
    EXPECT_EQ(hex.size(), 64u);
    
    auto parsed = hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, digest);
    
    EXPECT_FALSE(hash_utils::hash_from_hex("abcd").has_value());
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'z')).has_value());
}

TEST_F(CryptoTest, SecureBytesHoldsText) {
    SecureBytes password(std::string_view("hunter2"));
    EXPECT_EQ(password.size(), 7u);
    EXPECT_EQ(password.view(), "hunter2");
    
    SecureBytes moved(std::move(password));
    EXPECT_EQ(moved.view(), "hunter2");
    
    moved.clear();
    EXPECT_TRUE(moved.empty());
    EXPECT_TRUE(SecureBytes(std::string_view()).empty());
}

TEST_F(CryptoTest, SecureBytesZeroFilled) {
    SecureBytes buffer(8);
    ASSERT_EQ(buffer.size(), 8u);
    for (auto byte : buffer.data) {
        EXPECT_EQ(byte, 0);
    }
}

} // namespace peerdrop::crypto::test
