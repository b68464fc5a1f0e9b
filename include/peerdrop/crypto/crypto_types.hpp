#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <cstdint>

namespace peerdrop::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t CHALLENGE_SIZE = 16;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;
using ChallengeBytes = std::array<std::uint8_t, CHALLENGE_SIZE>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    explicit SecureBytes(std::string_view text);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
    }
    
    void clear();
};

enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    BUFFER_TOO_SMALL,
    HASH_FAILED,
    FILE_READ_ERROR,
    VERIFICATION_FAILED
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
