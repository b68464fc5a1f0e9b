#pragma once

#include "peerdrop/crypto/crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace peerdrop::crypto {

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    Sha256Hash finalize();
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Sha256Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {
    Sha256Hash hash_string(std::string_view str);
    std::string hash_to_hex(const Sha256Hash& hash);
    std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);
}

}
