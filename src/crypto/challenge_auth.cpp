#include "peerdrop/crypto/challenge_auth.hpp"
#include "peerdrop/crypto/hash.hpp"
#include "peerdrop/core/logger.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace peerdrop::crypto {

namespace {
bool sodium_ready = false;
}

bool ChallengeAuth::initialize() {
    if (sodium_ready) {
        return true;
    }
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    sodium_ready = true;
    LOG_DEBUG("libsodium initialized");
    return true;
}

std::string ChallengeAuth::issue_challenge() {
    if (!initialize()) {
        throw std::runtime_error("Cannot issue challenge: libsodium unavailable");
    }
    
    ChallengeBytes bytes;
    randombytes_buf(bytes.data(), bytes.size());
    
    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::string ChallengeAuth::compute_response(std::string_view password, std::string_view challenge) {
    SecureBytes material(password.size() + challenge.size());
    std::copy(password.begin(), password.end(), material.data.begin());
    std::copy(challenge.begin(), challenge.end(), material.data.begin() + password.size());
    
    return hash_utils::hash_to_hex(Sha256Hasher::hash(material.span()));
}

bool ChallengeAuth::verify(std::string_view password, std::string_view challenge, std::string_view response) {
    if (challenge.empty()) {
        return false;
    }
    
    auto expected = compute_response(password, challenge);
    if (expected.size() != response.size()) {
        return false;
    }
    
    return sodium_memcmp(expected.data(), response.data(), expected.size()) == 0;
}

}
