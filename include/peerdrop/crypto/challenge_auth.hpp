#pragma once

#include "peerdrop/crypto/crypto_types.hpp"
#include <string>
#include <string_view>

namespace peerdrop::crypto {

// Password gate for a transfer. The verifier issues a one-time challenge, the
// prover answers with hex(SHA-256(password || challenge)), and the verifier
// recomputes the same value locally. The password itself never crosses the
// channel.
class ChallengeAuth {
public:
    // Idempotent libsodium startup; issue_challenge() calls it on demand.
    static bool initialize();
    
    // Random UUIDv4-formatted string backed by libsodium's CSPRNG.
    // Throws std::runtime_error if libsodium cannot be initialized.
    static std::string issue_challenge();
    
    static std::string compute_response(std::string_view password, std::string_view challenge);
    
    // Constant-time comparison of the submitted response against the
    // locally recomputed one.
    static bool verify(std::string_view password, std::string_view challenge, std::string_view response);
};

}
