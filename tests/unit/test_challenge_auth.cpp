#include <gtest/gtest.h>
#include "peerdrop/crypto/challenge_auth.hpp"
#include "peerdrop/crypto/hash.hpp"
#include <regex>
#include <set>

namespace peerdrop::crypto::test {

TEST(ChallengeAuthTest, ChallengeLooksLikeUuidV4) {
    auto challenge = ChallengeAuth::issue_challenge();
    
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(challenge, uuid)) << challenge;
}

TEST(ChallengeAuthTest, InitializeIsIdempotent) {
    EXPECT_TRUE(ChallengeAuth::initialize());
    EXPECT_TRUE(ChallengeAuth::initialize());
}

TEST(ChallengeAuthTest, ChallengesAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        seen.insert(ChallengeAuth::issue_challenge());
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(ChallengeAuthTest, ResponseIsHexDigestOfPasswordAndChallenge) {
    auto response = ChallengeAuth::compute_response("secret", "c0ffee");
    
    EXPECT_EQ(response.size(), 64u);
    EXPECT_EQ(response, hash_utils::hash_to_hex(hash_utils::hash_string("secretc0ffee")));
}

TEST(ChallengeAuthTest, VerifyAcceptsMatchingResponse) {
    auto challenge = ChallengeAuth::issue_challenge();
    auto response = ChallengeAuth::compute_response("correct horse", challenge);
    
    EXPECT_TRUE(ChallengeAuth::verify("correct horse", challenge, response));
}

TEST(ChallengeAuthTest, VerifyRejectsWrongPassword) {
    auto challenge = ChallengeAuth::issue_challenge();
    auto response = ChallengeAuth::compute_response("battery staple", challenge);
    
    EXPECT_FALSE(ChallengeAuth::verify("correct horse", challenge, response));
}

TEST(ChallengeAuthTest, ResponseIsBoundToChallenge) {
    auto first = ChallengeAuth::issue_challenge();
    auto second = ChallengeAuth::issue_challenge();
    auto response = ChallengeAuth::compute_response("pw", first);
    
    EXPECT_FALSE(ChallengeAuth::verify("pw", second, response));
}

TEST(ChallengeAuthTest, VerifyRejectsMalformedInput) {
    auto challenge = ChallengeAuth::issue_challenge();
    auto response = ChallengeAuth::compute_response("pw", challenge);
    
    EXPECT_FALSE(ChallengeAuth::verify("pw", "", ChallengeAuth::compute_response("pw", "")));
    EXPECT_FALSE(ChallengeAuth::verify("pw", challenge, ""));
    EXPECT_FALSE(ChallengeAuth::verify("pw", challenge, response.substr(1)));
    EXPECT_FALSE(ChallengeAuth::verify("pw", challenge, response + "0"));
}

} // namespace peerdrop::crypto::test
