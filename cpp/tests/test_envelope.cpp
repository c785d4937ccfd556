#include <catch2/catch_test_macros.hpp>
#include "ferry/envelope.hpp"

using namespace ferry;

namespace
{
    crypto::Ed25519KeyPair caller_key()
    {
        std::array<std::uint8_t, 32> seed{};
        seed.fill(42);
        return crypto::Ed25519KeyPair::from_seed(seed).value();
    }
}

TEST_CASE("Signed envelopes verify against the caller identity", "[envelope]")
{
    auto kp = caller_key();
    auto env = SignedEnvelope::sign(kp, 0, "/ledgers/sibling/bridge_out", {{"amount", "5"}});
    REQUIRE(env.caller == kp.identity());
    REQUIRE(env.verify().has_value());

    auto parsed = SignedEnvelope::from_json(env.to_json());
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->verify().has_value());
    REQUIRE(parsed->signing_payload() == env.signing_payload());
}

TEST_CASE("Any altered field breaks the envelope signature", "[envelope]")
{
    auto kp = caller_key();
    auto env = SignedEnvelope::sign(kp, 3, "/ledgers/sibling/bridge_out", {{"amount", "5"}});

    auto body = env;
    body.body["amount"] = "500";
    REQUIRE(body.verify().error().code == ErrorCode::Unauthorized);

    auto nonce = env;
    nonce.nonce = 4;
    REQUIRE_FALSE(nonce.verify().has_value());

    auto route = env;
    route.route = "/ledgers/origin/bridge_out";
    REQUIRE_FALSE(route.verify().has_value());

    auto caller = env;
    caller.caller[0] ^= 0x01;
    REQUIRE_FALSE(caller.verify().has_value());
}

TEST_CASE("Malformed envelopes are rejected", "[envelope]")
{
    auto kp = caller_key();
    auto j = SignedEnvelope::sign(kp, 0, "/r", {}).to_json();

    auto missing = j;
    missing.erase("nonce");
    REQUIRE(SignedEnvelope::from_json(missing).error().code == ErrorCode::InvalidInput);
    REQUIRE(SignedEnvelope::from_json(nlohmann::json::array()).error().code == ErrorCode::InvalidInput);

    auto bad_caller = j;
    bad_caller["caller"] = "0x1234";
    REQUIRE_FALSE(SignedEnvelope::from_json(bad_caller).has_value());

    auto env = SignedEnvelope::from_json(j).value();
    env.signature = "not base64!";
    REQUIRE(env.verify().error().code == ErrorCode::CryptoError);

    env.signature = crypto::Base64::encode(Bytes(10, 0x01));
    REQUIRE(std::string(env.verify().error().what()) == "Invalid envelope signature length");
}

TEST_CASE("Nonces advance one at a time per caller", "[envelope][nonce]")
{
    NonceTracker nonces;
    auto a = caller_key().identity();
    Identity b{};
    b[0] = 1;

    REQUIRE(nonces.expected(a) == 0);
    REQUIRE(nonces.consume(a, 0).has_value());
    REQUIRE(nonces.expected(a) == 1);

    auto replay = nonces.consume(a, 0);
    REQUIRE(replay.error().code == ErrorCode::Unauthorized);
    REQUIRE(std::string(replay.error().what()) == "Unexpected nonce 0 (expected 1)");
    REQUIRE_FALSE(nonces.consume(a, 2).has_value());

    REQUIRE(nonces.consume(b, 0).has_value());
    REQUIRE(nonces.consume(a, 1).has_value());
    REQUIRE(nonces.expected(a) == 2);
}
