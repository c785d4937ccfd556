#include <catch2/catch_test_macros.hpp>
#include "ferry/operation.hpp"

using namespace ferry;

namespace
{
    Identity id(std::uint8_t tag)
    {
        Identity out{};
        out.fill(tag);
        return out;
    }
}

TEST_CASE("Default code tables differ per variant", "[operation]")
{
    auto primary = OperationCodeTable::primary();
    auto secondary = OperationCodeTable::secondary();
    auto vault = OperationCodeTable::vault();

    REQUIRE(primary.kind_of(0) == OperationKind::Mint);
    REQUIRE(primary.kind_of(3) == OperationKind::Pause);
    REQUIRE(primary.kind_of(8) == OperationKind::DistributeTokens);
    REQUIRE_FALSE(primary.supports(OperationKind::RelinquishTokens));

    REQUIRE(secondary.kind_of(0) == OperationKind::Pause);
    REQUIRE(secondary.kind_of(5) == OperationKind::SetBridgeInEnabled);
    REQUIRE(secondary.kind_of(6) == OperationKind::SetBridgeOutEnabled);
    REQUIRE_FALSE(secondary.kind_of(7).has_value());

    REQUIRE(vault.kind_of(5) == OperationKind::RelinquishTokens);
    REQUIRE(vault.kind_of(6) == OperationKind::SetBridgeOutEnabled);
    REQUIRE_FALSE(vault.supports(OperationKind::SetBridgeInEnabled));

    // Same kind, different numeric code
    REQUIRE(primary.code_of(OperationKind::Pause) == 3);
    REQUIRE(secondary.code_of(OperationKind::Pause) == 0);
}

TEST_CASE("Code tables reject double assignment", "[operation]")
{
    OperationCodeTable table;
    REQUIRE(table.empty());
    REQUIRE(table.assign(10, OperationKind::Pause).has_value());
    REQUIRE_FALSE(table.assign(10, OperationKind::Unpause).has_value());
    REQUIRE_FALSE(table.assign(11, OperationKind::Pause).has_value());
    REQUIRE(table.assign(11, OperationKind::Unpause).has_value());
    REQUIRE(table.to_json() == nlohmann::json{{"Pause", 10}, {"Unpause", 11}});
}

TEST_CASE("Kind names round-trip", "[operation]")
{
    REQUIRE(operation_kind_to_string(OperationKind::SetBridgeInLimits) == "SetBridgeInLimits");
    REQUIRE(operation_kind_from_string("RelinquishTokens") == OperationKind::RelinquishTokens);
    REQUIRE_FALSE(operation_kind_from_string("SelfDestruct").has_value());
}

TEST_CASE("Effects decode from target, value and payload", "[operation]")
{
    SECTION("bridge-in caller must be non-zero")
    {
        auto ok = decode_effect(OperationKind::SetBridgeInCaller, id(7), 0, {});
        REQUIRE(ok.has_value());
        REQUIRE(std::get<effect::SetBridgeInCaller>(*ok).caller == id(7));

        auto zero = decode_effect(OperationKind::SetBridgeInCaller, kZeroIdentity, 0, {});
        REQUIRE_FALSE(zero.has_value());
        REQUIRE(std::string(zero.error().what()) == "Invalid bridge-in caller");
    }

    SECTION("limits carry the cap in value and the cooldown in the payload")
    {
        auto ok = decode_effect(OperationKind::SetBridgeInLimits, kZeroIdentity, whole_tokens(5), encode_word(120));
        REQUIRE(ok.has_value());
        const auto &limits = std::get<effect::SetBridgeInLimits>(*ok);
        REQUIRE(limits.max_amount == whole_tokens(5));
        REQUIRE(limits.cooldown == std::chrono::seconds{120});

        auto short_payload = decode_effect(OperationKind::SetBridgeInLimits, kZeroIdentity, 1, Bytes(31, 0));
        REQUIRE_FALSE(short_payload.has_value());
        REQUIRE(std::string(short_payload.error().what()) == "Invalid operation payload");

        Bytes huge(32, 0xff);
        REQUIRE_FALSE(decode_effect(OperationKind::SetBridgeInLimits, kZeroIdentity, 1, huge).has_value());
    }

    SECTION("update signer takes the replacement from value")
    {
        auto ok = decode_effect(OperationKind::UpdateSigner, id(1), amount_from_identity(id(9)), {});
        REQUIRE(ok.has_value());
        const auto &update = std::get<effect::UpdateSigner>(*ok);
        REQUIRE(update.old_signer == id(1));
        REQUIRE(update.new_signer == id(9));
    }

    SECTION("flags are boolean words")
    {
        auto on = decode_effect(OperationKind::SetBridgeOutEnabled, kZeroIdentity, 0, encode_bool(true));
        REQUIRE(std::get<effect::SetBridgeOutEnabled>(on.value()).enabled);
        auto off = decode_effect(OperationKind::SetBridgeInEnabled, kZeroIdentity, 0, encode_bool(false));
        REQUIRE_FALSE(std::get<effect::SetBridgeInEnabled>(off.value()).enabled);

        REQUIRE_FALSE(decode_effect(OperationKind::SetBridgeInEnabled, kZeroIdentity, 0, encode_word(2)).has_value());
        REQUIRE_FALSE(decode_effect(OperationKind::SetBridgeInEnabled, kZeroIdentity, 0, {}).has_value());
    }

    SECTION("distribution needs a recipient")
    {
        auto zero = decode_effect(OperationKind::DistributeTokens, kZeroIdentity, 5, {});
        REQUIRE_FALSE(zero.has_value());
        REQUIRE(std::string(zero.error().what()) == "Invalid recipient address");
    }
}

TEST_CASE("Payload words are 32-byte big-endian", "[operation]")
{
    auto word = encode_word(0x0102);
    REQUIRE(word.size() == 32);
    REQUIRE(word[30] == 0x01);
    REQUIRE(word[31] == 0x02);
    REQUIRE(word[0] == 0x00);
    REQUIRE(encode_bool(true)[31] == 1);
}

TEST_CASE("Operation fingerprints are domain-separated by chain id", "[operation]")
{
    auto a = compute_operation_id(1, 0, 3, id(5), 100, encode_word(1));
    auto b = compute_operation_id(2, 0, 3, id(5), 100, encode_word(1));
    REQUIRE(a != b);
    REQUIRE(a == compute_operation_id(1, 0, 3, id(5), 100, encode_word(1)));

    // Every field participates
    REQUIRE(a != compute_operation_id(1, 1, 3, id(5), 100, encode_word(1)));
    REQUIRE(a != compute_operation_id(1, 0, 4, id(5), 100, encode_word(1)));
    REQUIRE(a != compute_operation_id(1, 0, 3, id(6), 100, encode_word(1)));
    REQUIRE(a != compute_operation_id(1, 0, 3, id(5), 101, encode_word(1)));
    REQUIRE(a != compute_operation_id(1, 0, 3, id(5), 100, encode_word(2)));

    Operation op;
    op.id = a;
    op.type = 3;
    op.target = id(5);
    op.value = 100;
    op.payload = encode_word(1);
    REQUIRE(compute_operation_hash(op, 1) != compute_operation_hash(op, 2));
    REQUIRE(compute_operation_hash(op, 1) != a);
}

TEST_CASE("Operation records serialize their signers", "[operation]")
{
    Operation op;
    op.signatures[id(1)] = true;
    op.signatures[id(2)] = true;
    op.signature_count = 2;

    REQUIRE(op.has_signed(id(1)));
    REQUIRE_FALSE(op.has_signed(id(3)));

    auto j = op.to_json();
    REQUIRE(j["signature_count"] == 2);
    REQUIRE(j["signed_by"].size() == 2);
    REQUIRE(j["executed"] == false);
}
