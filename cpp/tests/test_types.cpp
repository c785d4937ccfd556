#include <catch2/catch_test_macros.hpp>
#include "ferry/types.hpp"

using namespace ferry;

TEST_CASE("Hex encoding of identities", "[types]")
{
    Identity id{};
    id[0] = 0xab;
    id[31] = 0x01;

    auto hex = to_hex(id);
    REQUIRE(hex.size() == 66);
    REQUIRE(hex.starts_with("0xab"));
    REQUIRE(hex.ends_with("01"));

    auto parsed = identity_from_hex(hex);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);

    // Prefix is optional and case is ignored
    auto upper = identity_from_hex("AB" + std::string(60, '0') + "01");
    REQUIRE(upper.has_value());
    REQUIRE(*upper == id);
}

TEST_CASE("Malformed hex is rejected", "[types]")
{
    REQUIRE_FALSE(from_hex32("0x1234").has_value());
    REQUIRE_FALSE(bytes_from_hex("abc").has_value());
    REQUIRE_FALSE(bytes_from_hex("zz").has_value());
    REQUIRE(bytes_from_hex("0x").value().empty());
    REQUIRE(bytes_to_hex({0x00, 0xff}) == "0x00ff");
}

TEST_CASE("Decimal amounts", "[types]")
{
    REQUIRE(amount_from_string("0").value() == 0);
    REQUIRE(amount_from_string("10000000000000000000000").value() == whole_tokens(10'000));
    REQUIRE(amount_to_string(whole_tokens(1)) == "1000000000000000000");

    REQUIRE_FALSE(amount_from_string("").has_value());
    REQUIRE_FALSE(amount_from_string("-1").has_value());
    REQUIRE_FALSE(amount_from_string("1.5").has_value());

    // 2^256 does not fit
    auto too_big = amount_from_string("115792089237316195423570985008687907853269984665640564039457584007913129639936");
    REQUIRE_FALSE(too_big.has_value());
    auto max = amount_from_string("115792089237316195423570985008687907853269984665640564039457584007913129639935");
    REQUIRE(max.has_value());
}

TEST_CASE("Token quantities scale by decimals", "[types]")
{
    REQUIRE(parse_units("1000").value() == whole_tokens(1'000));
    REQUIRE(parse_units("0.5").value() == whole_tokens(5) / 10);
    REQUIRE(parse_units("1.25", 2).value() == 125);
    REQUIRE_FALSE(parse_units("1.255", 2).has_value());
    REQUIRE_FALSE(parse_units("ten").has_value());
}

TEST_CASE("Identities round-trip through 256-bit values", "[types]")
{
    Identity id{};
    for (std::size_t i = 0; i < id.size(); ++i)
        id[i] = static_cast<std::uint8_t>(i + 1);

    auto value = amount_from_identity(id);
    REQUIRE(identity_from_amount(value) == id);
    REQUIRE(amount_from_identity(kZeroIdentity) == 0);
    REQUIRE(is_zero(identity_from_amount(0)));
}

TEST_CASE("Timestamps render as UTC ISO 8601", "[types]")
{
    Timestamp ts{std::chrono::seconds{1'700'000'000}};
    REQUIRE(format_timestamp(ts) == "2023-11-14T22:13:20Z");
}
