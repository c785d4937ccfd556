#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "ferry/deployment.hpp"
#include "ledger_fixture.hpp"
#include <format>

using namespace ferry;
using Catch::Matchers::ContainsSubstring;
using ferry::test::LedgerFixture;

namespace
{
    std::string signer_list(const LedgerFixture &f)
    {
        std::string out = "[";
        for (std::size_t i = 0; i < f.signers.size(); ++i)
        {
            if (i)
                out += ", ";
            out += "\"" + to_hex(f.signers[i].identity()) + "\"";
        }
        return out + "]";
    }

    std::string header(const LedgerFixture &f)
    {
        return std::format("admin = \"{}\"\nsigners = {}\n", to_hex(f.admin.identity()), signer_list(f));
    }

    const LedgerConfig &ledger_named(const FerryConfig &cfg, std::string_view name)
    {
        for (const auto &ledger : cfg.ledgers)
        {
            if (ledger.name == name)
                return ledger;
        }
        throw std::out_of_range(std::string(name));
    }

    std::string config_error(const std::string &toml)
    {
        auto cfg = ConfigLoader::from_string(toml);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
        return cfg.error().what();
    }
}

TEST_CASE("Deployment config parses ledgers with defaults", "[config]")
{
    LedgerFixture f;
    auto toml = header(f) + R"(
[logging]
level = "debug"

[server]
port = 9090
threads = 2

[ledgers.origin]
variant = "primary"
chain_id = 1

[ledgers.sibling]
variant = "secondary"
chain_id = 2
limits = { max_amount = "500.5", cooldown_seconds = 30 }
policy = { bridge_out_enabled = false }

[ledgers.custody]
variant = "vault"
chain_id = 1
token = "origin"
)";

    auto cfg = ConfigLoader::from_string(toml);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->logging.level == "debug");
    REQUIRE(cfg->server.port == 9090);
    REQUIRE(cfg->server.threads == 2);
    REQUIRE(cfg->admin == f.admin.identity());
    REQUIRE(cfg->ledgers.size() == 3);

    const auto &origin = ledger_named(*cfg, "origin");
    REQUIRE(origin.account == derive_account("origin"));
    REQUIRE(origin.codes.code_of(OperationKind::Mint) == OperationCode{0});
    REQUIRE(origin.limits.max_amount == whole_tokens(10'000));
    REQUIRE_FALSE(origin.policy.inbound_exempt_from_pause);

    const auto &sibling = ledger_named(*cfg, "sibling");
    REQUIRE(sibling.limits.max_amount == whole_tokens(500) + whole_tokens(1) / 2);
    REQUIRE(sibling.limits.cooldown == std::chrono::seconds{30});
    REQUIRE_FALSE(sibling.policy.bridge_out_enabled);
    REQUIRE(sibling.policy.bridge_in_enabled);

    const auto &custody = ledger_named(*cfg, "custody");
    REQUIRE(custody.token == "origin");
    REQUIRE(custody.policy.inbound_exempt_from_pause);

    auto settings = cfg->settings_for(sibling);
    REQUIRE(settings.signers == f.slots());
    REQUIRE(settings.admin == f.admin.identity());

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["ledgers"]["custody"]["token"] == "origin");
    REQUIRE(j["server"]["port"] == 9090);
}

TEST_CASE("Per-ledger operation codes override the defaults", "[config]")
{
    LedgerFixture f;
    auto cfg = ConfigLoader::from_string(header(f) + R"(
[ledgers.sibling]
variant = "secondary"
chain_id = 2

[ledgers.sibling.operations]
Pause = 7
Unpause = 9
)");
    REQUIRE(cfg.has_value());
    const auto &codes = cfg->ledgers.front().codes;
    REQUIRE(codes.kind_of(7) == OperationKind::Pause);
    REQUIRE(codes.kind_of(9) == OperationKind::Unpause);
    REQUIRE_FALSE(codes.kind_of(0).has_value());
    REQUIRE_FALSE(codes.supports(OperationKind::SetBridgeInCaller));
}

TEST_CASE("Invalid deployment configs are rejected", "[config]")
{
    LedgerFixture f;

    REQUIRE_THAT(config_error("admin = [unclosed"), ContainsSubstring("Failed to parse TOML"));

    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"bridge\"\nchain_id = 1\n"),
                 ContainsSubstring("variant must be primary, secondary or vault"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"secondary\"\nchain_id = 0\n"),
                 ContainsSubstring("chain_id must be positive"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"vault\"\nchain_id = 1\n"),
                 ContainsSubstring("a vault needs a token"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"secondary\"\nchain_id = 1\ntoken = \"y\"\n"),
                 ContainsSubstring("only a vault takes a token"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"secondary\"\nchain_id = 1\n"
                                          "[ledgers.x.operations]\nMint = 3\n"),
                 ContainsSubstring("Mint is not available on a secondary ledger"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"secondary\"\nchain_id = 1\n"
                                          "[ledgers.x.operations]\nPause = 1\nUnpause = 1\n"),
                 ContainsSubstring("ledgers.x.operations"));
    REQUIRE_THAT(config_error(header(f) + "[ledgers.x]\nvariant = \"secondary\"\nchain_id = 1\n"
                                          "limits = { cooldown_seconds = 9223372036854775807 }\n"),
                 ContainsSubstring("ledgers.x.limits.cooldown_seconds must be at most 31536000"));

    auto dup = std::format("signers = [\"{0}\", \"{0}\", \"{1}\", \"{2}\"]\n",
                           to_hex(f.signers[0].identity()),
                           to_hex(f.signers[1].identity()),
                           to_hex(f.signers[2].identity()));
    REQUIRE_THAT(config_error(dup), ContainsSubstring("Duplicate signer"));
    REQUIRE_THAT(config_error("signers = [\"0x01\"]\n"), ContainsSubstring("expected 4 signers"));
    REQUIRE_THAT(config_error("[ledgers.x]\nvariant = \"secondary\"\nchain_id = 1\n"),
                 ContainsSubstring("no signers configured"));
}

TEST_CASE("Deployment builds every configured ledger", "[config][deployment]")
{
    LedgerFixture f;
    auto cfg = ConfigLoader::from_string(header(f) + R"(
[ledgers.origin]
variant = "primary"
chain_id = 1

[ledgers.custody]
variant = "vault"
chain_id = 1
token = "origin"

[ledgers.sibling]
variant = "secondary"
chain_id = 2
)").value();

    auto deployment = Deployment::build(cfg, f.clock, f.events);
    REQUIRE(deployment.has_value());
    auto &d = **deployment;
    REQUIRE(d.names().size() == 3);

    REQUIRE(d.find("origin")->variant() == "primary");
    REQUIRE(d.find_token("origin") != nullptr);
    REQUIRE(d.find_token("custody") == nullptr);
    REQUIRE(d.find_vault("custody")->token().account() == derive_account("origin"));
    REQUIRE(d.find("sibling")->get_chain_id() == 2);
    REQUIRE(d.find("nowhere") == nullptr);
    REQUIRE(d.describe()["custody"]["token"] == to_hex(derive_account("origin")));
}

TEST_CASE("A vault must hold a burn-mint ledger's token", "[config][deployment]")
{
    LedgerFixture f;
    auto cfg = ConfigLoader::from_string(header(f) + R"(
[ledgers.custody]
variant = "vault"
chain_id = 1
token = "missing"
)").value();

    auto deployment = Deployment::build(cfg, f.clock, f.events);
    REQUIRE_FALSE(deployment.has_value());
    REQUIRE_THAT(std::string(deployment.error().what()), ContainsSubstring("token missing is not a burn-mint ledger"));
}
