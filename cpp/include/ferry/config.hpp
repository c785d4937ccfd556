#pragma once

#include "bridge_ledger.hpp"
#include "events.hpp"
#include "operation.hpp"
#include "signer_registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry
{

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct ServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{4};
        double requests_per_second{1.0};
        double burst{60.0};
    };

    /** One [ledgers.<name>] table */
    struct LedgerConfig
    {
        std::string name;
        std::string variant; // primary | secondary | vault
        ChainId chain_id{0};
        Identity account{};
        std::optional<std::string> token; // vault only: name of a burn-mint ledger
        std::optional<Identity> admin;
        std::optional<SignerRegistry::Slots> signers;
        BridgeLimits limits{};
        BridgePolicy policy{};
        OperationCodeTable codes;
    };

    struct FerryConfig
    {
        LoggingConfig logging{};
        AuditConfig audit{};
        ServerConfig server{};
        Identity admin{};
        SignerRegistry::Slots signers{};
        std::vector<LedgerConfig> ledgers;

        /** Settings for ledger, falling back to the top-level admin and signers */
        LedgerSettings settings_for(const LedgerConfig &ledger) const;
    };

    /** Account identity derived from a ledger name when none is configured */
    Identity derive_account(std::string_view ledger_name);

    /** Default code table of a variant; empty for an unknown variant */
    OperationCodeTable default_codes(std::string_view variant);

    /**
     * ConfigLoader loads deployment TOML files with environment overrides
     * (FERRY_LOG_LEVEL, FERRY_AUDIT_ENABLED, FERRY_AUDIT_LOG, FERRY_PORT).
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<FerryConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<FerryConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const FerryConfig &cfg);

    private:
        static void apply_env_overrides(FerryConfig &cfg);
    };

} // namespace ferry
