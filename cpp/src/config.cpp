#include "ferry/config.hpp"
#include "ferry/crypto.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <toml++/toml.h>

namespace ferry
{
    namespace
    {
        const std::set<std::string, std::less<>> kVariants{"primary", "secondary", "vault"};

        Result<Identity> parse_identity(std::string_view field, std::string_view text)
        {
            auto id = identity_from_hex(text);
            if (!id)
                return std::unexpected(FerryError::config(std::format("{}: {}", field, id.error().what())));
            return *id;
        }

        Result<SignerRegistry::Slots> parse_signers(std::string_view field, const toml::array &arr)
        {
            if (arr.size() != kSignerCount)
            {
                return std::unexpected(FerryError::config(
                    std::format("{}: expected {} signers, got {}", field, kSignerCount, arr.size())));
            }

            SignerRegistry::Slots slots{};
            for (std::size_t i = 0; i < arr.size(); ++i)
            {
                auto text = arr[i].value<std::string>();
                if (!text)
                    return std::unexpected(FerryError::config(std::format("{}[{}]: expected a hex string", field, i)));
                auto id = parse_identity(field, *text);
                if (!id)
                    return std::unexpected(id.error());
                slots[i] = *id;
            }

            // Same rules the ledger applies, reported at load time
            auto registry = SignerRegistry::create(slots);
            if (!registry)
                return std::unexpected(FerryError::config(std::format("{}: {}", field, registry.error().what())));
            return slots;
        }

        Result<Amount> parse_token_amount(std::string_view field, toml::node_view<const toml::node> node)
        {
            if (auto text = node.value<std::string>())
            {
                auto amount = parse_units(*text);
                if (!amount)
                    return std::unexpected(FerryError::config(std::format("{}: {}", field, amount.error().what())));
                return *amount;
            }
            if (auto whole = node.value<int64_t>(); whole && *whole >= 0)
                return whole_tokens(static_cast<std::uint64_t>(*whole));
            return std::unexpected(FerryError::config(std::format("{}: expected a token quantity", field)));
        }

        Result<OperationCodeTable> parse_codes(const LedgerConfig &ledger, const toml::table &tbl)
        {
            auto allowed = default_codes(ledger.variant);
            OperationCodeTable table;
            for (const auto &[key, node] : tbl)
            {
                auto kind = operation_kind_from_string(key.str());
                if (!kind)
                {
                    return std::unexpected(FerryError::config(
                        std::format("ledgers.{}.operations: unknown operation {}", ledger.name, key.str())));
                }
                if (!allowed.supports(*kind))
                {
                    return std::unexpected(FerryError::config(
                        std::format("ledgers.{}.operations: {} is not available on a {} ledger",
                                    ledger.name, key.str(), ledger.variant)));
                }
                auto code = node.value<int64_t>();
                if (!code || *code < 0 || *code > 255)
                {
                    return std::unexpected(FerryError::config(
                        std::format("ledgers.{}.operations.{}: expected a code in 0..255", ledger.name, key.str())));
                }
                auto assigned = table.assign(static_cast<OperationCode>(*code), *kind);
                if (!assigned)
                {
                    return std::unexpected(FerryError::config(
                        std::format("ledgers.{}.operations: {}", ledger.name, assigned.error().what())));
                }
            }
            return table;
        }

        Result<LedgerConfig> parse_ledger(std::string name, const toml::table &tbl)
        {
            LedgerConfig ledger;
            ledger.name = std::move(name);

            auto variant = tbl["variant"].value<std::string>();
            if (!variant || !kVariants.contains(*variant))
            {
                return std::unexpected(FerryError::config(
                    std::format("ledgers.{}.variant must be primary, secondary or vault", ledger.name)));
            }
            ledger.variant = *variant;

            auto chain_id = tbl["chain_id"].value<int64_t>();
            if (!chain_id || *chain_id <= 0)
                return std::unexpected(FerryError::config(std::format("ledgers.{}.chain_id must be positive", ledger.name)));
            ledger.chain_id = static_cast<ChainId>(*chain_id);

            if (auto account = tbl["account"].value<std::string>())
            {
                auto id = parse_identity(std::format("ledgers.{}.account", ledger.name), *account);
                if (!id)
                    return std::unexpected(id.error());
                ledger.account = *id;
            }
            else
            {
                ledger.account = derive_account(ledger.name);
            }

            if (auto admin = tbl["admin"].value<std::string>())
            {
                auto id = parse_identity(std::format("ledgers.{}.admin", ledger.name), *admin);
                if (!id)
                    return std::unexpected(id.error());
                ledger.admin = *id;
            }

            if (auto signers = tbl["signers"].as_array())
            {
                auto slots = parse_signers(std::format("ledgers.{}.signers", ledger.name), *signers);
                if (!slots)
                    return std::unexpected(slots.error());
                ledger.signers = *slots;
            }

            ledger.token = tbl["token"].value<std::string>();
            if (ledger.variant == "vault" && !ledger.token)
                return std::unexpected(FerryError::config(std::format("ledgers.{}: a vault needs a token", ledger.name)));
            if (ledger.variant != "vault" && ledger.token)
                return std::unexpected(FerryError::config(std::format("ledgers.{}: only a vault takes a token", ledger.name)));

            if (auto limits = tbl["limits"].as_table())
            {
                auto max_node = (*limits)["max_amount"];
                if (max_node)
                {
                    auto max = parse_token_amount(std::format("ledgers.{}.limits.max_amount", ledger.name), max_node);
                    if (!max)
                        return std::unexpected(max.error());
                    ledger.limits.max_amount = *max;
                }
                if (auto cooldown = (*limits)["cooldown_seconds"].value<int64_t>())
                {
                    if (*cooldown < 0)
                        return std::unexpected(FerryError::config(
                            std::format("ledgers.{}.limits.cooldown_seconds must not be negative", ledger.name)));
                    if (*cooldown > kMaxBridgeInCooldown.count())
                        return std::unexpected(FerryError::config(
                            std::format("ledgers.{}.limits.cooldown_seconds must be at most {}", ledger.name,
                                        kMaxBridgeInCooldown.count())));
                    ledger.limits.cooldown = std::chrono::seconds{*cooldown};
                }
            }

            ledger.policy.inbound_exempt_from_pause = ledger.variant == "vault";
            if (auto policy = tbl["policy"].as_table())
            {
                if (auto v = (*policy)["bridge_in_enabled"].value<bool>())
                    ledger.policy.bridge_in_enabled = *v;
                if (auto v = (*policy)["bridge_out_enabled"].value<bool>())
                    ledger.policy.bridge_out_enabled = *v;
                if (auto v = (*policy)["inbound_exempt_from_pause"].value<bool>())
                    ledger.policy.inbound_exempt_from_pause = *v;
            }

            if (auto ops = tbl["operations"].as_table())
            {
                auto codes = parse_codes(ledger, *ops);
                if (!codes)
                    return std::unexpected(codes.error());
                ledger.codes = std::move(*codes);
            }
            else
            {
                ledger.codes = default_codes(ledger.variant);
            }

            return ledger;
        }

        Result<FerryConfig> parse_toml(const toml::table &tbl)
        {
            FerryConfig cfg{};

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto enabled = (*audit)["enabled"].value<bool>())
                    cfg.audit.enabled = *enabled;
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    if (*port <= 0 || *port > 65535)
                        return std::unexpected(FerryError::config("server.port out of range"));
                    cfg.server.port = static_cast<std::uint16_t>(*port);
                }
                if (auto threads = (*server)["threads"].value<int64_t>(); threads && *threads > 0)
                    cfg.server.threads = static_cast<std::size_t>(*threads);
                if (auto rps = (*server)["requests_per_second"].value<double>())
                    cfg.server.requests_per_second = *rps;
                if (auto burst = (*server)["burst"].value<double>())
                    cfg.server.burst = *burst;
            }

            if (auto admin = tbl["admin"].value<std::string>())
            {
                auto id = parse_identity("admin", *admin);
                if (!id)
                    return std::unexpected(id.error());
                cfg.admin = *id;
            }

            if (auto signers = tbl["signers"].as_array())
            {
                auto slots = parse_signers("signers", *signers);
                if (!slots)
                    return std::unexpected(slots.error());
                cfg.signers = *slots;
            }

            if (auto ledgers = tbl["ledgers"].as_table())
            {
                for (const auto &[key, node] : *ledgers)
                {
                    auto ledger_tbl = node.as_table();
                    if (!ledger_tbl)
                        return std::unexpected(FerryError::config(std::format("ledgers.{} must be a table", key.str())));
                    auto ledger = parse_ledger(std::string(key.str()), *ledger_tbl);
                    if (!ledger)
                        return std::unexpected(ledger.error());
                    if (!ledger->signers && std::all_of(cfg.signers.begin(), cfg.signers.end(), is_zero))
                    {
                        return std::unexpected(FerryError::config(
                            std::format("ledgers.{}: no signers configured", ledger->name)));
                    }
                    cfg.ledgers.push_back(std::move(*ledger));
                }
            }

            return cfg;
        }

    } // namespace

    LedgerSettings FerryConfig::settings_for(const LedgerConfig &ledger) const
    {
        LedgerSettings settings;
        settings.name = ledger.name;
        settings.chain_id = ledger.chain_id;
        settings.account = ledger.account;
        settings.admin = ledger.admin.value_or(admin);
        settings.signers = ledger.signers.value_or(signers);
        settings.codes = ledger.codes;
        settings.limits = ledger.limits;
        settings.policy = ledger.policy;
        return settings;
    }

    Identity derive_account(std::string_view ledger_name)
    {
        return crypto::SHA256::hash("ferry.ledger:" + std::string(ledger_name));
    }

    OperationCodeTable default_codes(std::string_view variant)
    {
        if (variant == "primary")
            return OperationCodeTable::primary();
        if (variant == "secondary")
            return OperationCodeTable::secondary();
        if (variant == "vault")
            return OperationCodeTable::vault();
        return {};
    }

    Result<FerryConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(FerryError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<FerryConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        toml::table tbl;
        try
        {
            tbl = toml::parse(toml_content);
        }
        catch (const std::exception &e)
        {
            return std::unexpected(FerryError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto cfg = parse_toml(tbl);
        if (!cfg)
            return cfg;

        apply_env_overrides(*cfg);
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(FerryConfig &cfg)
    {
        if (const char *level = std::getenv("FERRY_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit_en = std::getenv("FERRY_AUDIT_ENABLED"))
            cfg.audit.enabled = std::string(audit_en) != "0";
        if (const char *audit_path = std::getenv("FERRY_AUDIT_LOG"))
            cfg.audit.log_path = audit_path;
        if (const char *port = std::getenv("FERRY_PORT"))
        {
            char *end = nullptr;
            auto value = std::strtoul(port, &end, 10);
            if (end != port && *end == '\0' && value > 0 && value <= 65535)
                cfg.server.port = static_cast<std::uint16_t>(value);
        }
    }

    nlohmann::json ConfigLoader::to_json(const FerryConfig &cfg)
    {
        nlohmann::json j;
        j["logging"] = {{"level", cfg.logging.level}};
        j["audit"] = {{"enabled", cfg.audit.enabled}, {"log_path", cfg.audit.log_path}};
        j["server"] = {{"port", cfg.server.port},
                       {"threads", cfg.server.threads},
                       {"requests_per_second", cfg.server.requests_per_second},
                       {"burst", cfg.server.burst}};
        j["admin"] = to_hex(cfg.admin);

        nlohmann::json ledgers = nlohmann::json::object();
        for (const auto &ledger : cfg.ledgers)
        {
            auto settings = cfg.settings_for(ledger);
            nlohmann::json signers = nlohmann::json::array();
            for (const auto &signer : settings.signers)
                signers.push_back(to_hex(signer));

            nlohmann::json entry{
                {"variant", ledger.variant},
                {"chain_id", ledger.chain_id},
                {"account", to_hex(ledger.account)},
                {"admin", to_hex(settings.admin)},
                {"signers", signers},
                {"limits", {{"max_amount", amount_to_string(ledger.limits.max_amount)},
                            {"cooldown_seconds", ledger.limits.cooldown.count()}}},
                {"policy", {{"bridge_in_enabled", ledger.policy.bridge_in_enabled},
                            {"bridge_out_enabled", ledger.policy.bridge_out_enabled},
                            {"inbound_exempt_from_pause", ledger.policy.inbound_exempt_from_pause}}},
                {"operations", ledger.codes.to_json()}};
            if (ledger.token)
                entry["token"] = *ledger.token;
            ledgers[ledger.name] = entry;
        }
        j["ledgers"] = ledgers;
        return j;
    }

} // namespace ferry
