#include "ferry/deployment.hpp"
#include <spdlog/spdlog.h>

namespace ferry
{

    Deployment::Deployment(ConstructionKey, std::shared_ptr<const Clock> clock, std::shared_ptr<EventLog> events)
        : clock_(std::move(clock)), events_(std::move(events))
    {
    }

    Result<std::unique_ptr<Deployment>> Deployment::build(const FerryConfig &cfg,
                                                          std::shared_ptr<const Clock> clock,
                                                          std::shared_ptr<EventLog> events)
    {
        auto deployment = std::make_unique<Deployment>(ConstructionKey{}, clock, events);

        for (const auto &ledger : cfg.ledgers)
        {
            if (ledger.variant == "vault")
                continue;

            std::shared_ptr<BurnMintLedger> built;
            if (ledger.variant == "primary")
            {
                auto primary = PrimaryLedger::create(cfg.settings_for(ledger), clock, events);
                if (!primary)
                    return std::unexpected(FerryError::config(std::format("ledger {}: {}", ledger.name, primary.error().what())));
                built = std::move(*primary);
            }
            else
            {
                auto secondary = BurnMintLedger::create(cfg.settings_for(ledger), clock, events);
                if (!secondary)
                    return std::unexpected(FerryError::config(std::format("ledger {}: {}", ledger.name, secondary.error().what())));
                built = std::move(*secondary);
            }

            deployment->tokens_.emplace(ledger.name, built);
            deployment->ledgers_.emplace(ledger.name, built);
        }

        for (const auto &ledger : cfg.ledgers)
        {
            if (ledger.variant != "vault")
                continue;

            auto token = deployment->tokens_.find(*ledger.token);
            if (token == deployment->tokens_.end())
            {
                return std::unexpected(FerryError::config(
                    std::format("ledger {}: token {} is not a burn-mint ledger", ledger.name, *ledger.token)));
            }

            auto vault = VaultLedger::create(cfg.settings_for(ledger), token->second, clock, events);
            if (!vault)
                return std::unexpected(FerryError::config(std::format("ledger {}: {}", ledger.name, vault.error().what())));

            std::shared_ptr<VaultLedger> built = std::move(*vault);
            deployment->vaults_.emplace(ledger.name, built);
            deployment->ledgers_.emplace(ledger.name, built);
        }

        spdlog::info("deployment ready with {} ledger(s)", deployment->ledgers_.size());
        return deployment;
    }

    BridgeLedger *Deployment::find(std::string_view name) const
    {
        auto it = ledgers_.find(name);
        return it == ledgers_.end() ? nullptr : it->second.get();
    }

    BurnMintLedger *Deployment::find_token(std::string_view name) const
    {
        auto it = tokens_.find(name);
        return it == tokens_.end() ? nullptr : it->second.get();
    }

    VaultLedger *Deployment::find_vault(std::string_view name) const
    {
        auto it = vaults_.find(name);
        return it == vaults_.end() ? nullptr : it->second.get();
    }

    std::vector<std::string> Deployment::names() const
    {
        std::vector<std::string> out;
        for (const auto &[name, ledger] : ledgers_)
            out.push_back(name);
        return out;
    }

    nlohmann::json Deployment::describe() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[name, ledger] : ledgers_)
            j[name] = ledger->describe();
        return j;
    }

} // namespace ferry
