#pragma once

#include "bridge_ledger.hpp"
#include "burn_mint_ledger.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "events.hpp"
#include "vault_ledger.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ferry
{
    /**
     * Every ledger of one configuration, sharing a clock and an event log.
     * Burn-mint ledgers are built first so vaults can hold custody of them.
     */
    class Deployment
    {
    public:
        static Result<std::unique_ptr<Deployment>> build(const FerryConfig &cfg,
                                                         std::shared_ptr<const Clock> clock,
                                                         std::shared_ptr<EventLog> events);

    private:
        struct ConstructionKey
        {
            explicit ConstructionKey() = default;
        };

    public:
        Deployment(ConstructionKey, std::shared_ptr<const Clock> clock, std::shared_ptr<EventLog> events);

        BridgeLedger *find(std::string_view name) const;
        BurnMintLedger *find_token(std::string_view name) const;
        VaultLedger *find_vault(std::string_view name) const;

        std::vector<std::string> names() const;

        EventLog &events() const { return *events_; }
        const Clock &clock() const { return *clock_; }

        nlohmann::json describe() const;

    private:
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<EventLog> events_;
        std::map<std::string, std::shared_ptr<BridgeLedger>, std::less<>> ledgers_;
        std::map<std::string, std::shared_ptr<BurnMintLedger>, std::less<>> tokens_;
        std::map<std::string, std::shared_ptr<VaultLedger>, std::less<>> vaults_;
    };

} // namespace ferry
