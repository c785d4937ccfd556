#pragma once

#include "bridge_ledger.hpp"
#include "token.hpp"
#include <memory>

namespace ferry
{
    /**
     * Ledger that is itself the bridged token. Outbound transfers burn from the
     * caller; inbound settlements mint to the recipient. Token transfers are
     * blocked while the ledger is paused.
     */
    class BurnMintLedger : public BridgeLedger, public Token
    {
    public:
        /** Sibling-chain deployment (secondary operation codes unless overridden) */
        static Result<std::unique_ptr<BurnMintLedger>> create(LedgerSettings settings,
                                                              std::shared_ptr<const Clock> clock,
                                                              std::shared_ptr<EventLog> events);

        BurnMintLedger(ConstructionKey,
                       LedgerSettings settings,
                       SignerRegistry signers,
                       std::shared_ptr<const Clock> clock,
                       std::shared_ptr<EventLog> events);

        // ========== Token ==========

        Identity account() const override { return BridgeLedger::account(); }
        Amount balance_of(const Identity &holder) const override { return balances_.balance_of(holder); }
        Result<void> transfer(const Identity &from, const Identity &to, const Amount &amount) override;
        Result<void> transfer_from(const Identity &spender,
                                   const Identity &owner,
                                   const Identity &to,
                                   const Amount &amount) override;

        Result<void> approve(const Identity &owner, const Identity &spender, const Amount &amount);
        Amount allowance(const Identity &owner, const Identity &spender) const;
        Amount total_supply() const { return balances_.total_supply(); }

        /** Tokens held by the ledger's own account */
        Amount get_vault_balance() const override;

        std::string variant() const override { return "secondary"; }

        nlohmann::json describe() const override;

    protected:
        Result<void> debit_outbound(const Identity &caller, const Amount &amount) override;
        Result<void> credit_inbound(const Identity &recipient, const Amount &amount) override;

        TokenBalances &balances() { return balances_; }

    private:
        TokenBalances balances_;
    };

    /** Fixed quantity created by one Mint operation */
    Amount primary_mint_tranche();
    /** Supply ceiling of the origin token */
    Amount primary_max_supply();
    inline constexpr std::chrono::seconds kMintInterval{3 * 7 * 24 * 60 * 60};

    /**
     * Origin-chain token. Supply is created by quorum in fixed tranches into the
     * ledger's own account and handed out by DistributeTokens. Bridging stays
     * closed until a PostLaunch operation executes.
     */
    class PrimaryLedger : public BurnMintLedger
    {
    public:
        static Result<std::unique_ptr<PrimaryLedger>> create(LedgerSettings settings,
                                                             std::shared_ptr<const Clock> clock,
                                                             std::shared_ptr<EventLog> events);

        PrimaryLedger(ConstructionKey,
                      LedgerSettings settings,
                      SignerRegistry signers,
                      std::shared_ptr<const Clock> clock,
                      std::shared_ptr<EventLog> events);

        bool launched() const { return launched_; }
        Timestamp last_mint() const { return last_mint_; }

        std::string variant() const override { return "primary"; }

        nlohmann::json describe() const override;

    protected:
        Result<void> apply_variant_effect(const Operation &op,
                                          const OperationEffect &effect,
                                          EventLog::Batch &batch) override;

        Result<void> check_bridge_available() const override;

    private:
        Result<void> mint_tranche(EventLog::Batch &batch);

        bool launched_{false};
        Timestamp last_mint_{};
    };

} // namespace ferry
