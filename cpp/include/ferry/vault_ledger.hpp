#pragma once

#include "bridge_ledger.hpp"
#include "token.hpp"
#include <memory>

namespace ferry
{
    /**
     * Lock-release ledger holding custody of an external token in its own
     * account. Outbound transfers escrow the caller's tokens (allowance
     * required); inbound settlements release from custody. RelinquishTokens
     * returns all custody to the token's account and halts the vault for good.
     */
    class VaultLedger : public BridgeLedger
    {
    public:
        static Result<std::unique_ptr<VaultLedger>> create(LedgerSettings settings,
                                                           std::shared_ptr<Token> token,
                                                           std::shared_ptr<const Clock> clock,
                                                           std::shared_ptr<EventLog> events);

        VaultLedger(ConstructionKey,
                    LedgerSettings settings,
                    SignerRegistry signers,
                    std::shared_ptr<Token> token,
                    std::shared_ptr<const Clock> clock,
                    std::shared_ptr<EventLog> events);

        /** Same as bridge_out */
        Result<void> lock_tokens(const Identity &caller,
                                 const Amount &amount,
                                 const Identity &target,
                                 ChainId chain_id,
                                 std::optional<ChainId> destination_chain_id = std::nullopt)
        {
            return bridge_out(caller, amount, target, chain_id, destination_chain_id);
        }

        /** Same as bridge_in */
        Result<void> release_tokens(const Identity &caller,
                                    const Identity &recipient,
                                    const Amount &amount,
                                    ChainId chain_id,
                                    const TransferId &transfer_id,
                                    std::optional<ChainId> source_chain_id = std::nullopt)
        {
            return bridge_in(caller, recipient, amount, chain_id, transfer_id, source_chain_id);
        }

        Amount get_vault_balance() const override;

        const Token &token() const { return *token_; }

        std::string variant() const override { return "vault"; }

        nlohmann::json describe() const override;

    protected:
        Result<void> apply_variant_effect(const Operation &op,
                                          const OperationEffect &effect,
                                          EventLog::Batch &batch) override;

        Result<void> debit_outbound(const Identity &caller, const Amount &amount) override;
        Result<void> check_inbound_funds(const Amount &amount) const override;
        Result<void> credit_inbound(const Identity &recipient, const Amount &amount) override;

    private:
        Result<void> relinquish(EventLog::Batch &batch);

        std::shared_ptr<Token> token_;
    };

} // namespace ferry
