#include "ferry/vault_ledger.hpp"
#include <spdlog/spdlog.h>

namespace ferry
{

    Result<std::unique_ptr<VaultLedger>> VaultLedger::create(LedgerSettings settings,
                                                             std::shared_ptr<Token> token,
                                                             std::shared_ptr<const Clock> clock,
                                                             std::shared_ptr<EventLog> events)
    {
        if (!token || is_zero(token->account()))
            return std::unexpected(FerryError::invalid_input("Invalid token address"));

        if (settings.codes.empty())
            settings.codes = OperationCodeTable::vault();
        if (!settings.policy)
        {
            BridgePolicy policy;
            policy.inbound_exempt_from_pause = true;
            settings.policy = policy;
        }

        auto signers = validate(settings);
        if (!signers)
            return std::unexpected(signers.error());

        return std::make_unique<VaultLedger>(ConstructionKey{}, std::move(settings), std::move(*signers),
                                             std::move(token), std::move(clock), std::move(events));
    }

    VaultLedger::VaultLedger(ConstructionKey,
                             LedgerSettings settings,
                             SignerRegistry signers,
                             std::shared_ptr<Token> token,
                             std::shared_ptr<const Clock> clock,
                             std::shared_ptr<EventLog> events)
        : BridgeLedger(std::move(settings), std::move(signers), std::move(clock), std::move(events)),
          token_(std::move(token))
    {
    }

    Amount VaultLedger::get_vault_balance() const
    {
        return token_->balance_of(account());
    }

    Result<void> VaultLedger::debit_outbound(const Identity &caller, const Amount &amount)
    {
        if (token_->balance_of(caller) < amount)
            return std::unexpected(FerryError::policy("Insufficient balance"));
        return token_->transfer_from(account(), caller, account(), amount);
    }

    Result<void> VaultLedger::check_inbound_funds(const Amount &amount) const
    {
        if (get_vault_balance() < amount)
            return std::unexpected(FerryError::policy("Insufficient vault balance"));
        return {};
    }

    Result<void> VaultLedger::credit_inbound(const Identity &recipient, const Amount &amount)
    {
        return token_->transfer(account(), recipient, amount);
    }

    Result<void> VaultLedger::relinquish(EventLog::Batch &batch)
    {
        auto balance = get_vault_balance();
        if (balance == 0)
            return std::unexpected(FerryError::policy("No tokens to relinquish"));

        auto halted = state().lifecycle.halt();
        if (!halted)
            return halted;

        auto destination = token_->account();
        batch.emit("TokensRelinquished",
                   {{"to", to_hex(destination)}, {"amount", amount_to_string(balance)}});
        batch.emit("ContractHalted", {{"vault", to_hex(account())}});

        // Halted before custody leaves; a nested call finds the vault closed
        auto swept = token_->transfer(account(), destination, balance);
        if (!swept)
            return swept;

        spdlog::warn("vault {} relinquished {} to {} and is halted", name(), amount_to_string(balance), to_hex(destination));
        return {};
    }

    Result<void> VaultLedger::apply_variant_effect(const Operation &op,
                                                   const OperationEffect &effect,
                                                   EventLog::Batch &batch)
    {
        if (std::holds_alternative<effect::RelinquishTokens>(effect))
            return relinquish(batch);
        return BridgeLedger::apply_variant_effect(op, effect, batch);
    }

    nlohmann::json VaultLedger::describe() const
    {
        auto j = BridgeLedger::describe();
        j["token"] = to_hex(token_->account());
        return j;
    }

} // namespace ferry
