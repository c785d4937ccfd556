#include "ferry/burn_mint_ledger.hpp"
#include <spdlog/spdlog.h>

namespace ferry
{

    // ========== BurnMintLedger ==========

    Result<std::unique_ptr<BurnMintLedger>> BurnMintLedger::create(LedgerSettings settings,
                                                                   std::shared_ptr<const Clock> clock,
                                                                   std::shared_ptr<EventLog> events)
    {
        if (settings.codes.empty())
            settings.codes = OperationCodeTable::secondary();

        auto signers = validate(settings);
        if (!signers)
            return std::unexpected(signers.error());

        return std::make_unique<BurnMintLedger>(
            ConstructionKey{}, std::move(settings), std::move(*signers), std::move(clock), std::move(events));
    }

    BurnMintLedger::BurnMintLedger(ConstructionKey,
                                   LedgerSettings settings,
                                   SignerRegistry signers,
                                   std::shared_ptr<const Clock> clock,
                                   std::shared_ptr<EventLog> events)
        : BridgeLedger(std::move(settings), std::move(signers), std::move(clock), std::move(events))
    {
    }

    Result<void> BurnMintLedger::transfer(const Identity &from, const Identity &to, const Amount &amount)
    {
        if (paused())
            return std::unexpected(FerryError::lifecycle("Enforced pause"));
        return balances_.transfer(from, to, amount);
    }

    Result<void> BurnMintLedger::transfer_from(const Identity &spender,
                                               const Identity &owner,
                                               const Identity &to,
                                               const Amount &amount)
    {
        if (paused())
            return std::unexpected(FerryError::lifecycle("Enforced pause"));
        if (balances_.allowance(owner, spender) < amount)
            return std::unexpected(FerryError::policy("Insufficient allowance"));

        auto moved = balances_.transfer(owner, to, amount);
        if (!moved)
            return moved;
        return balances_.spend_allowance(owner, spender, amount);
    }

    Result<void> BurnMintLedger::approve(const Identity &owner, const Identity &spender, const Amount &amount)
    {
        return balances_.approve(owner, spender, amount);
    }

    Amount BurnMintLedger::allowance(const Identity &owner, const Identity &spender) const
    {
        return balances_.allowance(owner, spender);
    }

    Amount BurnMintLedger::get_vault_balance() const
    {
        return balances_.balance_of(account());
    }

    Result<void> BurnMintLedger::debit_outbound(const Identity &caller, const Amount &amount)
    {
        return balances_.burn(caller, amount);
    }

    Result<void> BurnMintLedger::credit_inbound(const Identity &recipient, const Amount &amount)
    {
        return balances_.mint(recipient, amount);
    }

    nlohmann::json BurnMintLedger::describe() const
    {
        auto j = BridgeLedger::describe();
        j["total_supply"] = amount_to_string(total_supply());
        return j;
    }

    // ========== PrimaryLedger ==========

    Amount primary_mint_tranche()
    {
        return whole_tokens(3'000'000);
    }

    Amount primary_max_supply()
    {
        return whole_tokens(210'000'000);
    }

    Result<std::unique_ptr<PrimaryLedger>> PrimaryLedger::create(LedgerSettings settings,
                                                                 std::shared_ptr<const Clock> clock,
                                                                 std::shared_ptr<EventLog> events)
    {
        if (settings.codes.empty())
            settings.codes = OperationCodeTable::primary();

        auto signers = validate(settings);
        if (!signers)
            return std::unexpected(signers.error());

        return std::make_unique<PrimaryLedger>(
            ConstructionKey{}, std::move(settings), std::move(*signers), std::move(clock), std::move(events));
    }

    PrimaryLedger::PrimaryLedger(ConstructionKey key,
                                 LedgerSettings settings,
                                 SignerRegistry signers,
                                 std::shared_ptr<const Clock> clock,
                                 std::shared_ptr<EventLog> events)
        : BurnMintLedger(key, std::move(settings), std::move(signers), std::move(clock), std::move(events))
    {
    }

    Result<void> PrimaryLedger::check_bridge_available() const
    {
        if (!launched_)
            return std::unexpected(FerryError::lifecycle("Bridging not available before launch"));
        return {};
    }

    Result<void> PrimaryLedger::mint_tranche(EventLog::Batch &batch)
    {
        auto current = now();
        if (current < last_mint_ + kMintInterval)
            return std::unexpected(FerryError::policy("Mint interval not reached"));

        auto tranche = primary_mint_tranche();
        if (total_supply() + tranche > primary_max_supply())
            return std::unexpected(FerryError::policy("Max supply exceeded"));

        auto minted = balances().mint(account(), tranche);
        if (!minted)
            return minted;

        last_mint_ = current;
        batch.emit("Minted", {{"to", to_hex(account())}, {"amount", amount_to_string(tranche)}});
        spdlog::info("ledger {} minted {} (supply {})", name(), amount_to_string(tranche), amount_to_string(total_supply()));
        return {};
    }

    Result<void> PrimaryLedger::apply_variant_effect(const Operation &op,
                                                     const OperationEffect &effect,
                                                     EventLog::Batch &batch)
    {
        if (std::holds_alternative<effect::Mint>(effect))
            return mint_tranche(batch);

        if (const auto *burn = std::get_if<effect::Burn>(&effect))
        {
            auto burned = balances().burn(account(), burn->amount);
            if (!burned)
                return burned;
            batch.emit("Burned", {{"from", to_hex(account())}, {"amount", amount_to_string(burn->amount)}});
            return {};
        }

        if (std::holds_alternative<effect::PostLaunch>(effect))
        {
            if (launched_)
                return std::unexpected(FerryError::operation_state("Already launched"));
            launched_ = true;
            batch.emit("LaunchCompleted", {{"operation_id", to_hex(op.id)}});
            return {};
        }

        if (const auto *distribute = std::get_if<effect::DistributeTokens>(&effect))
        {
            auto moved = balances().transfer(account(), distribute->recipient, distribute->amount);
            if (!moved)
                return moved;
            batch.emit("TokensDistributed",
                       {{"recipient", to_hex(distribute->recipient)},
                        {"amount", amount_to_string(distribute->amount)}});
            return {};
        }

        return BurnMintLedger::apply_variant_effect(op, effect, batch);
    }

    nlohmann::json PrimaryLedger::describe() const
    {
        auto j = BurnMintLedger::describe();
        j["launched"] = launched_;
        j["last_mint"] = format_timestamp(last_mint_);
        return j;
    }

} // namespace ferry
