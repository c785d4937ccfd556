#include "ferry/bridge_ledger.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>

namespace ferry
{

    Result<SignerRegistry> BridgeLedger::validate(const LedgerSettings &settings)
    {
        if (settings.chain_id == 0)
            return std::unexpected(FerryError::invalid_input("Invalid chain ID"));
        if (is_zero(settings.account))
            return std::unexpected(FerryError::invalid_input("Invalid ledger account"));
        if (settings.codes.empty())
            return std::unexpected(FerryError::invalid_input("Empty operation code table"));
        return SignerRegistry::create(settings.signers);
    }

    BridgeLedger::BridgeLedger(LedgerSettings settings,
                               SignerRegistry signers,
                               std::shared_ptr<const Clock> clock,
                               std::shared_ptr<EventLog> events)
        : settings_(std::move(settings)),
          state_{std::move(signers)},
          clock_(std::move(clock)),
          events_(std::move(events)),
          authorizer_(settings_.chain_id, settings_.admin, settings_.codes, state_.signers, *clock_, *this)
    {
        state_.limits = settings_.limits;
        state_.policy = settings_.policy.value_or(BridgePolicy{});
        spdlog::info("ledger {} ({}) deployed on chain {}", settings_.name, to_hex(settings_.account), settings_.chain_id);
    }

    BridgeLedger::~BridgeLedger() = default;

    // ========== Authorization ==========

    Result<OperationId> BridgeLedger::request_operation(const Identity &caller,
                                                        OperationCode type,
                                                        const Identity &target,
                                                        const Amount &value,
                                                        const Bytes &payload)
    {
        if (auto live = state_.lifecycle.require_not_halted(); !live)
            return std::unexpected(live.error());

        auto batch = events_->begin(settings_.chain_id, now());
        auto id = authorizer_.request_operation(caller, type, target, value, payload, batch);
        if (!id)
            return std::unexpected(id.error());
        batch.commit();
        return id;
    }

    Digest BridgeLedger::get_operation_hash(const OperationId &operation_id) const
    {
        return authorizer_.get_operation_hash(operation_id);
    }

    Result<bool> BridgeLedger::submit_signature(const Identity &caller,
                                                const OperationId &operation_id,
                                                const Bytes &signature)
    {
        if (auto live = state_.lifecycle.require_not_halted(); !live)
            return std::unexpected(live.error());

        ReentrancyGuard guard(entered_);
        if (auto ok = guard.check(); !ok)
            return std::unexpected(ok.error());

        LedgerState snapshot = state_;
        auto batch = events_->begin(settings_.chain_id, now());

        auto executed = authorizer_.submit_signature(caller, operation_id, signature, batch);
        if (!executed)
        {
            state_ = std::move(snapshot);
            return std::unexpected(executed.error());
        }
        batch.commit();
        return executed;
    }

    Result<bool> BridgeLedger::is_operation_expired(const OperationId &operation_id) const
    {
        return authorizer_.is_operation_expired(operation_id);
    }

    bool BridgeLedger::is_signer(const Identity &identity) const
    {
        return state_.signers.is_signer(identity);
    }

    std::optional<Operation> BridgeLedger::find_operation(const OperationId &operation_id) const
    {
        return authorizer_.find(operation_id);
    }

    std::vector<Operation> BridgeLedger::operations() const
    {
        return authorizer_.operations();
    }

    // ========== Effects ==========

    Result<void> BridgeLedger::execute(const Operation &op,
                                       const OperationEffect &effect,
                                       EventLog::Batch &batch)
    {
        if (!authorizer_.codes().supports(op.kind))
            return std::unexpected(FerryError::invalid_input("Invalid operation type"));

        return std::visit(
            [&](const auto &e) -> Result<void>
            {
                using E = std::decay_t<decltype(e)>;

                if constexpr (std::is_same_v<E, effect::Pause>)
                {
                    auto paused = state_.lifecycle.pause();
                    if (!paused)
                        return paused;
                    batch.emit("Paused", {{"operation_id", to_hex(op.id)}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::Unpause>)
                {
                    auto unpaused = state_.lifecycle.unpause();
                    if (!unpaused)
                        return unpaused;
                    batch.emit("Unpaused", {{"operation_id", to_hex(op.id)}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::SetBridgeInCaller>)
                {
                    state_.bridge_in_caller = e.caller;
                    batch.emit("BridgeInCallerSet", {{"caller", to_hex(e.caller)}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::SetBridgeInLimits>)
                {
                    state_.limits.max_amount = e.max_amount;
                    state_.limits.cooldown = e.cooldown;
                    batch.emit("BridgeInLimitsSet",
                               {{"max_amount", amount_to_string(e.max_amount)},
                                {"cooldown", e.cooldown.count()}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::UpdateSigner>)
                {
                    auto replaced = state_.signers.replace(e.old_signer, e.new_signer);
                    if (!replaced)
                        return replaced;
                    batch.emit("SignerUpdated",
                               {{"old_signer", to_hex(e.old_signer)},
                                {"new_signer", to_hex(e.new_signer)}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::SetBridgeInEnabled>)
                {
                    state_.policy.bridge_in_enabled = e.enabled;
                    batch.emit("BridgeInEnabledSet", {{"enabled", e.enabled}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::SetBridgeOutEnabled>)
                {
                    state_.policy.bridge_out_enabled = e.enabled;
                    batch.emit("BridgeOutEnabledSet", {{"enabled", e.enabled}});
                    return {};
                }
                else if constexpr (std::is_same_v<E, effect::RelinquishTokens> ||
                                   std::is_same_v<E, effect::Mint> ||
                                   std::is_same_v<E, effect::Burn> ||
                                   std::is_same_v<E, effect::PostLaunch> ||
                                   std::is_same_v<E, effect::DistributeTokens>)
                {
                    return apply_variant_effect(op, effect, batch);
                }
                else
                {
                    static_assert(!sizeof(E), "unhandled operation effect");
                }
            },
            effect);
    }

    Result<void> BridgeLedger::apply_variant_effect(const Operation &op,
                                                    const OperationEffect &,
                                                    EventLog::Batch &)
    {
        spdlog::error("ledger {} has no handler for {}", settings_.name, operation_kind_to_string(op.kind));
        return std::unexpected(FerryError::invalid_input("Invalid operation type"));
    }

    // ========== Value movement ==========

    Result<void> BridgeLedger::bridge_out(const Identity &caller,
                                          const Amount &amount,
                                          const Identity &target,
                                          ChainId chain_id,
                                          std::optional<ChainId> destination_chain_id)
    {
        if (auto live = state_.lifecycle.require_not_halted(); !live)
            return std::unexpected(live.error());

        ReentrancyGuard guard(entered_);
        if (auto ok = guard.check(); !ok)
            return std::unexpected(ok.error());

        if (auto available = check_bridge_available(); !available)
            return std::unexpected(available.error());
        if (auto running = state_.lifecycle.require_not_paused(); !running)
            return std::unexpected(running.error());
        if (chain_id != settings_.chain_id)
            return std::unexpected(FerryError::policy("Invalid chain ID"));
        if (destination_chain_id && *destination_chain_id != 0 && *destination_chain_id == chain_id)
            return std::unexpected(FerryError::policy("Destination chain must differ from source chain"));
        if (!state_.policy.bridge_out_enabled)
            return std::unexpected(FerryError::policy("Bridge out disabled"));
        if (amount == 0)
            return std::unexpected(FerryError::policy("Cannot bridge out zero tokens"));
        if (is_zero(target))
            return std::unexpected(FerryError::invalid_input("Invalid target address"));
        if (amount > state_.limits.max_amount)
            return std::unexpected(FerryError::policy("Amount exceeds bridge-in limit"));

        LedgerState snapshot = state_;
        auto batch = events_->begin(settings_.chain_id, now());
        batch.emit("BridgedOut",
                   {{"from", to_hex(caller)},
                    {"amount", amount_to_string(amount)},
                    {"target", to_hex(target)},
                    {"chain_id", chain_id},
                    {"destination_chain_id", destination_chain_id.value_or(0)}});

        auto debited = debit_outbound(caller, amount);
        if (!debited)
        {
            state_ = std::move(snapshot);
            return std::unexpected(debited.error());
        }

        batch.commit();
        return {};
    }

    Result<void> BridgeLedger::bridge_in(const Identity &caller,
                                         const Identity &recipient,
                                         const Amount &amount,
                                         ChainId chain_id,
                                         const TransferId &transfer_id,
                                         std::optional<ChainId> source_chain_id)
    {
        if (auto live = state_.lifecycle.require_not_halted(); !live)
            return std::unexpected(live.error());

        ReentrancyGuard guard(entered_);
        if (auto ok = guard.check(); !ok)
            return std::unexpected(ok.error());

        if (auto available = check_bridge_available(); !available)
            return std::unexpected(available.error());
        if (is_zero(state_.bridge_in_caller) || caller != state_.bridge_in_caller)
            return std::unexpected(FerryError::unauthorized("Not authorized to bridge in"));
        if (chain_id != settings_.chain_id)
            return std::unexpected(FerryError::policy("Invalid chain ID"));
        if (source_chain_id && *source_chain_id != 0 && *source_chain_id == chain_id)
            return std::unexpected(FerryError::policy("Source chain must differ from destination chain"));
        if (!state_.policy.inbound_exempt_from_pause)
        {
            if (auto running = state_.lifecycle.require_not_paused(); !running)
                return std::unexpected(running.error());
        }
        if (!state_.policy.bridge_in_enabled)
            return std::unexpected(FerryError::policy("Bridge in disabled"));
        if (amount == 0)
            return std::unexpected(FerryError::policy("Cannot bridge in zero tokens"));
        if (is_zero(recipient))
            return std::unexpected(FerryError::invalid_input("Invalid recipient address"));
        if (amount > state_.limits.max_amount)
            return std::unexpected(FerryError::policy("Amount exceeds bridge-in limit"));

        auto current = now();
        if (current - state_.last_bridge_in < state_.limits.cooldown)
            return std::unexpected(FerryError::policy("Bridge-in cooldown not met"));
        if (state_.processed.contains(transfer_id))
            return std::unexpected(FerryError::policy("Transaction already processed"));
        if (auto funded = check_inbound_funds(amount); !funded)
            return std::unexpected(funded.error());

        LedgerState snapshot = state_;
        auto batch = events_->begin(settings_.chain_id, current);

        // Replay and pacing state is settled before any value leaves
        if (auto recorded = state_.processed.insert(transfer_id); !recorded)
            return std::unexpected(recorded.error());
        state_.last_bridge_in = current;

        batch.emit("BridgedIn",
                   {{"caller", to_hex(caller)},
                    {"recipient", to_hex(recipient)},
                    {"amount", amount_to_string(amount)},
                    {"chain_id", chain_id},
                    {"source_chain_id", source_chain_id.value_or(0)},
                    {"transfer_id", to_hex(transfer_id)}});

        auto credited = credit_inbound(recipient, amount);
        if (!credited)
        {
            state_ = std::move(snapshot);
            return std::unexpected(credited.error());
        }

        batch.commit();
        return {};
    }

    nlohmann::json BridgeLedger::describe() const
    {
        nlohmann::json signers = nlohmann::json::array();
        for (const auto &signer : state_.signers.signers())
            signers.push_back(to_hex(signer));

        return nlohmann::json{
            {"name", settings_.name},
            {"variant", variant()},
            {"chain_id", settings_.chain_id},
            {"account", to_hex(account())},
            {"admin", to_hex(settings_.admin)},
            {"signers", signers},
            {"bridge_in_caller", to_hex(state_.bridge_in_caller)},
            {"limits", {{"max_amount", amount_to_string(state_.limits.max_amount)},
                        {"cooldown_seconds", state_.limits.cooldown.count()}}},
            {"policy", {{"bridge_in_enabled", state_.policy.bridge_in_enabled},
                        {"bridge_out_enabled", state_.policy.bridge_out_enabled},
                        {"inbound_exempt_from_pause", state_.policy.inbound_exempt_from_pause}}},
            {"lifecycle", lifecycle_state_to_string(state_.lifecycle.state())},
            {"last_bridge_in", format_timestamp(state_.last_bridge_in)},
            {"processed_transfers", state_.processed.size()},
            {"vault_balance", amount_to_string(get_vault_balance())},
            {"operation_codes", authorizer_.codes().to_json()}};
    }

} // namespace ferry
