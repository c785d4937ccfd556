#pragma once

#include "authorizer.hpp"
#include "clock.hpp"
#include "events.hpp"
#include "lifecycle.hpp"
#include "operation.hpp"
#include "replay_registry.hpp"
#include "signer_registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry
{
    /** Per-transfer cap and the minimum spacing of inbound settlements */
    struct BridgeLimits
    {
        Amount max_amount{whole_tokens(10'000)};
        std::chrono::seconds cooldown{60};
    };

    struct BridgePolicy
    {
        bool bridge_in_enabled{true};
        bool bridge_out_enabled{true};
        // Let committed transfers from the sibling chain settle during a pause
        bool inbound_exempt_from_pause{false};
    };

    /** Construction parameters of one deployed ledger */
    struct LedgerSettings
    {
        std::string name;
        ChainId chain_id{0};
        Identity account{};
        Identity admin{};
        SignerRegistry::Slots signers{};
        OperationCodeTable codes;
        BridgeLimits limits{};
        // Unset: the variant's default policy
        std::optional<BridgePolicy> policy{};
    };

    /**
     * All mutable ledger state outside the operation records. Entry points copy
     * it before mutating and restore the copy when the call fails.
     */
    struct LedgerState
    {
        SignerRegistry signers;
        Lifecycle lifecycle{};
        Identity bridge_in_caller{};
        BridgeLimits limits{};
        BridgePolicy policy{};
        Timestamp last_bridge_in{};
        ReplayRegistry processed{};
    };

    /**
     * Bridge ledger on one chain: multi-sig administration, outbound and inbound
     * transfers bound by a cap, a global inbound cooldown and replay protection.
     *
     * Subclasses decide what moving value means (burning and minting a token
     * they own, or holding custody of an external one). Every public entry point
     * is all-or-nothing and publishes its events only on success.
     */
    class BridgeLedger : public OperationExecutor
    {
    public:
        ~BridgeLedger() override;

        BridgeLedger(const BridgeLedger &) = delete;
        BridgeLedger &operator=(const BridgeLedger &) = delete;

        // ========== Authorization ==========

        Result<OperationId> request_operation(const Identity &caller,
                                              OperationCode type,
                                              const Identity &target,
                                              const Amount &value,
                                              const Bytes &payload);

        Digest get_operation_hash(const OperationId &operation_id) const;

        /** Returns true when this signature executed the operation */
        Result<bool> submit_signature(const Identity &caller,
                                      const OperationId &operation_id,
                                      const Bytes &signature);

        Result<bool> is_operation_expired(const OperationId &operation_id) const;

        bool is_signer(const Identity &identity) const;

        // ========== Value movement ==========

        Result<void> bridge_out(const Identity &caller,
                                const Amount &amount,
                                const Identity &target,
                                ChainId chain_id,
                                std::optional<ChainId> destination_chain_id = std::nullopt);

        Result<void> bridge_in(const Identity &caller,
                               const Identity &recipient,
                               const Amount &amount,
                               ChainId chain_id,
                               const TransferId &transfer_id,
                               std::optional<ChainId> source_chain_id = std::nullopt);

        // ========== Inspection ==========

        virtual Amount get_vault_balance() const = 0;
        ChainId get_chain_id() const { return settings_.chain_id; }

        /** "primary", "secondary" or "vault" */
        virtual std::string variant() const = 0;

        virtual Identity account() const { return settings_.account; }

        const std::string &name() const { return settings_.name; }
        const Identity &admin() const { return settings_.admin; }
        const Identity &bridge_in_caller() const { return state_.bridge_in_caller; }
        const BridgeLimits &limits() const { return state_.limits; }
        const BridgePolicy &policy() const { return state_.policy; }
        LifecycleState lifecycle_state() const { return state_.lifecycle.state(); }
        bool paused() const { return state_.lifecycle.paused(); }
        bool halted() const { return state_.lifecycle.halted(); }
        Timestamp last_bridge_in() const { return state_.last_bridge_in; }
        bool is_processed(const TransferId &transfer_id) const { return state_.processed.contains(transfer_id); }
        const SignerRegistry::Slots &signers() const { return state_.signers.signers(); }
        const OperationCodeTable &codes() const { return authorizer_.codes(); }

        std::optional<Operation> find_operation(const OperationId &operation_id) const;
        std::vector<Operation> operations() const;

        EventLog &events() const { return *events_; }
        const Clock &clock() const { return *clock_; }

        virtual nlohmann::json describe() const;

    protected:
        /** Only the ledger factories can name this, so only they construct ledgers */
        struct ConstructionKey
        {
            explicit ConstructionKey() = default;
        };

        /** Validates settings and returns the signer registry they describe */
        static Result<SignerRegistry> validate(const LedgerSettings &settings);

        BridgeLedger(LedgerSettings settings,
                     SignerRegistry signers,
                     std::shared_ptr<const Clock> clock,
                     std::shared_ptr<EventLog> events);

        Result<void> execute(const Operation &op,
                             const OperationEffect &effect,
                             EventLog::Batch &batch) final;

        /** Effects only some variants support; the default rejects them */
        virtual Result<void> apply_variant_effect(const Operation &op,
                                                  const OperationEffect &effect,
                                                  EventLog::Batch &batch);

        /** Extra gate before any bridge call (e.g. launch phase) */
        virtual Result<void> check_bridge_available() const { return {}; }

        /** Remove amount from caller on the way out. Last mutation of bridge_out. */
        virtual Result<void> debit_outbound(const Identity &caller, const Amount &amount) = 0;

        /** Check that amount can be paid out before any state changes */
        virtual Result<void> check_inbound_funds(const Amount &) const { return {}; }

        /** Pay amount to recipient. Runs after replay and pacing state is updated. */
        virtual Result<void> credit_inbound(const Identity &recipient, const Amount &amount) = 0;

        LedgerState &state() { return state_; }
        Timestamp now() const { return clock_->now(); }

    private:
        LedgerSettings settings_;
        LedgerState state_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<EventLog> events_;
        OperationAuthorizer authorizer_;
        bool entered_{false};
    };

} // namespace ferry
