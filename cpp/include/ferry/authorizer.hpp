#pragma once

#include "clock.hpp"
#include "events.hpp"
#include "operation.hpp"
#include "signer_registry.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ferry
{
    inline constexpr std::size_t kQuorumThreshold = 3;
    inline constexpr std::chrono::seconds kOperationLifetime{3 * 24 * 60 * 60};

    /**
     * Applies the effect of an operation that reached quorum. Implemented by the
     * ledger that owns the authorizer.
     */
    class OperationExecutor
    {
    public:
        virtual ~OperationExecutor() = default;

        virtual Result<void> execute(const Operation &op,
                                     const OperationEffect &effect,
                                     EventLog::Batch &batch) = 0;
    };

    /**
     * Multi-signature authorization state machine.
     *
     * Requested operations collect self-submitted signatures from distinct
     * registered signers; the third valid signature executes the operation in
     * the same call. An operation is inert once executed or past its deadline.
     * Records are never purged.
     */
    class OperationAuthorizer
    {
    public:
        OperationAuthorizer(ChainId chain_id,
                            Identity admin,
                            OperationCodeTable codes,
                            const SignerRegistry &signers,
                            const Clock &clock,
                            OperationExecutor &executor);

        OperationAuthorizer(const OperationAuthorizer &) = delete;
        OperationAuthorizer &operator=(const OperationAuthorizer &) = delete;

        /** Store a new operation and return its fingerprint */
        Result<OperationId> request_operation(const Identity &caller,
                                              OperationCode type,
                                              const Identity &target,
                                              const Amount &value,
                                              const Bytes &payload,
                                              EventLog::Batch &batch);

        /**
         * Digest a signer signs for operation_id. An unknown id hashes its
         * default (empty) record, still domain-separated by chain id.
         */
        Digest get_operation_hash(const OperationId &operation_id) const;

        /**
         * Record caller's signature. Returns true if this signature completed the
         * quorum and the operation executed. On any failure the record is left
         * exactly as it was.
         */
        Result<bool> submit_signature(const Identity &caller,
                                      const OperationId &operation_id,
                                      const Bytes &signature,
                                      EventLog::Batch &batch);

        Result<bool> is_operation_expired(const OperationId &operation_id) const;

        std::optional<Operation> find(const OperationId &operation_id) const;
        std::vector<Operation> operations() const;

        std::uint64_t next_sequence() const { return next_sequence_; }
        const OperationCodeTable &codes() const { return codes_; }
        const Identity &admin() const { return admin_; }

    private:
        Result<void> validate_update_signer(const Identity &caller,
                                            const effect::UpdateSigner &update) const;

        Result<void> execute(Operation &op, EventLog::Batch &batch);

        ChainId chain_id_;
        Identity admin_;
        OperationCodeTable codes_;
        const SignerRegistry &signers_;
        const Clock &clock_;
        OperationExecutor &executor_;

        std::unordered_map<OperationId, Operation, ByteArrayHash> operations_;
        std::uint64_t next_sequence_{0};
    };

} // namespace ferry
