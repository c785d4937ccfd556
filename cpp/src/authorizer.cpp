#include "ferry/authorizer.hpp"
#include "ferry/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ferry
{

    OperationAuthorizer::OperationAuthorizer(ChainId chain_id,
                                             Identity admin,
                                             OperationCodeTable codes,
                                             const SignerRegistry &signers,
                                             const Clock &clock,
                                             OperationExecutor &executor)
        : chain_id_(chain_id),
          admin_(admin),
          codes_(std::move(codes)),
          signers_(signers),
          clock_(clock),
          executor_(executor)
    {
    }

    Result<void> OperationAuthorizer::validate_update_signer(const Identity &caller,
                                                             const effect::UpdateSigner &update) const
    {
        if (!signers_.is_signer(update.old_signer))
            return std::unexpected(FerryError::invalid_input("Old signer not found"));
        if (is_zero(update.new_signer))
            return std::unexpected(FerryError::invalid_input("Invalid new signer"));
        if (signers_.is_signer(update.new_signer))
            return std::unexpected(FerryError::invalid_input("New signer already exists"));
        if (caller == update.old_signer)
            return std::unexpected(FerryError::unauthorized("Cannot request own removal"));
        return {};
    }

    Result<OperationId> OperationAuthorizer::request_operation(const Identity &caller,
                                                               OperationCode type,
                                                               const Identity &target,
                                                               const Amount &value,
                                                               const Bytes &payload,
                                                               EventLog::Batch &batch)
    {
        if (!signers_.is_signer(caller) && caller != admin_)
            return std::unexpected(FerryError::unauthorized("Only signers or owner can request operations"));

        auto kind = codes_.kind_of(type);
        if (!kind)
            return std::unexpected(FerryError::invalid_input("Invalid operation type"));

        auto decoded = decode_effect(*kind, target, value, payload);
        if (!decoded)
            return std::unexpected(decoded.error());

        if (const auto *update = std::get_if<effect::UpdateSigner>(&*decoded))
        {
            auto valid = validate_update_signer(caller, *update);
            if (!valid)
                return std::unexpected(valid.error());
        }

        Operation op;
        op.sequence = next_sequence_;
        op.type = type;
        op.kind = *kind;
        op.target = target;
        op.value = value;
        op.payload = payload;
        op.created = clock_.now();
        op.deadline = op.created + kOperationLifetime;
        op.id = compute_operation_id(chain_id_, op.sequence, type, target, value, payload);

        if (operations_.contains(op.id))
            return std::unexpected(FerryError::internal("Operation id collision"));

        ++next_sequence_;

        batch.emit("OperationRequested",
                   {{"operation_id", to_hex(op.id)},
                    {"requester", to_hex(caller)},
                    {"sequence", op.sequence},
                    {"type", op.type},
                    {"kind", operation_kind_to_string(op.kind)},
                    {"target", to_hex(op.target)},
                    {"value", amount_to_string(op.value)},
                    {"payload", bytes_to_hex(op.payload)},
                    {"deadline", format_timestamp(op.deadline)}});

        auto id = op.id;
        operations_.emplace(id, std::move(op));
        spdlog::debug("operation {} requested on chain {}", to_hex(id), chain_id_);
        return id;
    }

    Digest OperationAuthorizer::get_operation_hash(const OperationId &operation_id) const
    {
        auto it = operations_.find(operation_id);
        if (it != operations_.end())
            return compute_operation_hash(it->second, chain_id_);

        Operation empty;
        empty.id = operation_id;
        return compute_operation_hash(empty, chain_id_);
    }

    Result<bool> OperationAuthorizer::submit_signature(const Identity &caller,
                                                       const OperationId &operation_id,
                                                       const Bytes &signature,
                                                       EventLog::Batch &batch)
    {
        if (!signers_.is_signer(caller))
            return std::unexpected(FerryError::unauthorized("Only signers can submit signatures"));

        auto it = operations_.find(operation_id);
        if (it == operations_.end())
            return std::unexpected(FerryError::not_found("Operation does not exist"));

        Operation &op = it->second;
        if (op.executed)
            return std::unexpected(FerryError::operation_state("Operation already executed"));
        if (clock_.now() > op.deadline)
            return std::unexpected(FerryError::operation_state("Operation deadline passed"));
        if (op.has_signed(caller))
            return std::unexpected(FerryError::operation_state("Signature already submitted"));

        auto recovered = crypto::MessageSigner::recover(compute_operation_hash(op, chain_id_), signature);
        if (!recovered)
            return std::unexpected(recovered.error());
        if (*recovered != caller)
            return std::unexpected(FerryError::unauthorized("Signature does not match caller"));

        if (op.kind == OperationKind::UpdateSigner)
        {
            if (!signers_.is_signer(*recovered) && *recovered != admin_)
                return std::unexpected(FerryError::unauthorized("Only signers can submit signatures"));
            if (*recovered == op.target)
                return std::unexpected(FerryError::unauthorized("Signer being replaced cannot approve"));
        }

        Operation before = op;
        op.signatures[caller] = true;
        ++op.signature_count;

        batch.emit("SignatureSubmitted",
                   {{"operation_id", to_hex(op.id)},
                    {"signer", to_hex(caller)},
                    {"signature", bytes_to_hex(signature)},
                    {"signature_count", op.signature_count}});

        if (op.signature_count != kQuorumThreshold)
            return false;

        auto executed = execute(op, batch);
        if (!executed)
        {
            op = std::move(before);
            return std::unexpected(executed.error());
        }
        return true;
    }

    Result<void> OperationAuthorizer::execute(Operation &op, EventLog::Batch &batch)
    {
        // Marked first: a nested call observing this record sees it as spent
        op.executed = true;

        auto decoded = decode_effect(op.kind, op.target, op.value, op.payload);
        if (!decoded)
            return std::unexpected(decoded.error());

        auto applied = executor_.execute(op, *decoded, batch);
        if (!applied)
        {
            spdlog::warn("operation {} ({}) failed to execute: {}",
                         to_hex(op.id), operation_kind_to_string(op.kind), applied.error().what());
            return std::unexpected(applied.error());
        }

        batch.emit("OperationExecuted",
                   {{"operation_id", to_hex(op.id)},
                    {"type", op.type},
                    {"kind", operation_kind_to_string(op.kind)}});
        spdlog::info("operation {} ({}) executed on chain {}",
                     to_hex(op.id), operation_kind_to_string(op.kind), chain_id_);
        return {};
    }

    Result<bool> OperationAuthorizer::is_operation_expired(const OperationId &operation_id) const
    {
        auto it = operations_.find(operation_id);
        if (it == operations_.end())
            return std::unexpected(FerryError::not_found("Operation does not exist"));
        return clock_.now() > it->second.deadline;
    }

    std::optional<Operation> OperationAuthorizer::find(const OperationId &operation_id) const
    {
        auto it = operations_.find(operation_id);
        if (it == operations_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<Operation> OperationAuthorizer::operations() const
    {
        std::vector<Operation> out;
        out.reserve(operations_.size());
        for (const auto &[id, op] : operations_)
            out.push_back(op);
        std::sort(out.begin(), out.end(),
                  [](const Operation &a, const Operation &b) { return a.sequence < b.sequence; });
        return out;
    }

} // namespace ferry
