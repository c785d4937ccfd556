#include "ferry/rpc_router.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace ferry
{
    namespace
    {
        // Request parsing throws FerryError; handle() turns it into a response
        template <typename T>
        T unwrap(Result<T> result)
        {
            if (!result)
                throw result.error();
            return std::move(*result);
        }

        void unwrap(Result<void> result)
        {
            if (!result)
                throw result.error();
        }

        const nlohmann::json &field(const nlohmann::json &body, const char *name)
        {
            if (!body.is_object() || !body.contains(name))
                throw FerryError::invalid_input(std::format("Missing field {}", name));
            return body.at(name);
        }

        std::string string_field(const nlohmann::json &body, const char *name)
        {
            const auto &v = field(body, name);
            if (!v.is_string())
                throw FerryError::invalid_input(std::format("Field {} must be a string", name));
            return v.get<std::string>();
        }

        Amount amount_field(const nlohmann::json &body, const char *name)
        {
            const auto &v = field(body, name);
            if (v.is_number_unsigned())
                return Amount{v.get<std::uint64_t>()};
            if (!v.is_string())
                throw FerryError::invalid_input(std::format("Field {} must be a decimal string", name));
            return unwrap(amount_from_string(v.get<std::string>()));
        }

        Identity identity_field(const nlohmann::json &body, const char *name)
        {
            return unwrap(identity_from_hex(string_field(body, name)));
        }

        Digest digest_field(const nlohmann::json &body, const char *name)
        {
            return unwrap(from_hex32(string_field(body, name)));
        }

        Bytes bytes_field(const nlohmann::json &body, const char *name)
        {
            if (!body.contains(name))
                return {};
            return unwrap(bytes_from_hex(string_field(body, name)));
        }

        std::uint64_t number_field(const nlohmann::json &body, const char *name)
        {
            const auto &v = field(body, name);
            if (!v.is_number_unsigned())
                throw FerryError::invalid_input(std::format("Field {} must be an unsigned integer", name));
            return v.get<std::uint64_t>();
        }

        std::optional<ChainId> optional_chain(const nlohmann::json &body, const char *name)
        {
            if (!body.contains(name) || body.at(name).is_null())
                return std::nullopt;
            return number_field(body, name);
        }

        std::vector<std::string> split_path(std::string_view target)
        {
            auto query = target.find('?');
            if (query != std::string_view::npos)
                target = target.substr(0, query);

            std::vector<std::string> parts;
            std::size_t start = 0;
            while (start <= target.size())
            {
                auto slash = target.find('/', start);
                auto end = slash == std::string_view::npos ? target.size() : slash;
                if (end > start)
                    parts.emplace_back(target.substr(start, end - start));
                if (slash == std::string_view::npos)
                    break;
                start = slash + 1;
            }
            return parts;
        }

        RpcResponse error_response(const FerryError &e)
        {
            return RpcResponse{status_for(e.code),
                               {{"error", e.what()}, {"code", error_code_to_string(e.code)}}};
        }

        RpcResponse not_found()
        {
            return RpcResponse{404, {{"error", "not found"}}};
        }

        BridgeLedger &ledger_or_throw(Deployment &deployment, const std::string &name)
        {
            auto *ledger = deployment.find(name);
            if (!ledger)
                throw FerryError::not_found("Unknown ledger " + name);
            return *ledger;
        }
    } // namespace

    unsigned status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::Unauthorized:
            return 403;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::OperationState:
        case ErrorCode::LedgerPolicy:
        case ErrorCode::Lifecycle:
            return 409;
        case ErrorCode::InvalidInput:
        case ErrorCode::ConfigError:
        case ErrorCode::CryptoError:
            return 400;
        case ErrorCode::NetworkError:
            return 502;
        case ErrorCode::InternalError:
            return 500;
        }
        return 500;
    }

    RpcRouter::RpcRouter(Deployment &deployment, RateLimiter::Config rate_limit)
        : deployment_(deployment), limiter_(rate_limit), caller_limiter_(rate_limit)
    {
    }

    RpcResponse RpcRouter::handle(std::string_view method,
                                  std::string_view target,
                                  const std::string &body,
                                  const std::string &client_key)
    {
        auto path = split_path(target);
        try
        {
            if (!limiter_.allow(client_key))
            {
                spdlog::warn("rate limit exceeded for client {}", client_key);
                return RpcResponse{429, {{"error", "rate limit exceeded"}}};
            }
            if (method == "GET")
            {
                std::lock_guard lock(mutex_);
                return handle_get(path);
            }
            if (method == "POST")
            {
                auto route = target.substr(0, target.find('?'));
                return handle_post(route, path, body, client_key);
            }
            return RpcResponse{405, {{"error", "method not allowed"}}};
        }
        catch (const FerryError &e)
        {
            return error_response(e);
        }
        catch (const nlohmann::json::exception &e)
        {
            return RpcResponse{400, {{"error", e.what()}}};
        }
    }

    RpcResponse RpcRouter::handle_get(const std::vector<std::string> &path)
    {
        if (path.size() == 1 && path[0] == "health")
            return RpcResponse{200, {{"status", "ok"}}};

        if (path.size() == 1 && path[0] == "events")
        {
            nlohmann::json events = nlohmann::json::array();
            for (const auto &event : deployment_.events().events())
                events.push_back(event.to_json());
            return RpcResponse{200,
                               {{"events", events},
                                {"head", deployment_.events().head().value_or("")},
                                {"verified", deployment_.events().verify_chain()}}};
        }

        if (path.size() == 2 && path[0] == "nonces")
        {
            auto caller = unwrap(identity_from_hex(path[1]));
            return RpcResponse{200, {{"caller", to_hex(caller)}, {"nonce", nonces_.expected(caller)}}};
        }

        if (path.empty() || path[0] != "ledgers")
            return not_found();

        if (path.size() == 1)
            return RpcResponse{200, deployment_.describe()};

        auto &ledger = ledger_or_throw(deployment_, path[1]);
        if (path.size() == 2)
            return RpcResponse{200, ledger.describe()};

        const auto &section = path[2];
        if (section == "operations")
        {
            if (path.size() == 3)
            {
                nlohmann::json ops = nlohmann::json::array();
                for (const auto &op : ledger.operations())
                    ops.push_back(op.to_json());
                return RpcResponse{200, {{"operations", ops}}};
            }

            auto id = unwrap(from_hex32(path[3]));
            if (path.size() == 5 && path[4] == "hash")
                return RpcResponse{200, {{"operation_hash", to_hex(ledger.get_operation_hash(id))}}};
            if (path.size() != 4)
                return not_found();

            auto op = ledger.find_operation(id);
            if (!op)
                throw FerryError::not_found("Operation does not exist");
            auto j = op->to_json();
            j["operation_hash"] = to_hex(ledger.get_operation_hash(id));
            j["expired"] = unwrap(ledger.is_operation_expired(id));
            return RpcResponse{200, j};
        }

        if (path.size() == 4 && section == "signers")
        {
            auto identity = unwrap(identity_from_hex(path[3]));
            return RpcResponse{200, {{"identity", to_hex(identity)}, {"is_signer", ledger.is_signer(identity)}}};
        }

        if (path.size() == 4 && section == "processed")
        {
            auto transfer_id = unwrap(from_hex32(path[3]));
            return RpcResponse{200, {{"transfer_id", to_hex(transfer_id)}, {"processed", ledger.is_processed(transfer_id)}}};
        }

        if (path.size() == 4 && section == "balances")
        {
            auto *token = deployment_.find_token(path[1]);
            if (!token)
                throw FerryError::invalid_input("Ledger " + path[1] + " is not a token");
            auto holder = unwrap(identity_from_hex(path[3]));
            return RpcResponse{200, {{"holder", to_hex(holder)}, {"balance", amount_to_string(token->balance_of(holder))}}};
        }

        if (path.size() == 3 && section == "vault_balance")
            return RpcResponse{200, {{"vault_balance", amount_to_string(ledger.get_vault_balance())}}};

        if (path.size() == 3 && section == "chain_id")
            return RpcResponse{200, {{"chain_id", ledger.get_chain_id()}}};

        return not_found();
    }

    RpcResponse RpcRouter::handle_post(std::string_view route,
                                       const std::vector<std::string> &path,
                                       const std::string &body,
                                       const std::string &client_key)
    {
        if (path.size() != 3 || path[0] != "ledgers")
            return not_found();

        auto envelope = unwrap(SignedEnvelope::from_json(nlohmann::json::parse(body)));
        if (envelope.route != route)
            throw FerryError::unauthorized("Envelope signed for a different route");
        unwrap(envelope.verify());

        // Only a verified caller may spend its own budget
        auto key = to_hex(envelope.caller);
        if (!caller_limiter_.allow(key))
        {
            spdlog::warn("rate limit exceeded for caller {} ({})", key, client_key);
            return RpcResponse{429, {{"error", "rate limit exceeded"}}};
        }

        std::lock_guard lock(mutex_);
        unwrap(nonces_.consume(envelope.caller, envelope.nonce));

        auto &ledger = ledger_or_throw(deployment_, path[1]);
        return dispatch(ledger, path[2], envelope.caller, envelope.body);
    }

    RpcResponse RpcRouter::dispatch(BridgeLedger &ledger,
                                    std::string_view action,
                                    const Identity &caller,
                                    const nlohmann::json &body)
    {
        if (action == "request_operation")
        {
            auto type = number_field(body, "type");
            if (type > 255)
                throw FerryError::invalid_input("Invalid operation type");
            auto id = unwrap(ledger.request_operation(caller,
                                                      static_cast<OperationCode>(type),
                                                      identity_field(body, "target"),
                                                      amount_field(body, "value"),
                                                      bytes_field(body, "payload")));
            return RpcResponse{200,
                               {{"operation_id", to_hex(id)},
                                {"operation_hash", to_hex(ledger.get_operation_hash(id))}}};
        }

        if (action == "submit_signature")
        {
            auto executed = unwrap(ledger.submit_signature(caller,
                                                           digest_field(body, "operation_id"),
                                                           bytes_field(body, "signature")));
            return RpcResponse{200, {{"executed", executed}}};
        }

        if (action == "bridge_out")
        {
            unwrap(ledger.bridge_out(caller,
                                     amount_field(body, "amount"),
                                     identity_field(body, "target"),
                                     number_field(body, "chain_id"),
                                     optional_chain(body, "destination_chain_id")));
            return RpcResponse{200, {{"status", "bridged_out"}}};
        }

        if (action == "bridge_in")
        {
            unwrap(ledger.bridge_in(caller,
                                    identity_field(body, "recipient"),
                                    amount_field(body, "amount"),
                                    number_field(body, "chain_id"),
                                    digest_field(body, "transfer_id"),
                                    optional_chain(body, "source_chain_id")));
            return RpcResponse{200, {{"status", "bridged_in"}}};
        }

        if (action == "approve" || action == "transfer")
        {
            auto *token = deployment_.find_token(ledger.name());
            if (!token)
                throw FerryError::invalid_input("Ledger " + ledger.name() + " is not a token");
            if (action == "approve")
                unwrap(token->approve(caller, identity_field(body, "spender"), amount_field(body, "amount")));
            else
                unwrap(token->transfer(caller, identity_field(body, "to"), amount_field(body, "amount")));
            return RpcResponse{200, {{"status", "ok"}}};
        }

        return not_found();
    }

} // namespace ferry
