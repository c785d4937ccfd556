#include "ferry/envelope.hpp"
#include "ferry/json_canonicalization.hpp"
#include <algorithm>

namespace ferry
{

    SignedEnvelope SignedEnvelope::sign(const crypto::Ed25519KeyPair &keypair,
                                        std::uint64_t nonce,
                                        std::string route,
                                        nlohmann::json body)
    {
        SignedEnvelope envelope;
        envelope.caller = keypair.identity();
        envelope.nonce = nonce;
        envelope.route = std::move(route);
        envelope.body = std::move(body);

        auto payload = envelope.signing_payload();
        auto sig = keypair.sign(Bytes(payload.begin(), payload.end()));
        envelope.signature = crypto::Base64::encode(Bytes(sig.begin(), sig.end()));
        return envelope;
    }

    Result<SignedEnvelope> SignedEnvelope::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(FerryError::invalid_input("Envelope must be a JSON object"));

        SignedEnvelope envelope;
        try
        {
            auto caller = identity_from_hex(j.at("caller").get<std::string>());
            if (!caller)
                return std::unexpected(caller.error());
            envelope.caller = *caller;
            envelope.nonce = j.at("nonce").get<std::uint64_t>();
            envelope.route = j.at("route").get<std::string>();
            envelope.body = j.value("body", nlohmann::json::object());
            envelope.signature = j.at("signature").get<std::string>();
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(FerryError::invalid_input(std::string("Malformed envelope: ") + e.what()));
        }
        return envelope;
    }

    nlohmann::json SignedEnvelope::to_json() const
    {
        return nlohmann::json{{"caller", to_hex(caller)},
                              {"nonce", nonce},
                              {"route", route},
                              {"body", body},
                              {"signature", signature}};
    }

    std::string SignedEnvelope::signing_payload() const
    {
        return json::RFC8785Canonicalizer::canonicalize(nlohmann::json{{"caller", to_hex(caller)},
                                                                       {"nonce", nonce},
                                                                       {"route", route},
                                                                       {"body", body}});
    }

    Result<void> SignedEnvelope::verify() const
    {
        auto sig_bytes = crypto::Base64::decode(signature);
        if (!sig_bytes)
            return std::unexpected(FerryError::crypto("Envelope signature is not base64"));
        if (sig_bytes->size() != 64)
            return std::unexpected(FerryError::crypto("Invalid envelope signature length"));

        crypto::Ed25519Signature sig{};
        std::copy(sig_bytes->begin(), sig_bytes->end(), sig.begin());

        auto payload = signing_payload();
        if (!crypto::Ed25519KeyPair::verify(Bytes(payload.begin(), payload.end()), sig, caller))
            return std::unexpected(FerryError::unauthorized("Invalid envelope signature"));
        return {};
    }

    std::uint64_t NonceTracker::expected(const Identity &caller) const
    {
        std::lock_guard lock(mutex_);
        auto it = next_.find(caller);
        return it == next_.end() ? 0 : it->second;
    }

    Result<void> NonceTracker::consume(const Identity &caller, std::uint64_t nonce)
    {
        std::lock_guard lock(mutex_);
        auto &next = next_[caller];
        if (nonce != next)
        {
            return std::unexpected(FerryError::unauthorized(
                std::format("Unexpected nonce {} (expected {})", nonce, next)));
        }
        ++next;
        return {};
    }

} // namespace ferry
