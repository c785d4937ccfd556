#include "ferry/operation.hpp"
#include "ferry/crypto.hpp"
#include "ferry/json_canonicalization.hpp"
#include <algorithm>
#include <array>

namespace ferry
{

    namespace
    {
        struct KindName
        {
            OperationKind kind;
            std::string_view name;
        };

        constexpr std::array<KindName, 12> kKindNames{{
            {OperationKind::Pause, "Pause"},
            {OperationKind::Unpause, "Unpause"},
            {OperationKind::SetBridgeInCaller, "SetBridgeInCaller"},
            {OperationKind::SetBridgeInLimits, "SetBridgeInLimits"},
            {OperationKind::UpdateSigner, "UpdateSigner"},
            {OperationKind::SetBridgeInEnabled, "SetBridgeInEnabled"},
            {OperationKind::SetBridgeOutEnabled, "SetBridgeOutEnabled"},
            {OperationKind::RelinquishTokens, "RelinquishTokens"},
            {OperationKind::Mint, "Mint"},
            {OperationKind::Burn, "Burn"},
            {OperationKind::PostLaunch, "PostLaunch"},
            {OperationKind::DistributeTokens, "DistributeTokens"},
        }};

        Result<Amount> decode_word(const Bytes &payload)
        {
            if (payload.size() != 32)
                return std::unexpected(FerryError::invalid_input("Invalid operation payload"));
            Amount word = 0;
            for (auto b : payload)
            {
                word <<= 8;
                word |= b;
            }
            return word;
        }

        Result<bool> decode_bool(const Bytes &payload)
        {
            auto word = decode_word(payload);
            if (!word)
                return std::unexpected(word.error());
            if (*word > 1)
                return std::unexpected(FerryError::invalid_input("Invalid operation payload"));
            return *word == 1;
        }
    } // namespace

    std::string operation_kind_to_string(OperationKind kind)
    {
        for (const auto &entry : kKindNames)
        {
            if (entry.kind == kind)
                return std::string(entry.name);
        }
        return "Unknown";
    }

    std::optional<OperationKind> operation_kind_from_string(std::string_view name)
    {
        for (const auto &entry : kKindNames)
        {
            if (entry.name == name)
                return entry.kind;
        }
        return std::nullopt;
    }

    // ========== OperationCodeTable ==========

    OperationCodeTable OperationCodeTable::primary()
    {
        return OperationCodeTable({OperationKind::Mint,
                                  OperationKind::Burn,
                                  OperationKind::PostLaunch,
                                  OperationKind::Pause,
                                  OperationKind::Unpause,
                                  OperationKind::SetBridgeInCaller,
                                  OperationKind::SetBridgeInLimits,
                                  OperationKind::UpdateSigner,
                                  OperationKind::DistributeTokens});
    }

    OperationCodeTable OperationCodeTable::secondary()
    {
        return OperationCodeTable({OperationKind::Pause,
                                  OperationKind::Unpause,
                                  OperationKind::SetBridgeInCaller,
                                  OperationKind::SetBridgeInLimits,
                                  OperationKind::UpdateSigner,
                                  OperationKind::SetBridgeInEnabled,
                                  OperationKind::SetBridgeOutEnabled});
    }

    OperationCodeTable OperationCodeTable::vault()
    {
        return OperationCodeTable({OperationKind::Pause,
                                  OperationKind::Unpause,
                                  OperationKind::SetBridgeInCaller,
                                  OperationKind::SetBridgeInLimits,
                                  OperationKind::UpdateSigner,
                                  OperationKind::RelinquishTokens,
                                  OperationKind::SetBridgeOutEnabled});
    }

    OperationCodeTable::OperationCodeTable(std::initializer_list<OperationKind> kinds)
    {
        OperationCode code = 0;
        for (auto kind : kinds)
        {
            codes_.emplace(code++, kind);
        }
    }

    Result<void> OperationCodeTable::assign(OperationCode code, OperationKind kind)
    {
        if (codes_.contains(code))
        {
            return std::unexpected(FerryError::config(
                std::format("Operation code {} assigned twice", static_cast<unsigned>(code))));
        }
        if (supports(kind))
        {
            return std::unexpected(FerryError::config(
                "Operation kind " + operation_kind_to_string(kind) + " assigned twice"));
        }
        codes_.emplace(code, kind);
        return {};
    }

    std::optional<OperationKind> OperationCodeTable::kind_of(OperationCode code) const
    {
        auto it = codes_.find(code);
        if (it == codes_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<OperationCode> OperationCodeTable::code_of(OperationKind kind) const
    {
        auto it = std::find_if(codes_.begin(), codes_.end(),
                               [&](const auto &entry) { return entry.second == kind; });
        if (it == codes_.end())
            return std::nullopt;
        return it->first;
    }

    nlohmann::json OperationCodeTable::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[code, kind] : codes_)
        {
            j[operation_kind_to_string(kind)] = code;
        }
        return j;
    }

    // ========== Effects ==========

    Result<OperationEffect> decode_effect(OperationKind kind,
                                          const Identity &target,
                                          const Amount &value,
                                          const Bytes &payload)
    {
        switch (kind)
        {
        case OperationKind::Pause:
            return effect::Pause{};
        case OperationKind::Unpause:
            return effect::Unpause{};
        case OperationKind::SetBridgeInCaller:
            if (is_zero(target))
                return std::unexpected(FerryError::invalid_input("Invalid bridge-in caller"));
            return effect::SetBridgeInCaller{target};
        case OperationKind::SetBridgeInLimits:
        {
            auto cooldown = decode_word(payload);
            if (!cooldown)
                return std::unexpected(cooldown.error());
            if (*cooldown > static_cast<std::uint64_t>(kMaxBridgeInCooldown.count()))
                return std::unexpected(FerryError::invalid_input("Cooldown exceeds maximum"));
            return effect::SetBridgeInLimits{
                value, std::chrono::seconds{static_cast<std::int64_t>(*cooldown)}};
        }
        case OperationKind::UpdateSigner:
            return effect::UpdateSigner{target, identity_from_amount(value)};
        case OperationKind::SetBridgeInEnabled:
        {
            auto enabled = decode_bool(payload);
            if (!enabled)
                return std::unexpected(enabled.error());
            return effect::SetBridgeInEnabled{*enabled};
        }
        case OperationKind::SetBridgeOutEnabled:
        {
            auto enabled = decode_bool(payload);
            if (!enabled)
                return std::unexpected(enabled.error());
            return effect::SetBridgeOutEnabled{*enabled};
        }
        case OperationKind::RelinquishTokens:
            return effect::RelinquishTokens{};
        case OperationKind::Mint:
            return effect::Mint{};
        case OperationKind::Burn:
            return effect::Burn{value};
        case OperationKind::PostLaunch:
            return effect::PostLaunch{};
        case OperationKind::DistributeTokens:
            if (is_zero(target))
                return std::unexpected(FerryError::invalid_input("Invalid recipient address"));
            return effect::DistributeTokens{target, value};
        }
        return std::unexpected(FerryError::invalid_input("Invalid operation type"));
    }

    Bytes encode_word(const Amount &value)
    {
        Bytes word(32, 0);
        Amount rest = value;
        for (std::size_t i = 0; i < 32; ++i)
        {
            word[31 - i] = static_cast<std::uint8_t>(rest & 0xff);
            rest >>= 8;
        }
        return word;
    }

    Bytes encode_bool(bool value)
    {
        return encode_word(value ? 1 : 0);
    }

    // ========== Operation ==========

    bool Operation::has_signed(const Identity &signer) const
    {
        auto it = signatures.find(signer);
        return it != signatures.end() && it->second;
    }

    nlohmann::json Operation::to_json() const
    {
        nlohmann::json signed_by = nlohmann::json::array();
        for (const auto &[signer, present] : signatures)
        {
            if (present)
                signed_by.push_back(to_hex(signer));
        }

        return nlohmann::json{{"operation_id", to_hex(id)},
                              {"sequence", sequence},
                              {"type", type},
                              {"kind", operation_kind_to_string(kind)},
                              {"target", to_hex(target)},
                              {"value", amount_to_string(value)},
                              {"payload", bytes_to_hex(payload)},
                              {"signature_count", signature_count},
                              {"signed_by", signed_by},
                              {"executed", executed},
                              {"created", format_timestamp(created)},
                              {"deadline", format_timestamp(deadline)}};
    }

    OperationId compute_operation_id(ChainId chain_id,
                                     std::uint64_t sequence,
                                     OperationCode type,
                                     const Identity &target,
                                     const Amount &value,
                                     const Bytes &payload)
    {
        nlohmann::json fingerprint{{"chain_id", chain_id},
                                   {"sequence", sequence},
                                   {"type", type},
                                   {"target", to_hex(target)},
                                   {"value", amount_to_string(value)},
                                   {"payload", bytes_to_hex(payload)}};
        return crypto::SHA256::hash(json::RFC8785Canonicalizer::canonicalize(fingerprint));
    }

    Digest compute_operation_hash(const Operation &op, ChainId chain_id)
    {
        nlohmann::json message{{"operation_id", to_hex(op.id)},
                               {"type", op.type},
                               {"target", to_hex(op.target)},
                               {"value", amount_to_string(op.value)},
                               {"payload", bytes_to_hex(op.payload)},
                               {"chain_id", chain_id}};
        return crypto::SHA256::hash(json::RFC8785Canonicalizer::canonicalize(message));
    }

} // namespace ferry
