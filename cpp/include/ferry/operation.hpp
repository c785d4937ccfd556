#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ferry
{
    using OperationCode = std::uint8_t;

    /** Longest bridge-in cooldown a quorum or a config file may set */
    inline constexpr std::chrono::seconds kMaxBridgeInCooldown{std::chrono::days{365}};

    /** Administrative actions a quorum can authorize */
    enum class OperationKind
    {
        Pause,
        Unpause,
        SetBridgeInCaller,
        SetBridgeInLimits,
        UpdateSigner,
        SetBridgeInEnabled,
        SetBridgeOutEnabled,
        RelinquishTokens,
        Mint,
        Burn,
        PostLaunch,
        DistributeTokens
    };

    std::string operation_kind_to_string(OperationKind kind);
    std::optional<OperationKind> operation_kind_from_string(std::string_view name);

    /**
     * Maps the numeric operation codes of one deployed ledger to kinds.
     * Codes differ between deployments and are never assumed generically.
     */
    class OperationCodeTable
    {
    public:
        OperationCodeTable() = default;

        /** Sequential codes starting at zero, in the order given */
        explicit OperationCodeTable(std::initializer_list<OperationKind> kinds);

        /** Burn-mint origin token */
        static OperationCodeTable primary();
        /** Burn-mint ledger on the sibling chain */
        static OperationCodeTable secondary();
        /** Lock-release custody ledger */
        static OperationCodeTable vault();

        /** Bind code to kind; each code and each kind may appear once */
        Result<void> assign(OperationCode code, OperationKind kind);

        std::optional<OperationKind> kind_of(OperationCode code) const;
        std::optional<OperationCode> code_of(OperationKind kind) const;

        bool supports(OperationKind kind) const { return code_of(kind).has_value(); }
        bool empty() const { return codes_.empty(); }

        const std::map<OperationCode, OperationKind> &entries() const { return codes_; }

        nlohmann::json to_json() const;

    private:
        std::map<OperationCode, OperationKind> codes_;
    };

    /** Decoded effect of an operation, one struct per kind */
    namespace effect
    {
        struct Pause
        {
        };

        struct Unpause
        {
        };

        struct SetBridgeInCaller
        {
            Identity caller;
        };

        struct SetBridgeInLimits
        {
            Amount max_amount;
            std::chrono::seconds cooldown;
        };

        struct UpdateSigner
        {
            Identity old_signer;
            Identity new_signer;
        };

        struct SetBridgeInEnabled
        {
            bool enabled;
        };

        struct SetBridgeOutEnabled
        {
            bool enabled;
        };

        struct RelinquishTokens
        {
        };

        struct Mint
        {
        };

        struct Burn
        {
            Amount amount;
        };

        struct PostLaunch
        {
        };

        struct DistributeTokens
        {
            Identity recipient;
            Amount amount;
        };
    } // namespace effect

    using OperationEffect = std::variant<effect::Pause,
                                         effect::Unpause,
                                         effect::SetBridgeInCaller,
                                         effect::SetBridgeInLimits,
                                         effect::UpdateSigner,
                                         effect::SetBridgeInEnabled,
                                         effect::SetBridgeOutEnabled,
                                         effect::RelinquishTokens,
                                         effect::Mint,
                                         effect::Burn,
                                         effect::PostLaunch,
                                         effect::DistributeTokens>;

    /**
     * Decode the (target, value, payload) triple of a request into its effect.
     * Payload words are 32-byte big-endian; malformed payloads fail with
     * "Invalid operation payload".
     */
    Result<OperationEffect> decode_effect(OperationKind kind,
                                          const Identity &target,
                                          const Amount &value,
                                          const Bytes &payload);

    /** Encode helpers for building request payloads */
    Bytes encode_word(const Amount &value);
    Bytes encode_bool(bool value);

    /**
     * Stored operation record. Immutable after creation apart from signature
     * accumulation and the executed flag.
     */
    struct Operation
    {
        OperationId id{};
        std::uint64_t sequence{0};
        OperationCode type{0};
        OperationKind kind{OperationKind::Pause};
        Identity target{};
        Amount value{0};
        Bytes payload;
        std::map<Identity, bool> signatures;
        std::size_t signature_count{0};
        bool executed{false};
        Timestamp created{};
        Timestamp deadline{};

        bool has_signed(const Identity &signer) const;

        nlohmann::json to_json() const;
    };

    /** Fingerprint of a request, domain-separated by chain id */
    OperationId compute_operation_id(ChainId chain_id,
                                     std::uint64_t sequence,
                                     OperationCode type,
                                     const Identity &target,
                                     const Amount &value,
                                     const Bytes &payload);

    /** Digest signers sign for a stored operation */
    Digest compute_operation_hash(const Operation &op, ChainId chain_id);

} // namespace ferry
