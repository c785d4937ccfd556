#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace ferry
{

    /**
     * Error categories for ledger and authorization failures.
     * Every rejection carries one of these plus a short reason string.
     */
    enum class ErrorCode
    {
        Unauthorized,
        OperationState,
        LedgerPolicy,
        Lifecycle,
        ConfigError,
        CryptoError,
        InvalidInput,
        NotFound,
        NetworkError,
        InternalError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::Unauthorized:
            return "Unauthorized";
        case ErrorCode::OperationState:
            return "OperationState";
        case ErrorCode::LedgerPolicy:
            return "LedgerPolicy";
        case ErrorCode::Lifecycle:
            return "Lifecycle";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Ferry error with code and reason
     */
    class FerryError : public std::runtime_error
    {
    public:
        ErrorCode code;

        FerryError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static FerryError unauthorized(const std::string &msg)
        {
            return FerryError(ErrorCode::Unauthorized, msg);
        }

        static FerryError operation_state(const std::string &msg)
        {
            return FerryError(ErrorCode::OperationState, msg);
        }

        static FerryError policy(const std::string &msg)
        {
            return FerryError(ErrorCode::LedgerPolicy, msg);
        }

        static FerryError lifecycle(const std::string &msg)
        {
            return FerryError(ErrorCode::Lifecycle, msg);
        }

        static FerryError config(const std::string &msg)
        {
            return FerryError(ErrorCode::ConfigError, msg);
        }

        static FerryError crypto(const std::string &msg)
        {
            return FerryError(ErrorCode::CryptoError, msg);
        }

        static FerryError invalid_input(const std::string &msg)
        {
            return FerryError(ErrorCode::InvalidInput, msg);
        }

        static FerryError not_found(const std::string &msg)
        {
            return FerryError(ErrorCode::NotFound, msg);
        }

        static FerryError internal(const std::string &msg)
        {
            return FerryError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, FerryError>;

    using Bytes = std::vector<std::uint8_t>;

    /** 32-byte Ed25519 public key identifying a signer, caller or account */
    using Identity = std::array<std::uint8_t, 32>;

    /** SHA-256 digests used as operation ids, operation hashes and transfer ids */
    using Digest = std::array<std::uint8_t, 32>;
    using OperationId = Digest;
    using TransferId = Digest;

    using Amount = boost::multiprecision::uint256_t;
    using ChainId = std::uint64_t;
    using Timestamp = std::chrono::sys_seconds;

    inline constexpr Identity kZeroIdentity{};

    /** Hash functor for fixed-size byte arrays (identities, digests) */
    struct ByteArrayHash
    {
        std::size_t operator()(const std::array<std::uint8_t, 32> &value) const noexcept
        {
            // Values are already uniformly distributed (keys and hashes)
            std::size_t h = 0;
            for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
                h = (h << 8) | value[i];
            return h;
        }
    };

    inline bool is_zero(const Identity &identity)
    {
        return identity == kZeroIdentity;
    }

    /** Lowercase hex with 0x prefix */
    std::string to_hex(const std::array<std::uint8_t, 32> &value);
    std::string bytes_to_hex(const Bytes &data);

    /** Parse a 32-byte value from hex (0x prefix optional) */
    Result<std::array<std::uint8_t, 32>> from_hex32(std::string_view hex);
    Result<Bytes> bytes_from_hex(std::string_view hex);

    inline Result<Identity> identity_from_hex(std::string_view hex)
    {
        return from_hex32(hex);
    }

    /** Reinterpret a 256-bit value as an identity (big-endian) and back */
    Identity identity_from_amount(const Amount &value);
    Amount amount_from_identity(const Identity &identity);

    /** Decimal string form of an amount */
    std::string amount_to_string(const Amount &value);
    Result<Amount> amount_from_string(std::string_view text);

    /**
     * Scale a decimal quantity ("1000", "0.5") by 10^decimals.
     * Rejects more fractional digits than decimals.
     */
    Result<Amount> parse_units(std::string_view quantity, unsigned decimals = 18);

    /** whole * 10^decimals */
    Amount whole_tokens(std::uint64_t whole, unsigned decimals = 18);

    /** ISO 8601 UTC rendering of a timestamp */
    std::string format_timestamp(Timestamp ts);

} // namespace ferry
