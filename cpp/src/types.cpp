#include "ferry/types.hpp"
#include <algorithm>
#include <ctime>
#include <limits>

namespace ferry
{

    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string_view strip_prefix(std::string_view hex)
        {
            if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
                hex.remove_prefix(2);
            return hex;
        }
    } // namespace

    std::string to_hex(const std::array<std::uint8_t, 32> &value)
    {
        std::string hex = "0x";
        hex.reserve(66);
        for (std::uint8_t byte : value)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    std::string bytes_to_hex(const Bytes &data)
    {
        std::string hex = "0x";
        hex.reserve(2 + data.size() * 2);
        for (std::uint8_t byte : data)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    Result<Bytes> bytes_from_hex(std::string_view hex)
    {
        hex = strip_prefix(hex);
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(FerryError::invalid_input("Odd-length hex string"));
        }

        Bytes out;
        out.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2)
        {
            int hi = hex_value(hex[i]);
            int lo = hex_value(hex[i + 1]);
            if (hi < 0 || lo < 0)
            {
                return std::unexpected(FerryError::invalid_input("Invalid hex character"));
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    Result<std::array<std::uint8_t, 32>> from_hex32(std::string_view hex)
    {
        auto bytes = bytes_from_hex(hex);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (bytes->size() != 32)
        {
            return std::unexpected(FerryError::invalid_input(
                std::format("Expected 32 bytes of hex, got {}", bytes->size())));
        }

        std::array<std::uint8_t, 32> out{};
        std::copy(bytes->begin(), bytes->end(), out.begin());
        return out;
    }

    Identity identity_from_amount(const Amount &value)
    {
        Identity out{};
        Amount v = value;
        for (std::size_t i = 0; i < out.size(); ++i)
        {
            out[out.size() - 1 - i] = static_cast<std::uint8_t>(v & 0xff);
            v >>= 8;
        }
        return out;
    }

    Amount amount_from_identity(const Identity &identity)
    {
        Amount v = 0;
        for (std::uint8_t byte : identity)
        {
            v <<= 8;
            v |= byte;
        }
        return v;
    }

    std::string amount_to_string(const Amount &value)
    {
        return value.str();
    }

    Result<Amount> amount_from_string(std::string_view text)
    {
        if (text.empty() || text.size() > 78)
        {
            return std::unexpected(FerryError::invalid_input("Invalid amount"));
        }
        if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
        {
            return std::unexpected(FerryError::invalid_input(std::format("Invalid amount: {}", text)));
        }

        boost::multiprecision::uint512_t wide = 0;
        for (char c : text)
        {
            wide = wide * 10 + static_cast<unsigned>(c - '0');
        }
        if (wide > boost::multiprecision::uint512_t(std::numeric_limits<Amount>::max()))
        {
            return std::unexpected(FerryError::invalid_input("Amount overflows 256 bits"));
        }
        return static_cast<Amount>(wide);
    }

    Result<Amount> parse_units(std::string_view quantity, unsigned decimals)
    {
        auto dot = quantity.find('.');
        std::string_view whole = quantity.substr(0, dot);
        std::string_view frac = dot == std::string_view::npos ? std::string_view{} : quantity.substr(dot + 1);

        if (frac.size() > decimals)
        {
            return std::unexpected(FerryError::invalid_input(
                std::format("Too many decimal places in {}", quantity)));
        }

        std::string digits(whole.empty() ? "0" : whole);
        digits.append(frac);
        digits.append(decimals - frac.size(), '0');

        // Strip leading zeros so the 78-digit bound applies to the value
        auto first = digits.find_first_not_of('0');
        digits = first == std::string::npos ? "0" : digits.substr(first);
        return amount_from_string(digits);
    }

    Amount whole_tokens(std::uint64_t whole, unsigned decimals)
    {
        Amount value = whole;
        for (unsigned i = 0; i < decimals; ++i)
            value *= 10;
        return value;
    }

    std::string format_timestamp(Timestamp ts)
    {
        auto t = std::chrono::system_clock::to_time_t(ts);
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec);
    }

} // namespace ferry
