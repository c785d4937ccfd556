#include "ferry/json_canonicalization.hpp"
#include <array>
#include <charconv>
#include <cstdint>
#include <string_view>

namespace ferry::json
{

    namespace
    {
        /** Two-character escapes; everything else below 0x20 becomes \u00xx */
        std::string_view short_escape(unsigned char ch)
        {
            switch (ch)
            {
            case '"':
                return "\\\"";
            case '\\':
                return "\\\\";
            case '\b':
                return "\\b";
            case '\f':
                return "\\f";
            case '\n':
                return "\\n";
            case '\r':
                return "\\r";
            case '\t':
                return "\\t";
            default:
                return {};
            }
        }

        template <typename Int>
        void write_integer(Int value, std::string &out)
        {
            std::array<char, 24> buf{};
            auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value);
            out.append(buf.data(), result.ptr);
        }
    } // namespace

    std::string RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string out;
        write(value, out);
        return out;
    }

    void RFC8785Canonicalizer::write(const nlohmann::json &value, std::string &out)
    {
        using value_t = nlohmann::json::value_t;

        switch (value.type())
        {
        case value_t::object:
        {
            // nlohmann::json stores objects in a std::map, so iteration is already byte order
            out += '{';
            bool first = true;
            for (const auto &[key, member] : value.items())
            {
                if (!first)
                    out += ',';
                first = false;
                write_string(key, out);
                out += ':';
                write(member, out);
            }
            out += '}';
            break;
        }
        case value_t::array:
            out += '[';
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (i != 0)
                    out += ',';
                write(value[i], out);
            }
            out += ']';
            break;
        case value_t::string:
            write_string(value.get_ref<const std::string &>(), out);
            break;
        case value_t::number_unsigned:
            write_integer(value.get<std::uint64_t>(), out);
            break;
        case value_t::number_integer:
            write_integer(value.get<std::int64_t>(), out);
            break;
        case value_t::number_float:
            // Shortest round-trip form; non-finite values render as null
            out += value.dump();
            break;
        case value_t::boolean:
            out += value.get<bool>() ? "true" : "false";
            break;
        default:
            out += "null";
            break;
        }
    }

    void RFC8785Canonicalizer::write_string(const std::string &str, std::string &out)
    {
        static constexpr std::string_view kHex = "0123456789abcdef";

        out.reserve(out.size() + str.size() + 2);
        out += '"';
        for (unsigned char ch : str)
        {
            if (auto esc = short_escape(ch); !esc.empty())
            {
                out += esc;
            }
            else if (ch < 0x20)
            {
                out += "\\u00";
                out += kHex[ch >> 4];
                out += kHex[ch & 0x0f];
            }
            else
            {
                out += static_cast<char>(ch);
            }
        }
        out += '"';
    }

} // namespace ferry::json
