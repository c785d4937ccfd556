#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace ferry::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS) for everything that gets
     * hashed or signed: operation fingerprints, operation hashes, audit chain
     * links and RPC request envelopes.
     *
     * Keys are emitted in byte order with no insignificant whitespace. Only
     * quote, backslash and control characters are escaped. Amounts travel as
     * decimal strings, so integers are the only numbers ferry ever signs.
     */
    class RFC8785Canonicalizer
    {
    public:
        static std::string canonicalize(const nlohmann::json &value);

    private:
        static void write(const nlohmann::json &value, std::string &out);
        static void write_string(const std::string &str, std::string &out);
    };

} // namespace ferry::json
