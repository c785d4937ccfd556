#include "ferry/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>
#include <format>

using json = nlohmann::json;

namespace ferry::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        constexpr std::string_view kMessagePrefix = "\x19"
                                                    "Ferry Signed Message:\n32";
    }

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(FerryError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const std::array<uint8_t, 32> &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(FerryError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_keys(
        const Ed25519PublicKey &public_key,
        const Ed25519SecretKey &secret_key)
    {
        Ed25519KeyPair keypair;
        keypair.public_key = public_key;
        keypair.secret_key = secret_key;

        Ed25519PublicKey derived_pubkey;
        if (crypto_sign_ed25519_sk_to_pk(derived_pubkey.data(), secret_key.data()) != 0)
        {
            return std::unexpected(FerryError::crypto("Invalid secret key"));
        }

        if (std::memcmp(public_key.data(), derived_pubkey.data(), 32) != 0)
        {
            return std::unexpected(FerryError::crypto("Public key does not match secret key"));
        }

        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    std::string Ed25519KeyPair::to_json() const
    {
        json j = {
            {"identity", ferry::to_hex(public_key)},
            {"public_key", Base64::encode(Bytes(public_key.begin(), public_key.end()))},
            {"secret_key", Base64::encode(Bytes(secret_key.begin(), secret_key.end()))}};
        return j.dump(2);
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_json(const std::string &json_str)
    {
        try
        {
            auto j = json::parse(json_str);

            auto pub_result = Base64::decode(j.at("public_key").get<std::string>());
            if (!pub_result)
                return std::unexpected(pub_result.error());

            auto sec_result = Base64::decode(j.at("secret_key").get<std::string>());
            if (!sec_result)
                return std::unexpected(sec_result.error());

            if (pub_result->size() != 32)
            {
                return std::unexpected(FerryError::crypto("Invalid public key length"));
            }
            if (sec_result->size() != 64)
            {
                return std::unexpected(FerryError::crypto("Invalid secret key length"));
            }

            Ed25519PublicKey pubkey;
            Ed25519SecretKey seckey;
            std::copy(pub_result->begin(), pub_result->end(), pubkey.begin());
            std::copy(sec_result->begin(), sec_result->end(), seckey.begin());

            return Ed25519KeyPair::from_keys(pubkey, seckey);
        }
        catch (const json::exception &e)
        {
            return std::unexpected(FerryError::crypto(
                std::format("Failed to parse keypair JSON: {}", e.what())));
        }
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        return ferry::to_hex(hash);
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(FerryError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // MessageSigner Implementation
    // ============================================================================

    Bytes MessageSigner::prefixed_message(const Digest &digest)
    {
        Bytes message(kMessagePrefix.begin(), kMessagePrefix.end());
        message.insert(message.end(), digest.begin(), digest.end());
        return message;
    }

    Bytes MessageSigner::sign_digest(const Ed25519KeyPair &keypair, const Digest &digest)
    {
        auto signature = keypair.sign(prefixed_message(digest));

        Bytes proof;
        proof.reserve(kSignatureEnvelopeSize);
        proof.insert(proof.end(), keypair.public_key.begin(), keypair.public_key.end());
        proof.insert(proof.end(), signature.begin(), signature.end());
        return proof;
    }

    Result<Identity> MessageSigner::recover(const Digest &digest, const Bytes &proof)
    {
        if (proof.size() != kSignatureEnvelopeSize)
        {
            return std::unexpected(FerryError::crypto(
                std::format("Invalid signature length (expected {} bytes)", kSignatureEnvelopeSize)));
        }

        Ed25519PublicKey signer{};
        Ed25519Signature signature{};
        std::copy_n(proof.begin(), signer.size(), signer.begin());
        std::copy_n(proof.begin() + signer.size(), signature.size(), signature.begin());

        if (!Ed25519KeyPair::verify(prefixed_message(digest), signature, signer))
        {
            return std::unexpected(FerryError::crypto("Invalid signature"));
        }
        return signer;
    }

} // namespace ferry::crypto
