#pragma once

#include "types.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::crypto
{

    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /** Size of a submitted operation signature: public key followed by Ed25519 signature */
    inline constexpr std::size_t kSignatureEnvelopeSize = 32 + 64;

    /**
     * Ed25519 key pair for signing and verification.
     * The public key doubles as the signer's Identity.
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Load key pair from seed bytes (32 bytes)
         */
        static Result<Ed25519KeyPair> from_seed(const std::array<uint8_t, 32> &seed);

        /**
         * Load from separate public/secret key bytes
         */
        static Result<Ed25519KeyPair> from_keys(
            const Ed25519PublicKey &public_key,
            const Ed25519SecretKey &secret_key);

        Identity identity() const { return public_key; }

        /**
         * Sign a message, returns 64-byte signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify signature against message
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /**
         * Export to base64-encoded JSON
         */
        std::string to_json() const;

        /**
         * Import from base64-encoded JSON
         */
        static Result<Ed25519KeyPair> from_json(const std::string &json);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(std::string_view data);

        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * Base64 encoding/decoding
     */
    class Base64
    {
    public:
        /**
         * Encode bytes to base64 string (standard alphabet)
         */
        static std::string encode(const Bytes &data);

        /**
         * Decode base64 string to bytes
         */
        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Signed-message convention for operation approvals.
     *
     * A signer approves a digest by signing "\x19Ferry Signed Message:\n32" || digest.
     * The submitted proof is public_key || signature, so the approving identity can be
     * recovered from the proof itself and compared to the submitting caller.
     */
    class MessageSigner
    {
    public:
        /** Bytes actually covered by the Ed25519 signature */
        static Bytes prefixed_message(const Digest &digest);

        /** Produce a 96-byte approval proof over digest */
        static Bytes sign_digest(const Ed25519KeyPair &keypair, const Digest &digest);

        /**
         * Verify proof over digest and return the identity that produced it.
         * Fails with CryptoError on malformed or non-verifying proofs.
         */
        static Result<Identity> recover(const Digest &digest, const Bytes &proof);
    };

} // namespace ferry::crypto
