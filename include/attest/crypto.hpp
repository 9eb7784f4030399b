#pragma once

#include "types.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace attest::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using Ed25519Seed = std::array<uint8_t, 32>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>; // seed || public key
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;

    inline constexpr std::size_t kNonceBytes = 16;

    /**
     * Ed25519 key pair for signing and verification
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
         * Derive key pair from seed bytes (32 bytes)
         */
        static Result<Ed25519KeyPair> from_seed(const Ed25519Seed &seed);

        /**
         * Load from a 64-byte secret key, checking that the embedded public
         * key matches the one derived from the seed half
         */
        static Result<Ed25519KeyPair> from_secret_key(const Ed25519SecretKey &secret_key);

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
         * Encode bytes to base64 string (standard alphabet, padded)
         */
        static std::string encode(const Bytes &data);

        /**
         * Decode standard base64 string to bytes
         */
        static Result<Bytes> decode(std::string_view encoded);

        /**
         * Encode to URL-safe base64 (no padding)
         */
        static std::string encode_url_safe(const Bytes &data);

        /**
         * Decode URL-safe base64 (no padding)
         */
        static Result<Bytes> decode_url_safe(std::string_view encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static void fill_bytes(Bytes &buffer);

        static Bytes generate_bytes(std::size_t n);
    };

    /**
     * Anti-replay nonce: 16 CSPRNG bytes, URL-safe base64 without padding.
     */
    std::string generate_nonce();

    /**
     * Encode a fixed-size array as standard base64
     */
    template <std::size_t N>
    std::string to_base64(const std::array<uint8_t, N> &data)
    {
        return Base64::encode(Bytes(data.begin(), data.end()));
    }

    /**
     * Decode standard base64 into a fixed-size array, failing on length mismatch
     */
    template <std::size_t N>
    Result<std::array<uint8_t, N>> from_base64(std::string_view encoded)
    {
        auto decoded = Base64::decode(encoded);
        if (!decoded)
            return std::unexpected(decoded.error());
        if (decoded->size() != N)
        {
            return std::unexpected(LedgerError::crypto(
                "Expected " + std::to_string(N) + " bytes, got " + std::to_string(decoded->size())));
        }
        std::array<uint8_t, N> out{};
        std::copy(decoded->begin(), decoded->end(), out.begin());
        return out;
    }

} // namespace attest::crypto
