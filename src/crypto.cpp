#include "attest/crypto.hpp"
#include <sodium.h>
#include <fmt/format.h>
#include <cstring>

namespace attest::crypto
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

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(LedgerError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const Ed25519Seed &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(LedgerError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_secret_key(const Ed25519SecretKey &secret_key)
    {
        Ed25519Seed seed;
        std::copy_n(secret_key.begin(), seed.size(), seed.begin());

        auto keypair = from_seed(seed);
        sodium_memzero(seed.data(), seed.size());
        if (!keypair)
            return keypair;

        // Trailing half must be the public key of the seed half
        if (sodium_memcmp(keypair->secret_key.data() + 32, secret_key.data() + 32, 32) != 0)
        {
            return std::unexpected(LedgerError::invalid_key_material(
                "Ed25519 private key public half does not match its seed"));
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
        std::string hex;
        hex.reserve(64);
        for (uint8_t byte : hash)
        {
            hex += fmt::format("{:02x}", byte);
        }
        return hex;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    namespace
    {
        std::string encode_variant(const Bytes &data, int variant)
        {
            size_t b64_len = sodium_base64_encoded_len(data.size(), variant);
            std::string encoded(b64_len, '\0');

            sodium_bin2base64(
                encoded.data(),
                b64_len,
                data.data(),
                data.size(),
                variant);

            // Remove null terminator
            encoded.resize(std::strlen(encoded.c_str()));
            return encoded;
        }

        Result<Bytes> decode_variant(std::string_view encoded, int variant, const char *what)
        {
            Bytes decoded(encoded.size()); // Worst case size
            size_t decoded_len;
            const char *end = nullptr;

            if (sodium_base642bin(
                    decoded.data(),
                    decoded.size(),
                    encoded.data(),
                    encoded.size(),
                    nullptr, // ignore characters
                    &decoded_len,
                    &end,
                    variant) != 0 ||
                end != encoded.data() + encoded.size())
            {
                return std::unexpected(LedgerError::crypto(fmt::format("Invalid {} encoding", what)));
            }

            decoded.resize(decoded_len);
            return decoded;
        }
    } // namespace

    std::string Base64::encode(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_ORIGINAL);
    }

    Result<Bytes> Base64::decode(std::string_view encoded)
    {
        return decode_variant(encoded, sodium_base64_VARIANT_ORIGINAL, "base64");
    }

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    }

    Result<Bytes> Base64::decode_url_safe(std::string_view encoded)
    {
        return decode_variant(encoded, sodium_base64_VARIANT_URLSAFE_NO_PADDING, "base64url");
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string generate_nonce()
    {
        return Base64::encode_url_safe(SecureRandom::generate_bytes(kNonceBytes));
    }

} // namespace attest::crypto
