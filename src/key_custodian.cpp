#include "attest/key_custodian.hpp"
#include <spdlog/spdlog.h>
#include <sodium.h>

namespace attest
{

    Result<KeyCustodian> KeyCustodian::load(const SigningConfig &cfg)
    {
        if (!cfg.private_key_b64 || cfg.private_key_b64->empty())
        {
            auto generated = crypto::Ed25519KeyPair::generate();
            if (!generated)
                return std::unexpected(generated.error());

            spdlog::warn("Ed25519 private key not configured (ATTEST_ED25519_PRIVATE_KEY); "
                         "using an ephemeral key. Signatures made now will NOT verify against "
                         "the key of any future restart.");
            spdlog::warn("Ephemeral public key: {}", crypto::to_base64(generated->public_key));
            return KeyCustodian(*generated, true);
        }

        auto decoded = crypto::Base64::decode(*cfg.private_key_b64);
        if (!decoded)
        {
            return std::unexpected(LedgerError::invalid_key_material(
                "Ed25519 private key is not valid base64"));
        }

        if (decoded->size() != crypto::Ed25519SecretKey{}.size())
        {
            auto size = decoded->size();
            sodium_memzero(decoded->data(), decoded->size());
            return std::unexpected(LedgerError::invalid_key_material(
                "Ed25519 private key must decode to 64 bytes, got " + std::to_string(size)));
        }

        crypto::Ed25519SecretKey secret;
        std::copy(decoded->begin(), decoded->end(), secret.begin());
        sodium_memzero(decoded->data(), decoded->size());

        auto keypair = crypto::Ed25519KeyPair::from_secret_key(secret);
        sodium_memzero(secret.data(), secret.size());
        if (!keypair)
        {
            return std::unexpected(LedgerError::invalid_key_material(keypair.error().what()));
        }

        spdlog::info("Loaded persistent Ed25519 signing key, public key {}",
                     crypto::to_base64(keypair->public_key));
        return KeyCustodian(*keypair, false);
    }

    KeyCustodian KeyCustodian::from_keypair(const crypto::Ed25519KeyPair &keypair, bool ephemeral)
    {
        return KeyCustodian(keypair, ephemeral);
    }

    Result<std::string> KeyCustodian::generate_private_key_b64()
    {
        auto keypair = crypto::Ed25519KeyPair::generate();
        if (!keypair)
            return std::unexpected(keypair.error());
        auto encoded = crypto::to_base64(keypair->secret_key);
        sodium_memzero(keypair->secret_key.data(), keypair->secret_key.size());
        return encoded;
    }

    Result<crypto::Ed25519Signature> KeyCustodian::sign(const crypto::Bytes &hash) const
    {
        if (hash.empty())
        {
            return std::unexpected(LedgerError::invalid_input("Refusing to sign an empty payload hash"));
        }
        return keypair_.sign(hash);
    }

    Result<crypto::Ed25519Signature> KeyCustodian::sign(const crypto::SHA256Hash &hash) const
    {
        return sign(crypto::Bytes(hash.begin(), hash.end()));
    }

    std::string KeyCustodian::public_key_b64() const
    {
        return crypto::to_base64(keypair_.public_key);
    }

} // namespace attest
