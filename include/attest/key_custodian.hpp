#pragma once

#include "config.hpp"
#include "crypto.hpp"
#include "types.hpp"
#include <string>

namespace attest
{

    /**
     * Owns the deployment's Ed25519 signing key for the process lifetime.
     *
     * Constructed once at startup and passed by shared_ptr<const> to every
     * component that signs; it is immutable after load and safe to share
     * across threads without synchronization.
     */
    class KeyCustodian
    {
    public:
        /**
         * Load the configured private key (base64, 64 bytes: seed || public key).
         * Without one, generate an ephemeral key and log a warning: signatures
         * made with it will not verify against the key of a later restart.
         *
         * Fails with InvalidKeyMaterial when the secret cannot be decoded, has
         * the wrong length, or its public half does not match its seed.
         */
        static Result<KeyCustodian> load(const SigningConfig &cfg);

        /** Wrap an existing key pair, e.g. a fixed test key */
        static KeyCustodian from_keypair(const crypto::Ed25519KeyPair &keypair, bool ephemeral = false);

        /** Fresh random private key in the format load() accepts */
        static Result<std::string> generate_private_key_b64();

        /**
         * Sign a payload hash. Rejects empty input.
         */
        Result<crypto::Ed25519Signature> sign(const crypto::Bytes &hash) const;

        Result<crypto::Ed25519Signature> sign(const crypto::SHA256Hash &hash) const;

        const crypto::Ed25519PublicKey &public_key() const { return keypair_.public_key; }

        std::string public_key_b64() const;

        bool is_ephemeral() const { return ephemeral_; }

    private:
        KeyCustodian(const crypto::Ed25519KeyPair &keypair, bool ephemeral)
            : keypair_(keypair), ephemeral_(ephemeral) {}

        crypto::Ed25519KeyPair keypair_;
        bool ephemeral_;
    };

} // namespace attest
