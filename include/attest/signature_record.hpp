#pragma once

#include "canonical_encoder.hpp"
#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace attest
{

    /**
     * Persisted ledger entry. Records form a singly linked, append-only list
     * ordered by id: prev_hash of record n is payload_hash of record n-1.
     */
    struct SignatureRecord
    {
        std::uint64_t id{0};       // assigned by the store, starts at 1
        AttestationFact fact;      // signed facts
        std::string signer_name;   // display only, not part of the signed payload
        crypto::SHA256Hash payload_hash{};
        crypto::Ed25519Signature signature{};
        std::optional<crypto::SHA256Hash> prev_hash; // absent for the first record
        Timestamp created_at{};    // assigned by the store, write-once

        /**
         * Recompute the payload hash from the fact fields, ignoring the
         * stored payload_hash.
         */
        crypto::SHA256Hash compute_hash() const;

        /**
         * Verify the stored signature over the recomputed hash
         */
        bool verify_signature(const crypto::Ed25519PublicKey &public_key) const;

        /**
         * Convert to JSON. Hashes and signature are standard base64,
         * timestamps RFC 3339.
         */
        nlohmann::json to_json() const;

        /**
         * Parse from JSON
         */
        static Result<SignatureRecord> from_json(const nlohmann::json &j);
    };

    /**
     * Whether a signer has acknowledged a subject, and when.
     */
    struct SignatureStatus
    {
        std::string subject_id;
        std::string signer_id;
        bool is_signed{false};
        std::optional<Timestamp> signed_at;
    };

} // namespace attest
