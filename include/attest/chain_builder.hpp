#pragma once

#include "audit.hpp"
#include "canonical_encoder.hpp"
#include "document_catalog.hpp"
#include "key_custodian.hpp"
#include "ledger_store.hpp"
#include "signature_record.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace attest
{

    struct AppendRequest
    {
        AttestationFact fact;
        std::string signer_name; // display only
    };

    /**
     * Turns a verified attestation into a signed, chained ledger record.
     *
     * Safe for concurrent use; the store serializes the linking step.
     */
    class ChainBuilder
    {
    public:
        ChainBuilder(std::shared_ptr<const KeyCustodian> custodian,
                     std::shared_ptr<LedgerStore> store,
                     std::shared_ptr<const DocumentCatalog> catalog = nullptr);

        /**
         * Validate, sign and append one attestation. An unset signed_at
         * (the epoch) is stamped with the current time.
         *
         * Errors: InvalidInput for missing identity fields, AlreadyAcknowledged
         * when the signer already acknowledged the subject, SubjectChanged when
         * the acknowledged checksum is no longer current, NonceReused,
         * StorageError, CryptoError.
         */
        Result<SignatureRecord> append(const AppendRequest &request) const;

    private:
        /**
         * Checksum to sign: the catalog's current one when the subject is
         * known, otherwise whatever the caller presented. A presented
         * checksum that differs from the catalog is SubjectChanged.
         */
        Result<std::optional<std::string>> resolve_subject_checksum(const AttestationFact &fact) const;

        std::shared_ptr<const KeyCustodian> custodian_;
        std::shared_ptr<LedgerStore> store_;
        std::shared_ptr<const DocumentCatalog> catalog_;
        AuditLogger audit_;
    };

} // namespace attest
