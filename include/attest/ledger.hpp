#pragma once

#include "chain_builder.hpp"
#include "chain_verifier.hpp"
#include "config.hpp"
#include "document_catalog.hpp"
#include "key_custodian.hpp"
#include "ledger_store.hpp"
#include "signature_record.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest
{

    /**
     * Entry point for host applications: one signing key, one store, one
     * global chain.
     */
    class Ledger
    {
    public:
        Ledger(std::shared_ptr<const KeyCustodian> custodian,
               std::shared_ptr<LedgerStore> store,
               std::shared_ptr<const DocumentCatalog> catalog = nullptr);

        /**
         * Load the signing key and open the configured store.
         */
        static Result<Ledger> open(const LedgerConfig &cfg,
                                   std::shared_ptr<const DocumentCatalog> catalog = nullptr);

        Result<SignatureRecord> append(const AppendRequest &request) const;

        const crypto::Ed25519PublicKey &public_key() const { return custodian_->public_key(); }

        std::string public_key_b64() const { return custodian_->public_key_b64(); }

        bool uses_ephemeral_key() const { return custodian_->is_ephemeral(); }

        Result<VerificationReport> verify_chain(std::uint64_t from = 1, std::uint64_t to = 0) const;

        Result<SignatureStatus> status(std::string_view subject_id, std::string_view signer_id) const;

        Result<std::optional<SignatureRecord>> find(std::string_view subject_id,
                                                    std::string_view signer_id) const;

        Result<std::vector<SignatureRecord>> signatures_for_subject(std::string_view subject_id) const;

        Result<std::vector<SignatureRecord>> signatures_for_signer(std::string_view signer_id) const;

        /**
         * True when the subject was acknowledged by a signer whose id equals
         * identifier, or whose email equals it case-insensitively.
         */
        Result<bool> has_acknowledged(std::string_view subject_id, std::string_view identifier) const;

        /** Records with from <= id <= to; to == 0 means up to the tail */
        Result<std::vector<SignatureRecord>> records(std::uint64_t from = 1, std::uint64_t to = 0) const;

        Result<std::uint64_t> last_id() const { return store_->last_id(); }

    private:
        std::shared_ptr<const KeyCustodian> custodian_;
        std::shared_ptr<LedgerStore> store_;
        ChainBuilder builder_;
    };

} // namespace attest
