#pragma once

#include "crypto.hpp"
#include "ledger_store.hpp"
#include "signature_record.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest
{

    enum class DiscrepancyKind
    {
        HashMismatch,     // stored payload_hash differs from the recomputed hash
        LinkMismatch,     // prev_hash differs from the predecessor's hash
        MissingLink,      // record after the first has no prev_hash
        UnexpectedLink,   // first record carries a prev_hash
        SequenceGap,      // ids are not contiguous
        SignatureInvalid  // signature does not verify over the recomputed hash
    };

    std::string_view discrepancy_kind_to_string(DiscrepancyKind kind);

    struct Discrepancy
    {
        std::uint64_t record_id{0};
        DiscrepancyKind kind{DiscrepancyKind::HashMismatch};
        std::string detail;

        nlohmann::json to_json() const;
    };

    struct VerificationReport
    {
        std::uint64_t from{0};
        std::uint64_t to{0};
        std::uint64_t records_checked{0};
        std::vector<Discrepancy> discrepancies;

        bool is_valid() const { return discrepancies.empty(); }

        nlohmann::json to_json() const;
    };

    /**
     * Check one record on its own: hash recomputation and signature.
     * Link fields are not examined.
     */
    std::vector<Discrepancy> verify_record(const SignatureRecord &record,
                                           const crypto::Ed25519PublicKey &public_key);

    /**
     * Check an id-ordered run of records. The anchor, when given, is the
     * record immediately before the run and is used only for the first link.
     * Every discrepancy is reported; checking never stops early.
     */
    VerificationReport verify_records(const std::vector<SignatureRecord> &records,
                                      const std::optional<SignatureRecord> &anchor,
                                      const crypto::Ed25519PublicKey &public_key);

    /**
     * Verify ids [from, to] of a store. to == 0 means up to the current
     * tail. Read-only; takes no write lock. Discrepancies are written to the
     * audit log at error level.
     *
     * @return the report, or StorageError when records cannot be read
     */
    Result<VerificationReport> verify_chain(const LedgerStore &store,
                                            const crypto::Ed25519PublicKey &public_key,
                                            std::uint64_t from = 1,
                                            std::uint64_t to = 0);

} // namespace attest
