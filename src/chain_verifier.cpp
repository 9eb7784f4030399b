#include "attest/chain_verifier.hpp"
#include "attest/audit.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace attest
{

    namespace
    {
        std::string short_hex(const crypto::SHA256Hash &hash)
        {
            return crypto::SHA256::to_hex(hash).substr(0, 16);
        }

        void check_link(const SignatureRecord &record,
                        const SignatureRecord *predecessor,
                        std::vector<Discrepancy> &out)
        {
            if (record.id == 1)
            {
                if (record.prev_hash)
                {
                    out.push_back({record.id, DiscrepancyKind::UnexpectedLink,
                                   "first record carries prev_hash " + short_hex(*record.prev_hash)});
                }
                return;
            }

            if (!record.prev_hash)
            {
                out.push_back({record.id, DiscrepancyKind::MissingLink, "prev_hash is absent"});
                return;
            }

            // Without the immediate predecessor the gap is reported instead
            if (!predecessor || predecessor->id + 1 != record.id)
                return;

            auto recomputed = predecessor->compute_hash();
            if (*record.prev_hash != predecessor->payload_hash || *record.prev_hash != recomputed)
            {
                out.push_back({record.id, DiscrepancyKind::LinkMismatch,
                               fmt::format("prev_hash {} does not match record {} (stored {}, recomputed {})",
                                           short_hex(*record.prev_hash), predecessor->id,
                                           short_hex(predecessor->payload_hash), short_hex(recomputed))});
            }
        }
    } // namespace

    std::string_view discrepancy_kind_to_string(DiscrepancyKind kind)
    {
        switch (kind)
        {
        case DiscrepancyKind::HashMismatch:
            return "hash_mismatch";
        case DiscrepancyKind::LinkMismatch:
            return "link_mismatch";
        case DiscrepancyKind::MissingLink:
            return "missing_link";
        case DiscrepancyKind::UnexpectedLink:
            return "unexpected_link";
        case DiscrepancyKind::SequenceGap:
            return "sequence_gap";
        case DiscrepancyKind::SignatureInvalid:
            return "signature_invalid";
        }
        return "unknown";
    }

    nlohmann::json Discrepancy::to_json() const
    {
        return {{"record_id", record_id},
                {"kind", std::string(discrepancy_kind_to_string(kind))},
                {"detail", detail}};
    }

    nlohmann::json VerificationReport::to_json() const
    {
        auto items = nlohmann::json::array();
        for (const auto &d : discrepancies)
            items.push_back(d.to_json());

        return {{"from", from},
                {"to", to},
                {"records_checked", records_checked},
                {"valid", is_valid()},
                {"discrepancies", items}};
    }

    std::vector<Discrepancy> verify_record(const SignatureRecord &record,
                                           const crypto::Ed25519PublicKey &public_key)
    {
        std::vector<Discrepancy> out;

        auto recomputed = record.compute_hash();
        if (recomputed != record.payload_hash)
        {
            out.push_back({record.id, DiscrepancyKind::HashMismatch,
                           fmt::format("stored {}, recomputed {}",
                                       short_hex(record.payload_hash), short_hex(recomputed))});
        }

        if (!crypto::Ed25519KeyPair::verify(crypto::Bytes(recomputed.begin(), recomputed.end()),
                                            record.signature, public_key))
        {
            out.push_back({record.id, DiscrepancyKind::SignatureInvalid,
                           "signature does not verify over the recomputed hash"});
        }

        return out;
    }

    VerificationReport verify_records(const std::vector<SignatureRecord> &records,
                                      const std::optional<SignatureRecord> &anchor,
                                      const crypto::Ed25519PublicKey &public_key)
    {
        VerificationReport report;
        if (!records.empty())
        {
            report.from = records.front().id;
            report.to = records.back().id;
        }

        const SignatureRecord *predecessor = anchor ? &*anchor : nullptr;
        std::uint64_t expected_id = anchor ? anchor->id + 1 : report.from;

        for (const auto &record : records)
        {
            ++report.records_checked;

            if (record.id != expected_id)
            {
                report.discrepancies.push_back(
                    {record.id, DiscrepancyKind::SequenceGap,
                     fmt::format("expected id {}, found {}", expected_id, record.id)});
            }

            auto own = verify_record(record, public_key);
            report.discrepancies.insert(report.discrepancies.end(), own.begin(), own.end());

            check_link(record, predecessor, report.discrepancies);

            predecessor = &record;
            expected_id = record.id + 1;
        }

        return report;
    }

    Result<VerificationReport> verify_chain(const LedgerStore &store,
                                            const crypto::Ed25519PublicKey &public_key,
                                            std::uint64_t from,
                                            std::uint64_t to)
    {
        if (from == 0)
            from = 1;

        auto last = store.last_id();
        if (!last)
            return std::unexpected(last.error());

        std::uint64_t upper = (to == 0) ? *last : std::min(to, *last);
        if (upper < from)
        {
            VerificationReport empty;
            empty.from = from;
            empty.to = upper;
            return empty;
        }

        std::optional<SignatureRecord> anchor;
        if (from > 1)
        {
            auto prior = store.get(from - 1);
            if (!prior)
                return std::unexpected(prior.error());
            anchor = std::move(*prior);
        }

        auto records = store.range(from, upper);
        if (!records)
            return std::unexpected(records.error());

        auto report = verify_records(*records, anchor, public_key);
        report.from = from;
        report.to = upper;

        if (from > 1 && !anchor)
        {
            report.discrepancies.push_back({from - 1, DiscrepancyKind::SequenceGap,
                                            "anchor record is missing"});
        }
        if (records->empty())
        {
            report.discrepancies.push_back({from, DiscrepancyKind::SequenceGap,
                                            fmt::format("no records found in [{}, {}]", from, upper)});
        }
        else if (!anchor && records->front().id != from)
        {
            report.discrepancies.push_back({records->front().id, DiscrepancyKind::SequenceGap,
                                            fmt::format("expected id {}, found {}", from, records->front().id)});
        }
        if (!records->empty() && records->back().id < upper)
        {
            report.discrepancies.push_back({upper, DiscrepancyKind::SequenceGap,
                                            fmt::format("records {} to {} are missing", records->back().id + 1, upper)});
        }

        AuditLogger audit;
        for (const auto &d : report.discrepancies)
        {
            auto event = AuditEvent::now("verify", "corruption");
            event.record_id = d.record_id;
            event.details = d.to_json();
            audit.log(event, spdlog::level::err);
        }

        spdlog::info("Verified records {}..{}: {} checked, {} discrepancies",
                     report.from, report.to, report.records_checked, report.discrepancies.size());
        return report;
    }

} // namespace attest
