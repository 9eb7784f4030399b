#include "attest/ledger.hpp"
#include "attest/canonical_encoder.hpp"
#include <spdlog/spdlog.h>

namespace attest
{

    Ledger::Ledger(std::shared_ptr<const KeyCustodian> custodian,
                   std::shared_ptr<LedgerStore> store,
                   std::shared_ptr<const DocumentCatalog> catalog)
        : custodian_(custodian), store_(store), builder_(std::move(custodian), std::move(store), std::move(catalog))
    {
    }

    Result<Ledger> Ledger::open(const LedgerConfig &cfg, std::shared_ptr<const DocumentCatalog> catalog)
    {
        auto custodian = KeyCustodian::load(cfg.signing);
        if (!custodian)
            return std::unexpected(custodian.error());

        auto store = open_ledger_store(cfg.storage);
        if (!store)
            return std::unexpected(store.error());

        spdlog::debug("Ledger opened with {} backend", cfg.storage.backend);
        return Ledger(std::make_shared<const KeyCustodian>(std::move(*custodian)),
                      std::move(*store),
                      std::move(catalog));
    }

    Result<SignatureRecord> Ledger::append(const AppendRequest &request) const
    {
        return builder_.append(request);
    }

    Result<VerificationReport> Ledger::verify_chain(std::uint64_t from, std::uint64_t to) const
    {
        return attest::verify_chain(*store_, custodian_->public_key(), from, to);
    }

    Result<SignatureStatus> Ledger::status(std::string_view subject_id, std::string_view signer_id) const
    {
        auto record = store_->find(subject_id, signer_id);
        if (!record)
            return std::unexpected(record.error());

        SignatureStatus status{std::string(subject_id), std::string(signer_id), false, std::nullopt};
        if (record->has_value())
        {
            status.is_signed = true;
            status.signed_at = (*record)->fact.signed_at;
        }
        return status;
    }

    Result<std::optional<SignatureRecord>> Ledger::find(std::string_view subject_id,
                                                        std::string_view signer_id) const
    {
        return store_->find(subject_id, signer_id);
    }

    Result<std::vector<SignatureRecord>> Ledger::signatures_for_subject(std::string_view subject_id) const
    {
        return store_->list_by_subject(subject_id);
    }

    Result<std::vector<SignatureRecord>> Ledger::signatures_for_signer(std::string_view signer_id) const
    {
        return store_->list_by_signer(signer_id);
    }

    Result<bool> Ledger::has_acknowledged(std::string_view subject_id, std::string_view identifier) const
    {
        if (identifier.empty())
            return false;

        auto direct = store_->find(subject_id, identifier);
        if (!direct)
            return std::unexpected(direct.error());
        if (direct->has_value())
            return true;

        auto records = store_->list_by_subject(subject_id);
        if (!records)
            return std::unexpected(records.error());

        auto email = normalize_email(identifier);
        for (const auto &record : *records)
        {
            if (normalize_email(record.fact.signer_email) == email)
                return true;
        }
        return false;
    }

    Result<std::vector<SignatureRecord>> Ledger::records(std::uint64_t from, std::uint64_t to) const
    {
        if (to == 0)
        {
            auto last = store_->last_id();
            if (!last)
                return std::unexpected(last.error());
            to = *last;
        }
        return store_->range(from, to);
    }

} // namespace attest
