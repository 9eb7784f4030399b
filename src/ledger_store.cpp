#include "attest/ledger_store.hpp"
#include "attest/timestamp.hpp"
#include <fmt/format.h>
#include <mutex>
#include <utility>

namespace attest
{

    std::string acknowledgment_key(std::string_view subject_id, std::string_view signer_id)
    {
        // Length prefix keeps ("a:b", "c") and ("a", "b:c") apart
        return fmt::format("{}:{}{}", subject_id.size(), subject_id, signer_id);
    }

    Result<void> check_insertable(const SignatureRecord &record)
    {
        if (record.fact.nonce.empty())
        {
            return std::unexpected(LedgerError::invalid_input("Record nonce must not be empty"));
        }

        const std::pair<std::string_view, const std::string *> fields[] = {
            {"subject_id", &record.fact.subject_id},
            {"signer_id", &record.fact.signer_id},
            {"signer_email", &record.fact.signer_email},
            {"signer_name", &record.signer_name},
            {"nonce", &record.fact.nonce}};
        for (const auto &[name, value] : fields)
        {
            if (!is_valid_utf8(*value))
            {
                return std::unexpected(LedgerError::invalid_input(fmt::format("{} is not valid UTF-8", name)));
            }
        }
        if (record.fact.subject_checksum && !is_valid_utf8(*record.fact.subject_checksum))
        {
            return std::unexpected(LedgerError::invalid_input("subject_checksum is not valid UTF-8"));
        }
        return {};
    }

    // ============================================================================
    // InMemoryLedgerStore
    // ============================================================================

    Result<SignatureRecord> InMemoryLedgerStore::insert_linked(const SignatureRecord &pending)
    {
        if (auto insertable = check_insertable(pending); !insertable)
            return std::unexpected(insertable.error());

        auto key = acknowledgment_key(pending.fact.subject_id, pending.fact.signer_id);

        std::unique_lock lock(mutex_);

        if (acknowledgments_.contains(key))
        {
            return std::unexpected(LedgerError::already_acknowledged(
                fmt::format("'{}' already acknowledged '{}'", pending.fact.signer_id, pending.fact.subject_id)));
        }
        if (nonces_.contains(pending.fact.nonce))
        {
            return std::unexpected(LedgerError::nonce_reused("Nonce already present in ledger"));
        }

        SignatureRecord record = pending;
        record.id = records_.size() + 1;
        record.prev_hash = records_.empty()
                               ? std::nullopt
                               : std::optional<crypto::SHA256Hash>(records_.back().payload_hash);
        record.created_at = now_utc();

        records_.push_back(record);
        acknowledgments_.emplace(std::move(key), record.id);
        nonces_.insert(record.fact.nonce);

        return record;
    }

    Result<std::optional<SignatureRecord>> InMemoryLedgerStore::get(std::uint64_t id) const
    {
        std::shared_lock lock(mutex_);
        if (id == 0 || id > records_.size())
            return std::optional<SignatureRecord>{};
        return std::optional<SignatureRecord>(records_[id - 1]);
    }

    Result<std::optional<SignatureRecord>> InMemoryLedgerStore::find(std::string_view subject_id,
                                                                     std::string_view signer_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = acknowledgments_.find(acknowledgment_key(subject_id, signer_id));
        if (it == acknowledgments_.end())
            return std::optional<SignatureRecord>{};
        return std::optional<SignatureRecord>(records_[it->second - 1]);
    }

    Result<std::optional<SignatureRecord>> InMemoryLedgerStore::tail() const
    {
        std::shared_lock lock(mutex_);
        if (records_.empty())
            return std::optional<SignatureRecord>{};
        return std::optional<SignatureRecord>(records_.back());
    }

    Result<std::vector<SignatureRecord>> InMemoryLedgerStore::range(std::uint64_t from, std::uint64_t to) const
    {
        std::vector<SignatureRecord> out;
        std::shared_lock lock(mutex_);
        if (from == 0)
            from = 1;
        for (std::uint64_t id = from; id <= to && id <= records_.size(); ++id)
        {
            out.push_back(records_[id - 1]);
        }
        return out;
    }

    Result<std::vector<SignatureRecord>> InMemoryLedgerStore::list_by_subject(std::string_view subject_id) const
    {
        std::vector<SignatureRecord> out;
        std::shared_lock lock(mutex_);
        for (const auto &record : records_)
        {
            if (record.fact.subject_id == subject_id)
                out.push_back(record);
        }
        return out;
    }

    Result<std::vector<SignatureRecord>> InMemoryLedgerStore::list_by_signer(std::string_view signer_id) const
    {
        std::vector<SignatureRecord> out;
        std::shared_lock lock(mutex_);
        for (const auto &record : records_)
        {
            if (record.fact.signer_id == signer_id)
                out.push_back(record);
        }
        return out;
    }

    Result<std::uint64_t> InMemoryLedgerStore::last_id() const
    {
        std::shared_lock lock(mutex_);
        return static_cast<std::uint64_t>(records_.size());
    }

    // ============================================================================
    // Factory
    // ============================================================================

    Result<std::shared_ptr<LedgerStore>> open_ledger_store(const StorageConfig &cfg)
    {
        if (cfg.backend == "memory")
        {
            return std::shared_ptr<LedgerStore>(std::make_shared<InMemoryLedgerStore>());
        }
        if (cfg.backend == "rocksdb")
        {
            auto store = RocksDbLedgerStore::open(cfg);
            if (!store)
                return std::unexpected(store.error());
            return std::shared_ptr<LedgerStore>(std::move(*store));
        }
        return std::unexpected(LedgerError::config("Unknown storage backend: " + cfg.backend));
    }

} // namespace attest
