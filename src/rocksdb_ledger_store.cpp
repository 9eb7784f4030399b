#include "attest/ledger_store.hpp"
#include "attest/timestamp.hpp"
#include <fmt/format.h>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <filesystem>
#include <mutex>

namespace attest
{

    namespace
    {
        constexpr std::string_view kRecordPrefix = "rec/";
        constexpr std::string_view kUniquePrefix = "uniq/";
        constexpr std::string_view kNoncePrefix = "nonce/";
        constexpr std::string_view kTailKey = "meta/tail";

        std::string record_key(std::uint64_t id)
        {
            // Zero padding keeps lexicographic order equal to id order
            return fmt::format("{}{:020d}", kRecordPrefix, id);
        }

        std::string unique_key(std::string_view subject_id, std::string_view signer_id)
        {
            return std::string(kUniquePrefix) + acknowledgment_key(subject_id, signer_id);
        }

        std::string nonce_key(std::string_view nonce)
        {
            return std::string(kNoncePrefix) + std::string(nonce);
        }

        Result<std::uint64_t> parse_id(std::string_view text)
        {
            std::uint64_t id = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::unexpected(LedgerError::storage(fmt::format("Corrupt id value '{}'", text)));
            }
            return id;
        }

        Result<SignatureRecord> decode_record(const std::string &raw)
        {
            auto parsed = nlohmann::json::parse(raw, nullptr, false);
            if (parsed.is_discarded())
            {
                return std::unexpected(LedgerError::storage("Stored record is not valid JSON"));
            }
            return SignatureRecord::from_json(parsed);
        }
    } // namespace

    class RocksDbLedgerStore::Impl
    {
    public:
        explicit Impl(rocksdb::DB *db) : db_(db) {}

        ~Impl()
        {
            delete db_;
        }

        Result<std::optional<std::string>> read(const std::string &key) const
        {
            std::string value;
            auto status = db_->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
            {
                return std::unexpected(LedgerError::storage("RocksDB Get failed: " + status.ToString()));
            }
            return std::optional<std::string>(std::move(value));
        }

        Result<std::uint64_t> last_id() const
        {
            auto raw = read(std::string(kTailKey));
            if (!raw)
                return std::unexpected(raw.error());
            if (!raw->has_value())
                return std::uint64_t{0};
            return parse_id(**raw);
        }

        Result<std::optional<SignatureRecord>> get(std::uint64_t id) const
        {
            auto raw = read(record_key(id));
            if (!raw)
                return std::unexpected(raw.error());
            if (!raw->has_value())
                return std::optional<SignatureRecord>{};
            auto record = decode_record(**raw);
            if (!record)
                return std::unexpected(record.error());
            return std::optional<SignatureRecord>(std::move(*record));
        }

        Result<SignatureRecord> insert(const SignatureRecord &pending)
        {
            if (auto insertable = check_insertable(pending); !insertable)
                return std::unexpected(insertable.error());

            auto ukey = unique_key(pending.fact.subject_id, pending.fact.signer_id);
            auto nkey = nonce_key(pending.fact.nonce);

            std::lock_guard lock(write_mutex_);

            auto existing = read(ukey);
            if (!existing)
                return std::unexpected(existing.error());
            if (existing->has_value())
            {
                return std::unexpected(LedgerError::already_acknowledged(
                    fmt::format("'{}' already acknowledged '{}'", pending.fact.signer_id, pending.fact.subject_id)));
            }

            auto used_nonce = read(nkey);
            if (!used_nonce)
                return std::unexpected(used_nonce.error());
            if (used_nonce->has_value())
            {
                return std::unexpected(LedgerError::nonce_reused("Nonce already present in ledger"));
            }

            auto tail_id = last_id();
            if (!tail_id)
                return std::unexpected(tail_id.error());

            SignatureRecord record = pending;
            record.id = *tail_id + 1;
            record.prev_hash.reset();
            if (*tail_id != 0)
            {
                auto tail = get(*tail_id);
                if (!tail)
                    return std::unexpected(tail.error());
                if (!tail->has_value())
                {
                    return std::unexpected(LedgerError::storage(
                        fmt::format("Tail pointer references missing record {}", *tail_id)));
                }
                record.prev_hash = (*tail)->payload_hash;
            }
            record.created_at = now_utc();

            auto rkey = record_key(record.id);
            auto occupied = read(rkey);
            if (!occupied)
                return std::unexpected(occupied.error());
            if (occupied->has_value())
            {
                // Records are write-once; never overwrite
                return std::unexpected(LedgerError::storage(
                    fmt::format("Refusing to overwrite existing record {}", record.id)));
            }

            std::string encoded;
            try
            {
                encoded = record.to_json().dump();
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(LedgerError::storage(
                    fmt::format("Cannot serialize record {}: {}", record.id, e.what())));
            }

            auto id_text = std::to_string(record.id);
            rocksdb::WriteBatch batch;
            batch.Put(rkey, encoded);
            batch.Put(ukey, id_text);
            batch.Put(nkey, id_text);
            batch.Put(std::string(kTailKey), id_text);

            rocksdb::WriteOptions options;
            options.sync = true;
            auto status = db_->Write(options, &batch);
            if (!status.ok())
            {
                return std::unexpected(LedgerError::storage("RocksDB Write failed: " + status.ToString()));
            }

            return record;
        }

        template <typename Predicate>
        Result<std::vector<SignatureRecord>> scan(std::uint64_t from, std::uint64_t to, Predicate keep) const
        {
            std::vector<SignatureRecord> out;
            auto upper = record_key(to);

            std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(record_key(from)); it->Valid(); it->Next())
            {
                auto key = it->key().ToString();
                if (!key.starts_with(kRecordPrefix) || key > upper)
                    break;

                auto record = decode_record(it->value().ToString());
                if (!record)
                {
                    return std::unexpected(LedgerError::storage(
                        fmt::format("Unreadable record at key {}: {}", key, record.error().what())));
                }
                if (keep(*record))
                    out.push_back(std::move(*record));
            }

            if (!it->status().ok())
            {
                return std::unexpected(LedgerError::storage("RocksDB iteration failed: " + it->status().ToString()));
            }
            return out;
        }

    private:
        rocksdb::DB *db_{nullptr};
        std::mutex write_mutex_;
    };

    Result<std::unique_ptr<RocksDbLedgerStore>> RocksDbLedgerStore::open(const StorageConfig &cfg)
    {
        std::error_code ec;
        auto parent = std::filesystem::path(cfg.rocksdb_path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(LedgerError(ErrorCode::IOError,
                                                   "Cannot create " + parent.string() + ": " + ec.message()));
            }
        }

        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::DB *db = nullptr;
        auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
        if (!status.ok())
        {
            return std::unexpected(LedgerError::storage("RocksDB open failed: " + status.ToString()));
        }

        spdlog::info("Opened ledger store at {}", cfg.rocksdb_path);
        return std::unique_ptr<RocksDbLedgerStore>(new RocksDbLedgerStore(std::make_unique<Impl>(db)));
    }

    RocksDbLedgerStore::RocksDbLedgerStore(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
    RocksDbLedgerStore::~RocksDbLedgerStore() = default;

    Result<SignatureRecord> RocksDbLedgerStore::insert_linked(const SignatureRecord &pending)
    {
        return impl_->insert(pending);
    }

    Result<std::optional<SignatureRecord>> RocksDbLedgerStore::get(std::uint64_t id) const
    {
        return impl_->get(id);
    }

    Result<std::optional<SignatureRecord>> RocksDbLedgerStore::find(std::string_view subject_id,
                                                                    std::string_view signer_id) const
    {
        auto raw = impl_->read(unique_key(subject_id, signer_id));
        if (!raw)
            return std::unexpected(raw.error());
        if (!raw->has_value())
            return std::optional<SignatureRecord>{};
        auto id = parse_id(**raw);
        if (!id)
            return std::unexpected(id.error());
        return impl_->get(*id);
    }

    Result<std::optional<SignatureRecord>> RocksDbLedgerStore::tail() const
    {
        auto id = impl_->last_id();
        if (!id)
            return std::unexpected(id.error());
        if (*id == 0)
            return std::optional<SignatureRecord>{};
        return impl_->get(*id);
    }

    Result<std::vector<SignatureRecord>> RocksDbLedgerStore::range(std::uint64_t from, std::uint64_t to) const
    {
        if (from == 0)
            from = 1;
        if (to < from)
            return std::vector<SignatureRecord>{};
        return impl_->scan(from, to, [](const SignatureRecord &) { return true; });
    }

    Result<std::vector<SignatureRecord>> RocksDbLedgerStore::list_by_subject(std::string_view subject_id) const
    {
        return impl_->scan(1, UINT64_MAX, [subject_id](const SignatureRecord &r) { return r.fact.subject_id == subject_id; });
    }

    Result<std::vector<SignatureRecord>> RocksDbLedgerStore::list_by_signer(std::string_view signer_id) const
    {
        return impl_->scan(1, UINT64_MAX, [signer_id](const SignatureRecord &r) { return r.fact.signer_id == signer_id; });
    }

    Result<std::uint64_t> RocksDbLedgerStore::last_id() const
    {
        return impl_->last_id();
    }

} // namespace attest
