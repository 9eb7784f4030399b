#include <catch2/catch_test_macros.hpp>
#include "attest/ledger_store.hpp"
#include "attest/timestamp.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace attest;

namespace
{
    SignatureRecord pending(std::string subject, std::string signer, std::string nonce)
    {
        SignatureRecord record;
        record.fact.subject_id = std::move(subject);
        record.fact.signer_id = std::move(signer);
        record.fact.signer_email = record.fact.signer_id + "@example.com";
        record.fact.signed_at = now_utc();
        record.fact.nonce = std::move(nonce);
        record.payload_hash = record.compute_hash();
        return record;
    }

    struct TempDir
    {
        std::filesystem::path path;

        TempDir()
        {
            path = std::filesystem::temp_directory_path() /
                   ("attest-store-" + crypto::generate_nonce());
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    std::shared_ptr<LedgerStore> open_backend(const std::string &backend, const TempDir &dir)
    {
        StorageConfig cfg;
        cfg.backend = backend;
        cfg.rocksdb_path = (dir.path / "db").string();
        auto store = open_ledger_store(cfg);
        REQUIRE(store.has_value());
        return *store;
    }
} // namespace

TEST_CASE("Acknowledgment keys are unambiguous", "[store]")
{
    REQUIRE(acknowledgment_key("a:b", "c") != acknowledgment_key("a", "b:c"));
    REQUIRE(acknowledgment_key("ab", "c") != acknowledgment_key("a", "bc"));
}

TEST_CASE("Store links records in insertion order", "[store]")
{
    TempDir dir;
    for (std::string backend : {"memory", "rocksdb"})
    {
        DYNAMIC_SECTION("backend " << backend)
        {
            auto store = open_backend(backend, dir);
            REQUIRE(store->last_id().value() == 0);
            REQUIRE_FALSE(store->tail().value().has_value());

            auto first = store->insert_linked(pending("doc-1", "alice", "n1"));
            REQUIRE(first.has_value());
            REQUIRE(first->id == 1);
            REQUIRE_FALSE(first->prev_hash.has_value());
            REQUIRE(first->created_at.time_since_epoch().count() != 0);

            auto second = store->insert_linked(pending("doc-1", "bob", "n2"));
            REQUIRE(second.has_value());
            REQUIRE(second->id == 2);
            REQUIRE(second->prev_hash == std::optional<crypto::SHA256Hash>(first->payload_hash));

            REQUIRE(store->last_id().value() == 2);
            REQUIRE(store->tail().value()->id == 2);

            auto found = store->find("doc-1", "bob");
            REQUIRE(found.has_value());
            REQUIRE(found->has_value());
            REQUIRE((*found)->fact.nonce == "n2");

            REQUIRE_FALSE(store->find("doc-1", "carol").value().has_value());
            REQUIRE_FALSE(store->get(3).value().has_value());

            auto all = store->range(1, 10);
            REQUIRE(all.has_value());
            REQUIRE(all->size() == 2);
            REQUIRE(all->front().id == 1);

            REQUIRE(store->list_by_subject("doc-1").value().size() == 2);
            REQUIRE(store->list_by_signer("alice").value().size() == 1);
        }
    }
}

TEST_CASE("Store enforces acknowledgment and nonce uniqueness", "[store]")
{
    TempDir dir;
    for (std::string backend : {"memory", "rocksdb"})
    {
        DYNAMIC_SECTION("backend " << backend)
        {
            auto store = open_backend(backend, dir);
            REQUIRE(store->insert_linked(pending("doc-1", "alice", "n1")).has_value());

            auto duplicate = store->insert_linked(pending("doc-1", "alice", "n9"));
            REQUIRE_FALSE(duplicate.has_value());
            REQUIRE(duplicate.error().code == ErrorCode::AlreadyAcknowledged);

            auto replay = store->insert_linked(pending("doc-2", "alice", "n1"));
            REQUIRE_FALSE(replay.has_value());
            REQUIRE(replay.error().code == ErrorCode::NonceReused);

            auto no_nonce = store->insert_linked(pending("doc-3", "alice", ""));
            REQUIRE_FALSE(no_nonce.has_value());
            REQUIRE(no_nonce.error().code == ErrorCode::InvalidInput);

            REQUIRE(store->last_id().value() == 1);
        }
    }
}

TEST_CASE("Concurrent inserts keep one chain without lost tails", "[store][concurrency]")
{
    TempDir dir;
    for (std::string backend : {"memory", "rocksdb"})
    {
        DYNAMIC_SECTION("backend " << backend)
        {
            auto store = open_backend(backend, dir);
            constexpr int kThreads = 8;
            constexpr int kPerThread = 25;

            std::atomic<int> failures{0};
            std::vector<std::thread> workers;
            for (int t = 0; t < kThreads; ++t)
            {
                workers.emplace_back([&store, &failures, t]
                {
                    for (int i = 0; i < kPerThread; ++i)
                    {
                        auto signer = "user-" + std::to_string(t) + "-" + std::to_string(i);
                        if (!store->insert_linked(pending("doc-1", signer, crypto::generate_nonce())))
                            ++failures;
                    }
                });
            }
            for (auto &w : workers)
                w.join();

            REQUIRE(failures == 0);

            auto records = store->range(1, kThreads * kPerThread).value();
            REQUIRE(records.size() == kThreads * kPerThread);

            std::set<std::string> prev_hashes;
            for (std::size_t i = 0; i < records.size(); ++i)
            {
                REQUIRE(records[i].id == i + 1);
                if (i > 0)
                {
                    REQUIRE(records[i].prev_hash == std::optional<crypto::SHA256Hash>(records[i - 1].payload_hash));
                    REQUIRE(prev_hashes.insert(crypto::SHA256::to_hex(*records[i].prev_hash)).second);
                }
            }
        }
    }
}

TEST_CASE("Concurrent duplicate acknowledgments admit exactly one", "[store][concurrency]")
{
    InMemoryLedgerStore store;
    std::atomic<int> ok{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 16; ++t)
    {
        workers.emplace_back([&]
        {
            auto result = store.insert_linked(pending("doc-1", "alice", crypto::generate_nonce()));
            if (result)
                ++ok;
            else if (result.error().code == ErrorCode::AlreadyAcknowledged)
                ++conflicts;
        });
    }
    for (auto &w : workers)
        w.join();

    REQUIRE(ok == 1);
    REQUIRE(conflicts == 15);
}

TEST_CASE("Store rejects text that is not UTF-8", "[store]")
{
    TempDir dir;
    for (std::string backend : {"memory", "rocksdb"})
    {
        DYNAMIC_SECTION("backend " << backend)
        {
            auto store = open_backend(backend, dir);

            auto record = pending("doc-1", "alice", "n1");
            record.signer_name = "\xff\xfe";
            auto result = store->insert_linked(record);
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().code == ErrorCode::InvalidInput);

            auto bad_subject = store->insert_linked(pending("doc-\xC0\xAF", "alice", "n2"));
            REQUIRE_FALSE(bad_subject.has_value());
            REQUIRE(bad_subject.error().code == ErrorCode::InvalidInput);

            REQUIRE(store->last_id().value() == 0);
        }
    }
}

TEST_CASE("RocksDB store never overwrites a stored record", "[store][rocksdb]")
{
    TempDir dir;
    StorageConfig cfg;
    cfg.backend = "rocksdb";
    cfg.rocksdb_path = (dir.path / "db").string();

    {
        auto store = RocksDbLedgerStore::open(cfg);
        REQUIRE(store.has_value());
        REQUIRE((*store)->insert_linked(pending("doc-1", "alice", "n1")).has_value());
        REQUIRE((*store)->insert_linked(pending("doc-2", "alice", "n2")).has_value());
    }

    // Move the tail pointer backwards so the next id collides with record 2
    {
        rocksdb::DB *raw = nullptr;
        auto status = rocksdb::DB::Open(rocksdb::Options(), cfg.rocksdb_path, &raw);
        REQUIRE(status.ok());
        std::unique_ptr<rocksdb::DB> db(raw);
        REQUIRE(db->Put(rocksdb::WriteOptions(), "meta/tail", "1").ok());
    }

    auto reopened = RocksDbLedgerStore::open(cfg);
    REQUIRE(reopened.has_value());

    auto original = (*reopened)->get(2).value().value();
    auto collided = (*reopened)->insert_linked(pending("doc-3", "alice", "n3"));
    REQUIRE_FALSE(collided.has_value());
    REQUIRE(collided.error().code == ErrorCode::StorageError);

    auto after = (*reopened)->get(2).value().value();
    REQUIRE(after.fact.subject_id == original.fact.subject_id);
    REQUIRE(after.created_at == original.created_at);
    REQUIRE_FALSE((*reopened)->find("doc-3", "alice").value().has_value());
}

TEST_CASE("RocksDB store survives reopen", "[store][rocksdb]")
{
    TempDir dir;
    StorageConfig cfg;
    cfg.backend = "rocksdb";
    cfg.rocksdb_path = (dir.path / "db").string();

    crypto::SHA256Hash tail_hash{};
    {
        auto store = RocksDbLedgerStore::open(cfg);
        REQUIRE(store.has_value());
        REQUIRE((*store)->insert_linked(pending("doc-1", "alice", "n1")).has_value());
        tail_hash = (*store)->insert_linked(pending("doc-2", "alice", "n2")).value().payload_hash;
    }

    auto reopened = RocksDbLedgerStore::open(cfg);
    REQUIRE(reopened.has_value());
    REQUIRE((*reopened)->last_id().value() == 2);

    auto duplicate = (*reopened)->insert_linked(pending("doc-1", "alice", "n3"));
    REQUIRE_FALSE(duplicate.has_value());
    REQUIRE(duplicate.error().code == ErrorCode::AlreadyAcknowledged);

    auto third = (*reopened)->insert_linked(pending("doc-3", "alice", "n3"));
    REQUIRE(third.has_value());
    REQUIRE(third->id == 3);
    REQUIRE(third->prev_hash == std::optional<crypto::SHA256Hash>(tail_hash));
}

TEST_CASE("Unknown backend is a config error", "[store]")
{
    StorageConfig cfg;
    cfg.backend = "postgres";
    auto store = open_ledger_store(cfg);
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == ErrorCode::ConfigError);
}
