#pragma once

#include "config.hpp"
#include "signature_record.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace attest
{

    /**
     * Append-only persistence for signature records.
     *
     * insert_linked is the only write. Implementations execute it as one
     * atomic unit with respect to every other insert: read the tail, enforce
     * the (subject_id, signer_id) and nonce uniqueness constraints, assign id,
     * prev_hash and created_at, and commit all-or-nothing. No operation updates
     * or deletes a stored record.
     */
    class LedgerStore
    {
    public:
        virtual ~LedgerStore() = default;

        /**
         * Link and persist a signed record. The id, prev_hash and created_at
         * of the argument are ignored and assigned by the store.
         *
         * @return the stored record, or AlreadyAcknowledged / NonceReused /
         *         StorageError
         */
        virtual Result<SignatureRecord> insert_linked(const SignatureRecord &pending) = 0;

        virtual Result<std::optional<SignatureRecord>> get(std::uint64_t id) const = 0;

        virtual Result<std::optional<SignatureRecord>> find(
            std::string_view subject_id,
            std::string_view signer_id) const = 0;

        /** Most recently inserted record, if any */
        virtual Result<std::optional<SignatureRecord>> tail() const = 0;

        /** Records with from <= id <= to, ordered by id */
        virtual Result<std::vector<SignatureRecord>> range(std::uint64_t from, std::uint64_t to) const = 0;

        virtual Result<std::vector<SignatureRecord>> list_by_subject(std::string_view subject_id) const = 0;

        virtual Result<std::vector<SignatureRecord>> list_by_signer(std::string_view signer_id) const = 0;

        /** Highest assigned id, 0 for an empty ledger */
        virtual Result<std::uint64_t> last_id() const = 0;
    };

    /**
     * Reject records whose text fields are not valid UTF-8 or whose nonce is
     * empty. Called by every backend before insert_linked takes its lock.
     */
    Result<void> check_insertable(const SignatureRecord &record);

    /** Uniqueness key for a (subject_id, signer_id) pair, unambiguous for any input */
    std::string acknowledgment_key(std::string_view subject_id, std::string_view signer_id);

    /**
     * Process-local store backed by an id-indexed vector. Used for tests and
     * evaluation deployments.
     */
    class InMemoryLedgerStore : public LedgerStore
    {
    public:
        InMemoryLedgerStore() = default;

        Result<SignatureRecord> insert_linked(const SignatureRecord &pending) override;
        Result<std::optional<SignatureRecord>> get(std::uint64_t id) const override;
        Result<std::optional<SignatureRecord>> find(std::string_view subject_id,
                                                    std::string_view signer_id) const override;
        Result<std::optional<SignatureRecord>> tail() const override;
        Result<std::vector<SignatureRecord>> range(std::uint64_t from, std::uint64_t to) const override;
        Result<std::vector<SignatureRecord>> list_by_subject(std::string_view subject_id) const override;
        Result<std::vector<SignatureRecord>> list_by_signer(std::string_view signer_id) const override;
        Result<std::uint64_t> last_id() const override;

    private:
        mutable std::shared_mutex mutex_;
        std::vector<SignatureRecord> records_; // records_[id - 1]
        std::unordered_map<std::string, std::uint64_t> acknowledgments_;
        std::unordered_set<std::string> nonces_;
    };

    /**
     * RocksDB-backed store. Key space:
     *
     *   rec/<20-digit id>            record JSON
     *   uniq/<acknowledgment key>    id
     *   nonce/<nonce>                id
     *   meta/tail                    last id
     *
     * Each insert is a single WriteBatch written under the store's write mutex.
     * Reads take no lock.
     */
    class RocksDbLedgerStore : public LedgerStore
    {
    public:
        static Result<std::unique_ptr<RocksDbLedgerStore>> open(const StorageConfig &cfg);
        ~RocksDbLedgerStore() override;

        Result<SignatureRecord> insert_linked(const SignatureRecord &pending) override;
        Result<std::optional<SignatureRecord>> get(std::uint64_t id) const override;
        Result<std::optional<SignatureRecord>> find(std::string_view subject_id,
                                                    std::string_view signer_id) const override;
        Result<std::optional<SignatureRecord>> tail() const override;
        Result<std::vector<SignatureRecord>> range(std::uint64_t from, std::uint64_t to) const override;
        Result<std::vector<SignatureRecord>> list_by_subject(std::string_view subject_id) const override;
        Result<std::vector<SignatureRecord>> list_by_signer(std::string_view signer_id) const override;
        Result<std::uint64_t> last_id() const override;

    private:
        class Impl;
        explicit RocksDbLedgerStore(std::unique_ptr<Impl> impl);
        std::unique_ptr<Impl> impl_;
    };

    /**
     * Construct the backend named by storage.backend
     */
    Result<std::shared_ptr<LedgerStore>> open_ledger_store(const StorageConfig &cfg);

} // namespace attest
