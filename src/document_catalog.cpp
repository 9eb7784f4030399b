#include "attest/document_catalog.hpp"
#include <mutex>

namespace attest
{

    void InMemoryDocumentCatalog::put(const std::string &subject_id, const std::string &checksum)
    {
        std::unique_lock lock(mutex_);
        checksums_[subject_id] = checksum;
    }

    Result<std::string> InMemoryDocumentCatalog::current_checksum(const std::string &subject_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = checksums_.find(subject_id);
        if (it == checksums_.end())
        {
            return std::unexpected(LedgerError::not_found("Unknown subject: " + subject_id));
        }
        return it->second;
    }

} // namespace attest
