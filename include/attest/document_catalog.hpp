#pragma once

#include "types.hpp"
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace attest
{

    /**
     * Source of truth for the current version of each subject.
     */
    class DocumentCatalog
    {
    public:
        virtual ~DocumentCatalog() = default;

        /**
         * Checksum of the subject's current version.
         *
         * @return the checksum, or NotFound when the subject is unknown
         */
        virtual Result<std::string> current_checksum(const std::string &subject_id) const = 0;
    };

    /** Catalog held in process memory, populated by the host application */
    class InMemoryDocumentCatalog : public DocumentCatalog
    {
    public:
        void put(const std::string &subject_id, const std::string &checksum);

        Result<std::string> current_checksum(const std::string &subject_id) const override;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::string> checksums_;
    };

} // namespace attest
