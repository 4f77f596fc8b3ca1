#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <pqxx/pqxx>

#include "db/document_registry.hpp"

namespace verirag
{

    // PostgreSQL-backed registry. A single connection is shared and guarded by
    // a mutex; libpqxx connections are not thread-safe.
    class PgDocumentRegistry final : public DocumentRegistry
    {
    public:
        PgDocumentRegistry(const std::string &conninfo, std::chrono::seconds processing_timeout);

        void ensure_schema();

        Document register_document(const Document &document) override;
        std::optional<Document> find(const std::string &document_id) override;
        bool mark_processing(const std::string &document_id) override;
        void mark_ready(const std::string &document_id, int chunk_count) override;
        void mark_error(const std::string &document_id, const std::string &message) override;
        bool set_deleted(const std::string &document_id, bool deleted) override;

    private:
        std::optional<Document> find_locked(const std::string &document_id);

        std::chrono::seconds processing_timeout_;
        std::mutex mutex_;
        std::optional<pqxx::connection> connection_;
    };

} // namespace verirag
