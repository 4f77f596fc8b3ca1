#pragma once

#include <optional>
#include <string>

#include "core/document.hpp"

namespace verirag {

// Document metadata plus the ingestion status machine
// PENDING|ERROR -> PROCESSING -> READY|ERROR. Implementations are thread-safe
// and throw RegistryUnavailable when their store cannot be reached.
class DocumentRegistry {
public:
    virtual ~DocumentRegistry() = default;

    // Inserts the document as PENDING when its id is unknown and returns the
    // stored record (the existing one if the id was already registered).
    virtual Document register_document(const Document& document) = 0;
    virtual std::optional<Document> find(const std::string& document_id) = 0;

    // Returns false unless the document is PENDING, ERROR, or PROCESSING for
    // longer than the registry's processing timeout (an ingest that died
    // without recording its outcome).
    virtual bool mark_processing(const std::string& document_id) = 0;
    virtual void mark_ready(const std::string& document_id, int chunk_count) = 0;
    virtual void mark_error(const std::string& document_id, const std::string& message) = 0;

    // Returns false when the id is unknown.
    virtual bool set_deleted(const std::string& document_id, bool deleted) = 0;
};

}  // namespace verirag
