#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "db/document_registry.hpp"

namespace verirag {

class MemoryDocumentRegistry final : public DocumentRegistry {
public:
    explicit MemoryDocumentRegistry(std::chrono::seconds processing_timeout = std::chrono::minutes{15});

    Document register_document(const Document& document) override;
    std::optional<Document> find(const std::string& document_id) override;
    bool mark_processing(const std::string& document_id) override;
    void mark_ready(const std::string& document_id, int chunk_count) override;
    void mark_error(const std::string& document_id, const std::string& message) override;
    bool set_deleted(const std::string& document_id, bool deleted) override;

private:
    Document& require_locked(const std::string& document_id);

    std::chrono::seconds processing_timeout_;
    std::mutex mutex_;
    std::unordered_map<std::string, Document> documents_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> processing_since_;
};

}  // namespace verirag
