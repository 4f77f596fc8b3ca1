#include "db/memory_document_registry.hpp"

#include "core/errors.hpp"

namespace verirag {

MemoryDocumentRegistry::MemoryDocumentRegistry(std::chrono::seconds processing_timeout)
    : processing_timeout_(processing_timeout) {}

Document& MemoryDocumentRegistry::require_locked(const std::string& document_id) {
    const auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        throw InvalidRequest("unknown document: " + document_id);
    }
    return it->second;
}

Document MemoryDocumentRegistry::register_document(const Document& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = documents_.emplace(document.id, document);
    if (inserted) {
        it->second.status = DocumentStatus::Pending;
        it->second.chunk_count = 0;
        it->second.deleted = false;
        it->second.error_message.clear();
    }
    return it->second;
}

std::optional<Document> MemoryDocumentRegistry::find(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryDocumentRegistry::mark_processing(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& document = require_locked(document_id);
    const auto now = std::chrono::steady_clock::now();
    if (document.status == DocumentStatus::Processing) {
        if (now - processing_since_[document_id] < processing_timeout_) {
            return false;
        }
    } else if (document.status != DocumentStatus::Pending && document.status != DocumentStatus::Error) {
        return false;
    }
    document.status = DocumentStatus::Processing;
    document.error_message.clear();
    processing_since_[document_id] = now;
    return true;
}

void MemoryDocumentRegistry::mark_ready(const std::string& document_id, int chunk_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& document = require_locked(document_id);
    document.status = DocumentStatus::Ready;
    document.chunk_count = chunk_count;
    document.error_message.clear();
}

void MemoryDocumentRegistry::mark_error(const std::string& document_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& document = require_locked(document_id);
    document.status = DocumentStatus::Error;
    document.error_message = message;
}

bool MemoryDocumentRegistry::set_deleted(const std::string& document_id, bool deleted) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        return false;
    }
    it->second.deleted = deleted;
    return true;
}

}  // namespace verirag
