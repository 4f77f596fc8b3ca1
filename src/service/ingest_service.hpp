#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chunk/text_chunker.hpp"
#include "db/document_registry.hpp"
#include "embedding/embedder.hpp"
#include "index/vector_index.hpp"

namespace verirag {

// Turns extracted document text into indexed chunks and owns the soft-delete
// lifecycle. Ingestion of one document id is serialized in-process; different
// documents are ingested concurrently.
class IngestService {
public:
    IngestService(DocumentRegistry& registry,
                  const Embedder& embedder,
                  VectorIndex& index,
                  ChunkerOptions chunker_options = {});

    // Returns the number of chunks indexed for the document. A document that
    // is already READY is not indexed again.
    int ingest(const std::string& document_id,
               const std::string& document_name,
               const std::string& version,
               const std::string& text);

    // Both return false when the document id is unknown. The registry flag is
    // written before the index so that an ingest finishing concurrently sees
    // it and re-applies the delete to the points it just wrote.
    bool soft_delete(const std::string& document_id);
    bool restore(const std::string& document_id);

    static std::string chunk_id(const std::string& document_id, int seq_no);

private:
    std::shared_ptr<std::mutex> document_lock(const std::string& document_id);
    int index_chunks(const Document& document, const std::vector<Chunk>& chunks);

    DocumentRegistry& registry_;
    const Embedder& embedder_;
    VectorIndex& index_;
    ChunkerOptions chunker_options_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> document_locks_;
};

}  // namespace verirag
