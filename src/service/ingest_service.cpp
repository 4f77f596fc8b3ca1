#include "service/ingest_service.hpp"

#include "core/errors.hpp"
#include "core/version_label.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace verirag {
namespace {

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

IngestService::IngestService(DocumentRegistry& registry,
                             const Embedder& embedder,
                             VectorIndex& index,
                             ChunkerOptions chunker_options)
    : registry_(registry),
      embedder_(embedder),
      index_(index),
      chunker_options_(chunker_options) {
    validate_chunker_options(chunker_options_);
}

std::string IngestService::chunk_id(const std::string& document_id, int seq_no) {
    return document_id + ":" + std::to_string(seq_no);
}

std::shared_ptr<std::mutex> IngestService::document_lock(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = document_locks_[document_id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

int IngestService::ingest(const std::string& document_id,
                          const std::string& document_name,
                          const std::string& version,
                          const std::string& text) {
    const std::string id = trim(document_id);
    if (id.empty()) {
        throw InvalidRequest("document_id must not be empty");
    }
    const std::string label = require_version_label(version);
    std::string name = trim(document_name);
    if (name.empty()) {
        name = id;
    }

    const auto chunks = chunk_text(text, chunker_options_);
    if (chunks.empty()) {
        throw InvalidRequest("document " + id + " contains no text");
    }

    const auto mutex = document_lock(id);
    std::lock_guard<std::mutex> guard(*mutex);

    const Document document = registry_.register_document(Document{
        .id = id,
        .name = name,
        .version = label,
        .uploaded_at = time::current_time_iso8601(),
    });
    if (document.version != label) {
        throw InvalidRequest("document " + id + " is registered with version " + document.version);
    }
    if (document.status == DocumentStatus::Ready) {
        log::info("ingest skipped document_id=" + id + " status=READY chunks=" +
                  std::to_string(document.chunk_count));
        return document.chunk_count;
    }
    if (!registry_.mark_processing(id)) {
        throw InvalidRequest("document " + id + " is already being ingested");
    }

    try {
        const int indexed = index_chunks(document, chunks);
        registry_.mark_ready(id, indexed);
        log::info("ingest completed document_id=" + id + " version=" + label +
                  " chunks=" + std::to_string(indexed));
        return indexed;
    } catch (const std::exception& ex) {
        try {
            registry_.mark_error(id, ex.what());
        } catch (const Error& mark_ex) {
            log::error("failed to record ingest error for " + id + ": " + mark_ex.what());
        }
        throw;
    }
}

int IngestService::index_chunks(const Document& document, const std::vector<Chunk>& chunks) {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        texts.push_back(chunk.content);
    }

    // Embedding happens before any index lock is taken.
    const auto vectors = embedder_.embed_batch(texts);
    if (vectors.size() != chunks.size()) {
        throw EmbeddingUnavailable("embedding batch returned " + std::to_string(vectors.size()) +
                                   " vectors for " + std::to_string(chunks.size()) + " chunks");
    }

    std::vector<IndexedChunk> batch;
    batch.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        batch.push_back(IndexedChunk{
            .metadata =
                ChunkMetadata{
                    .chunk_id = chunk_id(document.id, chunk.seq_no),
                    .document_id = document.id,
                    .document_name = document.name,
                    .version = document.version,
                    .seq_no = chunk.seq_no,
                    .content = chunk.content,
                },
            .vector = vectors[i],
        });
    }
    index_.upsert_batch(batch);

    // Upserted points are active. A soft delete recorded before or during
    // this ingest must be applied again on top of them.
    const auto current = registry_.find(document.id);
    if (document.deleted || (current && current->deleted)) {
        index_.mark_deleted(document.id);
    }
    return static_cast<int>(batch.size());
}

bool IngestService::soft_delete(const std::string& document_id) {
    if (!registry_.find(document_id)) {
        return false;
    }
    registry_.set_deleted(document_id, true);
    index_.mark_deleted(document_id);
    log::info("document soft-deleted document_id=" + document_id);
    return true;
}

bool IngestService::restore(const std::string& document_id) {
    if (!registry_.find(document_id)) {
        return false;
    }
    registry_.set_deleted(document_id, false);
    index_.restore(document_id);
    log::info("document restored document_id=" + document_id);
    return true;
}

}  // namespace verirag
