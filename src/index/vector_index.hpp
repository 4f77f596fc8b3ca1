#pragma once

#include <optional>
#include <string>
#include <vector>

namespace verirag {

struct ChunkMetadata {
    std::string chunk_id;
    std::string document_id;
    std::string document_name;
    std::string version;
    int seq_no = 0;
    std::string content;
};

struct IndexedChunk {
    ChunkMetadata metadata;
    std::vector<float> vector;
};

// Conjunction of an optional version match and "document not soft-deleted".
struct IndexFilter {
    std::optional<std::string> version;
};

struct IndexHit {
    ChunkMetadata metadata;
    double score = 0.0;
};

// Nearest-neighbour store for chunk vectors. Scores are cosine similarity
// clamped to [0, 1]; equal scores keep insertion order. Implementations throw
// IndexUnavailable when the backing store cannot be used.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual void upsert(const IndexedChunk& chunk) = 0;
    virtual void upsert_batch(const std::vector<IndexedChunk>& chunks) {
        for (const auto& chunk : chunks) {
            upsert(chunk);
        }
    }

    // Empty result when nothing satisfies the filter.
    virtual std::vector<IndexHit> query(const std::vector<float>& vector,
                                        int top_k,
                                        const IndexFilter& filter) const = 0;

    // Soft delete: the chunks stay stored but are excluded from queries.
    virtual void mark_deleted(const std::string& document_id) = 0;
    virtual void restore(const std::string& document_id) = 0;
};

}  // namespace verirag
