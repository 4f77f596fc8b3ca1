#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "index/vector_index.hpp"

namespace verirag {

// In-process brute-force index. Readers share the lock; an upsert becomes
// visible only once the entry is fully built.
class MemoryVectorIndex final : public VectorIndex {
public:
    // dimension 0 adopts the dimension of the first upserted vector.
    explicit MemoryVectorIndex(int dimension = 0);

    void upsert(const IndexedChunk& chunk) override;
    void upsert_batch(const std::vector<IndexedChunk>& chunks) override;
    std::vector<IndexHit> query(const std::vector<float>& vector,
                                int top_k,
                                const IndexFilter& filter) const override;
    void mark_deleted(const std::string& document_id) override;
    void restore(const std::string& document_id) override;

    std::size_t size() const;

private:
    struct Entry {
        ChunkMetadata metadata;
        std::vector<float> unit_vector;
    };

    Entry make_entry(const IndexedChunk& chunk) const;
    void insert_locked(Entry entry);

    mutable std::shared_mutex mutex_;
    int dimension_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
    std::unordered_set<std::string> deleted_documents_;
};

}  // namespace verirag
