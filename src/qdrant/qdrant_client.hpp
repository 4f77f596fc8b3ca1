#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "index/vector_index.hpp"

namespace verirag {

// Point id -> indexed_seq for the points listed in a /points retrieve
// response. Points without the field are skipped.
std::map<std::uint64_t, std::uint64_t> parse_stored_sequences(const nlohmann::json& response);

// indexed_seq for each chunk: the stored value when the point already exists,
// otherwise a fresh one from `next`. Keeps a re-upserted chunk in its
// original tie-break position.
std::vector<std::uint64_t> resolve_sequences(const std::vector<IndexedChunk>& chunks,
                                             const std::map<std::uint64_t, std::uint64_t>& stored,
                                             const std::function<std::uint64_t()>& next);

// VectorIndex backed by a Qdrant collection over its REST API. Soft delete is
// the payload flag is_active, filtered at query time.
class QdrantVectorIndex final : public VectorIndex {
public:
    QdrantVectorIndex(std::string base_url, std::string collection, int dimension, long timeout_seconds = 15);

    void upsert(const IndexedChunk& chunk) override;
    void upsert_batch(const std::vector<IndexedChunk>& chunks) override;
    std::vector<IndexHit> query(const std::vector<float>& vector,
                                int top_k,
                                const IndexFilter& filter) const override;
    void mark_deleted(const std::string& document_id) override;
    void restore(const std::string& document_id) override;

    void ensure_collection();

private:
    std::string collection_url() const;
    void set_active(const std::string& document_id, bool active);
    std::uint64_t next_sequence();
    std::map<std::uint64_t, std::uint64_t> stored_sequences(const std::vector<IndexedChunk>& chunks) const;

    std::string base_url_;
    std::string collection_;
    int dimension_;
    long timeout_seconds_;
    std::mutex collection_mutex_;
    bool collection_ready_ = false;
    std::atomic<std::uint64_t> last_sequence_{0};
};

}  // namespace verirag
