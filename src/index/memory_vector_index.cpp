#include "index/memory_vector_index.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

#include "core/errors.hpp"

namespace verirag {
namespace {

std::vector<float> normalize(const std::vector<float>& vector) {
    double norm = 0.0;
    for (const float value : vector) {
        norm += static_cast<double>(value) * static_cast<double>(value);
    }
    norm = std::sqrt(norm);
    if (norm == 0.0 || !std::isfinite(norm)) {
        throw std::invalid_argument("vector has zero or non-finite norm");
    }
    std::vector<float> unit(vector.size());
    for (std::size_t i = 0; i < vector.size(); ++i) {
        unit[i] = static_cast<float>(vector[i] / norm);
    }
    return unit;
}

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return std::clamp(dot, 0.0, 1.0);
}

}  // namespace

MemoryVectorIndex::MemoryVectorIndex(int dimension) : dimension_(dimension) {
    if (dimension < 0) {
        throw std::invalid_argument("index dimension must not be negative");
    }
}

MemoryVectorIndex::Entry MemoryVectorIndex::make_entry(const IndexedChunk& chunk) const {
    if (chunk.metadata.chunk_id.empty() || chunk.metadata.document_id.empty()) {
        throw std::invalid_argument("indexed chunk requires chunk_id and document_id");
    }
    return Entry{chunk.metadata, normalize(chunk.vector)};
}

void MemoryVectorIndex::insert_locked(Entry entry) {
    const int dimension = static_cast<int>(entry.unit_vector.size());
    if (dimension_ == 0) {
        dimension_ = dimension;
    } else if (dimension != dimension_) {
        throw IndexUnavailable("vector dimension " + std::to_string(dimension) + " does not match index dimension " +
                               std::to_string(dimension_));
    }

    const auto it = positions_.find(entry.metadata.chunk_id);
    if (it != positions_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    positions_.emplace(entry.metadata.chunk_id, entries_.size());
    entries_.push_back(std::move(entry));
}

void MemoryVectorIndex::upsert(const IndexedChunk& chunk) {
    Entry entry = make_entry(chunk);
    std::unique_lock lock(mutex_);
    insert_locked(std::move(entry));
}

void MemoryVectorIndex::upsert_batch(const std::vector<IndexedChunk>& chunks) {
    std::vector<Entry> prepared;
    prepared.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        prepared.push_back(make_entry(chunk));
    }
    if (prepared.empty()) {
        return;
    }

    std::unique_lock lock(mutex_);
    // Validate the whole batch first so a mismatch leaves the index untouched.
    const std::size_t expected = dimension_ != 0 ? static_cast<std::size_t>(dimension_) : prepared.front().unit_vector.size();
    for (const auto& entry : prepared) {
        if (entry.unit_vector.size() != expected) {
            throw IndexUnavailable("batch vector dimension " + std::to_string(entry.unit_vector.size()) +
                                   " does not match " + std::to_string(expected));
        }
    }
    for (auto& entry : prepared) {
        insert_locked(std::move(entry));
    }
}

std::vector<IndexHit> MemoryVectorIndex::query(const std::vector<float>& vector,
                                               int top_k,
                                               const IndexFilter& filter) const {
    if (top_k <= 0) {
        throw std::invalid_argument("query requires top_k > 0");
    }
    const auto unit = normalize(vector);

    std::shared_lock lock(mutex_);
    if (entries_.empty()) {
        return {};
    }
    if (static_cast<int>(unit.size()) != dimension_) {
        throw IndexUnavailable("query dimension " + std::to_string(unit.size()) + " does not match index dimension " +
                               std::to_string(dimension_));
    }

    std::vector<IndexHit> hits;
    for (const auto& entry : entries_) {
        if (deleted_documents_.count(entry.metadata.document_id) != 0) {
            continue;
        }
        if (filter.version && entry.metadata.version != *filter.version) {
            continue;
        }
        hits.push_back(IndexHit{entry.metadata, cosine(unit, entry.unit_vector)});
    }
    lock.unlock();

    // entries_ is in insertion order, so a stable sort keeps earlier chunks first on ties.
    std::stable_sort(hits.begin(), hits.end(),
                     [](const IndexHit& a, const IndexHit& b) { return a.score > b.score; });
    if (hits.size() > static_cast<std::size_t>(top_k)) {
        hits.resize(static_cast<std::size_t>(top_k));
    }
    return hits;
}

void MemoryVectorIndex::mark_deleted(const std::string& document_id) {
    std::unique_lock lock(mutex_);
    deleted_documents_.insert(document_id);
}

void MemoryVectorIndex::restore(const std::string& document_id) {
    std::unique_lock lock(mutex_);
    deleted_documents_.erase(document_id);
}

std::size_t MemoryVectorIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace verirag
