#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "db/memory_document_registry.hpp"
#include "index/memory_vector_index.hpp"
#include "service/ingest_service.hpp"
#include "service/rag_service.hpp"
#include "test_support.hpp"

using namespace verirag;

namespace {

const std::vector<float> kProbe = {1.0f, 0.0f};

std::string long_document(int words) {
    std::string text;
    for (int i = 0; i < words; ++i) {
        text += "token" + std::to_string(i) + " ";
    }
    return text;
}

// Keeps the soft-delete flag on each stored point, the way a payload-filtered
// store does: upserting a point makes it visible again.
class PointFlagIndex final : public VectorIndex {
public:
    void upsert(const IndexedChunk& chunk) override {
        std::lock_guard<std::mutex> lock(mutex_);
        points_[chunk.metadata.chunk_id] = Point{chunk.metadata, true};
    }

    std::vector<IndexHit> query(const std::vector<float>&, int top_k, const IndexFilter&) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<IndexHit> hits;
        for (const auto& [id, point] : points_) {
            if (point.active && static_cast<int>(hits.size()) < top_k) {
                hits.push_back(IndexHit{point.metadata, 1.0});
            }
        }
        return hits;
    }

    void mark_deleted(const std::string& document_id) override { set_active(document_id, false); }
    void restore(const std::string& document_id) override { set_active(document_id, true); }

private:
    struct Point {
        ChunkMetadata metadata;
        bool active = true;
    };

    void set_active(const std::string& document_id, bool active) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, point] : points_) {
            if (point.metadata.document_id == document_id) {
                point.active = active;
            }
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, Point> points_;
};

// Runs a callback once, in the middle of the embedding call.
class HookedEmbedder final : public Embedder {
public:
    mutable std::function<void()> during_batch;

    std::vector<float> embed(const std::string& text) const override { return inner_.embed(text); }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const override {
        if (during_batch) {
            auto hook = std::move(during_batch);
            during_batch = nullptr;
            hook();
        }
        return inner_.embed_batch(texts);
    }

    int dimension() const override { return inner_.dimension(); }

private:
    test::StubEmbedder inner_;
};

void test_chunks_carry_document_version() {
    std::cout << "[Test] chunks carry the document version..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index, ChunkerOptions{50, 0.2});

    const int chunks = ingest.ingest("doc-1", "Manual v1", "v1", long_document(180));
    assert(chunks > 1);
    assert(index.size() == static_cast<std::size_t>(chunks));

    const auto hits = index.query(kProbe, 100, IndexFilter{});
    assert(hits.size() == static_cast<std::size_t>(chunks));
    for (const auto& hit : hits) {
        assert(hit.metadata.version == "v1");
        assert(hit.metadata.document_id == "doc-1");
        assert(hit.metadata.document_name == "Manual v1");
        assert(hit.metadata.chunk_id == IngestService::chunk_id("doc-1", hit.metadata.seq_no));
    }

    const auto document = registry.find("doc-1");
    assert(document);
    assert(document->status == DocumentStatus::Ready);
    assert(document->chunk_count == chunks);
    assert(!document->uploaded_at.empty());
    std::cout << "[PASS] version invariant" << std::endl;
}

void test_ready_document_is_not_reindexed() {
    std::cout << "[Test] READY document is not re-indexed..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index, ChunkerOptions{50, 0.2});

    const int first = ingest.ingest("doc-1", "Manual", "v1", long_document(120));
    const int calls = embedder.calls();
    assert(ingest.ingest("doc-1", "Manual", "v1", long_document(120)) == first);
    assert(embedder.calls() == calls);

    assert(test::throws<InvalidRequest>([&] { ingest.ingest("doc-1", "Manual", "v2", "new text"); }));
    std::cout << "[PASS] READY skip" << std::endl;
}

void test_invalid_input_is_rejected() {
    std::cout << "[Test] invalid ingest input..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index);

    assert(test::throws<InvalidRequest>([&] { ingest.ingest("  ", "Manual", "v1", "text"); }));
    assert(test::throws<InvalidVersionFilter>([&] { ingest.ingest("doc-1", "Manual", "v 1", "text"); }));
    assert(test::throws<InvalidVersionFilter>([&] { ingest.ingest("doc-1", "Manual", "", "text"); }));
    assert(test::throws<InvalidRequest>([&] { ingest.ingest("doc-1", "Manual", "v1", " \n "); }));
    assert(!registry.find("doc-1"));
    assert(embedder.calls() == 0);
    std::cout << "[PASS] invalid input" << std::endl;
}

void test_embedding_failure_marks_error() {
    std::cout << "[Test] embedding failure marks ERROR..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index);

    embedder.fail_with("embedding endpoint returned 500");
    assert(test::throws<EmbeddingUnavailable>([&] { ingest.ingest("doc-1", "Manual", "v1", "some text"); }));
    auto document = registry.find("doc-1");
    assert(document && document->status == DocumentStatus::Error);
    assert(document->error_message.find("500") != std::string::npos);
    assert(index.size() == 0);

    // ERROR documents may be retried.
    embedder.fail_with("");
    assert(ingest.ingest("doc-1", "Manual", "v1", "some text") == 1);
    document = registry.find("doc-1");
    assert(document->status == DocumentStatus::Ready);
    assert(document->error_message.empty());
    std::cout << "[PASS] ERROR state" << std::endl;
}

void test_soft_delete_and_restore() {
    std::cout << "[Test] soft delete and restore..." << std::endl;
    const std::string question = "How long is the warranty?";
    const std::string text = "The warranty lasts two years.";
    test::StubEmbedder embedder;
    embedder.set(question, kProbe);
    embedder.set(text, kProbe);
    test::StubGenerator model("The warranty lasts two years [S1].");
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    RagService rag(embedder, model, index, registry);

    assert(rag.ingest("doc-1", "Manual v1", "v1", text) == 1);
    Answer answer = rag.ask(question, QueryType::General);
    assert(!answer.refusal);
    assert((answer.used_documents == std::vector<std::string>{"Manual v1"}));

    assert(rag.soft_delete("doc-1"));
    assert(registry.find("doc-1")->deleted);
    answer = rag.ask(question, QueryType::General);
    assert(answer.refusal);
    assert(answer.outcome == AnswerOutcome::NoEvidence);

    assert(rag.restore("doc-1"));
    assert(!registry.find("doc-1")->deleted);
    assert(!rag.ask(question, QueryType::General, std::string{"v1"}).refusal);

    assert(!rag.soft_delete("missing"));
    assert(!rag.restore("missing"));
    std::cout << "[PASS] soft delete" << std::endl;
}

void test_soft_delete_during_ingest_is_kept() {
    std::cout << "[Test] soft delete while the ingest is embedding..." << std::endl;
    HookedEmbedder embedder;
    PointFlagIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index, ChunkerOptions{40, 0.1});

    embedder.during_batch = [&] { assert(ingest.soft_delete("doc-1")); };
    assert(ingest.ingest("doc-1", "Manual", "v1", long_document(100)) > 0);

    assert(registry.find("doc-1")->deleted);
    assert(index.query(kProbe, 100, IndexFilter{}).empty());

    assert(ingest.restore("doc-1"));
    assert(!index.query(kProbe, 100, IndexFilter{}).empty());
    std::cout << "[PASS] soft delete during ingest" << std::endl;
}

void test_stale_processing_is_taken_over() {
    std::cout << "[Test] document left PROCESSING by a crashed worker..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;

    // A fresh PROCESSING row belongs to a live ingest and is not touched.
    MemoryDocumentRegistry patient(std::chrono::seconds{3600});
    patient.register_document(Document{.id = "doc-1", .name = "Manual", .version = "v1"});
    assert(patient.mark_processing("doc-1"));
    IngestService blocked(patient, embedder, index);
    assert(test::throws<InvalidRequest>([&] { blocked.ingest("doc-1", "Manual", "v1", "some text"); }));

    // Past the timeout the row is reclaimed and the ingest completes.
    MemoryDocumentRegistry registry(std::chrono::seconds{0});
    registry.register_document(Document{.id = "doc-1", .name = "Manual", .version = "v1"});
    assert(registry.mark_processing("doc-1"));
    IngestService ingest(registry, embedder, index);
    assert(ingest.ingest("doc-1", "Manual", "v1", "some text") == 1);
    assert(registry.find("doc-1")->status == DocumentStatus::Ready);

    // READY is final; only ERROR and stale PROCESSING rows are reclaimed.
    assert(!registry.mark_processing("doc-1"));
    std::cout << "[PASS] stale PROCESSING" << std::endl;
}

void test_concurrent_ingest_indexes_once() {
    std::cout << "[Test] concurrent ingest of one document..." << std::endl;
    test::StubEmbedder embedder;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    IngestService ingest(registry, embedder, index, ChunkerOptions{40, 0.1});
    const std::string text = long_document(200);

    std::vector<std::thread> threads;
    std::vector<int> results(8, -1);
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] { results[static_cast<std::size_t>(i)] = ingest.ingest("doc-1", "Manual", "v1", text); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const int expected = results.front();
    assert(expected > 0);
    for (const int result : results) {
        assert(result == expected);
    }
    assert(index.size() == static_cast<std::size_t>(expected));
    assert(embedder.calls() == expected);

    // Different documents proceed independently.
    std::vector<std::thread> others;
    for (int i = 0; i < 4; ++i) {
        others.emplace_back([&, i] { ingest.ingest("other-" + std::to_string(i), "Other", "v2", text); });
    }
    for (auto& thread : others) {
        thread.join();
    }
    assert(index.size() == static_cast<std::size_t>(expected) * 5);
    std::cout << "[PASS] concurrent ingest" << std::endl;
}

}  // namespace

int main() {
    test_chunks_carry_document_version();
    test_ready_document_is_not_reindexed();
    test_invalid_input_is_rejected();
    test_embedding_failure_marks_error();
    test_soft_delete_and_restore();
    test_soft_delete_during_ingest_is_kept();
    test_stale_processing_is_taken_over();
    test_concurrent_ingest_indexes_once();
    std::cout << "[Test] IngestServiceTest completed." << std::endl;
    return 0;
}
