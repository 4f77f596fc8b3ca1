#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "index/memory_vector_index.hpp"
#include "test_support.hpp"

using namespace verirag;

namespace {

IndexedChunk make_chunk(const std::string& document_id, int seq_no, const std::string& version, std::vector<float> vector) {
    IndexedChunk chunk;
    chunk.metadata.chunk_id = document_id + ":" + std::to_string(seq_no);
    chunk.metadata.document_id = document_id;
    chunk.metadata.document_name = document_id + ".txt";
    chunk.metadata.version = version;
    chunk.metadata.seq_no = seq_no;
    chunk.metadata.content = "content of " + chunk.metadata.chunk_id;
    chunk.vector = std::move(vector);
    return chunk;
}

const std::vector<float> kQuery = {1.0f, 0.0f};

void test_ranking_and_ties() {
    std::cout << "[Test] ranking and tie order..." << std::endl;
    MemoryVectorIndex index;
    index.upsert(make_chunk("a", 0, "v1", test::at_score(0.5)));
    index.upsert(make_chunk("b", 0, "v1", test::at_score(0.9)));
    index.upsert(make_chunk("c", 0, "v1", test::at_score(0.5)));
    index.upsert(make_chunk("d", 0, "v1", {-1.0f, 0.0f}));

    const auto hits = index.query(kQuery, 10, IndexFilter{});
    assert(hits.size() == 4);
    assert(hits[0].metadata.document_id == "b");
    assert(test::near(hits[0].score, 0.9));
    assert(hits[1].metadata.document_id == "a");
    assert(hits[2].metadata.document_id == "c");
    assert(hits[3].metadata.document_id == "d");
    assert(hits[3].score == 0.0);

    // Re-upserting keeps the original position.
    index.upsert(make_chunk("a", 0, "v1", test::at_score(0.5)));
    const auto again = index.query(kQuery, 2, IndexFilter{});
    assert(again.size() == 2);
    assert(again[1].metadata.document_id == "a");
    assert(index.size() == 4);
    std::cout << "[PASS] ranking and ties" << std::endl;
}

void test_version_filter_and_soft_delete() {
    std::cout << "[Test] version filter and soft delete..." << std::endl;
    MemoryVectorIndex index;
    index.upsert(make_chunk("manual", 0, "v1", test::at_score(0.95)));
    index.upsert(make_chunk("manual", 1, "v1", test::at_score(0.85)));
    index.upsert(make_chunk("guide", 0, "v2", test::at_score(0.80)));

    assert(index.query(kQuery, 10, IndexFilter{std::string{"v2"}}).size() == 1);
    assert(index.query(kQuery, 10, IndexFilter{std::string{"v3"}}).empty());

    index.mark_deleted("manual");
    auto hits = index.query(kQuery, 10, IndexFilter{});
    assert(hits.size() == 1);
    assert(hits[0].metadata.document_id == "guide");
    assert(index.query(kQuery, 10, IndexFilter{std::string{"v1"}}).empty());

    index.restore("manual");
    hits = index.query(kQuery, 10, IndexFilter{});
    assert(hits.size() == 3);
    assert(hits[0].metadata.chunk_id == "manual:0");
    std::cout << "[PASS] filter and soft delete" << std::endl;
}

void test_invalid_input() {
    std::cout << "[Test] invalid input..." << std::endl;
    MemoryVectorIndex index;
    assert(index.query(kQuery, 3, IndexFilter{}).empty());
    assert(test::throws<std::invalid_argument>([&] { index.query(kQuery, 0, IndexFilter{}); }));

    index.upsert(make_chunk("a", 0, "v1", test::at_score(0.7)));
    assert(test::throws<IndexUnavailable>([&] { index.upsert(make_chunk("b", 0, "v1", {1.0f, 0.0f, 0.0f})); }));
    assert(test::throws<IndexUnavailable>([&] { index.query({1.0f, 0.0f, 0.0f}, 1, IndexFilter{}); }));
    assert(test::throws<std::invalid_argument>([&] { index.upsert(make_chunk("z", 0, "v1", {0.0f, 0.0f})); }));

    // A batch with one bad vector leaves the index untouched.
    const std::vector<IndexedChunk> batch = {
        make_chunk("c", 0, "v1", test::at_score(0.6)),
        make_chunk("c", 1, "v1", {1.0f, 0.0f, 0.0f}),
    };
    assert(test::throws<IndexUnavailable>([&] { index.upsert_batch(batch); }));
    assert(index.size() == 1);
    std::cout << "[PASS] invalid input" << std::endl;
}

void test_concurrent_readers_and_writers() {
    std::cout << "[Test] concurrent upserts and queries..." << std::endl;
    MemoryVectorIndex index(2);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&index, t] {
            for (int i = 0; i < 50; ++i) {
                index.upsert(make_chunk("doc" + std::to_string(t), i, "v1", test::at_score(0.5)));
                const auto hits = index.query(kQuery, 5, IndexFilter{});
                assert(!hits.empty());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(index.size() == 200);
    std::cout << "[PASS] concurrency" << std::endl;
}

}  // namespace

int main() {
    test_ranking_and_ties();
    test_version_filter_and_soft_delete();
    test_invalid_input();
    test_concurrent_readers_and_writers();
    std::cout << "[Test] VectorIndexTest completed." << std::endl;
    return 0;
}
