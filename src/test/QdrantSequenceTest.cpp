#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "qdrant/qdrant_client.hpp"
#include "test_support.hpp"
#include "util/hash.hpp"

using namespace verirag;

namespace {

IndexedChunk chunk(const std::string& chunk_id) {
    IndexedChunk out;
    out.metadata.chunk_id = chunk_id;
    out.metadata.document_id = "doc-1";
    out.vector = {1.0f, 0.0f};
    return out;
}

void test_reupsert_keeps_sequence() {
    std::cout << "[Test] re-upserted chunk keeps its indexed_seq..." << std::endl;
    const std::map<std::uint64_t, std::uint64_t> stored = {{hash::stable_id("doc-1:0"), 17}};
    std::uint64_t counter = 100;
    const auto sequences = resolve_sequences({chunk("doc-1:0"), chunk("doc-1:1"), chunk("doc-1:2")}, stored,
                                             [&] { return ++counter; });

    assert((sequences == std::vector<std::uint64_t>{17, 101, 102}));
    std::cout << "[PASS] stable sequence" << std::endl;
}

void test_parse_stored_sequences() {
    std::cout << "[Test] retrieve response parsing..." << std::endl;
    const auto response = nlohmann::json::parse(R"({
        "result": [
            {"id": 11, "payload": {"indexed_seq": 5}},
            {"id": 12, "payload": {}},
            {"id": 13, "payload": {"indexed_seq": 9}}
        ],
        "status": "ok"
    })");
    const auto stored = parse_stored_sequences(response);
    assert(stored.size() == 2);
    assert(stored.at(11) == 5);
    assert(stored.at(13) == 9);

    assert(test::throws<IndexUnavailable>([] { parse_stored_sequences(nlohmann::json::object()); }));
    std::cout << "[PASS] retrieve parsing" << std::endl;
}

}  // namespace

int main() {
    test_reupsert_keeps_sequence();
    test_parse_stored_sequences();
    std::cout << "[Test] QdrantSequenceTest completed." << std::endl;
    return 0;
}
