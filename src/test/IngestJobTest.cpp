#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "db/memory_document_registry.hpp"
#include "index/memory_vector_index.hpp"
#include "test_support.hpp"
#include "worker/ingest_job.hpp"

using namespace verirag;

namespace {

class StubObjectStore final : public ObjectStore {
public:
    void put(const std::string& key, const std::string& text) { objects_[key] = text; }
    void go_offline() { offline_ = true; }

    std::string fetch_text(const std::string& object_key) override {
        if (offline_) {
            throw StorageUnavailable("minio unreachable");
        }
        const auto it = objects_.find(object_key);
        if (it == objects_.end()) {
            throw InvalidRequest("no such object: " + object_key);
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> objects_;
    bool offline_ = false;
};

struct Fixture {
    Fixture() : rag(embedder, model, index, registry), handler(rag, store) {
        store.put("docs/manual.txt", "The warranty lasts two years.");
    }

    test::StubEmbedder embedder;
    test::StubGenerator model;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    StubObjectStore store;
    RagService rag;
    IngestJobHandler handler;
};

std::string request(const std::string& content_type, const std::string& object_key = "docs/manual.txt") {
    return nlohmann::json{
        {"document_id", "doc-1"},
        {"document_name", "Manual v1"},
        {"version", "v1"},
        {"object_key", object_key},
        {"content_type", content_type},
        {"trace_id", "trace-42"},
    }
        .dump();
}

void test_successful_ingest() {
    std::cout << "[Test] doc_ingest success..." << std::endl;
    Fixture fixture;
    const auto outcome = fixture.handler.handle(request("text/plain; charset=utf-8"));
    assert(outcome.success);
    assert(outcome.topic == kIngestResultTopic);
    assert(outcome.body["status"] == "OK");
    assert(outcome.body["chunks_indexed"] == 1);
    assert(outcome.body["trace_id"] == "trace-42");
    assert(fixture.index.size() == 1);
    assert(fixture.registry.find("doc-1")->status == DocumentStatus::Ready);
    std::cout << "[PASS] success" << std::endl;
}

void test_failures_are_published() {
    std::cout << "[Test] doc_ingest failures..." << std::endl;
    Fixture fixture;

    auto outcome = fixture.handler.handle("{broken");
    assert(!outcome.success);
    assert(outcome.topic == kIngestFailedTopic);
    assert(outcome.code == "INVALID_JSON");

    outcome = fixture.handler.handle(R"({"document_id":"doc-1"})");
    assert(outcome.code == "INVALID_REQUEST");
    assert(outcome.body["document_id"] == "");

    outcome = fixture.handler.handle(request("application/pdf"));
    assert(outcome.code == "UNSUPPORTED_CONTENT_TYPE");
    assert(outcome.body["document_id"] == "doc-1");
    assert(outcome.body["trace_id"] == "trace-42");

    outcome = fixture.handler.handle(request("text/plain", "docs/missing.txt"));
    assert(outcome.code == "INVALID_REQUEST");

    fixture.store.go_offline();
    outcome = fixture.handler.handle(request("text/plain"));
    assert(outcome.code == "STORAGE_UNAVAILABLE");
    assert(outcome.body["error"]["message"] == "service unavailable, try again");
    assert(fixture.index.size() == 0);
    std::cout << "[PASS] failures" << std::endl;
}

void test_embedding_outage_is_reported() {
    std::cout << "[Test] embedding outage..." << std::endl;
    Fixture fixture;
    fixture.embedder.fail_with("embeddings returned 503");
    const auto outcome = fixture.handler.handle(request("text/plain"));
    assert(!outcome.success);
    assert(outcome.code == "EMBEDDING_UNAVAILABLE");
    assert(fixture.registry.find("doc-1")->status == DocumentStatus::Error);
    std::cout << "[PASS] embedding outage" << std::endl;
}

}  // namespace

int main() {
    test_successful_ingest();
    test_failures_are_published();
    test_embedding_outage_is_reported();
    std::cout << "[Test] IngestJobTest completed." << std::endl;
    return 0;
}
