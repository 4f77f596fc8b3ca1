#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "db/memory_document_registry.hpp"
#include "http/api_handlers.hpp"
#include "index/memory_vector_index.hpp"
#include "test_support.hpp"

using namespace verirag;

namespace {

const std::string kQuestion = "How long is the warranty?";
const std::string kText = "The warranty lasts two years.";

struct Fixture {
    Fixture() : rag(embedder, model, index, registry), handlers(rag) {
        embedder.set(kQuestion, {1.0f, 0.0f});
        embedder.set(kText, {1.0f, 0.0f});
        model.reply_with("The warranty lasts two years [S1].");
    }

    test::StubEmbedder embedder;
    test::StubGenerator model;
    MemoryVectorIndex index;
    MemoryDocumentRegistry registry;
    RagService rag;
    ApiHandlers handlers;
};

// Mirrors the server: exceptions become error responses.
template <typename Fn>
ApiResponse call(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& ex) {
        return error_response(ex);
    }
}

void test_ingest_and_ask() {
    std::cout << "[Test] ingest then ask over the JSON API..." << std::endl;
    Fixture fixture;
    const nlohmann::json ingest_body = {
        {"document_id", "doc-1"}, {"document_name", "Manual v1"}, {"version", "v1"}, {"text", kText}};
    const auto ingested = call([&] { return fixture.handlers.ingest(ingest_body.dump()); });
    assert(ingested.status == 200);
    assert(ingested.body["chunks_indexed"] == 1);
    assert(ingested.body["version"] == "v1");

    const nlohmann::json ask_body = {{"question", kQuestion}, {"type", "technical"}, {"mode", "detailed"}};
    const auto asked = call([&] { return fixture.handlers.ask(ask_body.dump()); });
    assert(asked.status == 200);
    assert(asked.body["refusal"] == false);
    assert(asked.body["answer"] == "The warranty lasts two years [S1].");
    assert(asked.body["used_documents"] == nlohmann::json::array({"Manual v1"}));
    assert(asked.body["sources"].size() == 1);
    assert(asked.body["sources"][0]["marker"] == 1);
    assert(fixture.model.last_user_prompt().find("Response mode: deep") != std::string::npos);
    std::cout << "[PASS] ingest and ask" << std::endl;
}

void test_refusal_shape() {
    std::cout << "[Test] refusal response..." << std::endl;
    Fixture fixture;
    const auto asked = call([&] { return fixture.handlers.ask(R"({"question":"How long is the warranty?"})"); });
    assert(asked.status == 200);
    assert(asked.body["refusal"] == true);
    assert(asked.body["answer"] == std::string{kRefusalText});
    assert(asked.body["confidence"] == 0.0);
    assert(asked.body["used_documents"].empty());
    assert(asked.body["sources"].empty());
    std::cout << "[PASS] refusal response" << std::endl;
}

void test_error_mapping() {
    std::cout << "[Test] error mapping..." << std::endl;
    Fixture fixture;
    auto response = call([&] { return fixture.handlers.ask("{not json"); });
    assert(response.status == 400);
    assert(response.body["error"]["code"] == "INVALID_REQUEST");

    response = call([&] { return fixture.handlers.ask(R"({"type":"sales"})"); });
    assert(response.status == 400);

    response = call([&] { return fixture.handlers.ask(R"({"question":"q","version":"v1;drop"})"); });
    assert(response.status == 400);
    assert(response.body["error"]["code"] == "INVALID_VERSION");

    response = call([&] { return fixture.handlers.ask(R"({"question":"q","mode":"verbose"})"); });
    assert(response.status == 400);

    fixture.embedder.fail_with("connect to embeddings endpoint failed: secret-host:443");
    response = call([&] { return fixture.handlers.ask(R"({"question":"q"})"); });
    assert(response.status == 503);
    assert(response.body["error"]["message"] == "service unavailable, try again");
    assert(response.body.dump().find("secret-host") == std::string::npos);
    std::cout << "[PASS] error mapping" << std::endl;
}

void test_soft_delete_endpoints() {
    std::cout << "[Test] soft delete endpoints..." << std::endl;
    Fixture fixture;
    fixture.rag.ingest("doc-1", "Manual v1", "v1", kText);

    auto response = call([&] { return fixture.handlers.soft_delete("doc-1"); });
    assert(response.status == 200);
    assert(response.body["deleted"] == true);
    assert(call([&] { return fixture.handlers.ask(R"({"question":"How long is the warranty?"})"); })
               .body["refusal"] == true);

    response = call([&] { return fixture.handlers.restore("doc-1"); });
    assert(response.status == 200);
    assert(response.body["deleted"] == false);

    response = call([&] { return fixture.handlers.soft_delete("missing"); });
    assert(response.status == 404);
    std::cout << "[PASS] soft delete endpoints" << std::endl;
}

}  // namespace

int main() {
    test_ingest_and_ask();
    test_refusal_shape();
    test_error_mapping();
    test_soft_delete_endpoints();
    std::cout << "[Test] ApiHandlersTest completed." << std::endl;
    return 0;
}
