#include "worker/ingest_job.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace verirag {
namespace {

constexpr std::string_view kSupportedContentType = "text/plain";
constexpr std::string_view kUnavailableMessage = "service unavailable, try again";

class InvalidJson : public InvalidRequest {
public:
    using InvalidRequest::InvalidRequest;
};

class UnsupportedContentType : public InvalidRequest {
public:
    using InvalidRequest::InvalidRequest;
};

template <typename T>
T require_field(const nlohmann::json& json, const char* field) {
    if (!json.contains(field)) {
        throw InvalidRequest(std::string{"missing field: "} + field);
    }
    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw InvalidRequest(std::string{"invalid field type: "} + field);
    }
}

std::string optional_field(const nlohmann::json& json, const char* field) {
    if (!json.contains(field) || json[field].is_null()) {
        return {};
    }
    if (!json[field].is_string()) {
        throw InvalidRequest(std::string{"invalid field type: "} + field);
    }
    return json[field].get<std::string>();
}

// "text/plain; charset=utf-8" counts as text/plain.
bool is_plain_text(std::string content_type) {
    std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto semicolon = content_type.find(';');
    if (semicolon != std::string::npos) {
        content_type.erase(semicolon);
    }
    while (!content_type.empty() && content_type.back() == ' ') {
        content_type.pop_back();
    }
    return content_type == kSupportedContentType;
}

}  // namespace

std::string ingest_error_code(const std::exception& ex) {
    if (dynamic_cast<const InvalidJson*>(&ex) != nullptr) {
        return "INVALID_JSON";
    }
    if (dynamic_cast<const UnsupportedContentType*>(&ex) != nullptr) {
        return "UNSUPPORTED_CONTENT_TYPE";
    }
    if (dynamic_cast<const InvalidVersionFilter*>(&ex) != nullptr) {
        return "INVALID_VERSION";
    }
    if (dynamic_cast<const InvalidRequest*>(&ex) != nullptr) {
        return "INVALID_REQUEST";
    }
    if (dynamic_cast<const EmbeddingUnavailable*>(&ex) != nullptr) {
        return "EMBEDDING_UNAVAILABLE";
    }
    if (dynamic_cast<const IndexUnavailable*>(&ex) != nullptr) {
        return "INDEX_UNAVAILABLE";
    }
    if (dynamic_cast<const RegistryUnavailable*>(&ex) != nullptr) {
        return "REGISTRY_UNAVAILABLE";
    }
    if (dynamic_cast<const StorageUnavailable*>(&ex) != nullptr) {
        return "STORAGE_UNAVAILABLE";
    }
    return "INTERNAL_ERROR";
}

IngestRequest parse_ingest_request(const std::string& payload) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        throw InvalidJson(std::string{"invalid JSON: "} + ex.what());
    }
    if (!json.is_object()) {
        throw InvalidJson("ingest request must be a JSON object");
    }

    IngestRequest request;
    request.document_id = require_field<std::string>(json, "document_id");
    request.version = require_field<std::string>(json, "version");
    request.object_key = require_field<std::string>(json, "object_key");
    request.document_name = optional_field(json, "document_name");
    request.content_type = optional_field(json, "content_type");
    request.trace_id = optional_field(json, "trace_id");
    return request;
}

IngestJobHandler::IngestJobHandler(RagService& rag, ObjectStore& store) : rag_(rag), store_(store) {}

IngestOutcome IngestJobHandler::handle(const std::string& payload) {
    IngestOutcome outcome;
    std::string trace_id;
    try {
        const IngestRequest request = parse_ingest_request(payload);
        outcome.document_id = request.document_id;
        trace_id = request.trace_id;

        if (!is_plain_text(request.content_type)) {
            throw UnsupportedContentType("unsupported content_type: " + request.content_type);
        }
        const std::string text = store_.fetch_text(request.object_key);
        const int chunks = rag_.ingest(request.document_id, request.document_name, request.version, text);

        outcome.success = true;
        outcome.topic = std::string{kIngestResultTopic};
        outcome.code = "OK";
        outcome.body = {
            {"document_id", request.document_id},
            {"trace_id", request.trace_id},
            {"status", "OK"},
            {"chunks_indexed", chunks},
        };
    } catch (const std::exception& ex) {
        outcome.success = false;
        outcome.topic = std::string{kIngestFailedTopic};
        outcome.code = ingest_error_code(ex);
        const std::string message = is_infrastructure_error(ex) ? std::string{kUnavailableMessage} : ex.what();
        log::error("ingest failed document_id=" + outcome.document_id + " code=" + outcome.code + ": " + ex.what());
        outcome.body = {
            {"document_id", outcome.document_id},
            {"trace_id", trace_id},
            {"error", {{"code", outcome.code}, {"message", message}}},
        };
    }
    return outcome;
}

}  // namespace verirag
