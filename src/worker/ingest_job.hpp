#pragma once

#include <exception>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "service/rag_service.hpp"
#include "storage/object_store.hpp"

namespace verirag {

inline constexpr std::string_view kIngestRequestTopic = "doc_ingest";
inline constexpr std::string_view kIngestResultTopic = "doc_ingest_result";
inline constexpr std::string_view kIngestFailedTopic = "doc_ingest_failed";

struct IngestRequest {
    std::string document_id;
    std::string document_name;
    std::string version;
    std::string object_key;
    std::string content_type;
    std::string trace_id;
};

// Throws InvalidRequest when the payload is not a valid ingest request.
IngestRequest parse_ingest_request(const std::string& payload);

// The message to publish for one handled ingest request.
struct IngestOutcome {
    bool success = false;
    std::string document_id;
    std::string topic;
    std::string code;
    nlohmann::json body;
};

// Handles one `doc_ingest` payload without touching Kafka. Every failure is
// turned into a `doc_ingest_failed` outcome.
class IngestJobHandler {
public:
    IngestJobHandler(RagService& rag, ObjectStore& store);

    IngestOutcome handle(const std::string& payload);

private:
    RagService& rag_;
    ObjectStore& store_;
};

// Maps an exception to the error code published on the failure topic.
std::string ingest_error_code(const std::exception& ex);

}  // namespace verirag
