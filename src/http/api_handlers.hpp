#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "service/rag_service.hpp"

namespace verirag {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// JSON endpoint logic, independent of the HTTP library. Invalid input maps
// to 400, infrastructure failures to 503 with a generic message.
class ApiHandlers {
public:
    explicit ApiHandlers(RagService& rag);

    ApiResponse ask(const std::string& request_body) const;
    ApiResponse ingest(const std::string& request_body) const;
    ApiResponse soft_delete(const std::string& document_id) const;
    ApiResponse restore(const std::string& document_id) const;

private:
    RagService& rag_;
};

nlohmann::json answer_to_json(const Answer& answer);

ApiResponse error_response(const std::exception& ex);

}  // namespace verirag
