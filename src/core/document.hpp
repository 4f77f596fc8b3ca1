#pragma once

#include <string>

namespace verirag {

enum class DocumentStatus { Pending, Processing, Ready, Error };

const char* to_string(DocumentStatus status);
DocumentStatus parse_document_status(const std::string& value);

struct Document {
    std::string id;
    std::string name;
    std::string version;
    std::string uploaded_at;
    bool deleted = false;
    DocumentStatus status = DocumentStatus::Pending;
    int chunk_count = 0;
    std::string error_message;
};

}  // namespace verirag
