#include "core/document.hpp"

#include <stdexcept>

namespace verirag {

const char* to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending:
            return "PENDING";
        case DocumentStatus::Processing:
            return "PROCESSING";
        case DocumentStatus::Ready:
            return "READY";
        case DocumentStatus::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

DocumentStatus parse_document_status(const std::string& value) {
    if (value == "PENDING") {
        return DocumentStatus::Pending;
    }
    if (value == "PROCESSING") {
        return DocumentStatus::Processing;
    }
    if (value == "READY") {
        return DocumentStatus::Ready;
    }
    if (value == "ERROR") {
        return DocumentStatus::Error;
    }
    throw std::runtime_error("unknown document status: " + value);
}

}  // namespace verirag
