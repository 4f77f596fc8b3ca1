#pragma once

#include <string>

#include "service/rag_service.hpp"

namespace verirag {

// Blocks serving the internal JSON API. Returns non-zero when the listener
// cannot be started.
int run_http_server(RagService& rag, const std::string& host, int port);

}  // namespace verirag
