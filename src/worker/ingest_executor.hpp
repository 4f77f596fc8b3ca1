#pragma once

#include "config/config.hpp"
#include "service/rag_service.hpp"
#include "storage/object_store.hpp"

namespace verirag {

// Consumes `doc_ingest` until the process is stopped. Returns a non-zero exit
// code when the Kafka clients cannot be created or consumption fails.
int run_ingest_executor(const Config& config, RagService& rag, ObjectStore& store);

}  // namespace verirag
