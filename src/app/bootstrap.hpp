#pragma once

#include <memory>

#include "config/config.hpp"
#include "db/document_registry.hpp"
#include "embedding/embedder.hpp"
#include "generation/text_generator.hpp"
#include "index/vector_index.hpp"
#include "service/rag_service.hpp"

namespace verirag {

// Process-wide backends built once from Config and shared by every entry
// point. Members are declared in dependency order so that the service is
// destroyed before the backends it references.
struct Application {
    std::unique_ptr<Embedder> embedder;
    std::unique_ptr<TextGenerator> generator;
    std::unique_ptr<VectorIndex> index;
    std::unique_ptr<DocumentRegistry> registry;
    std::unique_ptr<RagService> rag;
};

// Throws when a backend cannot be created (bad configuration, unreachable
// PostgreSQL).
std::unique_ptr<Application> bootstrap(const Config& config);

}  // namespace verirag
