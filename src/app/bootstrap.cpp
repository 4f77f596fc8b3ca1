#include "app/bootstrap.hpp"

#include <chrono>

#include "db/memory_document_registry.hpp"
#include "db/pg_document_registry.hpp"
#include "embedding/openai_embedder.hpp"
#include "generation/chat_client.hpp"
#include "index/memory_vector_index.hpp"
#include "qdrant/qdrant_client.hpp"
#include "util/log.hpp"

namespace verirag {

std::unique_ptr<Application> bootstrap(const Config& config) {
    auto app = std::make_unique<Application>();
    app->embedder = std::make_unique<OpenAiEmbedder>(config);
    app->generator = std::make_unique<ChatClient>(config);

    if (config.vector_backend() == "memory") {
        app->index = std::make_unique<MemoryVectorIndex>(config.embedding_dimension());
    } else {
        app->index = std::make_unique<QdrantVectorIndex>(config.qdrant_url(),
                                                         config.qdrant_collection(),
                                                         config.embedding_dimension());
    }

    if (config.document_registry() == "memory") {
        app->registry =
            std::make_unique<MemoryDocumentRegistry>(std::chrono::seconds{config.ingest_processing_timeout_sec()});
    } else {
        auto registry = std::make_unique<PgDocumentRegistry>(
            config.pg_conninfo(), std::chrono::seconds{config.ingest_processing_timeout_sec()});
        registry->ensure_schema();
        app->registry = std::move(registry);
    }

    app->rag = std::make_unique<RagService>(*app->embedder, *app->generator, *app->index, *app->registry,
                                            make_rag_options(config));
    log::info("backends ready environment=" + config.environment() + " vector_backend=" +
              config.vector_backend() + " registry=" + config.document_registry() +
              " chat_model=" + config.chat_model());
    return app;
}

}  // namespace verirag
