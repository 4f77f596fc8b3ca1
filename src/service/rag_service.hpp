#pragma once

#include <optional>
#include <string>

#include "config/config.hpp"
#include "core/answer.hpp"
#include "db/document_registry.hpp"
#include "embedding/embedder.hpp"
#include "generation/answer_generator.hpp"
#include "generation/text_generator.hpp"
#include "index/vector_index.hpp"
#include "service/answer_service.hpp"
#include "service/ingest_service.hpp"
#include "service/retriever.hpp"

namespace verirag {

struct RagOptions {
    ChunkerOptions chunker;
    RetrieverOptions retriever;
    AnswerServiceOptions answer;
};

RagOptions make_rag_options(const Config& config);

// Entry point shared by the CLI, the HTTP server and the ingest worker. The
// backends are owned by the caller and must outlive the service.
class RagService {
public:
    RagService(const Embedder& embedder,
               const TextGenerator& generator,
               VectorIndex& index,
               DocumentRegistry& registry,
               RagOptions options = {});

    int ingest(const std::string& document_id,
               const std::string& document_name,
               const std::string& version,
               const std::string& text);

    Answer ask(const std::string& question,
               QueryType type,
               const std::optional<std::string>& version = std::nullopt,
               AnswerMode mode = AnswerMode::Standard) const;
    Answer ask(const Query& query) const;

    bool soft_delete(const std::string& document_id);
    bool restore(const std::string& document_id);

private:
    Retriever retriever_;
    AnswerGenerator generator_;
    AnswerService answer_service_;
    IngestService ingest_service_;
};

}  // namespace verirag
