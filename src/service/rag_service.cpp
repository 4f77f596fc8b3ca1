#include "service/rag_service.hpp"

namespace verirag {

RagOptions make_rag_options(const Config& config) {
    RagOptions options;
    options.chunker.chunk_size_words = static_cast<std::size_t>(config.chunk_size_words());
    options.chunker.overlap_ratio = config.chunk_overlap_ratio();
    options.retriever.top_k = config.retrieval_top_k();
    options.retriever.similarity_threshold = config.similarity_threshold();
    options.answer.max_sources_per_answer = config.max_sources_per_answer();
    options.answer.validator.strict = config.strict_citations();
    return options;
}

RagService::RagService(const Embedder& embedder,
                       const TextGenerator& generator,
                       VectorIndex& index,
                       DocumentRegistry& registry,
                       RagOptions options)
    : retriever_(embedder, index, options.retriever),
      generator_(generator),
      answer_service_(retriever_, generator_, options.answer),
      ingest_service_(registry, embedder, index, options.chunker) {}

int RagService::ingest(const std::string& document_id,
                       const std::string& document_name,
                       const std::string& version,
                       const std::string& text) {
    return ingest_service_.ingest(document_id, document_name, version, text);
}

Answer RagService::ask(const std::string& question,
                       QueryType type,
                       const std::optional<std::string>& version,
                       AnswerMode mode) const {
    return ask(Query{
        .question = question,
        .type = type,
        .version = version,
        .mode = mode,
    });
}

Answer RagService::ask(const Query& query) const {
    return answer_service_.ask(query);
}

bool RagService::soft_delete(const std::string& document_id) {
    return ingest_service_.soft_delete(document_id);
}

bool RagService::restore(const std::string& document_id) {
    return ingest_service_.restore(document_id);
}

}  // namespace verirag
