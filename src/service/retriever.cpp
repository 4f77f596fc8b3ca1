#include "service/retriever.hpp"

#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "core/version_label.hpp"
#include "util/log.hpp"

namespace verirag {

Retriever::Retriever(const Embedder& embedder, const VectorIndex& index, RetrieverOptions options)
    : embedder_(embedder),
      index_(index),
      options_(options) {
    if (options_.top_k <= 0) {
        throw std::invalid_argument("retriever top_k must be positive");
    }
    if (options_.similarity_threshold < 0.0 || options_.similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity threshold must be within [0, 1]");
    }
}

std::vector<RetrievedPassage> Retriever::retrieve(const std::string& question,
                                                  const std::optional<std::string>& version_filter) const {
    return retrieve(question, version_filter, options_.top_k, options_.similarity_threshold);
}

std::vector<RetrievedPassage> Retriever::retrieve(const std::string& question,
                                                  const std::optional<std::string>& version_filter,
                                                  int top_k,
                                                  double similarity_threshold) const {
    if (question.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InvalidRequest("question must not be empty");
    }
    if (top_k <= 0) {
        throw std::invalid_argument("top_k must be positive");
    }

    // Validated before any model call.
    IndexFilter filter{normalize_version_filter(version_filter)};

    const auto embedding = embedder_.embed(question);
    const auto hits = index_.query(embedding, top_k, filter);

    std::vector<RetrievedPassage> passages;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& hit : hits) {
        if (hit.score < similarity_threshold) {
            continue;
        }
        const auto& meta = hit.metadata;
        if (!seen.emplace(meta.document_id, meta.content).second) {
            continue;
        }
        passages.push_back(RetrievedPassage{
            .chunk_id = meta.chunk_id,
            .document_id = meta.document_id,
            .document_name = meta.document_name,
            .version = meta.version,
            .seq_no = meta.seq_no,
            .text = meta.content,
            .score = hit.score,
        });
    }

    if (log::enabled(log::Level::Debug)) {
        std::ostringstream oss;
        oss << "retrieve hits=" << hits.size() << " kept=" << passages.size() << " top_k=" << top_k
            << " threshold=" << similarity_threshold << " version=" << filter.version.value_or("*");
        log::debug(oss.str());
    }
    return passages;
}

}  // namespace verirag
