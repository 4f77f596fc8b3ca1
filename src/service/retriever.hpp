#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/answer.hpp"
#include "embedding/embedder.hpp"
#include "index/vector_index.hpp"

namespace verirag {

struct RetrieverOptions {
    int top_k = 8;
    double similarity_threshold = 0.6;
};

// Embeds the question, queries the index and keeps only passages that clear
// the similarity threshold. An empty result means "no evidence".
class Retriever {
public:
    Retriever(const Embedder& embedder, const VectorIndex& index, RetrieverOptions options = {});

    std::vector<RetrievedPassage> retrieve(const std::string& question,
                                           const std::optional<std::string>& version_filter) const;

    std::vector<RetrievedPassage> retrieve(const std::string& question,
                                           const std::optional<std::string>& version_filter,
                                           int top_k,
                                           double similarity_threshold) const;

    const RetrieverOptions& options() const { return options_; }

private:
    const Embedder& embedder_;
    const VectorIndex& index_;
    RetrieverOptions options_;
};

}  // namespace verirag
