#pragma once

#include <string>
#include <vector>

namespace verirag {

// Produces fixed-dimension vectors for text. Implementations throw
// EmbeddingUnavailable instead of returning placeholder vectors.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text) const = 0;
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const = 0;
    virtual int dimension() const = 0;
};

}  // namespace verirag
