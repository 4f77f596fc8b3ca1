#pragma once

#include <string>
#include <vector>

#include "embedding/embedder.hpp"

namespace verirag
{

    class Config;

    // Embedding gateway over the OpenAI /embeddings REST contract (plain or
    // Azure deployment URLs). One instance is created at startup and shared.
    class OpenAiEmbedder final : public Embedder
    {
    public:
        explicit OpenAiEmbedder(const Config &config);

        std::vector<float> embed(const std::string &text) const override;
        std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) const override;
        int dimension() const override { return dimension_; }

    private:
        std::vector<std::vector<float>> request_batch(const std::vector<std::string> &texts) const;

        std::string url_;
        std::vector<std::string> headers_;
        std::string model_;
        bool send_model_;
        int dimension_;
        int batch_size_;
        long timeout_seconds_;
    };

} // namespace verirag
