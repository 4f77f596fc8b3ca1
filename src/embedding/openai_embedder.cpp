#include "embedding/openai_embedder.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "core/errors.hpp"
#include "net/http_client.hpp"

namespace verirag
{

    namespace
    {

        nlohmann::json build_request_body(const std::vector<std::string> &texts,
                                          const std::string &model,
                                          bool send_model)
        {
            nlohmann::json body;
            body["input"] = texts;
            if (send_model)
            {
                body["model"] = model;
            }
            return body;
        }

        std::vector<std::string> build_headers(const Config &config)
        {
            std::vector<std::string> headers{"Content-Type: application/json"};
            if (config.llm_api_key().empty())
            {
                return headers;
            }
            if (config.uses_azure())
            {
                headers.push_back("api-key: " + config.llm_api_key());
            }
            else
            {
                headers.push_back("Authorization: Bearer " + config.llm_api_key());
            }
            return headers;
        }

    } // namespace

    OpenAiEmbedder::OpenAiEmbedder(const Config &config)
        : url_(config.embedding_url()),
          headers_(build_headers(config)),
          model_(config.embedding_model()),
          send_model_(!config.uses_azure()),
          dimension_(config.embedding_dimension()),
          batch_size_(config.embedding_batch_size()),
          timeout_seconds_(config.llm_timeout_sec())
    {
        if (url_.empty())
        {
            throw EmbeddingUnavailable("embedding endpoint not configured: LLM_API_BASE");
        }
        if (config.uses_azure() && config.llm_api_key().empty())
        {
            throw EmbeddingUnavailable("missing LLM_API_KEY for Azure embedding deployment");
        }
    }

    std::vector<float> OpenAiEmbedder::embed(const std::string &text) const
    {
        auto vectors = embed_batch({text});
        return std::move(vectors.front());
    }

    std::vector<std::vector<float>> OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) const
    {
        std::vector<std::vector<float>> vectors;
        vectors.reserve(texts.size());
        for (std::size_t offset = 0; offset < texts.size(); offset += static_cast<std::size_t>(batch_size_))
        {
            const auto end = std::min(texts.size(), offset + static_cast<std::size_t>(batch_size_));
            const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(offset),
                                                 texts.begin() + static_cast<std::ptrdiff_t>(end));
            auto batch = request_batch(slice);
            for (auto &vector : batch)
            {
                vectors.push_back(std::move(vector));
            }
        }
        return vectors;
    }

    std::vector<std::vector<float>> OpenAiEmbedder::request_batch(const std::vector<std::string> &texts) const
    {
        for (const auto &text : texts)
        {
            if (text.empty())
            {
                throw EmbeddingUnavailable("refusing to embed empty text");
            }
        }

        const HttpRequest request{
            .method = "POST",
            .url = url_,
            .headers = headers_,
            .body = build_request_body(texts, model_, send_model_).dump(),
            .timeout_seconds = timeout_seconds_,
        };

        HttpResponse response;
        try
        {
            response = perform_http_request(request);
        }
        catch (const HttpTransportError &ex)
        {
            throw EmbeddingUnavailable(std::string{"embedding model unreachable: "} + ex.what());
        }

        if (response.status == 401 || response.status == 403)
        {
            throw EmbeddingUnavailable("embedding request unauthorized (status " + std::to_string(response.status) + ')');
        }
        if (response.status != 200)
        {
            throw EmbeddingUnavailable("embedding request failed with status " + std::to_string(response.status) +
                                       " body: " + body_preview(response.body));
        }

        std::vector<std::vector<float>> vectors(texts.size());
        try
        {
            const auto json = nlohmann::json::parse(response.body);
            if (!json.contains("data") || !json["data"].is_array() || json["data"].size() != texts.size())
            {
                throw EmbeddingUnavailable("embedding response has wrong number of vectors");
            }
            for (std::size_t i = 0; i < json["data"].size(); ++i)
            {
                const auto &item = json["data"][i];
                // Providers may reorder items; "index" is authoritative.
                const std::size_t slot = item.contains("index") ? item["index"].get<std::size_t>() : i;
                if (slot >= vectors.size() || !item.contains("embedding") || !item["embedding"].is_array())
                {
                    throw EmbeddingUnavailable("embedding response item malformed");
                }
                auto vector = item["embedding"].get<std::vector<float>>();
                if (vector.size() != static_cast<std::size_t>(dimension_))
                {
                    throw EmbeddingUnavailable("unexpected embedding dimension: " + std::to_string(vector.size()));
                }
                vectors[slot] = std::move(vector);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw EmbeddingUnavailable(std::string{"failed to parse embedding response: "} + ex.what());
        }

        for (const auto &vector : vectors)
        {
            if (vector.empty())
            {
                throw EmbeddingUnavailable("embedding response missing an index");
            }
        }
        return vectors;
    }

} // namespace verirag
