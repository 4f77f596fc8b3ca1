#include "config/config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "util/log.hpp"

namespace verirag
{
    namespace
    {

        std::string env_or_default(const char *name, const char *default_value)
        {
            if (const char *value = std::getenv(name); value && *value)
            {
                return value;
            }
            return default_value;
        }

        int env_int(const char *name, int default_value, int min_value)
        {
            const char *raw = std::getenv(name);
            if (!raw || !*raw)
            {
                return default_value;
            }
            std::size_t consumed = 0;
            int value = 0;
            try
            {
                value = std::stoi(raw, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error(std::string{"invalid integer for "} + name + ": " + raw);
            }
            if (consumed != std::string{raw}.size())
            {
                throw std::runtime_error(std::string{"invalid integer for "} + name + ": " + raw);
            }
            if (value < min_value)
            {
                throw std::runtime_error(std::string{name} + " must be >= " + std::to_string(min_value));
            }
            return value;
        }

        double env_double(const char *name, double default_value, double min_value, double max_value)
        {
            const char *raw = std::getenv(name);
            if (!raw || !*raw)
            {
                return default_value;
            }
            std::size_t consumed = 0;
            double value = 0.0;
            try
            {
                value = std::stod(raw, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error(std::string{"invalid number for "} + name + ": " + raw);
            }
            if (consumed != std::string{raw}.size())
            {
                throw std::runtime_error(std::string{"invalid number for "} + name + ": " + raw);
            }
            if (value < min_value || value > max_value)
            {
                std::ostringstream oss;
                oss << name << " must be within [" << min_value << ", " << max_value << "]";
                throw std::runtime_error(oss.str());
            }
            return value;
        }

        bool env_bool(const char *name, bool default_value)
        {
            const std::string value = env_or_default(name, "");
            if (value.empty())
            {
                return default_value;
            }
            if (value == "1" || value == "true" || value == "TRUE" || value == "yes")
            {
                return true;
            }
            if (value == "0" || value == "false" || value == "FALSE" || value == "no")
            {
                return false;
            }
            throw std::runtime_error(std::string{"invalid boolean for "} + name + ": " + value);
        }

        std::string env_choice(const char *name, const char *default_value, const char *first, const char *second)
        {
            std::string value = env_or_default(name, default_value);
            if (value != first && value != second)
            {
                throw std::runtime_error(std::string{name} + " must be one of: " + first + ", " + second);
            }
            return value;
        }

        std::string strip_trailing_slashes(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

    } // namespace

    Config Config::load()
    {
        Config config;
        config.environment_ = env_or_default("ENVIRONMENT", "local");
        try
        {
            config.log_level_ = log::parse_level(env_or_default("LOG_LEVEL", "info"));
        }
        catch (const std::invalid_argument &ex)
        {
            throw std::runtime_error(std::string{"LOG_LEVEL: "} + ex.what());
        }
        log::set_min_level(config.log_level_);

        config.pg_host_ = env_or_default("PGHOST", "postgres");
        config.pg_port_ = env_or_default("PGPORT", "5432");
        config.pg_database_ = env_or_default("PGDATABASE", "verirag");
        config.pg_user_ = env_or_default("PGUSER", "verirag");
        config.pg_password_ = env_or_default("PGPASSWORD", "verirag");

        config.llm_api_base_ = strip_trailing_slashes(env_or_default("LLM_API_BASE", "http://localhost:11434/v1"));
        config.llm_api_key_ = env_or_default("LLM_API_KEY", "");
        config.llm_api_version_ = env_or_default("LLM_API_VERSION", "");
        config.embedding_model_ = env_or_default("EMBEDDING_MODEL", "text-embedding-3-small");
        config.embedding_dimension_ = env_int("EMBEDDING_DIMENSION", 1536, 1);
        config.embedding_batch_size_ = env_int("EMBEDDING_BATCH_SIZE", 32, 1);
        config.chat_model_ = env_or_default("CHAT_MODEL", "gpt-4o-mini");
        config.chat_max_tokens_ = env_int("CHAT_MAX_TOKENS", 500, 1);
        config.llm_timeout_sec_ = env_int("LLM_TIMEOUT_SEC", 30, 1);

        config.vector_backend_ = env_choice("VECTOR_BACKEND", "qdrant", "qdrant", "memory");
        config.qdrant_url_ = strip_trailing_slashes(env_or_default("QDRANT_URL", "http://qdrant:6333"));
        config.qdrant_collection_ = env_or_default("QDRANT_COLLECTION", "knowledge_base");
        config.document_registry_ = env_choice("DOCUMENT_REGISTRY", "postgres", "postgres", "memory");
        config.ingest_processing_timeout_sec_ = env_int("INGEST_PROCESSING_TIMEOUT_SEC", 900, 1);

        config.chunk_size_words_ = env_int("CHUNK_SIZE_WORDS", 220, 1);
        config.chunk_overlap_ratio_ = env_double("CHUNK_OVERLAP_RATIO", 0.18, 0.0, 0.95);
        config.retrieval_top_k_ = env_int("RETRIEVAL_TOP_K", 8, 1);
        config.similarity_threshold_ = env_double("SIMILARITY_THRESHOLD", 0.6, 0.0, 1.0);
        config.max_sources_per_answer_ = env_int("MAX_SOURCES_PER_ANSWER", 3, 1);
        config.strict_citations_ = env_bool("STRICT_CITATIONS", false);

        config.kafka_brokers_ = env_or_default("KAFKA_BROKERS", "redpanda:9092");
        config.kafka_ingest_group_ = env_or_default("KAFKA_INGEST_GROUP", "verirag-ingest");
        config.minio_endpoint_ = env_or_default("MINIO_ENDPOINT", "http://minio:9000");
        config.minio_bucket_ = env_or_default("MINIO_BUCKET", "verirag-docs");
        config.minio_root_user_ = env_or_default("MINIO_ROOT_USER", "");
        config.minio_root_password_ = env_or_default("MINIO_ROOT_PASSWORD", "");

        config.http_host_ = env_or_default("HTTP_HOST", "0.0.0.0");
        config.http_port_ = env_int("HTTP_PORT", 8080, 1);

        log::info("config loaded environment=" + config.environment_ + " vector_backend=" + config.vector_backend_ +
                  " document_registry=" + config.document_registry_);
        return config;
    }

    std::string Config::pg_conninfo() const
    {
        std::ostringstream oss;
        oss << "host=" << pg_host_;
        oss << " port=" << pg_port_;
        oss << " dbname=" << pg_database_;
        oss << " user=" << pg_user_;
        oss << " password=" << pg_password_;
        return oss.str();
    }

    std::string Config::embedding_url() const
    {
        if (llm_api_base_.empty())
        {
            return "";
        }
        if (!uses_azure())
        {
            return llm_api_base_ + "/embeddings";
        }
        std::ostringstream oss;
        oss << llm_api_base_ << "/openai/deployments/" << embedding_model_ << "/embeddings?api-version="
            << llm_api_version_;
        return oss.str();
    }

    std::string Config::chat_url() const
    {
        if (llm_api_base_.empty())
        {
            return "";
        }
        if (!uses_azure())
        {
            return llm_api_base_ + "/chat/completions";
        }
        std::ostringstream oss;
        oss << llm_api_base_ << "/openai/deployments/" << chat_model_ << "/chat/completions?api-version="
            << llm_api_version_;
        return oss.str();
    }

} // namespace verirag
