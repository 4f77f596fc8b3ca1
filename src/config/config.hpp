#pragma once

#include <string>

#include "util/log.hpp"

namespace verirag {

class Config {
public:
    // Reads every setting from the environment, falling back to defaults.
    // Throws std::runtime_error naming the variable when a value is malformed.
    static Config load();

    const std::string& environment() const noexcept { return environment_; }
    log::Level log_level() const noexcept { return log_level_; }

    const std::string& pg_host() const noexcept { return pg_host_; }
    const std::string& pg_port() const noexcept { return pg_port_; }
    const std::string& pg_database() const noexcept { return pg_database_; }
    const std::string& pg_user() const noexcept { return pg_user_; }
    const std::string& pg_password() const noexcept { return pg_password_; }

    const std::string& llm_api_base() const noexcept { return llm_api_base_; }
    const std::string& llm_api_key() const noexcept { return llm_api_key_; }
    const std::string& llm_api_version() const noexcept { return llm_api_version_; }
    const std::string& embedding_model() const noexcept { return embedding_model_; }
    int embedding_dimension() const noexcept { return embedding_dimension_; }
    int embedding_batch_size() const noexcept { return embedding_batch_size_; }
    const std::string& chat_model() const noexcept { return chat_model_; }
    int chat_max_tokens() const noexcept { return chat_max_tokens_; }
    int llm_timeout_sec() const noexcept { return llm_timeout_sec_; }

    const std::string& vector_backend() const noexcept { return vector_backend_; }
    const std::string& qdrant_url() const noexcept { return qdrant_url_; }
    const std::string& qdrant_collection() const noexcept { return qdrant_collection_; }
    const std::string& document_registry() const noexcept { return document_registry_; }
    // A PROCESSING document older than this may be claimed by a new ingest.
    int ingest_processing_timeout_sec() const noexcept { return ingest_processing_timeout_sec_; }

    int chunk_size_words() const noexcept { return chunk_size_words_; }
    double chunk_overlap_ratio() const noexcept { return chunk_overlap_ratio_; }
    int retrieval_top_k() const noexcept { return retrieval_top_k_; }
    double similarity_threshold() const noexcept { return similarity_threshold_; }
    int max_sources_per_answer() const noexcept { return max_sources_per_answer_; }
    bool strict_citations() const noexcept { return strict_citations_; }

    const std::string& kafka_brokers() const noexcept { return kafka_brokers_; }
    const std::string& kafka_ingest_group() const noexcept { return kafka_ingest_group_; }
    const std::string& minio_endpoint() const noexcept { return minio_endpoint_; }
    const std::string& minio_bucket() const noexcept { return minio_bucket_; }
    const std::string& minio_root_user() const noexcept { return minio_root_user_; }
    const std::string& minio_root_password() const noexcept { return minio_root_password_; }

    const std::string& http_host() const noexcept { return http_host_; }
    int http_port() const noexcept { return http_port_; }

    // Returns libpq-compatible connection information string.
    std::string pg_conninfo() const;

    // Azure OpenAI is selected when LLM_API_VERSION is set; otherwise the
    // base URL is treated as an OpenAI-compatible /v1 root.
    bool uses_azure() const noexcept { return !llm_api_version_.empty(); }
    std::string embedding_url() const;
    std::string chat_url() const;

private:
    Config() = default;

    std::string environment_;
    std::string pg_host_;
    std::string pg_port_;
    std::string pg_database_;
    std::string pg_user_;
    std::string pg_password_;
    std::string llm_api_base_;
    std::string llm_api_key_;
    std::string llm_api_version_;
    std::string embedding_model_;
    int embedding_dimension_ = 0;
    int embedding_batch_size_ = 0;
    std::string chat_model_;
    int chat_max_tokens_ = 0;
    int llm_timeout_sec_ = 0;
    std::string vector_backend_;
    log::Level log_level_ = log::Level::Info;
    std::string qdrant_url_;
    std::string qdrant_collection_;
    std::string document_registry_;
    int ingest_processing_timeout_sec_ = 0;
    int chunk_size_words_ = 0;
    double chunk_overlap_ratio_ = 0.0;
    int retrieval_top_k_ = 0;
    double similarity_threshold_ = 0.0;
    int max_sources_per_answer_ = 0;
    bool strict_citations_ = false;
    std::string kafka_brokers_;
    std::string kafka_ingest_group_;
    std::string minio_endpoint_;
    std::string minio_bucket_;
    std::string minio_root_user_;
    std::string minio_root_password_;
    std::string http_host_;
    int http_port_ = 0;
};

}  // namespace verirag
