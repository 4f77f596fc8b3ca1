#include "db/pg_document_registry.hpp"

#include <utility>

#include "core/errors.hpp"

namespace verirag {

namespace {
constexpr const char* kStatusPending = "PENDING";
constexpr const char* kStatusError = "ERROR";
constexpr const char* kStatusProcessing = "PROCESSING";
constexpr const char* kStatusReady = "READY";

template <typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::failure& ex) {
        throw RegistryUnavailable(std::string{"postgres "} + operation + " failed: " + ex.what());
    }
}

}  // namespace

PgDocumentRegistry::PgDocumentRegistry(const std::string& conninfo, std::chrono::seconds processing_timeout)
    : processing_timeout_(processing_timeout) {
    guarded("connect", [&] {
        connection_.emplace(conninfo);
        if (!connection_->is_open()) {
            throw RegistryUnavailable("failed to open postgres connection");
        }
    });
}

void PgDocumentRegistry::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    guarded("ensure_schema", [&] {
        pqxx::work txn{*connection_};
        txn.exec(
            "CREATE TABLE IF NOT EXISTS kb_document ("
            "  document_id TEXT PRIMARY KEY,"
            "  document_name TEXT NOT NULL,"
            "  version TEXT NOT NULL,"
            "  uploaded_at TEXT NOT NULL,"
            "  deleted BOOLEAN NOT NULL DEFAULT FALSE,"
            "  status TEXT NOT NULL,"
            "  chunk_count INTEGER NOT NULL DEFAULT 0,"
            "  error_message TEXT,"
            "  updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()"
            ");");
        txn.commit();
    });
}

Document PgDocumentRegistry::register_document(const Document& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    return guarded("register_document", [&] {
        {
            pqxx::work txn{*connection_};
            txn.exec_params(
                "INSERT INTO kb_document (document_id, document_name, version, uploaded_at, deleted, status, chunk_count, error_message) "
                "VALUES ($1, $2, $3, $4, FALSE, $5, 0, NULL) "
                "ON CONFLICT (document_id) DO NOTHING;",
                document.id,
                document.name,
                document.version,
                document.uploaded_at,
                kStatusPending);
            txn.commit();
        }
        auto stored = find_locked(document.id);
        if (!stored) {
            throw RegistryUnavailable("document missing after insert: " + document.id);
        }
        return *stored;
    });
}

std::optional<Document> PgDocumentRegistry::find(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return guarded("find", [&] { return find_locked(document_id); });
}

std::optional<Document> PgDocumentRegistry::find_locked(const std::string& document_id) {
    pqxx::read_transaction txn{*connection_};
    const auto result = txn.exec_params(
        "SELECT document_id, document_name, version, uploaded_at, deleted, status, chunk_count, COALESCE(error_message, '') "
        "FROM kb_document "
        "WHERE document_id = $1;",
        document_id);
    txn.commit();
    if (result.empty()) {
        return std::nullopt;
    }
    const auto row = result[0];
    Document document;
    document.id = row[0].c_str();
    document.name = row[1].c_str();
    document.version = row[2].c_str();
    document.uploaded_at = row[3].c_str();
    document.deleted = row[4].as<bool>(false);
    document.status = parse_document_status(row[5].c_str());
    document.chunk_count = row[6].as<int>(0);
    document.error_message = row[7].c_str();
    return document;
}

bool PgDocumentRegistry::mark_processing(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return guarded("mark_processing", [&] {
        pqxx::work txn{*connection_};
        const auto result = txn.exec_params(
            "UPDATE kb_document "
            "SET status = $2, error_message = NULL, updated_at = NOW() "
            "WHERE document_id = $1 AND (status IN ($3, $4) OR "
            "  (status = $2 AND updated_at < NOW() - make_interval(secs => $5))) "
            "RETURNING document_id;",
            document_id,
            kStatusProcessing,
            kStatusPending,
            kStatusError,
            static_cast<double>(processing_timeout_.count()));
        const bool updated = !result.empty();
        txn.commit();
        return updated;
    });
}

void PgDocumentRegistry::mark_ready(const std::string& document_id, int chunk_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    guarded("mark_ready", [&] {
        pqxx::work txn{*connection_};
        txn.exec_params(
            "UPDATE kb_document "
            "SET status = $2, chunk_count = $3, error_message = NULL, updated_at = NOW() "
            "WHERE document_id = $1;",
            document_id,
            kStatusReady,
            chunk_count);
        txn.commit();
    });
}

void PgDocumentRegistry::mark_error(const std::string& document_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    guarded("mark_error", [&] {
        pqxx::work txn{*connection_};
        txn.exec_params(
            "UPDATE kb_document "
            "SET status = $2, error_message = $3, updated_at = NOW() "
            "WHERE document_id = $1;",
            document_id,
            kStatusError,
            message);
        txn.commit();
    });
}

bool PgDocumentRegistry::set_deleted(const std::string& document_id, bool deleted) {
    std::lock_guard<std::mutex> lock(mutex_);
    return guarded("set_deleted", [&] {
        pqxx::work txn{*connection_};
        const auto result = txn.exec_params(
            "UPDATE kb_document "
            "SET deleted = $2, updated_at = NOW() "
            "WHERE document_id = $1 "
            "RETURNING document_id;",
            document_id,
            deleted);
        const bool updated = !result.empty();
        txn.commit();
        return updated;
    });
}

}  // namespace verirag
