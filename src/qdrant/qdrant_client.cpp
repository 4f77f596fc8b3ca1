#include "qdrant/qdrant_client.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "core/errors.hpp"
#include "net/http_client.hpp"
#include "util/hash.hpp"
#include "util/log.hpp"

namespace verirag
{
    namespace
    {

        std::string ensure_no_trailing_slash(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        HttpResponse send(const HttpRequest &request, const char *operation)
        {
            try
            {
                return perform_http_request(request);
            }
            catch (const HttpTransportError &ex)
            {
                throw IndexUnavailable(std::string{"qdrant "} + operation + " unreachable: " + ex.what());
            }
        }

        HttpRequest json_request(const char *method, std::string url, const nlohmann::json &body, long timeout)
        {
            return HttpRequest{
                .method = method,
                .url = std::move(url),
                .headers = {"Content-Type: application/json"},
                .body = body.dump(),
                .timeout_seconds = timeout,
            };
        }

        nlohmann::json match(const char *key, const nlohmann::json &value)
        {
            return {{"key", key}, {"match", {{"value", value}}}};
        }

        template <typename T>
        T payload_field(const nlohmann::json &payload, const char *field)
        {
            if (!payload.contains(field))
            {
                throw IndexUnavailable(std::string{"qdrant payload missing "} + field);
            }
            return payload[field].get<T>();
        }

    } // namespace

    std::map<std::uint64_t, std::uint64_t> parse_stored_sequences(const nlohmann::json &response)
    {
        std::map<std::uint64_t, std::uint64_t> stored;
        if (!response.contains("result") || !response["result"].is_array())
        {
            throw IndexUnavailable("qdrant retrieve response missing result");
        }
        for (const auto &point : response["result"])
        {
            if (!point.contains("id") || !point.contains("payload") || !point["payload"].contains("indexed_seq"))
            {
                continue;
            }
            stored[point["id"].get<std::uint64_t>()] = point["payload"]["indexed_seq"].get<std::uint64_t>();
        }
        return stored;
    }

    std::vector<std::uint64_t> resolve_sequences(const std::vector<IndexedChunk> &chunks,
                                                 const std::map<std::uint64_t, std::uint64_t> &stored,
                                                 const std::function<std::uint64_t()> &next)
    {
        std::vector<std::uint64_t> sequences;
        sequences.reserve(chunks.size());
        for (const auto &chunk : chunks)
        {
            const auto it = stored.find(hash::stable_id(chunk.metadata.chunk_id));
            sequences.push_back(it != stored.end() ? it->second : next());
        }
        return sequences;
    }

    QdrantVectorIndex::QdrantVectorIndex(std::string base_url, std::string collection, int dimension, long timeout_seconds)
        : base_url_(ensure_no_trailing_slash(std::move(base_url))),
          collection_(std::move(collection)),
          dimension_(dimension),
          timeout_seconds_(timeout_seconds)
    {
        if (collection_.empty())
        {
            throw std::invalid_argument("qdrant collection name must not be empty");
        }
        if (dimension_ <= 0)
        {
            throw std::invalid_argument("qdrant collection dimension must be positive");
        }
    }

    std::string QdrantVectorIndex::collection_url() const
    {
        return base_url_ + "/collections/" + collection_;
    }

    std::uint64_t QdrantVectorIndex::next_sequence()
    {
        // Wall-clock seeded so that later processes keep ordering after earlier ones.
        const auto now = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
        std::uint64_t last = last_sequence_.load();
        std::uint64_t next = 0;
        do
        {
            next = std::max(last + 1, now);
        } while (!last_sequence_.compare_exchange_weak(last, next));
        return next;
    }

    void QdrantVectorIndex::ensure_collection()
    {
        std::lock_guard<std::mutex> lock(collection_mutex_);
        if (collection_ready_)
        {
            return;
        }

        const HttpRequest get_request{
            .method = "GET",
            .url = collection_url(),
            .headers = {},
            .body = {},
            .timeout_seconds = timeout_seconds_,
        };
        HttpResponse response = send(get_request, "collection check");
        if (response.status == 200)
        {
            collection_ready_ = true;
            return;
        }
        if (response.status != 404)
        {
            throw IndexUnavailable("qdrant collection check failed with status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }

        nlohmann::json body;
        body["vectors"] = {{"size", dimension_}, {"distance", "Cosine"}};
        response = send(json_request("PUT", collection_url(), body, timeout_seconds_), "create collection");
        if (response.status != 200)
        {
            throw IndexUnavailable("failed to create qdrant collection: status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }

        const std::vector<std::pair<const char *, const char *>> indexes = {
            {"document_id", "keyword"},
            {"version", "keyword"},
            {"is_active", "bool"},
        };
        for (const auto &[field, schema] : indexes)
        {
            const nlohmann::json index_body = {{"field_name", field}, {"field_schema", schema}};
            response = send(json_request("PUT", collection_url() + "/index?wait=true", index_body, timeout_seconds_),
                            "create payload index");
            if (response.status != 200)
            {
                throw IndexUnavailable("failed to create qdrant payload index " + std::string{field} + ": status " +
                                       std::to_string(response.status));
            }
        }
        log::info("qdrant collection created: " + collection_);
        collection_ready_ = true;
    }

    std::map<std::uint64_t, std::uint64_t> QdrantVectorIndex::stored_sequences(const std::vector<IndexedChunk> &chunks) const
    {
        nlohmann::json body;
        body["ids"] = nlohmann::json::array();
        for (const auto &chunk : chunks)
        {
            body["ids"].push_back(hash::stable_id(chunk.metadata.chunk_id));
        }
        body["with_payload"] = nlohmann::json::array({"indexed_seq"});
        body["with_vector"] = false;

        const auto response =
            send(json_request("POST", collection_url() + "/points", body, timeout_seconds_), "retrieve");
        if (response.status != 200)
        {
            throw IndexUnavailable("qdrant retrieve failed with status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }
        try
        {
            return parse_stored_sequences(nlohmann::json::parse(response.body));
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw IndexUnavailable(std::string{"failed to parse qdrant retrieve response: "} + ex.what());
        }
    }

    void QdrantVectorIndex::upsert(const IndexedChunk &chunk)
    {
        upsert_batch({chunk});
    }

    void QdrantVectorIndex::upsert_batch(const std::vector<IndexedChunk> &chunks)
    {
        if (chunks.empty())
        {
            return;
        }
        ensure_collection();

        const auto sequences = resolve_sequences(chunks, stored_sequences(chunks), [this]
                                                 { return next_sequence(); });

        nlohmann::json body;
        body["points"] = nlohmann::json::array();
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            const auto &chunk = chunks[i];
            if (chunk.vector.size() != static_cast<std::size_t>(dimension_))
            {
                throw IndexUnavailable("vector dimension " + std::to_string(chunk.vector.size()) +
                                       " does not match collection dimension " + std::to_string(dimension_));
            }
            const auto &meta = chunk.metadata;
            nlohmann::json point;
            point["id"] = hash::stable_id(meta.chunk_id);
            point["vector"] = chunk.vector;
            point["payload"] = {
                {"chunk_id", meta.chunk_id},
                {"document_id", meta.document_id},
                {"document_name", meta.document_name},
                {"version", meta.version},
                {"seq_no", meta.seq_no},
                {"content", meta.content},
                {"indexed_seq", sequences[i]},
                {"is_active", true},
            };
            body["points"].push_back(std::move(point));
        }

        // wait=true: the call returns only once the points are searchable.
        const auto response =
            send(json_request("PUT", collection_url() + "/points?wait=true", body, timeout_seconds_), "upsert");
        if (response.status != 200)
        {
            throw IndexUnavailable("qdrant upsert failed with status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }
    }

    std::vector<IndexHit> QdrantVectorIndex::query(const std::vector<float> &vector,
                                                   int top_k,
                                                   const IndexFilter &filter) const
    {
        if (top_k <= 0)
        {
            throw std::invalid_argument("qdrant search requires top_k > 0");
        }

        nlohmann::json must = nlohmann::json::array();
        must.push_back(match("is_active", true));
        if (filter.version)
        {
            must.push_back(match("version", *filter.version));
        }

        nlohmann::json body;
        body["vector"] = vector;
        body["limit"] = top_k;
        body["with_payload"] = true;
        body["filter"] = {{"must", must}};

        const auto response =
            send(json_request("POST", collection_url() + "/points/search", body, timeout_seconds_), "search");
        if (response.status == 404)
        {
            return {};
        }
        if (response.status != 200)
        {
            throw IndexUnavailable("qdrant search failed with status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }

        struct Ranked
        {
            IndexHit hit;
            std::uint64_t sequence = 0;
        };
        std::vector<Ranked> ranked;
        try
        {
            const auto json = nlohmann::json::parse(response.body);
            if (!json.contains("result") || !json["result"].is_array())
            {
                throw IndexUnavailable("qdrant search response missing result array");
            }
            for (const auto &item : json["result"])
            {
                if (!item.contains("payload") || !item["payload"].is_object())
                {
                    throw IndexUnavailable("qdrant search result missing payload");
                }
                const auto &payload = item["payload"];
                Ranked entry;
                entry.hit.score = std::clamp(payload_field<double>(item, "score"), 0.0, 1.0);
                entry.hit.metadata.chunk_id = payload_field<std::string>(payload, "chunk_id");
                entry.hit.metadata.document_id = payload_field<std::string>(payload, "document_id");
                entry.hit.metadata.document_name = payload_field<std::string>(payload, "document_name");
                entry.hit.metadata.version = payload_field<std::string>(payload, "version");
                entry.hit.metadata.seq_no = payload_field<int>(payload, "seq_no");
                entry.hit.metadata.content = payload_field<std::string>(payload, "content");
                entry.sequence = payload.value("indexed_seq", std::uint64_t{0});
                ranked.push_back(std::move(entry));
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw IndexUnavailable(std::string{"failed to parse qdrant search response: "} + ex.what());
        }

        // Qdrant does not promise an order for equal scores.
        std::sort(ranked.begin(), ranked.end(), [](const Ranked &a, const Ranked &b)
                  { return a.hit.score != b.hit.score ? a.hit.score > b.hit.score : a.sequence < b.sequence; });

        std::vector<IndexHit> hits;
        hits.reserve(ranked.size());
        for (auto &entry : ranked)
        {
            hits.push_back(std::move(entry.hit));
        }
        return hits;
    }

    void QdrantVectorIndex::set_active(const std::string &document_id, bool active)
    {
        nlohmann::json body;
        body["payload"] = {{"is_active", active}};
        body["filter"] = {{"must", nlohmann::json::array({match("document_id", document_id)})}};

        const auto response =
            send(json_request("POST", collection_url() + "/points/payload?wait=true", body, timeout_seconds_),
                 "set_payload");
        if (response.status == 404)
        {
            return;
        }
        if (response.status != 200)
        {
            throw IndexUnavailable("qdrant set_payload failed with status " + std::to_string(response.status) +
                                   " body: " + body_preview(response.body));
        }
    }

    void QdrantVectorIndex::mark_deleted(const std::string &document_id)
    {
        set_active(document_id, false);
    }

    void QdrantVectorIndex::restore(const std::string &document_id)
    {
        set_active(document_id, true);
    }

} // namespace verirag
