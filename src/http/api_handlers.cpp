#include "http/api_handlers.hpp"

#include <optional>

#include "core/errors.hpp"

namespace verirag
{
    namespace
    {

        constexpr const char *kUnavailableMessage = "service unavailable, try again";

        nlohmann::json error_body(const std::string &code, const std::string &message)
        {
            return {{"error", {{"code", code}, {"message", message}}}};
        }

        nlohmann::json parse_object(const std::string &body)
        {
            nlohmann::json json;
            try
            {
                json = nlohmann::json::parse(body);
            }
            catch (const nlohmann::json::parse_error &ex)
            {
                throw InvalidRequest(std::string{"invalid JSON: "} + ex.what());
            }
            if (!json.is_object())
            {
                throw InvalidRequest("request body must be a JSON object");
            }
            return json;
        }

        template <typename T>
        T require_field(const nlohmann::json &json, const char *field)
        {
            if (!json.contains(field))
            {
                throw InvalidRequest(std::string{"missing field: "} + field);
            }
            try
            {
                return json.at(field).get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                throw InvalidRequest(std::string{"invalid field type: "} + field);
            }
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *field)
        {
            if (!json.contains(field) || json[field].is_null())
            {
                return std::nullopt;
            }
            if (!json[field].is_string())
            {
                throw InvalidRequest(std::string{"invalid field type: "} + field);
            }
            return json[field].get<std::string>();
        }

        ApiResponse document_flag(const std::string &document_id, bool found, bool deleted)
        {
            if (!found)
            {
                return ApiResponse{404, error_body("DOCUMENT_NOT_FOUND", "unknown document: " + document_id)};
            }
            return ApiResponse{200, {{"document_id", document_id}, {"deleted", deleted}}};
        }

    } // namespace

    nlohmann::json answer_to_json(const Answer &answer)
    {
        nlohmann::json sources = nlohmann::json::array();
        for (const auto &source : answer.sources)
        {
            sources.push_back({
                {"marker", source.marker},
                {"document_name", source.document_name},
                {"version", source.version},
                {"seq_no", source.seq_no},
                {"quote", source.quote},
                {"score", source.score},
            });
        }
        return {
            {"answer", answer.text},
            {"confidence", answer.confidence},
            {"used_documents", answer.used_documents},
            {"refusal", answer.refusal},
            {"sources", sources},
        };
    }

    ApiResponse error_response(const std::exception &ex)
    {
        if (is_infrastructure_error(ex))
        {
            return ApiResponse{503, error_body("SERVICE_UNAVAILABLE", kUnavailableMessage)};
        }
        if (dynamic_cast<const InvalidVersionFilter *>(&ex) != nullptr)
        {
            return ApiResponse{400, error_body("INVALID_VERSION", ex.what())};
        }
        if (dynamic_cast<const InvalidRequest *>(&ex) != nullptr)
        {
            return ApiResponse{400, error_body("INVALID_REQUEST", ex.what())};
        }
        return ApiResponse{500, error_body("INTERNAL_ERROR", "internal server error")};
    }

    ApiHandlers::ApiHandlers(RagService &rag) : rag_(rag) {}

    ApiResponse ApiHandlers::ask(const std::string &request_body) const
    {
        const auto json = parse_object(request_body);
        Query query;
        query.question = require_field<std::string>(json, "question");
        query.type = parse_query_type(optional_string(json, "type").value_or(""));
        query.version = optional_string(json, "version");
        query.mode = parse_answer_mode(optional_string(json, "mode").value_or(""));
        return ApiResponse{200, answer_to_json(rag_.ask(query))};
    }

    ApiResponse ApiHandlers::ingest(const std::string &request_body) const
    {
        const auto json = parse_object(request_body);
        const auto document_id = require_field<std::string>(json, "document_id");
        const auto version = require_field<std::string>(json, "version");
        const auto text = require_field<std::string>(json, "text");
        const auto name = optional_string(json, "document_name").value_or(document_id);

        const int chunks = rag_.ingest(document_id, name, version, text);
        return ApiResponse{200, {{"document_id", document_id}, {"version", version}, {"chunks_indexed", chunks}}};
    }

    ApiResponse ApiHandlers::soft_delete(const std::string &document_id) const
    {
        return document_flag(document_id, rag_.soft_delete(document_id), true);
    }

    ApiResponse ApiHandlers::restore(const std::string &document_id) const
    {
        return document_flag(document_id, rag_.restore(document_id), false);
    }

} // namespace verirag
