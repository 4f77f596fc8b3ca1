#include "generation/chat_client.hpp"

#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "core/errors.hpp"
#include "net/http_client.hpp"

namespace verirag {
namespace {

nlohmann::json build_chat_completions_body(const std::string& system_prompt,
                                           const std::string& user_prompt,
                                           const std::string& model,
                                           int max_tokens) {
    nlohmann::json body;
    body["model"] = model;
    body["temperature"] = 0.0;
    body["max_tokens"] = max_tokens;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", system_prompt}},
        {{"role", "user"}, {"content", user_prompt}},
    });
    return body;
}

std::string extract_chat_completions_text(const nlohmann::json& json) {
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw GenerationUnavailable("chat completions response missing choices");
    }
    const auto& choice = json["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw GenerationUnavailable("chat completions response missing message");
    }
    const auto& message = choice["message"];
    if (!message.contains("content")) {
        throw GenerationUnavailable("chat completions message missing content");
    }
    if (message["content"].is_array()) {
        std::string combined;
        for (const auto& part : message["content"]) {
            if (part.contains("text") && part["text"].is_string()) {
                if (!combined.empty()) {
                    combined.push_back('\n');
                }
                combined += part["text"].get<std::string>();
            }
        }
        return combined;
    }
    if (!message["content"].is_string()) {
        throw GenerationUnavailable("chat completions content not string");
    }
    return message["content"].get<std::string>();
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

ChatClient::ChatClient(const Config& config)
    : url_(config.chat_url()),
      headers_{"Content-Type: application/json"},
      model_(config.chat_model()),
      max_output_tokens_(config.chat_max_tokens()),
      timeout_seconds_(config.llm_timeout_sec()) {
    if (url_.empty()) {
        throw GenerationUnavailable("chat endpoint not configured: LLM_API_BASE");
    }
    if (config.uses_azure()) {
        if (config.llm_api_key().empty()) {
            throw GenerationUnavailable("missing LLM_API_KEY for Azure chat deployment");
        }
        headers_.push_back("api-key: " + config.llm_api_key());
    } else if (!config.llm_api_key().empty()) {
        headers_.push_back("Authorization: Bearer " + config.llm_api_key());
    }
}

std::string ChatClient::complete(const std::string& system_prompt,
                                 const std::string& user_prompt) const {
    const HttpRequest request{
        .method = "POST",
        .url = url_,
        .headers = headers_,
        .body = build_chat_completions_body(system_prompt, user_prompt, model_, max_output_tokens_).dump(),
        .timeout_seconds = timeout_seconds_,
    };

    HttpResponse response;
    try {
        response = perform_http_request(request);
    } catch (const HttpTransportError& ex) {
        if (ex.timed_out()) {
            throw GenerationUnavailable("chat completion timed out after " + std::to_string(timeout_seconds_) + "s");
        }
        throw GenerationUnavailable(std::string{"generation model unreachable: "} + ex.what());
    }

    if (response.status == 401 || response.status == 403) {
        throw GenerationUnavailable("chat completion unauthorized (status " + std::to_string(response.status) +
                                    ") body: " + body_preview(response.body));
    }
    if (response.status != 200) {
        throw GenerationUnavailable("chat completion failed with status " + std::to_string(response.status) +
                                    " body: " + body_preview(response.body));
    }

    std::string text;
    try {
        text = extract_chat_completions_text(nlohmann::json::parse(response.body));
    } catch (const nlohmann::json::exception& ex) {
        throw GenerationUnavailable(std::string{"failed to parse chat completion response: "} + ex.what());
    }
    if (is_blank(text)) {
        throw GenerationUnavailable("generation model returned empty content");
    }
    return text;
}

}  // namespace verirag
