#pragma once

#include <string>
#include <vector>

#include "generation/text_generator.hpp"

namespace verirag {

class Config;

// Chat-completions client (OpenAI-compatible or Azure deployment). The call is
// bounded by LLM_TIMEOUT_SEC; expiry surfaces as GenerationUnavailable.
class ChatClient final : public TextGenerator {
public:
    explicit ChatClient(const Config& config);

    std::string complete(const std::string& system_prompt,
                         const std::string& user_prompt) const override;

private:
    std::string url_;
    std::vector<std::string> headers_;
    std::string model_;
    int max_output_tokens_;
    long timeout_seconds_;
};

}  // namespace verirag
