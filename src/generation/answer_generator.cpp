#include "generation/answer_generator.hpp"

#include <stdexcept>

#include "core/errors.hpp"
#include "generation/prompt_builder.hpp"

namespace verirag {

AnswerGenerator::AnswerGenerator(const TextGenerator& generator) : generator_(generator) {}

std::string AnswerGenerator::generate(const std::string& question,
                                      QueryType type,
                                      const std::vector<RetrievedPassage>& passages,
                                      AnswerMode mode) const {
    if (passages.empty()) {
        throw std::invalid_argument("generation requires at least one passage");
    }
    const Prompt prompt = build_prompt(question, type, passages, mode);
    std::string text = generator_.complete(prompt.system, prompt.user);
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw GenerationUnavailable("model returned empty content");
    }
    return text;
}

}  // namespace verirag
