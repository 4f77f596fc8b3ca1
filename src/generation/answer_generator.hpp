#pragma once

#include <string>
#include <vector>

#include "core/answer.hpp"
#include "generation/text_generator.hpp"

namespace verirag {

// Closed-context generation over retrieved passages. The returned text is
// untrusted until it has passed the citation validator.
class AnswerGenerator {
public:
    explicit AnswerGenerator(const TextGenerator& generator);

    std::string generate(const std::string& question,
                         QueryType type,
                         const std::vector<RetrievedPassage>& passages,
                         AnswerMode mode) const;

private:
    const TextGenerator& generator_;
};

}  // namespace verirag
