#pragma once

#include <string>
#include <vector>

#include "citation/citation_validator.hpp"
#include "core/answer.hpp"
#include "generation/answer_generator.hpp"
#include "service/retriever.hpp"

namespace verirag {

struct AnswerServiceOptions {
    int max_sources_per_answer = 3;
    ValidatorOptions validator;
};

// Retrieval, generation and validation for a single question. Infrastructure
// failures propagate; "no evidence" and "unsupported" resolve to the refusal.
class AnswerService {
public:
    AnswerService(const Retriever& retriever, const AnswerGenerator& generator, AnswerServiceOptions options = {});

    Answer ask(const Query& query) const;

private:
    std::vector<SourceCitation> build_sources(const ValidationResult& validation,
                                              const std::vector<RetrievedPassage>& passages) const;

    const Retriever& retriever_;
    const AnswerGenerator& generator_;
    CitationValidator validator_;
    AnswerServiceOptions options_;
};

// Whitespace-collapsed passage text cut to at most `limit` bytes.
std::string compact_quote(const std::string& text, std::size_t limit = 240);

}  // namespace verirag
