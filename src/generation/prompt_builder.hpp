#pragma once

#include <string>
#include <vector>

#include "core/answer.hpp"

namespace verirag {

struct Prompt {
    std::string system;
    std::string user;
};

// Classifies the question for the prompt: practical, comparison, analytical or
// informational.
std::string detect_request_kind(const std::string& question);
// basic (<= 6 words), advanced (<= 16 words), expert otherwise.
std::string detect_complexity(const std::string& question);

std::string mode_guidance(AnswerMode mode);

// Context blocks are numbered from 1 in the order of `passages`; the number is
// the n of the [S<n>] marker the model must use.
std::string build_context_block(const std::vector<RetrievedPassage>& passages);

Prompt build_prompt(const std::string& question,
                    QueryType type,
                    const std::vector<RetrievedPassage>& passages,
                    AnswerMode mode);

}  // namespace verirag
