#include "core/answer.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors.hpp"

namespace verirag {
namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

const char* to_string(QueryType type) {
    switch (type) {
        case QueryType::Sales:
            return "sales";
        case QueryType::Technical:
            return "technical";
        case QueryType::General:
            return "general";
    }
    return "general";
}

const char* to_string(AnswerMode mode) {
    switch (mode) {
        case AnswerMode::Brief:
            return "brief";
        case AnswerMode::Standard:
            return "standard";
        case AnswerMode::Deep:
            return "deep";
    }
    return "standard";
}

const char* to_string(AnswerOutcome outcome) {
    switch (outcome) {
        case AnswerOutcome::Validated:
            return "validated";
        case AnswerOutcome::NoEvidence:
            return "no_evidence";
        case AnswerOutcome::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

QueryType parse_query_type(const std::string& value) {
    const std::string key = lowercase(value);
    if (key == "sales") {
        return QueryType::Sales;
    }
    if (key == "technical") {
        return QueryType::Technical;
    }
    if (key.empty() || key == "general") {
        return QueryType::General;
    }
    throw InvalidRequest("unknown query type: " + value);
}

AnswerMode parse_answer_mode(const std::string& value) {
    const std::string key = lowercase(value);
    if (key == "brief") {
        return AnswerMode::Brief;
    }
    if (key.empty() || key == "standard") {
        return AnswerMode::Standard;
    }
    if (key == "deep" || key == "detailed") {
        return AnswerMode::Deep;
    }
    throw InvalidRequest("unknown response mode: " + value);
}

Answer make_refusal(AnswerOutcome outcome) {
    Answer answer;
    answer.text = std::string{kRefusalText};
    answer.confidence = 0.0;
    answer.refusal = true;
    answer.outcome = outcome;
    return answer;
}

}  // namespace verirag
