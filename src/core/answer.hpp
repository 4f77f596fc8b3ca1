#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verirag {

// The single literal signal of "no trustworthy answer".
inline constexpr std::string_view kRefusalText =
    "The knowledge base does not contain confirmed information to answer this question.";

enum class QueryType { Sales, Technical, General };
enum class AnswerMode { Brief, Standard, Deep };
enum class AnswerOutcome { Validated, NoEvidence, Unsupported };

const char* to_string(QueryType type);
const char* to_string(AnswerMode mode);
const char* to_string(AnswerOutcome outcome);

// Both throw InvalidRequest on unknown values. "detailed" maps to Deep.
QueryType parse_query_type(const std::string& value);
AnswerMode parse_answer_mode(const std::string& value);

struct Query {
    std::string question;
    QueryType type = QueryType::General;
    std::optional<std::string> version;
    AnswerMode mode = AnswerMode::Standard;
};

struct RetrievedPassage {
    std::string chunk_id;
    std::string document_id;
    std::string document_name;
    std::string version;
    int seq_no = 0;
    std::string text;
    double score = 0.0;
};

struct SourceCitation {
    int marker = 0;
    std::string document_name;
    std::string version;
    int seq_no = 0;
    std::string quote;
    double score = 0.0;
};

struct Answer {
    std::string text;
    double confidence = 0.0;
    std::vector<std::string> used_documents;
    bool refusal = true;
    std::vector<SourceCitation> sources;
    AnswerOutcome outcome = AnswerOutcome::NoEvidence;
};

Answer make_refusal(AnswerOutcome outcome);

}  // namespace verirag
