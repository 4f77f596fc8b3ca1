#include "service/answer_service.hpp"

#include <chrono>
#include <sstream>

#include "util/log.hpp"
#include "util/time.hpp"

namespace verirag {
namespace {

void log_completion(const Query& query, const Answer& answer, std::size_t passages, long long latency_ms) {
    std::ostringstream oss;
    oss << "ask_completed outcome=" << to_string(answer.outcome) << " type=" << to_string(query.type)
        << " mode=" << to_string(query.mode) << " version=" << query.version.value_or("*")
        << " passages=" << passages << " confidence=" << answer.confidence
        << " documents=" << answer.used_documents.size() << " latency_ms=" << latency_ms;
    log::info(oss.str());
}

}  // namespace

std::string compact_quote(const std::string& text, std::size_t limit) {
    std::string collapsed;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        if (!collapsed.empty()) {
            collapsed.push_back(' ');
        }
        collapsed += word;
    }
    if (collapsed.size() <= limit) {
        return collapsed;
    }

    constexpr std::string_view kEllipsis = "...";
    std::size_t cut = limit > kEllipsis.size() ? limit - kEllipsis.size() : 0;
    // Do not split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(collapsed[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    while (cut > 0 && collapsed[cut - 1] == ' ') {
        --cut;
    }
    return collapsed.substr(0, cut) + std::string{kEllipsis};
}

AnswerService::AnswerService(const Retriever& retriever, const AnswerGenerator& generator, AnswerServiceOptions options)
    : retriever_(retriever),
      generator_(generator),
      validator_(options.validator),
      options_(options) {}

Answer AnswerService::ask(const Query& query) const {
    const auto started = std::chrono::steady_clock::now();

    const auto passages = retriever_.retrieve(query.question, query.version);
    if (passages.empty()) {
        Answer refusal = make_refusal(AnswerOutcome::NoEvidence);
        log_completion(query, refusal, 0, time::elapsed_ms(started));
        return refusal;
    }

    const std::string raw = generator_.generate(query.question, query.type, passages, query.mode);
    const auto validation = validator_.validate(raw, passages);
    if (!validation.ok) {
        Answer refusal = make_refusal(AnswerOutcome::Unsupported);
        log_completion(query, refusal, passages.size(), time::elapsed_ms(started));
        return refusal;
    }

    Answer answer{
        .text = validation.clean_text,
        .confidence = validation.confidence,
        .used_documents = validation.used_documents,
        .refusal = false,
        .sources = build_sources(validation, passages),
        .outcome = AnswerOutcome::Validated,
    };
    log_completion(query, answer, passages.size(), time::elapsed_ms(started));
    return answer;
}

std::vector<SourceCitation> AnswerService::build_sources(const ValidationResult& validation,
                                                         const std::vector<RetrievedPassage>& passages) const {
    std::vector<SourceCitation> sources;
    for (const int marker : validation.cited_passages) {
        if (static_cast<int>(sources.size()) >= options_.max_sources_per_answer) {
            break;
        }
        const auto& passage = passages[static_cast<std::size_t>(marker - 1)];
        sources.push_back(SourceCitation{
            .marker = marker,
            .document_name = passage.document_name,
            .version = passage.version,
            .seq_no = passage.seq_no,
            .quote = compact_quote(passage.text),
            .score = passage.score,
        });
    }
    return sources;
}

}  // namespace verirag
