#include "generation/prompt_builder.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>

#include "citation/citation_marker.hpp"

namespace verirag {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (const char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
            current.push_back(ch);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

// Stems of four letters or more also match their inflections ("step" in
// "steps"); shorter ones must be the whole word, so "how" misses "show".
bool has_word(const std::vector<std::string>& words, std::initializer_list<std::string_view> stems) {
    return std::any_of(words.begin(), words.end(), [&](const std::string& word) {
        return std::any_of(stems.begin(), stems.end(), [&](std::string_view stem) {
            return word == stem || (stem.size() >= 4 && word.rfind(stem, 0) == 0);
        });
    });
}

std::string build_system_prompt() {
    std::ostringstream oss;
    oss << "You are a corporate knowledge assistant for sales and technical teams.\n"
        << "\n"
        << "Hard constraints:\n"
        << "1. Answer ONLY from the numbered context passages. Do not use outside knowledge.\n"
        << "2. End every factual sentence with one or more citation markers such as [S1] or [S2][S3],\n"
        << "   where the number is the passage that supports the sentence.\n"
        << "3. Never cite a passage number that is not listed in the context.\n"
        << "4. If the passages do not contain confirmed information to answer, reply with EXACTLY:\n"
        << "   \"" << kRefusalText << "\"\n"
        << "5. Do not invent facts, numbers, features, plans or assumptions.\n"
        << "6. Do not add a sources section; citations are rendered separately.\n"
        << "7. Keep the language of the question.";
    return oss.str();
}

}  // namespace

std::string detect_request_kind(const std::string& question) {
    const auto words = split_words(lowercase(question));
    if (has_word(words, {"how", "step"})) {
        return "practical";
    }
    if (has_word(words, {"compar", "difference", "versus", "vs"})) {
        return "comparison";
    }
    if (has_word(words, {"why", "reason"})) {
        return "analytical";
    }
    return "informational";
}

std::string detect_complexity(const std::string& question) {
    std::istringstream iss(question);
    std::size_t words = 0;
    std::string word;
    while (iss >> word) {
        ++words;
    }
    if (words <= 6) {
        return "basic";
    }
    if (words <= 16) {
        return "advanced";
    }
    return "expert";
}

std::string mode_guidance(AnswerMode mode) {
    switch (mode) {
        case AnswerMode::Brief:
            return "- Keep the answer concise: 3-6 short sentences.\n"
                   "- Focus on the direct conclusion and one key evidence point.";
        case AnswerMode::Deep:
            return "- Give a layered explanation: conclusion, mechanism, practical implications.\n"
                   "- Use clear bullets and include edge cases from the context when available.";
        case AnswerMode::Standard:
            break;
    }
    return "- Give a balanced answer: conclusion, explanation, practice.\n"
           "- Avoid unnecessary verbosity.";
}

std::string build_context_block(const std::vector<RetrievedPassage>& passages) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < passages.size(); ++i) {
        const auto& passage = passages[i];
        oss << citation::format_marker(static_cast<int>(i + 1)) << " Document=" << passage.document_name
            << " Version=" << passage.version << "\n"
            << passage.text;
        if (i + 1 < passages.size()) {
            oss << "\n\n";
        }
    }
    return oss.str();
}

Prompt build_prompt(const std::string& question,
                    QueryType type,
                    const std::vector<RetrievedPassage>& passages,
                    AnswerMode mode) {
    std::ostringstream user;
    user << "Query type: " << to_string(type) << "\n"
         << "Response mode: " << to_string(mode) << "\n"
         << "\n"
         << "Mode guidance:\n"
         << mode_guidance(mode) << "\n"
         << "\n"
         << "Question profile:\n"
         << "- Query kind: " << detect_request_kind(question) << "\n"
         << "- Complexity: " << detect_complexity(question) << "\n"
         << "- Domain: " << to_string(type) << "\n"
         << "\n"
         << "Question:\n"
         << question << "\n"
         << "\n"
         << "Context:\n"
         << build_context_block(passages);

    return Prompt{
        .system = build_system_prompt(),
        .user = user.str(),
    };
}

}  // namespace verirag
