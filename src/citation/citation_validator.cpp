#include "citation/citation_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

#include "citation/citation_marker.hpp"

namespace verirag {
namespace {

bool is_blank(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string ltrim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r");
    return begin == std::string::npos ? std::string{} : text.substr(begin);
}

// Non-ASCII bytes count as letters so that UTF-8 prose is treated as text.
bool has_letter_or_digit(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u >= 0x80 || std::isalnum(u) != 0;
    });
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

// Splits a line into sentences whose concatenation is the line. Whitespace
// between sentences belongs to the following sentence.
std::vector<std::string> split_sentences(const std::string& line) {
    std::vector<std::string> sentences;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < line.size()) {
        if (!is_terminator(line[pos])) {
            ++pos;
            continue;
        }
        std::size_t end = pos;
        while (end < line.size() && is_terminator(line[end])) {
            ++end;
        }
        const std::size_t after_terminators = end;
        while (true) {
            std::size_t probe = end;
            while (probe < line.size() && is_blank(static_cast<unsigned char>(line[probe]))) {
                ++probe;
            }
            int index = 0;
            const std::size_t marker_end = citation::parse_marker_at(line, probe, index);
            if (marker_end == 0) {
                break;
            }
            end = marker_end;
        }
        const bool boundary = end == line.size() || end > after_terminators ||
                              is_blank(static_cast<unsigned char>(line[end]));
        if (boundary) {
            sentences.push_back(line.substr(start, end - start));
            start = end;
        }
        pos = end;
    }
    if (start < line.size()) {
        sentences.push_back(line.substr(start));
    }
    return sentences;
}

struct MarkerScan {
    std::string text;
    bool has_markers = false;
    bool has_valid = false;
    int invalid = 0;
};

// Removes markers outside [1, passage_count] together with the blanks before them.
MarkerScan remove_invalid_markers(const std::string& text, std::size_t passage_count) {
    MarkerScan scan;
    std::size_t copied = 0;
    for (const auto& marker : citation::find_markers(text)) {
        scan.has_markers = true;
        const bool valid = marker.index >= 1 && static_cast<std::size_t>(marker.index) <= passage_count;
        if (valid) {
            scan.has_valid = true;
            continue;
        }
        ++scan.invalid;
        std::size_t cut = marker.begin;
        while (cut > copied && is_blank(static_cast<unsigned char>(text[cut - 1]))) {
            --cut;
        }
        scan.text.append(text, copied, cut - copied);
        copied = marker.end;
    }
    scan.text.append(text, copied, std::string::npos);
    return scan;
}

struct Sentence {
    MarkerScan scan;
    bool claim = false;
};

struct LineOutcome {
    std::string text;
    int claims = 0;
    int supported = 0;
    int invalid_markers = 0;
};

LineOutcome validate_prose_line(const std::string& line, std::size_t passage_count) {
    std::vector<Sentence> sentences;
    LineOutcome outcome;
    for (const auto& raw : split_sentences(line)) {
        Sentence sentence;
        sentence.scan = remove_invalid_markers(raw, passage_count);
        sentence.claim = has_letter_or_digit(citation::strip_markers(raw));
        outcome.invalid_markers += sentence.scan.invalid;
        sentences.push_back(std::move(sentence));
    }

    bool dropped_first = false;
    for (std::size_t i = 0; i < sentences.size(); ++i) {
        const auto& sentence = sentences[i];
        bool keep = true;
        if (sentence.claim) {
            ++outcome.claims;
            bool supported = sentence.scan.has_valid;
            if (!sentence.scan.has_markers) {
                for (std::size_t j = i + 1; j < sentences.size(); ++j) {
                    if (sentences[j].scan.has_markers) {
                        supported = sentences[j].scan.has_valid;
                        break;
                    }
                }
            }
            if (supported) {
                ++outcome.supported;
            }
            keep = supported;
        }
        if (keep) {
            outcome.text += sentence.scan.text;
        } else if (outcome.text.empty()) {
            dropped_first = true;
        }
    }
    if (dropped_first) {
        outcome.text = ltrim(outcome.text);
    }
    return outcome;
}

bool is_fence(const std::string& line) {
    return ltrim(line).rfind("```", 0) == 0;
}

// Headings and colon-terminated lines up to this many words are labels.
constexpr std::size_t kMaxLabelWords = 5;

std::size_t count_words(const std::string& text) {
    std::size_t words = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto begin = text.find_first_not_of(" \t\r", pos);
        if (begin == std::string::npos) {
            break;
        }
        auto end = text.find_first_of(" \t\r", begin);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (has_letter_or_digit(text.substr(begin, end - begin))) {
            ++words;
        }
        pos = end;
    }
    return words;
}

// A short heading or lead-in such as "## Summary" or "Key facts:". Longer
// lines of that shape carry content and are judged as prose.
bool is_label_line(const std::string& line) {
    const std::string body = trim(citation::strip_markers(line));
    const bool shaped = body.rfind('#', 0) == 0 || (!body.empty() && body.back() == ':');
    return shaped && count_words(body) <= kMaxLabelWords;
}

struct BlockOutcome {
    std::vector<std::string> lines;
    bool claim = false;
    bool supported = false;
    int invalid_markers = 0;
};

// A fenced block with content is one claim, supported when any line of the
// block (fences included) carries a valid marker.
BlockOutcome validate_fenced_block(const std::vector<std::string>& lines,
                                   std::size_t first,
                                   std::size_t last,
                                   std::size_t passage_count) {
    BlockOutcome block;
    for (std::size_t i = first; i <= last; ++i) {
        auto scan = remove_invalid_markers(lines[i], passage_count);
        block.invalid_markers += scan.invalid;
        block.supported = block.supported || scan.has_valid;
        const bool fence_line = (i == first) || (i == last && is_fence(lines[i]));
        if (!fence_line && has_letter_or_digit(citation::strip_markers(lines[i]))) {
            block.claim = true;
        }
        block.lines.push_back(std::move(scan.text));
    }
    return block;
}

// At most one blank line between paragraphs, none at either end.
std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    int pending_blank = 0;
    for (const auto& line : lines) {
        if (trim(line).empty()) {
            ++pending_blank;
            continue;
        }
        if (!out.empty()) {
            out += pending_blank > 0 ? "\n\n" : "\n";
        }
        pending_blank = 0;
        out += line;
    }
    return out;
}

double round4(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

}  // namespace

CitationValidator::CitationValidator(ValidatorOptions options) : options_(options) {}

ValidationResult CitationValidator::validate(const std::string& raw_text,
                                             const std::vector<RetrievedPassage>& passages) const {
    ValidationResult result;

    if (trim(citation::strip_markers(raw_text)) == kRefusalText) {
        return result;
    }

    std::vector<std::string> kept_lines;
    const auto lines = split_lines(raw_text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (is_fence(line)) {
            // An unterminated fence runs to the end of the text.
            std::size_t last = i + 1;
            while (last < lines.size() && !is_fence(lines[last])) {
                ++last;
            }
            last = std::min(last, lines.size() - 1);
            auto block = validate_fenced_block(lines, i, last, passages.size());
            result.invalid_markers += block.invalid_markers;
            if (block.claim) {
                ++result.claims;
                if (block.supported) {
                    ++result.supported_claims;
                }
            }
            if (!block.claim || block.supported) {
                for (auto& kept : block.lines) {
                    kept_lines.push_back(std::move(kept));
                }
            }
            i = last;
            continue;
        }
        if (is_label_line(line)) {
            auto scan = remove_invalid_markers(line, passages.size());
            result.invalid_markers += scan.invalid;
            kept_lines.push_back(std::move(scan.text));
            continue;
        }

        auto outcome = validate_prose_line(line, passages.size());
        result.claims += outcome.claims;
        result.supported_claims += outcome.supported;
        result.invalid_markers += outcome.invalid_markers;
        // A line that lost all of its content disappears instead of leaving a gap.
        if (trim(outcome.text).empty() && !trim(line).empty()) {
            continue;
        }
        kept_lines.push_back(std::move(outcome.text));
    }

    if (options_.strict && result.invalid_markers > 0) {
        result.supported_claims = 0;
        return result;
    }
    if (result.supported_claims == 0) {
        return result;
    }

    result.clean_text = join_lines(kept_lines);

    double min_score = std::numeric_limits<double>::infinity();
    for (const auto& marker : citation::find_markers(result.clean_text)) {
        if (std::find(result.cited_passages.begin(), result.cited_passages.end(), marker.index) !=
            result.cited_passages.end()) {
            continue;
        }
        result.cited_passages.push_back(marker.index);
        const auto& passage = passages[static_cast<std::size_t>(marker.index - 1)];
        min_score = std::min(min_score, passage.score);
        if (std::find(result.used_documents.begin(), result.used_documents.end(), passage.document_name) ==
            result.used_documents.end()) {
            result.used_documents.push_back(passage.document_name);
        }
    }

    if (result.cited_passages.empty()) {
        result.clean_text.clear();
        result.used_documents.clear();
        return result;
    }

    const double coverage = static_cast<double>(result.supported_claims) / static_cast<double>(result.claims);
    result.confidence = round4(std::clamp(min_score * coverage, 0.0, 1.0));
    result.ok = true;
    return result;
}

}  // namespace verirag
