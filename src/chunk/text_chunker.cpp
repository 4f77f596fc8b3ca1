#include "chunk/text_chunker.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "util/hash.hpp"

namespace verirag {
namespace {

struct Unit {
    std::string text;
    std::size_t words = 1;
    bool atomic = false;
};

bool is_table_row(const std::string& line) {
    return line.find('\t') != std::string::npos || line.find('|') != std::string::npos;
}

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string normalize_row(const std::string& line) {
    std::string expanded;
    expanded.reserve(line.size());
    for (const char ch : line) {
        if (ch == '\t') {
            expanded += " | ";
        } else {
            expanded.push_back(ch);
        }
    }
    const auto words = split_words(expanded);
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += word;
    }
    return out;
}

std::vector<Unit> tokenize(const std::string& text) {
    std::vector<Unit> units;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (is_table_row(line)) {
            auto row = normalize_row(line);
            if (row.empty()) {
                continue;
            }
            Unit unit;
            unit.words = split_words(row).size();
            unit.text = std::move(row);
            unit.atomic = true;
            units.push_back(std::move(unit));
            continue;
        }
        for (auto& word : split_words(line)) {
            units.push_back(Unit{std::move(word), 1, false});
        }
    }
    return units;
}

std::string join_units(const std::vector<Unit>& units, std::size_t begin, std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (i > begin) {
            out.push_back((units[i].atomic || units[i - 1].atomic) ? '\n' : ' ');
        }
        out += units[i].text;
    }
    return out;
}

}  // namespace

std::size_t ChunkerOptions::overlap_words() const {
    return static_cast<std::size_t>(std::floor(static_cast<double>(chunk_size_words) * overlap_ratio + 1e-9));
}

void validate_chunker_options(const ChunkerOptions& options) {
    if (options.chunk_size_words == 0) {
        throw std::invalid_argument("chunk_size_words must be > 0");
    }
    if (!(options.overlap_ratio >= 0.0 && options.overlap_ratio < 1.0)) {
        throw std::invalid_argument("overlap_ratio must be in [0, 1)");
    }
    if (options.overlap_words() >= options.chunk_size_words) {
        throw std::invalid_argument("overlap must be smaller than chunk_size_words");
    }
}

std::vector<Chunk> chunk_text(const std::string& text, const ChunkerOptions& options) {
    validate_chunker_options(options);

    std::vector<Chunk> chunks;
    const auto units = tokenize(text);
    if (units.empty()) {
        return chunks;
    }

    const std::size_t size = options.chunk_size_words;
    const std::size_t overlap = options.overlap_words();
    std::size_t start = 0;
    int seq = 0;
    while (start < units.size()) {
        std::size_t end = start;
        std::size_t words = 0;
        // The first unit is always taken, so an oversized row still advances.
        while (end < units.size() && (words == 0 || words + units[end].words <= size)) {
            words += units[end].words;
            ++end;
        }

        Chunk chunk;
        chunk.seq_no = seq++;
        chunk.content = join_units(units, start, end);
        chunk.content_sha256 = hash::sha256_hex(chunk.content);
        chunk.word_count = static_cast<int>(words);
        chunks.push_back(std::move(chunk));

        if (end == units.size()) {
            break;
        }

        std::size_t next_start = end;
        std::size_t carried = 0;
        while (next_start > start + 1 && carried + units[next_start - 1].words <= overlap) {
            carried += units[next_start - 1].words;
            --next_start;
        }
        // Skip the overlap when it would leave no room for the next unit.
        if (carried + units[end].words > size) {
            next_start = end;
        }
        start = next_start;
    }
    return chunks;
}

}  // namespace verirag
