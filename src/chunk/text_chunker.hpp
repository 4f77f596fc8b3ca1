#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"

namespace verirag {

struct ChunkerOptions {
    std::size_t chunk_size_words = 220;
    double overlap_ratio = 0.18;

    // Number of trailing words repeated at the head of the next chunk.
    std::size_t overlap_words() const;
};

// Throws std::invalid_argument when the options cannot produce progress.
void validate_chunker_options(const ChunkerOptions& options);

// Splits extracted text into overlapping chunks in document order. Lines that
// look like table rows (tab or '|' separated) are never split; a row larger
// than the chunk size becomes a chunk of its own.
std::vector<Chunk> chunk_text(const std::string& text, const ChunkerOptions& options);

}  // namespace verirag
