#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace verirag::citation {

// A `[S<n>]` token found in generated text. `begin`/`end` are byte offsets.
struct MarkerToken {
    std::size_t begin = 0;
    std::size_t end = 0;
    int index = 0;
};

std::string format_marker(int index);

// Parses a marker starting exactly at `pos`. Returns the end offset, or 0 when
// there is no marker at `pos`.
std::size_t parse_marker_at(std::string_view text, std::size_t pos, int& index);

std::vector<MarkerToken> find_markers(std::string_view text);

std::string strip_markers(std::string_view text);

}  // namespace verirag::citation
