#include "citation/citation_marker.hpp"

#include <cctype>

namespace verirag::citation {
namespace {
// Anything longer cannot index a passage list; it is parsed as index 0.
constexpr std::size_t kMaxIndexDigits = 6;
}  // namespace

std::string format_marker(int index) {
    return "[S" + std::to_string(index) + "]";
}

std::size_t parse_marker_at(std::string_view text, std::size_t pos, int& index) {
    if (pos + 4 > text.size() || text.compare(pos, 2, "[S") != 0) {
        return 0;
    }
    std::size_t cursor = pos + 2;
    const std::size_t digits_begin = cursor;
    while (cursor < text.size() && std::isdigit(static_cast<unsigned char>(text[cursor]))) {
        ++cursor;
    }
    const std::size_t digits = cursor - digits_begin;
    if (digits == 0 || cursor >= text.size() || text[cursor] != ']') {
        return 0;
    }

    int value = 0;
    if (digits <= kMaxIndexDigits) {
        for (std::size_t i = digits_begin; i < cursor; ++i) {
            value = value * 10 + (text[i] - '0');
        }
    }
    index = value;
    return cursor + 1;
}

std::vector<MarkerToken> find_markers(std::string_view text) {
    std::vector<MarkerToken> markers;
    std::size_t pos = text.find("[S");
    while (pos != std::string_view::npos) {
        int index = 0;
        const std::size_t end = parse_marker_at(text, pos, index);
        if (end != 0) {
            markers.push_back(MarkerToken{pos, end, index});
            pos = text.find("[S", end);
        } else {
            pos = text.find("[S", pos + 1);
        }
    }
    return markers;
}

std::string strip_markers(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t copied = 0;
    for (const auto& marker : find_markers(text)) {
        out.append(text.substr(copied, marker.begin - copied));
        copied = marker.end;
    }
    out.append(text.substr(copied));
    return out;
}

}  // namespace verirag::citation
