#include "core/version_label.hpp"

#include <cctype>

#include "core/errors.hpp"

namespace verirag {
namespace {

constexpr std::size_t kMaxVersionLength = 64;

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

}  // namespace

bool is_valid_version_label(const std::string& label) {
    if (label.empty() || label.size() > kMaxVersionLength) {
        return false;
    }
    for (const char ch : label) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '.' && ch != '_' && ch != '-') {
            return false;
        }
    }
    return true;
}

std::string require_version_label(const std::string& label) {
    const std::string trimmed = trim(label);
    if (!is_valid_version_label(trimmed)) {
        throw InvalidVersionFilter("malformed version label: \"" + label + "\"");
    }
    return trimmed;
}

std::optional<std::string> normalize_version_filter(const std::optional<std::string>& filter) {
    if (!filter) {
        return std::nullopt;
    }
    const std::string trimmed = trim(*filter);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return require_version_label(trimmed);
}

}  // namespace verirag
