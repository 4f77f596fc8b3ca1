#pragma once

#include <optional>
#include <string>

namespace verirag {

// Version labels are 1-64 characters drawn from [A-Za-z0-9._-].
bool is_valid_version_label(const std::string& label);

// Throws InvalidVersionFilter for a malformed label.
std::string require_version_label(const std::string& label);

// An absent, empty or whitespace-only filter means "any version".
std::optional<std::string> normalize_version_filter(const std::optional<std::string>& filter);

}  // namespace verirag
