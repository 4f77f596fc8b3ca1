#pragma once

#include <string>

namespace verirag::uuid {

// Random RFC 4122 version 4 UUID, used as a trace id.
std::string generate();

}  // namespace verirag::uuid
