#pragma once

#include <string>

namespace verirag {

// Black-box completion model. Implementations throw GenerationUnavailable.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) const = 0;
};

}  // namespace verirag
