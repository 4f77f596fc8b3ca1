#pragma once

#include <string>

namespace verirag {

struct Chunk {
    int seq_no = 0;
    std::string content;
    std::string content_sha256;
    int word_count = 0;
};

}  // namespace verirag
