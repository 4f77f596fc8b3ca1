#include "util/uuid.hpp"

#include <array>
#include <random>

namespace verirag::uuid {
namespace {

std::mt19937_64& rng() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

}  // namespace

std::string generate() {
    static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                  '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::uniform_int_distribution<int> nibble(0, 15);
    std::uniform_int_distribution<int> variant(8, 11);

    std::string out(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        if (i == 14) {
            out[i] = '4';
        } else if (i == 19) {
            out[i] = kHex[variant(rng())];
        } else {
            out[i] = kHex[nibble(rng())];
        }
    }
    return out;
}

}  // namespace verirag::uuid
