#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "chunk/text_chunker.hpp"
#include "test_support.hpp"
#include "util/hash.hpp"

using namespace verirag;

namespace {

std::string numbered_words(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            text += (i % 7 == 0) ? "\n" : "  ";
        }
        text += "w" + std::to_string(i);
    }
    return text;
}

void test_overlap_is_shared_between_neighbours() {
    std::cout << "[Test] overlap shared between neighbours..." << std::endl;
    const auto chunks = chunk_text(numbered_words(10), ChunkerOptions{4, 0.5});
    assert(chunks.size() == 4);
    assert(chunks[0].content == "w0 w1 w2 w3");
    assert(chunks[1].content == "w2 w3 w4 w5");
    assert(chunks[2].content == "w4 w5 w6 w7");
    assert(chunks[3].content == "w6 w7 w8 w9");
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].seq_no == static_cast<int>(i));
        assert(chunks[i].content_sha256 == hash::sha256_hex(chunks[i].content));
        assert(chunks[i].content_sha256.size() == 64);
    }
    std::cout << "[PASS] overlap" << std::endl;
}

void test_empty_input_yields_no_chunks() {
    std::cout << "[Test] empty input..." << std::endl;
    assert(chunk_text("", ChunkerOptions{}).empty());
    assert(chunk_text(" \n\t \n", ChunkerOptions{}).empty());
    std::cout << "[PASS] empty input" << std::endl;
}

void test_oversized_table_row_is_kept_whole() {
    std::cout << "[Test] oversized table row..." << std::endl;
    const std::string text = "intro words here\nPlan\tSeats\tPrice\tSupport\tSLA\nafter";
    const auto chunks = chunk_text(text, ChunkerOptions{4, 0.25});
    assert(chunks.size() == 3);
    assert(chunks[0].content == "intro words here");
    assert(chunks[1].content == "Plan | Seats | Price | Support | SLA");
    assert(chunks[2].content == "after");
    std::cout << "[PASS] oversized table row" << std::endl;
}

void test_small_table_rows_are_not_split() {
    std::cout << "[Test] table rows stay intact..." << std::endl;
    const std::string text = "| a | b |\n| c | d |\n| e | f |";
    const auto chunks = chunk_text(text, ChunkerOptions{12, 0.0});
    assert(chunks.size() == 2);
    assert(chunks[0].content == "| a | b |\n| c | d |");
    assert(chunks[1].content == "| e | f |");
    std::cout << "[PASS] table rows" << std::endl;
}

void test_default_options_cover_long_text() {
    std::cout << "[Test] default options..." << std::endl;
    const ChunkerOptions options;
    assert(options.overlap_words() == 39);
    const auto chunks = chunk_text(numbered_words(1000), options);
    assert(!chunks.empty());
    for (const auto& chunk : chunks) {
        assert(chunk.word_count <= 220);
    }
    assert(chunks.front().content.rfind("w0 ", 0) == 0);
    const auto& last = chunks.back().content;
    assert(last.size() >= 4 && last.substr(last.size() - 4) == "w999");
    std::cout << "[PASS] default options" << std::endl;
}

void test_invalid_options_are_rejected() {
    std::cout << "[Test] invalid options..." << std::endl;
    assert(test::throws<std::invalid_argument>([] { chunk_text("a b", ChunkerOptions{0, 0.1}); }));
    assert(test::throws<std::invalid_argument>([] { chunk_text("a b", ChunkerOptions{10, 1.0}); }));
    assert(test::throws<std::invalid_argument>([] { chunk_text("a b", ChunkerOptions{10, -0.1}); }));
    assert(test::throws<std::invalid_argument>([] { validate_chunker_options(ChunkerOptions{1, 0.99}); }) == false);
    std::cout << "[PASS] invalid options" << std::endl;
}

}  // namespace

int main() {
    test_overlap_is_shared_between_neighbours();
    test_empty_input_yields_no_chunks();
    test_oversized_table_row_is_kept_whole();
    test_small_table_rows_are_not_split();
    test_default_options_cover_long_text();
    test_invalid_options_are_rejected();
    std::cout << "[Test] ChunkerTest completed." << std::endl;
    return 0;
}
