/* A fixed-size set of word indices, one bit per word, stored in 64-bit blocks.

   Bits past num_words in the last block are always zero so they can never be
   mistaken for matches, every operation below keeps that true.
*/

#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <iostream>

class WordBits {
public:
    WordBits();
    // all zero
    explicit WordBits(size_t num_words);
    static WordBits all_ones(size_t num_words);

    void set(size_t i);
    bool get(size_t i) const;
    size_t size() const { return num_words; }
    size_t num_blocks() const { return blocks.size(); }
    uint64_t block(size_t b) const { return blocks[b]; }
    size_t count() const;

    // all intended to be fast, sizes must match
    WordBits& and_with(const WordBits& o);
    WordBits& and_not_with(const WordBits& o);
    // same, restricted to blocks [first_block, end_block)
    void and_with(const WordBits& o, size_t first_block, size_t end_block);
    void and_not_with(const WordBits& o, size_t first_block, size_t end_block);

    // flips every real bit, pad bits stay clear
    WordBits complement() const;

    // appends the index of every set bit in blocks [first_block, end_block), ascending
    void extract(size_t first_block, size_t end_block, std::vector<uint32_t>& out) const;
    std::vector<uint32_t> to_indices() const;

    bool operator==(const WordBits& o) const;

    static void test();
private:
    void clear_padding();

    size_t num_words;
    std::vector<uint64_t> blocks;
};

std::ostream& operator<<(std::ostream& os, const WordBits& b);
