#include <sstream>
#include <stdexcept>
#include "wordbits.hpp"

static size_t blocks_for(size_t n) {
    return (n + 63) / 64;
}

WordBits::WordBits() : num_words(0) {}

WordBits::WordBits(size_t n) : num_words(n), blocks(blocks_for(n), 0) {}

WordBits WordBits::all_ones(size_t n) {
    WordBits rv(n);
    for (uint64_t& b : rv.blocks) b = ~uint64_t(0);
    rv.clear_padding();
    return rv;
}

void WordBits::clear_padding() {
    size_t used = num_words % 64;
    if (used && !blocks.empty()) {
        blocks.back() &= (uint64_t(1) << used) - 1;
    }
}

void WordBits::set(size_t i) {
    if (i >= num_words) throw std::out_of_range("WordBits::set past the end");
    blocks[i / 64] |= uint64_t(1) << (i % 64);
}

bool WordBits::get(size_t i) const {
    if (i >= num_words) return false;
    return (blocks[i / 64] >> (i % 64)) & 1;
}

size_t WordBits::count() const {
    size_t c = 0;
    for (uint64_t b : blocks) c += __builtin_popcountll(b);
    return c;
}

WordBits& WordBits::and_with(const WordBits& o) {
    and_with(o, 0, blocks.size());
    return *this;
}

WordBits& WordBits::and_not_with(const WordBits& o) {
    and_not_with(o, 0, blocks.size());
    return *this;
}

void WordBits::and_with(const WordBits& o, size_t first_block, size_t end_block) {
    const uint64_t* src = o.blocks.data();
    uint64_t* dst = blocks.data();
    for (size_t b = first_block; b < end_block; b++) {
        dst[b] &= src[b];
    }
}

// o's pad bits are clear, so ~o has them set, but ours are already clear.
void WordBits::and_not_with(const WordBits& o, size_t first_block, size_t end_block) {
    const uint64_t* src = o.blocks.data();
    uint64_t* dst = blocks.data();
    for (size_t b = first_block; b < end_block; b++) {
        dst[b] &= ~src[b];
    }
}

WordBits WordBits::complement() const {
    WordBits rv(num_words);
    for (size_t b = 0; b < blocks.size(); b++) {
        rv.blocks[b] = ~blocks[b];
    }
    rv.clear_padding();
    return rv;
}

void WordBits::extract(size_t first_block, size_t end_block, std::vector<uint32_t>& out) const {
    for (size_t b = first_block; b < end_block; b++) {
        uint64_t bits = blocks[b];
        uint32_t base = static_cast<uint32_t>(b * 64);
        while (bits) {
            out.push_back(base + __builtin_ctzll(bits));
            bits &= bits - 1;
        }
    }
}

std::vector<uint32_t> WordBits::to_indices() const {
    std::vector<uint32_t> rv;
    rv.reserve(count());
    extract(0, blocks.size(), rv);
    return rv;
}

bool WordBits::operator==(const WordBits& o) const {
    return num_words == o.num_words && blocks == o.blocks;
}

std::ostream& operator<<(std::ostream& os, const WordBits& b) {
    for (size_t i = 0; i < b.size(); i++) {
        os << (b.get(i) ? '1' : '0');
    }
    return os;
}

void WordBits::test() {
    std::stringstream output;
    std::stringstream expected;

    WordBits a = WordBits::all_ones(70);
    output << a.num_blocks() << " " << a.count() << " " << (a.block(1) == 0x3F) << std::endl;
    expected << "2 70 1" << std::endl;

    WordBits none = WordBits::all_ones(0);
    output << none.num_blocks() << " " << none.count() << " " << none.to_indices().size() << std::endl;
    expected << "0 0 0" << std::endl;

    WordBits exact = WordBits::all_ones(128);
    output << exact.count() << " " << (exact.block(1) == ~uint64_t(0)) << std::endl;
    expected << "128 1" << std::endl;

    WordBits x(70);
    x.set(0);
    x.set(3);
    x.set(63);
    x.set(64);
    x.set(69);
    WordBits c = x.complement();
    output << x.count() << " " << c.count() << " " << (c.block(1) & ~uint64_t(0x3F)) << std::endl;
    expected << "5 65 0" << std::endl;

    std::vector<uint32_t> idx = x.to_indices();
    for (uint32_t i : idx) output << i << ",";
    output << std::endl;
    expected << "0,3,63,64,69," << std::endl;

    WordBits y(70);
    y.set(3);
    y.set(64);
    y.set(10);
    WordBits z = x;
    z.and_with(y);
    output << z.to_indices().size() << " " << z.get(3) << z.get(64) << z.get(10) << std::endl;
    expected << "2 110" << std::endl;

    z = x;
    z.and_not_with(y);
    output << z.count() << " " << z.get(0) << z.get(63) << z.get(69) << z.get(3) << " " << z.get(1000) << std::endl;
    expected << "3 1110 0" << std::endl;

    // restricted to block 1 only
    z = x;
    z.and_with(y, 1, 2);
    output << z.count() << std::endl;
    expected << "4" << std::endl;

    WordBits small(6);
    small.set(1);
    small.set(5);
    output << small << " " << small.complement() << std::endl;
    expected << "010001 101110" << std::endl;

    bool threw = false;
    try {
        small.set(6);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    output << threw << std::endl;
    expected << 1 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("WordBits::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}
