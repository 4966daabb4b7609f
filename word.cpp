#include <sstream>
#include <vector>
#include <cstring>
#include "word.hpp"

int Word::letter_index(char c) {
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= 'A' && c <= 'Z') return c - 'A';
    return -1;
}

uint8_t Word::ascii_of(char c) {
    int zc = letter_index(c);
    if (zc < 0) return 0;
    return static_cast<uint8_t>('a' + zc);
}

Word::Word(const std::string& r) {
    if (r.length() != static_cast<size_t>(length)) {
        throw InvalidWord("Expected 5 letter word, not: " + r);
    }

    packed = 0;
    presence = 0;
    for (int i = 0; i < length; i++) {
        int zc = letter_index(r[i]);
        if (zc < 0) {
            throw InvalidWord("Expected only letters a-z, not: " + r);
        }
        letters[i] = 'a' + zc;
        presence |= (1 << zc);
        packed |= static_cast<uint64_t>(letters[i]) << (i * 8);
    }
    std::memset(padding, 0, sizeof(padding));
}

std::string Word::raw() const {
    return std::string(letters, length);
}

bool Word::contains(char letter) const {
    int zc = letter_index(letter);
    if (zc < 0) return false;
    return (presence >> zc) & 1;
}

bool Word::has_letter_at(char letter, int pos) const {
    if (pos < 0 || pos >= length) return false;
    uint8_t a = ascii_of(letter);
    return a != 0 && letters[pos] == static_cast<char>(a);
}

bool Word::operator==(const Word& r) const {
    return (packed == r.packed);
}

// alphabetical, since the first letter is the least significant byte of packed
bool Word::operator<(const Word& r) const {
    return std::memcmp(letters, r.letters, length) < 0;
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os.write(x.letters, Word::length);
}

void Word::test() {
    Word x ("azZAq");
    std::stringstream output1;
    std::stringstream expected1;

    output1 << x << " "
            << x.presence << " "
            << x.packed << " "
            << sizeof(x) << " "
            << x.raw()
            << std::endl;

    expected1 << "azzaq" << " "
              << int32_t(1<<0) + (1<<16) + (1<<25) << " "
              << (uint64_t('a') | (uint64_t('z') << 8) | (uint64_t('z') << 16) | (uint64_t('a') << 24) | (uint64_t('q') << 32)) << " "
              << 24 << " "
              << "azzaq"
              << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Word::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    // rejects
    std::stringstream output2;
    std::stringstream expected2;
    const char* bad[] = { "", "abcd", "abcdef", "ab1de", "ab de", "ab-de", "caf\xc3\xa9", "slate\n" };
    for (const char* b : bad) {
        bool threw = false;
        try {
            Word w(b);
        } catch (const InvalidWord&) {
            threw = true;
        }
        output2 << threw;
    }
    output2 << std::endl;
    expected2 << "11111111" << std::endl;

    // round trip, and popcount(presence) == distinct letters
    const char* good[] = { "slate", "CRANE", "AdIeU", "mamma", "eerie", "zzzzz" };
    for (const char* g : good) {
        Word w(g);
        std::string lower(g);
        for (char& c : lower) c = 'a' + letter_index(c);
        int distinct = 0;
        for (int zc = 0; zc < alphabet_size; zc++) {
            if (lower.find(static_cast<char>('a' + zc)) != std::string::npos) distinct++;
        }
        output2 << (w.raw() == lower) << (Word(w.raw()) == w) << (__builtin_popcount(w.presence) == distinct);
    }
    output2 << std::endl;
    expected2 << "111111111111111111" << std::endl;

    Word m("mamma");
    output2 << m.contains('m') << m.contains('A') << m.contains('z') << m.contains('?')
            << m.has_letter_at('m', 0) << m.has_letter_at('M', 3) << m.has_letter_at('a', 0)
            << m.has_letter_at('a', 5) << m.has_letter_at('a', -1)
            << std::endl;
    expected2 << "110011000" << std::endl;

    output2 << (Word("crane") < Word("slate")) << (Word("slate") < Word("crane")) << std::endl;
    expected2 << "10" << std::endl;

    std::string output2_str = output2.str();
    std::string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Word::test() 2 failed, got " + output2_str + ", but expected " + expected2_str);
    }
}
