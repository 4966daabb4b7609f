/* Represents a five-letter word. It also precomputes the stuff the index and
   the scans need later.

   Each Word keeps the lowercase letters, a "packed" representation in 8 bytes
   (byte N is the ASCII code of position N, so the top 3 bytes are unused) and
   a presence mask with bit i set if 'a' + i occurs anywhere in the word.

   Duplicate letters set the same presence bit, so masks alone can't say "at
   least two of X".
*/

#pragma once
#include <string>
#include <iostream>
#include <stdexcept>
#include <cstdint>

class InvalidWord : public std::runtime_error {
public:
    InvalidWord(const std::string& what) : std::runtime_error(what) {}
};

class Word {
public:
    // throws InvalidWord unless r is exactly 5 letters a-z (A-Z is folded to lowercase)
    Word(const std::string& r);
    bool operator==(const Word& r) const;
    bool operator<(const Word& r) const;
    char operator[](int pos) const { return letters[pos]; }
    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    std::string raw() const;
    int32_t get_presence() const { return presence; }
    uint64_t get_packed() const { return packed; }

    bool contains(char letter) const;
    bool has_letter_at(char letter, int pos) const;

    // 0..25, or -1 if c isn't a letter
    static int letter_index(char c);
    // lowercase ASCII code of c, or 0 if c isn't a letter
    static uint8_t ascii_of(char c);

    static const int length = 5;
    static const int alphabet_size = 26;

    static void test();
private:
    uint64_t packed;  // 8
    int32_t presence; // 4
    char letters[5];  // 5

    char padding[7];  // gets the total to 24 bytes
};

std::ostream& operator<<(std::ostream& os, const Word& x);
