#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include "dictionary.hpp"

namespace Solver {
    // All the naive solver needs to know about a word.
    class Letter_source {
    public:
        virtual ~Letter_source() {};
        virtual bool contains(char letter) const = 0;
        virtual bool has_letter_at(char letter, int pos) const = 0;
    };

    // a plain string, nothing precomputed. Letters compare case-insensitively.
    class Raw_word : public Letter_source {
    public:
        explicit Raw_word(const std::string& s);
        virtual bool contains(char letter) const;
        virtual bool has_letter_at(char letter, int pos) const;
    private:
        std::string s;
    };

    // Re-checks the raw constraints one letter at a time, with the same rules as
    // CMask::compile (green wins over gray, bad entries are ignored).
    bool naive_matches(const Letter_source& w,
                       const std::set<char>& excluded,
                       const std::map<int, char>& green,
                       const std::map<char, uint8_t>& yellow);

    // Slow, only here to check the other algorithms against.
    std::vector<Dictionary::WordIndex> naive_list(const Dictionary& d,
                                                  const std::set<char>& excluded,
                                                  const std::map<int, char>& green,
                                                  const std::map<char, uint8_t>& yellow);
}
