/********

A CMask is a compiled query. It can tell you if a given word is valid (via the [check] function).

Internally a CMask stores the constraints in the forms the query algorithms want:

  - excluded: 26-bit mask of gray letters, with every green letter removed (green wins over gray),
  - required: 26-bit mask of green | yellow letters,
  - green_mask/green_value: packed byte compare, (packed & green_mask) == green_value,
  - the green list of (position, ascii) and the yellow list of (ascii, forbidden positions).

Bit N of a yellow forbidden mask means "this letter is in the word, but not at position N".

Compiling never fails. Green entries with a position outside 0..4 or a non-letter, and yellow
entries with a non-letter, are dropped as if they were never given. Forbidden bits above 4 are
dropped too.

Two CMasks compiled from the same constraints are equal no matter what order the inputs were
iterated in, so a CMask is usable as a cache key (see cachekey.hpp).

*******/

#pragma once
#include <iostream>
#include <vector>
#include <map>
#include <set>
#include <string>
#include <cstdint>
#include "word.hpp"

class CMask {
public:
    struct Green {
        int8_t pos;
        uint8_t ascii;
    };
    struct Yellow {
        uint8_t ascii;
        uint8_t forbidden;
    };

    // no constraints, everything is allowed
    CMask();

    static CMask compile(const std::set<char>& excluded,
                         const std::map<int, char>& green,
                         const std::map<char, uint8_t>& yellow);

    // yellow letters with no position information
    static CMask compile(const std::set<char>& excluded,
                         const std::map<int, char>& green,
                         const std::set<char>& yellow);

    // [check] is the most speed-critical function
    bool check(int32_t presence, uint64_t packed) const;
    bool check(const Word& w) const { return check(w.get_presence(), w.get_packed()); }
    // only the yellow forbidden position part of [check]
    bool yellow_ok(uint64_t packed) const;

    // very slow, but raises a message that's useful for the user.
    void check_detail_reasons_exn(const Word& w) const;

    int32_t get_excluded() const { return excluded; }
    int32_t get_required() const { return required; }
    uint64_t get_green_mask() const { return green_mask; }
    uint64_t get_green_value() const { return green_value; }
    const std::vector<Green>& get_greens() const { return greens; }
    const std::vector<Yellow>& get_yellows() const { return yellows; }
    // ascii of the green letter at pos, or 0
    uint8_t green_at(int pos) const;

    bool operator<(const CMask& m) const;
    bool operator==(const CMask& m) const;

    // "0:s,4:e". Throws std::runtime_error on bad syntax, out of range positions are kept
    // (compile drops them).
    static std::map<int, char> green_of_string(const std::string& s);
    // "a:01,e,io" -> a not at 0 or 1; e, i, o anywhere. Throws std::runtime_error on bad syntax.
    static std::map<char, uint8_t> yellow_of_string(const std::string& s);
    static std::set<char> excluded_of_string(const std::string& s);

    friend std::ostream& operator<<(std::ostream& os, const CMask& m);
    static void test();
private:
    int32_t excluded;
    int32_t required;
    uint64_t green_mask;
    uint64_t green_value;
    std::vector<Green> greens;   // sorted by position
    std::vector<Yellow> yellows; // sorted by letter, one entry per letter
};

std::ostream& operator<<(std::ostream& os, const CMask& m);
