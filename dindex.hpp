/* Everything we precompute from the Dictionary once at startup so queries never
   have to look at a Word again:

   - dense presence masks and packed bytes, in dictionary order,
   - a WordBits per (position, letter), per "contains letter" and per "lacks letter",
   - a bucket permutation of the word indices sorted by (first letter, second
     letter, dictionary order), with the masks and packed bytes copied in that
     order, and the 26 first-letter and 676 bigram ranges into it.

   Read-only after construction, so any number of threads can share it.
*/

#pragma once
#include <vector>
#include <cstdint>
#include "wordbits.hpp"
#include "dictionary.hpp"

class DictionaryIndex {
public:
    // [start, start + count) in sorted positions
    struct Range {
        uint32_t start;
        uint32_t count;
        uint32_t end() const { return start + count; }
    };

    explicit DictionaryIndex(const Dictionary& d);

    size_t size() const { return num_words; }

    // dictionary order
    int32_t presence(uint32_t i) const { return presences[i]; }
    uint64_t packed(uint32_t i) const { return packeds[i]; }

    // zc is 0..25, pos is 0..4. Throws std::out_of_range otherwise.
    const WordBits& at_position(int pos, int zc) const;
    const WordBits& contains(int zc) const;
    const WordBits& lacks(int zc) const;
    const WordBits& all_words() const { return everything; }

    Range first_letter_range(int zc) const;
    Range bigram_range(int first_zc, int second_zc) const;

    // sorted (bucket) order
    Dictionary::WordIndex sorted_to_index(uint32_t pos) const { return Dictionary::WordIndex(sorted_order[pos]); }
    int32_t sorted_presence(uint32_t pos) const { return sorted_presences[pos]; }
    uint64_t sorted_packed(uint32_t pos) const { return sorted_packeds[pos]; }
    const int32_t* sorted_presence_data() const { return sorted_presences.data(); }
    const uint64_t* sorted_packed_data() const { return sorted_packeds.data(); }

    static const int num_bigrams = Word::alphabet_size * Word::alphabet_size;

    static void test();
private:
    size_t num_words;

    std::vector<int32_t> presences;
    std::vector<uint64_t> packeds;

    std::vector<WordBits> by_position; // [pos * 26 + zc]
    std::vector<WordBits> letter_contains;
    std::vector<WordBits> letter_lacks;
    WordBits everything;

    std::vector<uint32_t> sorted_order;
    std::vector<int32_t> sorted_presences;
    std::vector<uint64_t> sorted_packeds;
    std::vector<Range> first_letter_ranges;
    std::vector<Range> bigram_ranges;
};
