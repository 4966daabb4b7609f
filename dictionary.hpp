/* The ordered list of candidate words. Each word gets a small "pointer"
   (WordIndex) so the index, the scans and the cache can pass 32-bit handles
   around instead of Words.

   Loading is lenient: a line that isn't a valid Word just doesn't become a
   candidate. Built once, never changed afterwards.
*/

#pragma once
#include <map>
#include <vector>
#include <string>
#include <stdexcept>
#include "word.hpp"

// can't build a dictionary from the given input, try again with a different one
class ResourceError : public std::runtime_error {
public:
    ResourceError(const std::string& what) : std::runtime_error(what) {}
};

class Dictionary {
public:
    // empty dictionary, every query on it is empty
    Dictionary();
    // drops (and counts) anything Word rejects, keeps duplicates and order
    explicit Dictionary(const std::vector<std::string>& raw_words);

    // one word per line. Throws ResourceError if the file can't be read or has no valid words.
    static Dictionary load_from_file(const std::string& filename);

    class WordIndex {
    public:
        WordIndex() : index(0) {}
        explicit WordIndex(uint32_t i) : index(i) {}
        uint32_t get() const { return index; }

        bool operator==(WordIndex other) const;
        bool operator!=(WordIndex other) const;
        bool operator<(WordIndex other) const;
    private:
        uint32_t index;
    };

    // throws std::out_of_range on a bad index
    const Word& of_word_index(WordIndex i) const;
    // first occurrence, throws if w isn't in the dictionary
    WordIndex to_word_index(const Word& w) const;
    bool contains(const Word& w) const;

    size_t size() const { return all_words.size(); }
    bool empty() const { return all_words.empty(); }
    size_t get_num_rejected() const { return num_rejected; }
    const std::vector<Word>& get_all_words() const { return all_words; }
    std::vector<WordIndex> get_all_indices() const;

    // turns off the load messages, only set by the tests
    static bool silence;

    static void test();
private:
    void add(const std::string& raw);

    std::vector<Word> all_words;
    std::map<Word, WordIndex> word_index_map;
    size_t num_rejected;
};
