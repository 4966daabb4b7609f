#include "naive.hpp"

using std::string;
using std::vector;
using std::map;
using std::set;
typedef Dictionary::WordIndex WordIndex;

namespace Solver {
    Raw_word::Raw_word(const string& s_) : s(s_) {}

    bool Raw_word::contains(char letter) const {
        uint8_t a = Word::ascii_of(letter);
        if (a == 0) return false;
        for (char c : s) {
            if (Word::ascii_of(c) == a) return true;
        }
        return false;
    }

    bool Raw_word::has_letter_at(char letter, int pos) const {
        if (pos < 0 || static_cast<size_t>(pos) >= s.length()) return false;
        uint8_t a = Word::ascii_of(letter);
        return a != 0 && Word::ascii_of(s[pos]) == a;
    }

    bool naive_matches(const Letter_source& w,
                       const set<char>& excluded,
                       const map<int, char>& green,
                       const map<char, uint8_t>& yellow) {
        set<char> green_letters;
        for (const auto& kv : green) {
            uint8_t a = Word::ascii_of(kv.second);
            if (kv.first < 0 || kv.first >= Word::length || a == 0) continue;
            green_letters.insert(static_cast<char>(a));
            if (!w.has_letter_at(kv.second, kv.first)) return false;
        }

        for (char c : excluded) {
            uint8_t a = Word::ascii_of(c);
            if (a == 0 || green_letters.count(static_cast<char>(a))) continue;
            if (w.contains(c)) return false;
        }

        for (char c : green_letters) {
            if (!w.contains(c)) return false;
        }

        for (const auto& kv : yellow) {
            if (Word::ascii_of(kv.first) == 0) continue;
            if (!w.contains(kv.first)) return false;
            for (int pos = 0; pos < Word::length; pos++) {
                if ((kv.second & (1 << pos)) && w.has_letter_at(kv.first, pos)) return false;
            }
        }
        return true;
    }

    vector<WordIndex> naive_list(const Dictionary& d,
                                 const set<char>& excluded,
                                 const map<int, char>& green,
                                 const map<char, uint8_t>& yellow) {
        vector<WordIndex> rv;
        const vector<Word>& words = d.get_all_words();
        for (size_t i = 0; i < words.size(); i++) {
            if (naive_matches(Raw_word(words[i].raw()), excluded, green, yellow)) {
                rv.push_back(WordIndex(static_cast<uint32_t>(i)));
            }
        }
        return rv;
    }
}
