#include <sstream>
#include <stdexcept>
#include <algorithm>
#include "dindex.hpp"

using std::vector;
typedef Dictionary::WordIndex WordIndex;

static const int L = Word::length;
static const int A = Word::alphabet_size;

DictionaryIndex::DictionaryIndex(const Dictionary& d) :
    num_words(d.size()),
    by_position(L * A, WordBits(d.size())),
    letter_contains(A, WordBits(d.size())),
    everything(WordBits::all_ones(d.size())),
    first_letter_ranges(A),
    bigram_ranges(num_bigrams)
{
    const vector<Word>& words = d.get_all_words();
    presences.reserve(num_words);
    packeds.reserve(num_words);

    vector<uint32_t> bucket_counts(num_bigrams, 0);
    for (size_t i = 0; i < num_words; i++) {
        const Word& w = words[i];
        presences.push_back(w.get_presence());
        packeds.push_back(w.get_packed());

        for (int pos = 0; pos < L; pos++) {
            by_position[pos * A + (w[pos] - 'a')].set(i);
        }
        int32_t p = w.get_presence();
        for (int zc = 0; zc < A; zc++) {
            if (p & (1 << zc)) letter_contains[zc].set(i);
        }
        bucket_counts[(w[0] - 'a') * A + (w[1] - 'a')]++;
    }

    letter_lacks.reserve(A);
    for (int zc = 0; zc < A; zc++) {
        letter_lacks.push_back(letter_contains[zc].complement());
    }

    // counting sort by bigram, stable so each bucket keeps dictionary order
    uint32_t start = 0;
    for (int k = 0; k < num_bigrams; k++) {
        bigram_ranges[k].start = start;
        bigram_ranges[k].count = bucket_counts[k];
        start += bucket_counts[k];
    }
    for (int f = 0; f < A; f++) {
        first_letter_ranges[f].start = bigram_ranges[f * A].start;
        first_letter_ranges[f].count = bigram_ranges[f * A + A - 1].end() - bigram_ranges[f * A].start;
    }

    vector<uint32_t> next(num_bigrams);
    for (int k = 0; k < num_bigrams; k++) next[k] = bigram_ranges[k].start;
    sorted_order.resize(num_words);
    for (size_t i = 0; i < num_words; i++) {
        const Word& w = words[i];
        sorted_order[next[(w[0] - 'a') * A + (w[1] - 'a')]++] = static_cast<uint32_t>(i);
    }

    sorted_presences.reserve(num_words);
    sorted_packeds.reserve(num_words);
    for (uint32_t i : sorted_order) {
        sorted_presences.push_back(presences[i]);
        sorted_packeds.push_back(packeds[i]);
    }
}

const WordBits& DictionaryIndex::at_position(int pos, int zc) const {
    if (pos < 0 || pos >= L || zc < 0 || zc >= A) throw std::out_of_range("DictionaryIndex::at_position");
    return by_position[pos * A + zc];
}

const WordBits& DictionaryIndex::contains(int zc) const {
    return letter_contains.at(zc);
}

const WordBits& DictionaryIndex::lacks(int zc) const {
    return letter_lacks.at(zc);
}

DictionaryIndex::Range DictionaryIndex::first_letter_range(int zc) const {
    return first_letter_ranges.at(zc);
}

DictionaryIndex::Range DictionaryIndex::bigram_range(int first_zc, int second_zc) const {
    if (first_zc < 0 || first_zc >= A || second_zc < 0 || second_zc >= A) throw std::out_of_range("DictionaryIndex::bigram_range");
    return bigram_ranges[first_zc * A + second_zc];
}

// checks every invariant against the words themselves
static void check_invariants(const Dictionary& d, const DictionaryIndex& x, const std::string& name) {
    const vector<Word>& words = d.get_all_words();
    std::stringstream problems;

    if (x.size() != words.size()) problems << "size mismatch. ";
    if (x.all_words().count() != words.size()) problems << "all_words count. ";

    for (size_t i = 0; i < words.size(); i++) {
        const Word& w = words[i];
        if (x.presence(i) != w.get_presence()) problems << "presence " << i << ". ";
        if (x.packed(i) != w.get_packed()) problems << "packed " << i << ". ";
        for (int zc = 0; zc < A; zc++) {
            bool has = (w.get_presence() >> zc) & 1;
            if (x.contains(zc).get(i) != has) problems << "contains " << i << "/" << zc << ". ";
            if (x.lacks(zc).get(i) == has) problems << "lacks " << i << "/" << zc << ". ";
            for (int pos = 0; pos < L; pos++) {
                if (x.at_position(pos, zc).get(i) != (w[pos] == 'a' + zc)) problems << "at_position " << i << ". ";
            }
        }
    }
    for (int zc = 0; zc < A; zc++) {
        if (x.contains(zc).count() + x.lacks(zc).count() != words.size()) problems << "lacks/contains padding " << zc << ". ";
    }

    // buckets: the concatenation is a permutation, each bucket is sorted by dictionary order
    vector<bool> seen(words.size(), false);
    uint32_t expected_start = 0;
    for (int f = 0; f < A; f++) {
        DictionaryIndex::Range fr = x.first_letter_range(f);
        if (fr.start != expected_start) problems << "first letter range gap at " << f << ". ";
        expected_start = fr.end();
        for (int s = 0; s < A; s++) {
            DictionaryIndex::Range br = x.bigram_range(f, s);
            if (br.start < fr.start || br.end() > fr.end()) problems << "bigram outside first letter " << f << s << ". ";
            for (uint32_t pos = br.start; pos < br.end(); pos++) {
                uint32_t i = x.sorted_to_index(pos).get();
                if (seen[i]) problems << "seen twice " << i << ". ";
                seen[i] = true;
                if (words[i][0] != 'a' + f || words[i][1] != 'a' + s) problems << "wrong bucket " << i << ". ";
                if (pos > br.start && !(x.sorted_to_index(pos - 1).get() < i)) problems << "unstable " << i << ". ";
                if (x.sorted_presence(pos) != words[i].get_presence()) problems << "sorted presence " << i << ". ";
                if (x.sorted_packed(pos) != words[i].get_packed()) problems << "sorted packed " << i << ". ";
            }
        }
    }
    if (expected_start != words.size()) problems << "buckets don't cover. ";
    if (std::count(seen.begin(), seen.end(), false) != 0) problems << "not a permutation. ";

    std::string problems_str = problems.str();
    if (!problems_str.empty()) {
        throw std::runtime_error("DictionaryIndex::test() " + name + " failed: " + problems_str);
    }
}

void DictionaryIndex::test() {
    Dictionary d1({"slate", "crane", "adieu", "stare", "scale", "abbey", "zebra", "shake",
                   "crate", "sweet", "eerie", "mamma", "aaaaa", "zzzzz", "slate", "quack",
                   "jazzy", "fjord", "vivid", "awake", "abide", "about", "cigar", "rebut"});
    DictionaryIndex x1(d1);
    check_invariants(d1, x1, "small");

    Dictionary d0;
    DictionaryIndex x0(d0);
    check_invariants(d0, x0, "empty");

    // crosses a 64-bit block boundary
    vector<std::string> many;
    for (int i = 0; i < 150; i++) {
        std::string s = "aaaaa";
        s[0] = 'a' + (i * 7) % 26;
        s[1] = 'a' + (i * 3) % 26;
        s[2] = 'a' + i % 26;
        s[3] = 'a' + (i / 26) % 26;
        s[4] = 'a' + (i * 11) % 26;
        many.push_back(s);
    }
    Dictionary d2(many);
    DictionaryIndex x2(d2);
    check_invariants(d2, x2, "150 words");

    std::stringstream output;
    std::stringstream expected;
    DictionaryIndex::Range r = x1.first_letter_range('s' - 'a');
    output << r.count << " " << x1.bigram_range('s' - 'a', 'l' - 'a').count << " "
           << x1.first_letter_range('b' - 'a').count << " "
           << x1.contains('e' - 'a').count() << " "
           << x1.at_position(4, 'e' - 'a').count() << std::endl;
    expected << "6 2 0 15 10" << std::endl;

    bool threw = false;
    try {
        x1.at_position(5, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    output << threw << std::endl;
    expected << 1 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("DictionaryIndex::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}
