#include <iostream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include "solver.hpp"
#include "naive.hpp"

using std::string;
using std::vector;
using std::set;
using std::map;
typedef Dictionary::WordIndex WordIndex;
typedef DictionaryIndex::Range Range;

static const int L = Word::length;
static const int A = Word::alphabet_size;

namespace Solver {
    Indices bitset_list(const DictionaryIndex& x, const CMask& m, const Exec::Executor_intf& executor) {
        vector<const WordBits*> and_steps;
        vector<const WordBits*> and_not_steps;
        int32_t excluded = m.get_excluded();
        for (int zc = 0; zc < A; zc++) {
            if (excluded & (1 << zc)) and_steps.push_back(&x.lacks(zc));
        }
        for (const CMask::Green& g : m.get_greens()) {
            and_steps.push_back(&x.at_position(g.pos, g.ascii - 'a'));
        }
        for (const CMask::Yellow& y : m.get_yellows()) {
            int zc = y.ascii - 'a';
            and_steps.push_back(&x.contains(zc));
            for (int pos = 0; pos < L; pos++) {
                if (y.forbidden & (1 << pos)) and_not_steps.push_back(&x.at_position(pos, zc));
            }
        }

        // every chunk only touches its own blocks
        WordBits result = x.all_words();
        return executor.run(result.num_blocks(), [&] (size_t first, size_t end, Indices& out) {
            for (const WordBits* s : and_steps) result.and_with(*s, first, end);
            for (const WordBits* s : and_not_steps) result.and_not_with(*s, first, end);
            vector<uint32_t> found;
            result.extract(first, end, found);
            out.reserve(out.size() + found.size());
            for (uint32_t i : found) out.push_back(WordIndex(i));
        });
    }

    vector<Range> bucket_ranges(const DictionaryIndex& x, const CMask& m) {
        vector<Range> candidates;
        uint8_t g0 = m.green_at(0);
        uint8_t g1 = m.green_at(1);
        int32_t excluded = m.get_excluded();
        if (g0 && g1) {
            candidates.push_back(x.bigram_range(g0 - 'a', g1 - 'a'));
        } else if (g0) {
            candidates.push_back(x.first_letter_range(g0 - 'a'));
        } else if (g1) {
            for (int f = 0; f < A; f++) {
                if (!(excluded & (1 << f))) candidates.push_back(x.bigram_range(f, g1 - 'a'));
            }
        } else {
            for (int f = 0; f < A; f++) {
                if (!(excluded & (1 << f))) candidates.push_back(x.first_letter_range(f));
            }
        }

        vector<Range> rv;
        for (const Range& r : candidates) {
            if (r.count) rv.push_back(r);
        }
        return rv;
    }

    Indices bucket_list(const DictionaryIndex& x, const CMask& m, const Scan::Scan_intf& scan, const Exec::Executor_intf& executor) {
        vector<Range> ranges = bucket_ranges(x, m);
        size_t total = 0;
        for (const Range& r : ranges) total += r.count;

        // units are positions in the concatenation of the ranges
        Indices rv = executor.run(total, [&] (size_t b, size_t e, Indices& out) {
            size_t offset = 0;
            for (const Range& r : ranges) {
                size_t rb = offset;
                size_t re = offset + r.count;
                offset = re;
                if (re <= b) continue;
                if (rb >= e) break;
                uint32_t from = r.start + static_cast<uint32_t>(std::max(rb, b) - rb);
                uint32_t to = r.start + static_cast<uint32_t>(std::min(re, e) - rb);
                scan.scan(x, m, from, to, out);
            }
        });
        // buckets come out in bucket order
        std::sort(rv.begin(), rv.end());
        return rv;
    }

    Indices filter_list(const Dictionary& d, const Filter& f) {
        Indices rv;
        const vector<Word>& words = d.get_all_words();
        for (size_t i = 0; i < words.size(); i++) {
            if (f.matches(words[i])) rv.push_back(WordIndex(static_cast<uint32_t>(i)));
        }
        return rv;
    }

    Algorithm choose_algorithm(const CMask& m) {
        if (m.green_at(0)) return Algorithm::bucket;
        return Algorithm::bitset;
    }

    Indices solve(const Dictionary& d,
                  const DictionaryIndex& x,
                  const CMask& m,
                  Algorithm a,
                  const Scan::Scan_intf& scan,
                  const Exec::Executor_intf& executor) {
        if (a == Algorithm::automatic) a = choose_algorithm(m);
        switch (a) {
        case Algorithm::bitset:
            return bitset_list(x, m, executor);
        case Algorithm::bucket:
            return bucket_list(x, m, scan, executor);
        case Algorithm::filter:
            return filter_list(d, Filter::of_cmask(m));
        case Algorithm::naive:
        case Algorithm::automatic:
            break;
        }
        std::stringstream ss;
        ss << a;
        throw std::invalid_argument("Solver::solve can't run algorithm: " + ss.str());
    }

    //////////////////
    // tests

    struct Scenario {
        string name;
        set<char> excluded;
        map<int, char> green;
        map<char, uint8_t> yellow;
    };

    static vector<Scenario> scenarios() {
        vector<Scenario> rv;
        rv.push_back(Scenario{ "no constraints", {}, {}, {} });
        rv.push_back(Scenario{ "excluded only", {'q', 'x', 'z', 'j', 'v'}, {}, {} });
        rv.push_back(Scenario{ "green only", {}, {{0, 's'}, {4, 'e'}}, {} });
        rv.push_back(Scenario{ "yellow only", {}, {}, {{'a', 0}, {'e', 0}, {'i', 0}} });
        rv.push_back(Scenario{ "mixed", {'q', 'x', 'z'}, {{0, 's'}}, {{'a', 0}} });
        rv.push_back(Scenario{ "heavy", {'q', 'x', 'z', 'j', 'v', 'w', 'k', 'f', 'b', 'p'},
                               {{0, 's'}, {2, 'a'}, {4, 'e'}}, {{'r', 0}} });
        rv.push_back(Scenario{ "yellow positions", {'q', 'x', 'z'}, {}, {{'a', 0x03}} });
        rv.push_back(Scenario{ "green at 1 only", {'c'}, {{1, 'r'}}, {} });
        rv.push_back(Scenario{ "green at 0 and 1", {}, {{0, 's'}, {1, 't'}}, {{'e', 0x10}} });
        rv.push_back(Scenario{ "green and gray", {'s', 'e'}, {{0, 'S'}}, {} });
        rv.push_back(Scenario{ "many yellows", {'u'}, {}, {{'r', 0x01}, {'E', 0x10}, {'t', 0x04}} });
        return rv;
    }

    static bool all_agree(const Dictionary& d, const DictionaryIndex& x, const Scenario& s, std::ostream& problems) {
        Exec::Sequential_executor seq;
        Exec::Threaded_executor threaded(4);
        Scan::Scalar_scan scalar;
        Scan::Batch_scan batch;

        CMask m = CMask::compile(s.excluded, s.green, s.yellow);
        Indices expected = naive_list(d, s.excluded, s.green, s.yellow);

        bool ok = true;
        auto check = [&] (const string& what, const Indices& got) {
            if (got != expected) {
                problems << s.name << ": " << what << " got " << got.size() << " words, expected " << expected.size() << ". ";
                ok = false;
            }
        };
        check("bitset", bitset_list(x, m, seq));
        check("bitset threaded", bitset_list(x, m, threaded));
        check("bucket scalar", bucket_list(x, m, scalar, seq));
        check("bucket batch", bucket_list(x, m, batch, seq));
        check("bucket batch threaded", bucket_list(x, m, batch, threaded));
        check("filter", filter_list(d, Filter::of_cmask(m)));
        check("auto", solve(d, x, m, Algorithm::automatic, batch, threaded));
        for (WordIndex i : expected) {
            if (!m.check(d.of_word_index(i))) {
                problems << s.name << ": " << d.of_word_index(i) << " fails check. ";
                ok = false;
            }
        }
        return ok;
    }

    static bool has(const Dictionary& d, const Indices& r, const string& w) {
        for (WordIndex i : r) {
            if (d.of_word_index(i).raw() == w) return true;
        }
        return false;
    }

    // over the real word list
    static void test1(const Dictionary& d, const DictionaryIndex& x) {
        std::stringstream problems;
        for (const Scenario& s : scenarios()) {
            all_agree(d, x, s, problems);
        }
        string problems_str = problems.str();
        if (!problems_str.empty()) {
            throw std::runtime_error("Solver::test() 1 failed: " + problems_str);
        }
    }

    static void test2(const Dictionary& d, const DictionaryIndex& x) {
        std::stringstream output;
        std::stringstream expected;
        Exec::Sequential_executor seq;
        Scan::Batch_scan batch;
        set<char> none;
        map<char, uint8_t> no_yellow;

        map<int, char> se;
        se[0] = 's';
        se[4] = 'e';
        CMask m = CMask::compile(none, se, no_yellow);
        Indices r = bitset_list(x, m, seq);
        bool shape = !r.empty();
        for (WordIndex i : r) {
            const Word& w = d.of_word_index(i);
            if (w[0] != 's' || w[4] != 'e') shape = false;
        }
        output << has(d, r, "slate") << has(d, r, "crane") << has(d, r, "adieu") << shape << std::endl;
        expected << "1001" << std::endl;

        map<char, uint8_t> ya;
        ya['a'] = 0x03;
        m = CMask::compile({'q', 'x', 'z'}, map<int, char>(), ya);
        r = bucket_list(x, m, batch, seq);
        shape = !r.empty();
        for (WordIndex i : r) {
            const Word& w = d.of_word_index(i);
            if (!w.contains('a') || w[0] == 'a' || w[1] == 'a') shape = false;
            if (w.contains('q') || w.contains('x') || w.contains('z')) shape = false;
        }
        output << has(d, r, "slate") << has(d, r, "crane") << has(d, r, "adieu") << shape << std::endl;
        expected << "1101" << std::endl;

        // out of range greens do nothing at all
        map<int, char> g7;
        g7[7] = 's';
        map<int, char> gneg;
        gneg[-1] = 's';
        map<int, char> gdigit;
        gdigit[0] = '1';
        output << (bitset_list(x, CMask::compile(none, g7, no_yellow), seq).size() == d.size())
               << (bucket_list(x, CMask::compile(none, gneg, no_yellow), batch, seq).size() == d.size())
               << (CMask::compile(none, gdigit, no_yellow) == CMask()) << std::endl;
        expected << "111" << std::endl;

        // gray and yellow on the same letter can't both hold
        CMask contradiction = CMask::compile({'s'}, map<int, char>(), set<char>{'s'});
        output << bitset_list(x, contradiction, seq).size()
               << bucket_list(x, contradiction, batch, seq).size()
               << filter_list(d, Filter::of_cmask(contradiction)).size()
               << naive_list(d, {'s'}, map<int, char>(), {{'s', 0}}).size() << std::endl;
        expected << "0000" << std::endl;

        // same query twice, same answer
        Exec::Threaded_executor threaded(3);
        Indices once = solve(d, x, m, Algorithm::automatic, batch, threaded);
        Indices twice = solve(d, x, m, Algorithm::automatic, batch, threaded);
        output << (once == twice) << std::endl;
        expected << 1 << std::endl;

        // bucket selection
        map<int, char> st;
        st[0] = 's';
        st[1] = 't';
        map<int, char> r1;
        r1[1] = 'r';
        size_t sum = 0;
        for (const Range& range : bucket_ranges(x, CMask())) sum += range.count;
        output << bucket_ranges(x, CMask::compile(none, st, no_yellow)).size() << " "
               << bucket_ranges(x, CMask::compile(none, se, no_yellow)).size() << " "
               << (bucket_ranges(x, CMask::compile({'a'}, r1, no_yellow)).size() <= 25) << " "
               << (bucket_ranges(x, CMask::compile({'q', 'x', 'z'}, map<int, char>(), no_yellow)).size() <= 23) << " "
               << (sum == d.size()) << std::endl;
        expected << "1 1 1 1 1" << std::endl;

        output << choose_algorithm(CMask::compile(none, se, no_yellow)) << " "
               << choose_algorithm(CMask::compile(none, r1, no_yellow)) << " "
               << choose_algorithm(CMask()) << std::endl;
        expected << "bucket bitset bitset" << std::endl;

        bool threw = false;
        try {
            solve(d, x, CMask(), Algorithm::naive, batch, seq);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        output << threw << std::endl;
        expected << 1 << std::endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Solver::test() 2 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    // empty and tiny dictionaries, and one that spans a few bitset blocks
    static void test3() {
        std::stringstream problems;

        Dictionary d0;
        DictionaryIndex x0(d0);
        for (const Scenario& s : scenarios()) {
            all_agree(d0, x0, s, problems);
        }

        Dictionary d1({"slate"});
        DictionaryIndex x1(d1);
        for (const Scenario& s : scenarios()) {
            all_agree(d1, x1, s, problems);
        }

        vector<string> many;
        const char* stems[] = { "sl", "st", "cr", "ad", "ab", "ze", "qu", "ra" };
        const char* tails[] = { "ate", "are", "ice", "eer", "out", "ive", "ank", "ess",
                                "ant", "ine", "ore", "ack", "ump", "ide", "oke", "ear" };
        for (const char* st : stems) {
            for (const char* t : tails) {
                many.push_back(string(st) + t);
            }
        }
        Dictionary d2(many);
        DictionaryIndex x2(d2);
        for (const Scenario& s : scenarios()) {
            all_agree(d2, x2, s, problems);
        }

        string problems_str = problems.str();
        if (!problems_str.empty()) {
            throw std::runtime_error("Solver::test() 3 failed: " + problems_str);
        }
    }

    void test(const string& words_file) {
        Dictionary d = Dictionary::load_from_file(words_file);
        DictionaryIndex x(d);
        test1(d, x);
        test2(d, x);
        test3();
    }
}
