#include <sstream>
#include <cstring>
#include "scan.hpp"

using std::vector;
using std::string;
using std::map;
using std::set;
typedef Dictionary::WordIndex WordIndex;

// GCC vector extensions, also fine with clang
typedef int32_t v8i __attribute__ ((vector_size (32)));

namespace Scan {
    void Scalar_scan::scan(const DictionaryIndex& x, const CMask& m, uint32_t begin, uint32_t end,
                           vector<WordIndex>& out) const {
        for (uint32_t i = begin; i < end; i++) {
            if (m.check(x.sorted_presence(i), x.sorted_packed(i))) {
                out.push_back(x.sorted_to_index(i));
            }
        }
    }

    const int Batch_scan::lanes;

    void Batch_scan::scan(const DictionaryIndex& x, const CMask& m, uint32_t begin, uint32_t end,
                          vector<WordIndex>& out) const {
        const int32_t* presences = x.sorted_presence_data();
        const uint64_t* packeds = x.sorted_packed_data();
        const int32_t e = m.get_excluded();
        const int32_t r = m.get_required();
        const uint64_t green_mask = m.get_green_mask();
        const uint64_t green_value = m.get_green_value();

        const v8i v_excluded = {e, e, e, e, e, e, e, e};
        const v8i v_required = {r, r, r, r, r, r, r, r};
        const v8i v_zero = {0, 0, 0, 0, 0, 0, 0, 0};

        uint32_t i = begin;
        for (; i + lanes <= end; i += lanes) {
            v8i p;
            std::memcpy(&p, presences + i, sizeof(p));
            // -1 in every lane we can throw away without looking at the letters
            v8i reject = ((p & v_excluded) != v_zero) | ((p & v_required) != v_required);
            for (int lane = 0; lane < lanes; lane++) {
                if (reject[lane]) continue;
                uint64_t packed = packeds[i + lane];
                if ((packed & green_mask) != green_value) continue;
                if (!m.yellow_ok(packed)) continue;
                out.push_back(x.sorted_to_index(i + lane));
            }
        }
        for (; i < end; i++) {
            if (m.check(presences[i], packeds[i])) {
                out.push_back(x.sorted_to_index(i));
            }
        }
    }

    std::unique_ptr<Scan_intf> of_string(const string& s) {
        if (s == "scalar") return std::unique_ptr<Scan_intf>(new Scalar_scan());
        if (s == "batch") return std::unique_ptr<Scan_intf>(new Batch_scan());
        throw std::runtime_error("Scan::of_string: " + s);
    }

    static void test1() {
        Dictionary d({"slate", "crane", "adieu", "stare", "scale", "abbey", "zebra", "shake",
                      "crate", "sweet", "eerie", "mamma", "sissy", "sonic", "quack", "jazzy",
                      "fjord", "vivid", "awake", "abide", "about", "cigar", "rebut", "sauce",
                      "salad", "scare", "snare", "spare", "shade", "saute", "swore", "slave",
                      "stale", "solar", "sugar", "skate", "space", "style", "smile", "stone"});
        DictionaryIndex x(d);

        map<int, char> no_green;
        map<char, uint8_t> no_yellow;
        map<int, char> g1;
        g1[0] = 's';
        g1[4] = 'e';
        map<char, uint8_t> y1;
        y1['a'] = 0x3;
        map<int, char> g2;
        g2[0] = 's';
        g2[2] = 'a';
        g2[4] = 'e';
        map<char, uint8_t> y2;
        y2['r'] = 0;

        vector<CMask> masks;
        masks.push_back(CMask());
        masks.push_back(CMask::compile({'q', 'x', 'z', 'j', 'v'}, no_green, no_yellow));
        masks.push_back(CMask::compile(set<char>(), g1, no_yellow));
        masks.push_back(CMask::compile(set<char>(), no_green, y1));
        masks.push_back(CMask::compile({'q', 'x', 'z', 'j', 'v', 'w', 'k', 'f', 'b', 'p'}, g2, y2));

        Scalar_scan scalar;
        Batch_scan batch;
        uint32_t n = static_cast<uint32_t>(x.size());
        uint32_t ranges[][2] = { {0, n}, {3, n}, {5, 13}, {7, 7}, {n - 3, n}, {1, 9} };

        int mismatches = 0;
        size_t total = 0;
        for (const CMask& m : masks) {
            for (auto& range : ranges) {
                vector<WordIndex> expected;
                for (uint32_t i = range[0]; i < range[1]; i++) {
                    WordIndex wi = x.sorted_to_index(i);
                    if (m.check(d.of_word_index(wi))) expected.push_back(wi);
                }
                vector<WordIndex> got_scalar;
                vector<WordIndex> got_batch;
                scalar.scan(x, m, range[0], range[1], got_scalar);
                batch.scan(x, m, range[0], range[1], got_batch);
                if (got_scalar != expected) mismatches++;
                if (got_batch != expected) mismatches++;
                total += expected.size();
            }
        }
        if (mismatches != 0 || total == 0) {
            std::stringstream ss;
            ss << mismatches << " mismatches, " << total << " matches";
            throw std::runtime_error("Scan::test() 1 failed: " + ss.str());
        }

        // appends, doesn't clear
        vector<WordIndex> out(1, WordIndex(99));
        batch.scan(x, masks[2], 0, n, out);
        std::stringstream output;
        std::stringstream expected;
        output << out.size() << " " << out[0].get() << " " << d.of_word_index(out[1]) << std::endl;
        expected << "19 99 sauce" << std::endl;

        output << of_string("scalar")->name() << " " << of_string("batch")->name() << std::endl;
        expected << "scalar batch" << std::endl;
        bool threw = false;
        try {
            of_string("gpu");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        output << threw << std::endl;
        expected << 1 << std::endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Scan::test() 2 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    void test() {
        test1();
    }
}
