#include <sstream>
#include <thread>
#include <initializer_list>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "db.hpp"

using std::string;
using std::vector;
using std::map;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
typedef Dictionary::WordIndex WordIndex;

namespace Db {
    //////////////////
    // Db_intf
    void Db_intf::save(const CMask& m, const Result& r) { save(CacheKey(m), r); }
    bool Db_intf::query(const CMask& m, Result& r) const { return query(CacheKey(m), r); }
    bool Db_intf::query(const CacheKey& k) const {
        Result ignored;
        return query(k, ignored);
    }

    bool Db_intf::get_or_compute(const CacheKey& k, const std::function<Result()>& compute, Result& result) {
        if (query(k, result)) return true;
        result = compute();
        save(k, result);
        return false;
    }

    // internal to this file
    static std::ostream& operator<<(std::ostream& os, const Result& r) {
        for (size_t i = 0; i < r.words.size(); i++) {
            if (i) os << " ";
            os << r.words[i].get();
        }
        return os;
    }

    bool silence = false;

    //////////////////
    // Memory_db

    Memory_db::Memory_db(size_t capacity_, bool debug_output_) :
        capacity(capacity_), debug_output(debug_output_), num_hits(0), num_misses(0) {}

    void Memory_db::save(const CacheKey& k, const Result& r) {
        if (capacity == 0) return;
        std::lock_guard<std::mutex> guard(lock);
        if (data.count(k)) return;

        if (data.size() >= capacity) {
            ptime start = microsec_clock::local_time();
            size_t to_evict = (data.size() + 1) / 2;
            auto it = data.begin();
            for (size_t i = 0; i < to_evict; i++) ++it;
            data.erase(data.begin(), it);
            if (!silence) {
                cerr << "Cache full, evicted " << to_evict << " entries, took "
                     << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
            }
        }
        if (debug_output) {
            cerr << "saving " << k << " -> " << r.words.size() << " words, " << r.algorithm << endl;
        }
        data.insert(std::make_pair(k, r));
    }

    bool Memory_db::query(const CacheKey& k, Result& result) const {
        std::lock_guard<std::mutex> guard(lock);
        auto it = data.find(k);
        if (it == data.end()) {
            num_misses++;
            return false;
        } else {
            num_hits++;
            result = it->second;
            return true;
        }
    }

    size_t Memory_db::size() const {
        std::lock_guard<std::mutex> guard(lock);
        return data.size();
    }
    uint64_t Memory_db::hits() const {
        std::lock_guard<std::mutex> guard(lock);
        return num_hits;
    }
    uint64_t Memory_db::misses() const {
        std::lock_guard<std::mutex> guard(lock);
        return num_misses;
    }
    double Memory_db::hit_ratio() const {
        std::lock_guard<std::mutex> guard(lock);
        uint64_t total = num_hits + num_misses;
        return total == 0 ? 0.0 : static_cast<double>(num_hits) / total;
    }
    void Memory_db::clear() {
        std::lock_guard<std::mutex> guard(lock);
        data.clear();
        num_hits = 0;
        num_misses = 0;
    }

    //////////////////
    // Null_db

    void Null_db::save(const CacheKey&, const Result&) {
        return;
    }
    bool Null_db::query(const CacheKey&, Result&) const {
        return false;
    }

    static Result result_of(std::initializer_list<uint32_t> l, Solver::Algorithm a = Solver::Algorithm::bitset) {
        Result rv;
        for (uint32_t i : l) rv.words.push_back(WordIndex(i));
        rv.algorithm = a;
        return rv;
    }

    static bool same(const Result& a, const Result& b) {
        return a.words == b.words && a.algorithm == b.algorithm;
    }

    static CacheKey key_of_yellow(char c, uint8_t forbidden) {
        map<char, uint8_t> y;
        y[c] = forbidden;
        return CacheKey(CMask::compile(std::set<char>(), map<int, char>(), y));
    }

    static void test1() {
        std::stringstream output;
        std::stringstream expected;
        Result r;

        CacheKey k1 = key_of_yellow('a', 0);
        CacheKey k2 = key_of_yellow('a', 1);
        CacheKey k3 = key_of_yellow('b', 0);
        CacheKey k4 = key_of_yellow('c', 2);
        CacheKey k5 = key_of_yellow('d', 4);

        Memory_db db(4, false);
        bool hit = db.query(k1, r);
        output << hit << " " << r.words.size() << endl;
        db.save(k1, result_of({1, 2}));
        hit = db.query(k1, r);
        Db::operator<<(output << hit << " ", r) << endl;
        // first save wins
        db.save(k1, result_of({9}));
        hit = db.query(k1, r);
        Db::operator<<(output << hit << " ", r) << " " << db.hits() << " " << db.misses() << " " << db.hit_ratio() << endl;
        expected << "0 0" << endl;
        expected << "1 1 2" << endl;
        expected << "1 1 2 2 1 0.666667" << endl;

        // a different forbidden position is a different key
        output << db.query(k2) << endl;
        expected << 0 << endl;

        db.save(k2, result_of({2}));
        db.save(k3, result_of({3}));
        db.save(k4, result_of({4}));
        output << db.size() << endl;
        expected << 4 << endl;

        // full, half goes
        db.save(k5, result_of({5}));
        hit = db.query(k5, r);
        Db::operator<<(output << db.size() << " " << hit << " ", r) << endl;
        expected << "3 1 5" << endl;

        // whatever survived still maps to what was saved
        CacheKey keys[] = { k1, k2, k3, k4 };
        Result values[] = { result_of({1, 2}), result_of({2}), result_of({3}), result_of({4}) };
        int survivors = 0;
        bool consistent = true;
        for (int i = 0; i < 4; i++) {
            Result v;
            if (db.query(keys[i], v)) {
                survivors++;
                if (!same(v, values[i])) consistent = false;
            }
        }
        output << survivors << consistent << endl;
        expected << "21" << endl;

        db.clear();
        output << db.size() << db.hits() << db.misses() << db.hit_ratio() << endl;
        expected << "0000" << endl;

        // the CMask and key-only overloads reach the same entries
        map<int, char> green;
        green[0] = 's';
        CMask m = CMask::compile(std::set<char>(), green, map<char, uint8_t>());
        db.save(m, result_of({7}));
        Result via_mask;
        output << db.query(CacheKey(m));
        hit = db.query(m, via_mask);
        Db::operator<<(output << hit << " ", via_mask) << endl;
        expected << "11 7" << endl;

        // a hit hands back the algorithm that computed it
        db.save(k3, result_of({3}, Solver::Algorithm::bucket));
        Result got;
        got.algorithm = Solver::Algorithm::filter;
        hit = db.query(k3, got);
        output << hit << " " << got.algorithm << endl;
        expected << "1 bucket" << endl;

        Memory_db off(0, false);
        off.save(k1, result_of({1}));
        output << off.size() << off.query(k1) << endl;
        expected << "00" << endl;

        Null_db null_db;
        null_db.save(k1, result_of({1}));
        null_db.save(m, result_of({1}));
        output << null_db.query(k1, r) << null_db.query(k1) << null_db.query(m, r) << endl;
        expected << "000" << endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Db::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    static void test2() {
        std::stringstream output;
        std::stringstream expected;

        Memory_db db(100, false);
        CacheKey k = key_of_yellow('e', 3);
        int calls = 0;
        std::function<Result()> compute = [&calls] () {
            calls++;
            return result_of({4, 8, 15}, Solver::Algorithm::bucket);
        };
        Result r1, r2;
        bool hit1 = db.get_or_compute(k, compute, r1);
        bool hit2 = db.get_or_compute(k, compute, r2);
        Db::operator<<(output << hit1 << hit2 << " " << calls << " ", r1) << " " << same(r1, r2) << " " << r2.algorithm << endl;
        expected << "01 1 4 8 15 1 bucket" << endl;

        // many threads hammering the same small key set
        const int num_threads = 4;
        vector<std::thread> threads;
        vector<int> wrong(num_threads, 0);
        for (int t = 0; t < num_threads; t++) {
            threads.push_back(std::thread([&db, &wrong, t] () {
                for (int i = 0; i < 200; i++) {
                    uint32_t letter = i % 10;
                    CacheKey key = key_of_yellow('a' + letter, 0);
                    Result got;
                    db.get_or_compute(key, [letter] () { return result_of({letter, letter + 100}); }, got);
                    if (!same(got, result_of({letter, letter + 100}))) wrong[t]++;
                }
            }));
        }
        for (std::thread& th : threads) th.join();
        int total_wrong = 0;
        for (int w : wrong) total_wrong += w;
        output << total_wrong << " " << db.size() << " " << (db.hits() + db.misses()) << endl;
        expected << "0 11 802" << endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Db::test() 2 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    void test() {
        silence = true;
        test1();
        test2();
        silence = false;
    }
}
