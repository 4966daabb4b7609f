#include <sstream>
#include "queryresult.hpp"

using std::string;
using std::stringstream;

namespace Solver {
    QueryResult::QueryResult() : algorithm(Algorithm::bitset), from_cache(false), perf_microseconds(0) {}

    Algorithm algorithm_of_string(const string& str) {
        if (str == "auto") return Algorithm::automatic;
        if (str == "bitset") return Algorithm::bitset;
        if (str == "bucket") return Algorithm::bucket;
        if (str == "naive") return Algorithm::naive;
        if (str == "filter") return Algorithm::filter;
        throw std::runtime_error("algorithm_of_string: " + str);
    }

    std::ostream& operator<<(std::ostream& os, Algorithm a) {
        switch (a) {
        case Algorithm::automatic: return os << "auto";
        case Algorithm::bitset: return os << "bitset";
        case Algorithm::bucket: return os << "bucket";
        case Algorithm::naive: return os << "naive";
        case Algorithm::filter: return os << "filter";
        }
        return os << "?";
    }

    std::ostream& operator<<(std::ostream& os, const QueryResult& r) {
        os << r.words.size() << "," << r.algorithm << "," << (r.from_cache ? "cached" : "computed") << "," << r.perf_microseconds;
        return os;
    }

    string QueryResult::to_string() const {
        stringstream ss;
        ss << *this;
        return ss.str();
    }

    void QueryResult::test() {
        QueryResult r;
        std::stringstream output;
        std::stringstream expected;

        output << r << std::endl;
        expected << "0,bitset,computed,0" << std::endl;

        r.words.push_back(Dictionary::WordIndex(3));
        r.words.push_back(Dictionary::WordIndex(7));
        r.algorithm = algorithm_of_string("bucket");
        r.from_cache = true;
        r.perf_microseconds = 12.5;
        output << r.to_string() << std::endl;
        expected << "2,bucket,cached,12.5" << std::endl;

        const char* names[] = { "auto", "bitset", "bucket", "naive", "filter" };
        for (const char* n : names) {
            output << algorithm_of_string(n) << " ";
        }
        output << std::endl;
        expected << "auto bitset bucket naive filter " << std::endl;

        bool threw = false;
        try {
            algorithm_of_string("simd");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        output << threw << std::endl;
        expected << 1 << std::endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("QueryResult::test() failed, got " + output_str + ", but expected " + expected_str);
        }
    }
}
