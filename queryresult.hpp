#pragma once
#include <vector>
#include <string>
#include <iostream>
#include "dictionary.hpp"

namespace Solver {
    // How a query gets answered. [automatic] lets Solver::choose_algorithm decide per query.
    enum class Algorithm
        { automatic,
          bitset,
          bucket,
          naive,
          filter };

    // "auto", "bitset", "bucket", "naive" or "filter", throws std::runtime_error otherwise
    Algorithm algorithm_of_string(const std::string& str);

    /* The result of an Engine::query. */
    class QueryResult {
    public:
        QueryResult();
        std::vector<Dictionary::WordIndex> words; // matches, in dictionary order

        Algorithm algorithm; // the one picked for the query, never [automatic]
        bool from_cache;

        // performance stats
        float perf_microseconds;

        std::string to_string() const;

        static void test();
    };

    std::ostream& operator<<(std::ostream& os, Algorithm a);
    std::ostream& operator<<(std::ostream& os, const QueryResult& r);
}
