#pragma once
#include <vector>
#include <string>
#include "word.hpp"
#include "dictionary.hpp"
#include "dindex.hpp"
#include "cmask.hpp"
#include "filter.hpp"
#include "scan.hpp"
#include "executor.hpp"
#include "queryresult.hpp"

namespace Solver {
    typedef std::vector<Dictionary::WordIndex> Indices;

    // Every function below returns the words of x that pass m, in dictionary order.
    // They differ only in how fast they get there.

    // AND together one precomputed bitset per constraint, then read off the set
    // bits. The blocks are split between the executor's chunks.
    Indices bitset_list(const DictionaryIndex& x,
                        const CMask& m,
                        const Exec::Executor_intf& executor);

    // The sorted ranges worth looking at:
    //   green at 0 and 1 -> that one bigram bucket
    //   green at 0       -> that first letter's bucket
    //   green at 1       -> the (f, green) bigram bucket for every first letter f that isn't excluded
    //   otherwise        -> every first letter's bucket that isn't excluded
    // Empty ranges are left out.
    std::vector<DictionaryIndex::Range> bucket_ranges(const DictionaryIndex& x, const CMask& m);

    // scan only what bucket_ranges picked
    Indices bucket_list(const DictionaryIndex& x,
                        const CMask& m,
                        const Scan::Scan_intf& scan,
                        const Exec::Executor_intf& executor);

    // linear, f.matches on every word
    Indices filter_list(const Dictionary& d, const Filter& f);

    // bucket if position 0 is green, bitset otherwise. Only about speed.
    Algorithm choose_algorithm(const CMask& m);

    // [a] can't be naive, the naive solver needs the raw constraints (see naive.hpp).
    // Throws std::invalid_argument for it.
    Indices solve(const Dictionary& d,
                  const DictionaryIndex& x,
                  const CMask& m,
                  Algorithm a,
                  const Scan::Scan_intf& scan,
                  const Exec::Executor_intf& executor);

    void test(const std::string& words_file);
}
