#include <iostream>
#include <string>
#include "word.hpp"
#include "wordbits.hpp"
#include "dictionary.hpp"
#include "dindex.hpp"
#include "cmask.hpp"
#include "cachekey.hpp"
#include "filter.hpp"
#include "scan.hpp"
#include "executor.hpp"
#include "solver.hpp"
#include "queryresult.hpp"
#include "db.hpp"
#include "engine.hpp"

#ifndef WORDFILTER_TEST_WORDS
#define WORDFILTER_TEST_WORDS "words5.txt"
#endif

int main(int argc, char* argv[]) {
    std::string words_file = argc > 1 ? argv[1] : WORDFILTER_TEST_WORDS;

    try {
        Word::test();
        WordBits::test();
        Dictionary::test();
        DictionaryIndex::test();
        CMask::test();
        CacheKey::test();
        Filter::test();
        Scan::test();
        Exec::test();
        Solver::QueryResult::test();
        Db::test();
        Dictionary::silence = true;
        Solver::test(words_file);
        Dictionary::silence = false;
        Engine::test(words_file);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
