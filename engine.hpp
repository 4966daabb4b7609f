/* Everything a caller needs: load the words once, build the index once, then
   answer as many queries as you like. Each Engine owns its own result cache,
   cached results are only meaningful for the index they were computed on.

   Queries never change the dictionary or the index, and the cache has its own
   lock, so query/solve can be called from several threads at once.
*/

#pragma once
#include <vector>
#include <string>
#include <map>
#include <set>
#include <memory>
#include "word.hpp"
#include "dictionary.hpp"
#include "dindex.hpp"
#include "cmask.hpp"
#include "scan.hpp"
#include "executor.hpp"
#include "db.hpp"
#include "queryresult.hpp"

class Engine {
public:
    struct Config {
        Config();
        Solver::Algorithm algorithm; // default automatic
        std::string scan;            // "scalar" or "batch" (default)
        int threads;                 // 1 (default) runs every query on the calling thread
        size_t cache_capacity;       // 0 turns the cache off, default 10000
        bool debug_output;           // log every query to stderr
    };

    // Both throw ResourceError if no valid words are left, and std::runtime_error on a bad config.
    Engine(const std::vector<std::string>& raw_words, const Config& c = Config());
    Engine(const Dictionary& d, const Config& c = Config());
    static std::unique_ptr<Engine> from_file(const std::string& filename, const Config& c = Config());

    std::vector<Word> solve(const std::set<char>& excluded,
                            const std::map<int, char>& green,
                            const std::map<char, uint8_t>& yellow);
    // yellow letters with no forbidden positions
    std::vector<Word> solve(const std::set<char>& excluded,
                            const std::map<int, char>& green,
                            const std::set<char>& yellow);

    // with the configured algorithm
    Solver::QueryResult query(const CMask& m);
    Solver::QueryResult query(const CMask& m, Solver::Algorithm a);

    std::vector<Word> words_of(const std::vector<Dictionary::WordIndex>& indices) const;

    const Dictionary& get_dictionary() const { return dictionary; }
    const DictionaryIndex& get_index() const { return index; }
    const Config& get_config() const { return config; }
    const Db::Memory_db& get_cache() const { return cache; }

    // turns off the build messages, only set by the tests
    static bool silence;

    static void test(const std::string& words_file);
private:
    Config config;
    Dictionary dictionary;
    DictionaryIndex index;
    std::unique_ptr<Scan::Scan_intf> scan;
    std::unique_ptr<Exec::Executor_intf> executor;
    Db::Memory_db cache;
};
