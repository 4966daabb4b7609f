#include <string>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <iostream>
#include <boost/program_options.hpp>
#include "word.hpp"
#include "cmask.hpp"
#include "dictionary.hpp"
#include "engine.hpp"

using std::set;
using std::map;
using std::vector;
using std::cout;
using std::cerr;
using std::string;
using std::endl;

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    string opt_words;
    string opt_excluded;
    string opt_green;
    string opt_yellow;
    string opt_solver;
    string opt_why;
    Engine::Config config;
    size_t limit = 0;
    int repeat = 1;

    po::options_description desc("Print every word that fits the wordle constraints");
    desc.add_options()
        ("words,w",    po::value<string>(&opt_words)->default_value("words5.txt"),        "word list, one word per line")
        ("excluded,e", po::value<string>(&opt_excluded),                                  "gray letters, e.g. qxz")
        ("green,g",    po::value<string>(&opt_green),                                     "green letters by position, e.g. 0:s,4:e")
        ("yellow,y",   po::value<string>(&opt_yellow),                                    "yellow letters with the positions they're not at, e.g. a:01,e")
        ("solver,s",   po::value<string>(&opt_solver)->default_value("auto"),             "auto, bitset, bucket, naive or filter")
        ("scan",       po::value<string>(&config.scan)->default_value("batch"),           "scalar or batch")
        ("threads,t",  po::value<int>(&config.threads)->default_value(1),                 "threads per query")
        ("cache,c",    po::value<size_t>(&config.cache_capacity)->default_value(10000),   "result cache size, 0 turns it off")
        ("limit,n",    po::value<size_t>(&limit)->default_value(0),                       "print at most this many words, 0 for all")
        ("repeat,r",   po::value<int>(&repeat)->default_value(1),                         "run the query this many times")
        ("why",        po::value<string>(&opt_why),                                       "explain why this word does or doesn't fit")
        ("verbose,v",                                                                     "log every query")
        ("help,h",                                                                        "produce help message");
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        cerr << e.what() << endl << desc << endl;
        return 1;
    }
    if (vm.count("help")) {
        cerr << desc << endl;
        return 1;
    }
    config.debug_output = vm.count("verbose") > 0;

    CMask m;
    try {
        config.algorithm = Solver::algorithm_of_string(opt_solver);
        m = CMask::compile(CMask::excluded_of_string(opt_excluded),
                           CMask::green_of_string(opt_green),
                           CMask::yellow_of_string(opt_yellow));
    } catch (const std::runtime_error& e) {
        cerr << "Bad arguments: " << e.what() << endl;
        return 1;
    }

    std::unique_ptr<Engine> engine;
    try {
        engine = Engine::from_file(opt_words, config);
    } catch (const std::runtime_error& e) {
        cerr << e.what() << endl;
        return 1;
    }
    cerr << "Constraints: " << m << endl;

    Solver::QueryResult result;
    for (int i = 0; i < repeat; i++) {
        result = engine->query(m);
    }

    vector<Word> words = engine->words_of(result.words);
    for (size_t i = 0; i < words.size() && (limit == 0 || i < limit); i++) {
        cout << words[i] << endl;
    }
    cerr << words.size() << " words, " << result.algorithm << (result.from_cache ? " (cached)" : "")
         << ", took " << result.perf_microseconds / 1e6 << "s" << endl;

    if (!opt_why.empty()) {
        try {
            Word w(opt_why);
            m.check_detail_reasons_exn(w);
            cout << w << " fits." << endl;
        } catch (const InvalidWord& e) {
            cerr << e.what() << endl;
            return 1;
        } catch (const std::runtime_error& e) {
            cout << opt_why << " doesn't fit: " << e.what() << endl;
        }
    }
    return 0;
}
