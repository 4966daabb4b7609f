#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "engine.hpp"
#include "solver.hpp"
#include "naive.hpp"

using std::string;
using std::vector;
using std::set;
using std::map;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
using Solver::Algorithm;
using Solver::QueryResult;
typedef Dictionary::WordIndex WordIndex;

bool Engine::silence = false;

Engine::Config::Config() :
    algorithm(Algorithm::automatic),
    scan("batch"),
    threads(1),
    cache_capacity(10000),
    debug_output(false) {}

static DictionaryIndex build_index(const Dictionary& d) {
    if (d.empty()) {
        throw ResourceError("No valid 5 letter words to build an index from");
    }
    ptime start = microsec_clock::local_time();
    DictionaryIndex rv(d);
    if (!Engine::silence) {
        cerr << "Built index for " << d.size() << " words (" << d.get_num_rejected() << " rejected), took "
             << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
    }
    return rv;
}

Engine::Engine(const vector<string>& raw_words, const Config& c) :
    config(c),
    dictionary(raw_words),
    index(build_index(dictionary)),
    scan(Scan::of_string(c.scan)),
    executor(Exec::of_num_threads(c.threads)),
    cache(c.cache_capacity, c.debug_output) {}

Engine::Engine(const Dictionary& d, const Config& c) :
    config(c),
    dictionary(d),
    index(build_index(dictionary)),
    scan(Scan::of_string(c.scan)),
    executor(Exec::of_num_threads(c.threads)),
    cache(c.cache_capacity, c.debug_output) {}

std::unique_ptr<Engine> Engine::from_file(const string& filename, const Config& c) {
    return std::unique_ptr<Engine>(new Engine(Dictionary::load_from_file(filename), c));
}

// the naive solver wants the constraints back in their raw form
static void raw_of_cmask(const CMask& m, set<char>& excluded, map<int, char>& green, map<char, uint8_t>& yellow) {
    for (int zc = 0; zc < Word::alphabet_size; zc++) {
        if (m.get_excluded() & (1 << zc)) excluded.insert(static_cast<char>('a' + zc));
    }
    for (const CMask::Green& g : m.get_greens()) {
        green[g.pos] = static_cast<char>(g.ascii);
    }
    for (const CMask::Yellow& y : m.get_yellows()) {
        yellow[static_cast<char>(y.ascii)] = y.forbidden;
    }
}

QueryResult Engine::query(const CMask& m) {
    return query(m, config.algorithm);
}

QueryResult Engine::query(const CMask& m, Algorithm a) {
    ptime start = microsec_clock::local_time();
    QueryResult rv;
    rv.algorithm = (a == Algorithm::automatic) ? Solver::choose_algorithm(m) : a;

    if (rv.algorithm == Algorithm::naive) {
        set<char> excluded;
        map<int, char> green;
        map<char, uint8_t> yellow;
        raw_of_cmask(m, excluded, green, yellow);
        rv.words = Solver::naive_list(dictionary, excluded, green, yellow);
    } else {
        // a hit comes back with the algorithm that computed it
        Algorithm chosen = rv.algorithm;
        rv.from_cache = cache.get_or_compute(CacheKey(m), [&] () {
            QueryResult computed;
            computed.algorithm = chosen;
            computed.words = Solver::solve(dictionary, index, m, chosen, *scan, *executor);
            return computed;
        }, rv);
    }

    rv.perf_microseconds = (microsec_clock::local_time() - start).total_microseconds();
    if (config.debug_output) {
        cerr << "query " << m << " -> " << rv << endl;
    }
    return rv;
}

vector<Word> Engine::solve(const set<char>& excluded, const map<int, char>& green, const map<char, uint8_t>& yellow) {
    if (config.algorithm == Algorithm::naive) {
        return words_of(Solver::naive_list(dictionary, excluded, green, yellow));
    }
    return words_of(query(CMask::compile(excluded, green, yellow)).words);
}

vector<Word> Engine::solve(const set<char>& excluded, const map<int, char>& green, const set<char>& yellow) {
    map<char, uint8_t> yellow_positions;
    for (char c : yellow) {
        yellow_positions[c] |= 0;
    }
    return solve(excluded, green, yellow_positions);
}

vector<Word> Engine::words_of(const vector<WordIndex>& indices) const {
    vector<Word> rv;
    rv.reserve(indices.size());
    for (WordIndex i : indices) {
        rv.push_back(dictionary.of_word_index(i));
    }
    return rv;
}

static string joined(const vector<Word>& words) {
    std::stringstream ss;
    for (size_t i = 0; i < words.size(); i++) {
        if (i) ss << ",";
        ss << words[i];
    }
    return ss.str();
}

static void test1() {
    std::stringstream output;
    std::stringstream expected;

    int threw = 0;
    try {
        Engine e((vector<string>()));
    } catch (const ResourceError&) {
        threw++;
    }
    try {
        Engine e(vector<string>{"abc", "12345", "toolong"});
    } catch (const ResourceError&) {
        threw++;
    }
    try {
        Engine::from_file("/nonexistent/words5.txt");
    } catch (const ResourceError&) {
        threw++;
    }
    try {
        Engine::Config c;
        c.scan = "gpu";
        Engine e(vector<string>{"slate"}, c);
    } catch (const std::runtime_error&) {
        threw++;
    }
    output << threw << std::endl;
    expected << 4 << std::endl;

    Engine small(vector<string>{"slate", "crane", "adieu", "SHAKE", "sl8te", "sweet"});
    map<int, char> se;
    se[0] = 's';
    se[4] = 'e';
    map<char, uint8_t> ya;
    ya['a'] = 0x03;
    output << small.get_dictionary().size() << " "
           << joined(small.solve(set<char>(), se, set<char>())) << " "
           << joined(small.solve({'q', 'x', 'z'}, map<int, char>(), ya)) << std::endl;
    expected << "5 slate,shake slate,crane,shake" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Engine::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

static void test2(const string& words_file) {
    std::stringstream output;
    std::stringstream expected;

    std::unique_ptr<Engine> e = Engine::from_file(words_file);
    map<int, char> se;
    se[0] = 's';
    se[4] = 'e';
    map<char, uint8_t> ya;
    ya['a'] = 0x03;

    // second time around comes from the cache, whatever order the inputs were in
    CMask m1 = CMask::compile({'q', 'x', 'z'}, se, ya);
    CMask m2 = CMask::compile({'Z', 'q', 'X'}, se, ya);
    QueryResult r1 = e->query(m1);
    QueryResult r2 = e->query(m2);
    output << r1.from_cache << r2.from_cache << (r1.words == r2.words) << " "
           << r1.algorithm << " " << e->get_cache().hits() << " " << e->get_cache().size() << std::endl;
    expected << "011 bucket 1 1" << std::endl;

    // asking for another algorithm still hits, and says who did the work
    QueryResult r3 = e->query(m1, Algorithm::bitset);
    output << r3.from_cache << " " << r3.algorithm << " " << (r3.words == r1.words) << std::endl;
    expected << "1 bucket 1" << std::endl;

    // every configuration answers the same
    vector<Engine::Config> configs;
    const Algorithm algorithms[] = { Algorithm::automatic, Algorithm::bitset, Algorithm::bucket, Algorithm::naive, Algorithm::filter };
    for (Algorithm a : algorithms) {
        for (int threads = 1; threads <= 4; threads += 3) {
            Engine::Config c;
            c.algorithm = a;
            c.threads = threads;
            c.scan = threads == 1 ? "scalar" : "batch";
            c.cache_capacity = threads == 1 ? 0 : 16;
            configs.push_back(c);
        }
    }
    Dictionary d = Dictionary::load_from_file(words_file);
    vector<string> answers;
    for (const Engine::Config& c : configs) {
        Engine ec(d, c);
        std::stringstream ss;
        ss << joined(ec.solve(set<char>(), se, set<char>())) << "|"
           << joined(ec.solve({'q', 'x', 'z'}, map<int, char>(), ya)) << "|"
           << joined(ec.solve({'q', 'x', 'z', 'j', 'v'}, map<int, char>(), set<char>{'a', 'e'})) << "|"
           << joined(ec.solve({'s', 'e'}, {{0, 's'}}, map<char, uint8_t>()));
        answers.push_back(ss.str());
    }
    int disagreements = 0;
    for (const string& a : answers) {
        if (a != answers[0]) disagreements++;
    }
    output << disagreements << " " << (answers[0].find("slate") != string::npos) << std::endl;
    expected << "0 1" << std::endl;

    // a plain yellow set is a yellow map with no forbidden positions
    map<char, uint8_t> ae;
    ae['a'] = 0;
    ae['e'] = 0;
    output << (joined(e->solve({'q'}, map<int, char>(), set<char>{'a', 'e'})) ==
               joined(e->solve({'q'}, map<int, char>(), ae))) << std::endl;
    expected << 1 << std::endl;

    // cache off: never a hit, still right
    Engine::Config off;
    off.cache_capacity = 0;
    Engine e_off(d, off);
    QueryResult o1 = e_off.query(m1);
    QueryResult o2 = e_off.query(m1);
    output << o1.from_cache << o2.from_cache << (o1.words == r1.words) << (o2.words == r1.words) << std::endl;
    expected << "0011" << std::endl;

    // naive is never cached
    QueryResult n1 = e->query(m1, Algorithm::naive);
    output << n1.from_cache << (n1.words == r1.words) << " " << n1.algorithm << std::endl;
    expected << "01 naive" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Engine::test() 2 failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

void Engine::test(const string& words_file) {
    silence = true;
    Dictionary::silence = true;
    test1();
    test2(words_file);
    silence = false;
    Dictionary::silence = false;
}
