#include <fstream>
#include <sstream>
#include <cstdio>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "dictionary.hpp"

using std::string;
using std::cerr;
using std::endl;
using std::vector;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

bool Dictionary::silence = false;

Dictionary::Dictionary() : num_rejected(0) {}

Dictionary::Dictionary(const vector<string>& raw_words) : num_rejected(0) {
    all_words.reserve(raw_words.size());
    for (const string& r : raw_words) {
        add(r);
    }
}

void Dictionary::add(const string& raw) {
    try {
        Word w(raw);
        WordIndex i(static_cast<uint32_t>(all_words.size()));
        all_words.push_back(w);
        word_index_map.insert(std::make_pair(w, i));
    } catch (const InvalidWord&) {
        num_rejected++;
    }
}

static void trim_line(string& line) {
    size_t end = line.find_last_not_of(" \t\r\n");
    if (end == string::npos) {
        line.clear();
        return;
    }
    line.erase(end + 1);
    line.erase(0, line.find_first_not_of(" \t"));
}

Dictionary Dictionary::load_from_file(const string& filename) {
    ptime start = microsec_clock::local_time();
    std::ifstream f(filename.c_str());
    if (!f.is_open()) {
        throw ResourceError("Can't open word list: " + filename);
    }

    Dictionary rv;
    string line;
    while (std::getline(f, line)) {
        trim_line(line);
        if (line.empty()) continue;
        rv.add(line);
    }
    if (f.bad()) {
        throw ResourceError("Error reading word list: " + filename);
    }
    if (rv.empty()) {
        throw ResourceError("No valid 5 letter words in: " + filename);
    }
    if (!silence) {
        cerr << "Loaded " << rv.size() << " words (" << rv.num_rejected << " rejected) from " << filename
             << ", took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
    }
    return rv;
}

const Word& Dictionary::of_word_index(WordIndex i) const {
    return all_words.at(i.get());
}

Dictionary::WordIndex Dictionary::to_word_index(const Word& w) const {
    auto it = word_index_map.find(w);
    if (it == word_index_map.end()) {
        throw std::runtime_error("Word not in dictionary: " + w.raw());
    }
    return it->second;
}

bool Dictionary::contains(const Word& w) const {
    return word_index_map.count(w) > 0;
}

vector<Dictionary::WordIndex> Dictionary::get_all_indices() const {
    vector<WordIndex> rv;
    rv.reserve(all_words.size());
    for (size_t i = 0; i < all_words.size(); i++) {
        rv.push_back(WordIndex(static_cast<uint32_t>(i)));
    }
    return rv;
}

bool Dictionary::WordIndex::operator==(WordIndex other) const {
    return index == other.index;
}
bool Dictionary::WordIndex::operator!=(WordIndex other) const {
    return index != other.index;
}
bool Dictionary::WordIndex::operator<(WordIndex other) const {
    return index < other.index;
}

void Dictionary::test() {
    silence = true;
    std::stringstream output;
    std::stringstream expected;

    Dictionary d({"slate", "CRANE", "bad", "adieu", "sl4te", "slate", "toolong"});
    output << d.size() << " " << d.get_num_rejected() << " "
           << d.of_word_index(WordIndex(1)) << " "
           << d.to_word_index(Word("slate")).get() << " "
           << d.to_word_index(Word("ADIEU")).get() << " "
           << d.contains(Word("crane")) << d.contains(Word("zebra"))
           << std::endl;
    expected << "4 3 crane 0 2 10" << std::endl;

    bool threw = false;
    try {
        d.of_word_index(WordIndex(4));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    output << threw;
    threw = false;
    try {
        d.to_word_index(Word("zebra"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    output << threw << std::endl;
    expected << "11" << std::endl;

    Dictionary e;
    output << e.size() << e.empty() << e.get_all_indices().size() << std::endl;
    expected << "010" << std::endl;

    string tmpfile = "/tmp/tmp.wordfilter.words.txt";
    remove(tmpfile.c_str());
    {
        std::ofstream out(tmpfile.c_str());
        out << "slate\r\n" << "  crane  \n" << "\n" << "x\n" << "adieu\n" << "ab-cd\n";
    }
    Dictionary f = Dictionary::load_from_file(tmpfile);
    output << f.size() << " " << f.get_num_rejected() << " " << f.of_word_index(WordIndex(1)) << std::endl;
    expected << "3 2 crane" << std::endl;

    {
        std::ofstream out(tmpfile.c_str());
        out << "abc\n12345\n";
    }
    threw = false;
    try {
        Dictionary::load_from_file(tmpfile);
    } catch (const ResourceError&) {
        threw = true;
    }
    output << threw;
    remove(tmpfile.c_str());

    threw = false;
    try {
        Dictionary::load_from_file("/nonexistent/words5.txt");
    } catch (const ResourceError&) {
        threw = true;
    }
    output << threw << std::endl;
    expected << "11" << std::endl;

    silence = false;
    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Dictionary::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}
