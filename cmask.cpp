#include <sstream>
#include <boost/lexical_cast.hpp>
#include "cmask.hpp"

using std::string;
using std::map;
using std::set;
using std::vector;

static const int L = Word::length;
static const int A = Word::alphabet_size;
static const uint8_t all_positions = (1 << L) - 1;

CMask::CMask() : excluded(0), required(0), green_mask(0), green_value(0) {}

CMask CMask::compile(const set<char>& excluded_letters,
                     const map<int, char>& green,
                     const map<char, uint8_t>& yellow) {
    CMask m;

    int32_t green_letters = 0;
    for (const auto& kv : green) {
        int pos = kv.first;
        uint8_t ascii = Word::ascii_of(kv.second);
        if (pos < 0 || pos >= L || ascii == 0) continue;

        Green g;
        g.pos = static_cast<int8_t>(pos);
        g.ascii = ascii;
        m.greens.push_back(g);
        m.green_mask |= uint64_t(0xFF) << (pos * 8);
        m.green_value |= uint64_t(ascii) << (pos * 8);
        green_letters |= 1 << (ascii - 'a');
    }

    int32_t raw_excluded = 0;
    for (char c : excluded_letters) {
        int zc = Word::letter_index(c);
        if (zc >= 0) raw_excluded |= 1 << zc;
    }

    // 'A' and 'a' are the same letter, so merge before building the list
    int32_t yellow_letters = 0;
    uint8_t forbidden[A] = {};
    for (const auto& kv : yellow) {
        int zc = Word::letter_index(kv.first);
        if (zc < 0) continue;
        yellow_letters |= 1 << zc;
        forbidden[zc] |= kv.second & all_positions;
    }

    m.excluded = raw_excluded & ~green_letters;
    m.required = green_letters | yellow_letters;
    for (int zc = 0; zc < A; zc++) {
        if (yellow_letters & (1 << zc)) {
            Yellow y;
            y.ascii = static_cast<uint8_t>('a' + zc);
            y.forbidden = forbidden[zc];
            m.yellows.push_back(y);
        }
    }
    return m;
}

CMask CMask::compile(const set<char>& excluded_letters,
                     const map<int, char>& green,
                     const set<char>& yellow) {
    map<char, uint8_t> yellow_positions;
    for (char c : yellow) {
        yellow_positions[c] |= 0;
    }
    return compile(excluded_letters, green, yellow_positions);
}

bool CMask::check(int32_t presence, uint64_t packed) const {
    if (presence & excluded) return false;
    if ((presence & required) != required) return false;
    if ((packed & green_mask) != green_value) return false;
    return yellow_ok(packed);
}

bool CMask::yellow_ok(uint64_t packed) const {
    for (const Yellow& y : yellows) {
        uint8_t f = y.forbidden;
        while (f) {
            int pos = __builtin_ctz(f);
            if (((packed >> (pos * 8)) & 0xFF) == y.ascii) return false;
            f &= f - 1;
        }
    }
    return true;
}

uint8_t CMask::green_at(int pos) const {
    for (const Green& g : greens) {
        if (g.pos == pos) return g.ascii;
    }
    return 0;
}

static char upper(uint8_t ascii) {
    return static_cast<char>(ascii - 'a' + 'A');
}

void CMask::check_detail_reasons_exn(const Word& w) const {
    std::stringstream problems;
    int32_t presence = w.get_presence();
    for (int zc = 0; zc < A; zc++) {
        if (presence & excluded & (1 << zc)) {
            problems << "You know letter " << (char)('A' + zc) << " is absent. ";
        }
    }
    for (int zc = 0; zc < A; zc++) {
        if ((required & (1 << zc)) && !(presence & (1 << zc))) {
            problems << "You need letter " << (char)('A' + zc) << ". ";
        }
    }
    for (const Green& g : greens) {
        if (static_cast<uint8_t>(w[g.pos]) != g.ascii) {
            problems << "You need letter " << upper(g.ascii) << " in spot #" << (g.pos + 1) << ". ";
        }
    }
    for (const Yellow& y : yellows) {
        for (int s = 0; s < L; s++) {
            if ((y.forbidden & (1 << s)) && static_cast<uint8_t>(w[s]) == y.ascii) {
                problems << "You can't have letter " << upper(y.ascii) << " in spot #" << (s + 1) << ". ";
            }
        }
    }
    string problems_str = problems.str();
    if (problems_str.empty()) return;
    throw std::runtime_error(problems_str);
}

bool CMask::operator<(const CMask& m) const {
    if (excluded < m.excluded) return true;
    if (excluded > m.excluded) return false;
    if (required < m.required) return true;
    if (required > m.required) return false;
    if (green_mask < m.green_mask) return true;
    if (green_mask > m.green_mask) return false;
    if (green_value < m.green_value) return true;
    if (green_value > m.green_value) return false;
    if (yellows.size() != m.yellows.size()) return yellows.size() < m.yellows.size();
    for (size_t i = 0; i < yellows.size(); i++) {
        if (yellows[i].ascii != m.yellows[i].ascii) return yellows[i].ascii < m.yellows[i].ascii;
        if (yellows[i].forbidden != m.yellows[i].forbidden) return yellows[i].forbidden < m.yellows[i].forbidden;
    }
    return false;
}

// greens are fully described by green_mask/green_value
bool CMask::operator==(const CMask& m) const {
    if (excluded != m.excluded ||
        required != m.required ||
        green_mask != m.green_mask ||
        green_value != m.green_value ||
        yellows.size() != m.yellows.size()) {
        return false;
    }
    for (size_t i = 0; i < yellows.size(); i++) {
        if (yellows[i].ascii != m.yellows[i].ascii || yellows[i].forbidden != m.yellows[i].forbidden) return false;
    }
    return true;
}

static vector<string> split_commas(const string& s) {
    vector<string> rv;
    std::stringstream ss(s);
    string part;
    while (std::getline(ss, part, ',')) {
        size_t b = part.find_first_not_of(" \t");
        if (b == string::npos) continue;
        size_t e = part.find_last_not_of(" \t");
        rv.push_back(part.substr(b, e - b + 1));
    }
    return rv;
}

map<int, char> CMask::green_of_string(const string& s) {
    map<int, char> rv;
    for (const string& entry : split_commas(s)) {
        size_t colon = entry.find(':');
        if (colon == string::npos || colon == 0 || entry.length() != colon + 2) {
            throw std::runtime_error("green entry should look like 0:s, not: " + entry);
        }
        int pos;
        try {
            pos = boost::lexical_cast<int>(entry.substr(0, colon));
        } catch (const boost::bad_lexical_cast&) {
            throw std::runtime_error("bad green position in: " + entry);
        }
        rv[pos] = entry[colon + 1];
    }
    return rv;
}

map<char, uint8_t> CMask::yellow_of_string(const string& s) {
    map<char, uint8_t> rv;
    for (const string& entry : split_commas(s)) {
        size_t colon = entry.find(':');
        if (colon == string::npos) {
            for (char c : entry) rv[c] |= 0;
            continue;
        }
        if (colon != 1) {
            throw std::runtime_error("yellow entry should look like a:01, not: " + entry);
        }
        uint8_t forbidden = 0;
        for (size_t i = 2; i < entry.length(); i++) {
            char d = entry[i];
            if (d < '0' || d > '7') {
                throw std::runtime_error("bad yellow position in: " + entry);
            }
            forbidden |= 1 << (d - '0');
        }
        rv[entry[0]] |= forbidden;
    }
    return rv;
}

set<char> CMask::excluded_of_string(const string& s) {
    set<char> rv;
    for (char c : s) {
        if (c == ',' || c == ' ') continue;
        rv.insert(c);
    }
    return rv;
}

std::ostream& operator<<(std::ostream& os, const CMask& m) {
    for (int pos = 0; pos < L; pos++) {
        uint8_t g = m.green_at(pos);
        os << (g ? static_cast<char>(g) : '_');
    }
    for (const CMask::Yellow& y : m.yellows) {
        os << " ~" << static_cast<char>(y.ascii);
        for (int pos = 0; pos < L; pos++) {
            if (y.forbidden & (1 << pos)) os << pos;
        }
    }
    if (m.excluded) {
        os << " -";
        for (int zc = 0; zc < A; zc++) {
            if (m.excluded & (1 << zc)) os << static_cast<char>('a' + zc);
        }
    }
    return os;
}

static map<char, uint8_t> no_yellow;
static map<int, char> no_green;
static set<char> no_excluded;

static void test1() {
    std::stringstream output;
    std::stringstream expected;

    output << CMask() << std::endl;
    expected << "_____" << std::endl;

    map<int, char> g;
    g[0] = 's';
    g[4] = 'E';
    map<char, uint8_t> y;
    y['a'] = 3;
    y['r'] = 0;
    output << CMask::compile({'q', 'X', 'z'}, g, y) << std::endl;
    expected << "s___e ~a01 ~r -qxz" << std::endl;

    // green wins over gray
    map<int, char> gs;
    gs[0] = 's';
    CMask m = CMask::compile({'S', 'q'}, gs, no_yellow);
    output << m << " " << m.get_excluded() << " " << m.get_required() << std::endl;
    expected << "s____ -q " << (1 << ('q' - 'a')) << " " << (1 << ('s' - 'a')) << std::endl;

    // but yellow doesn't
    CMask c = CMask::compile({'s'}, no_green, set<char>{'s'});
    output << c << " " << c.check(Word("slate")) << c.check(Word("crane")) << std::endl;
    expected << "_____ ~s -s 00" << std::endl;

    // invalid entries are dropped, forbidden bits above 4 too
    map<int, char> bad_green;
    bad_green[-1] = 'a';
    bad_green[5] = 'b';
    bad_green[2] = '1';
    map<char, uint8_t> bad_yellow;
    bad_yellow['?'] = 3;
    bad_yellow['e'] = 0xE0;
    CMask d = CMask::compile({'#', 'a', 'b'}, bad_green, bad_yellow);
    output << d << " " << d.get_greens().size() << " " << d.get_yellows().size() << " "
           << (int)d.get_yellows()[0].forbidden << " " << (d.get_green_mask() == 0) << std::endl;
    expected << "_____ ~e -ab 0 1 0 1" << std::endl;

    // same constraints, different spellings, same mask
    map<char, uint8_t> y1;
    y1['A'] = 1;
    y1['a'] = 2;
    y1['e'] = 0;
    map<char, uint8_t> y2;
    y2['e'] = 0;
    y2['a'] = 3;
    CMask k1 = CMask::compile({'Q', 'x', 'z'}, gs, y1);
    CMask k2 = CMask::compile({'z', 'q', 'X'}, gs, y2);
    CMask k3 = CMask::compile({'q', 'x'}, gs, y2);
    output << (k1 == k2) << (k1 < k2) << (k2 < k1) << (k1 == k3) << ((k1 < k3) != (k3 < k1)) << std::endl;
    expected << "10001" << std::endl;

    output << (CMask::compile(no_excluded, no_green, set<char>{'a', 'e'}) ==
               CMask::compile(no_excluded, no_green, y2)) << std::endl;
    expected << 0 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("CMask::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

static void test2() {
    std::stringstream output;
    std::stringstream expected;

    map<int, char> g;
    g[0] = 's';
    g[4] = 'e';
    CMask m = CMask::compile(no_excluded, g, no_yellow);
    output << m.check(Word("slate"));
    output << m.check(Word("crane")); // doesn't start with s
    output << m.check(Word("shake"));
    output << m.check(Word("adieu")); // neither
    output << m.check(Word("sweet")); // doesn't end with e
    output << std::endl;
    expected << "10100" << std::endl;

    map<char, uint8_t> y;
    y['a'] = 0x3;
    m = CMask::compile({'q', 'x', 'z'}, no_green, y);
    output << m.check(Word("slate"));
    output << m.check(Word("crane"));
    output << m.check(Word("adieu")); // a at 0
    output << m.check(Word("about")); // a at 0
    output << m.check(Word("quack")); // q
    output << m.check(Word("zebra")); // z
    output << m.check(Word("cigar"));
    output << m.check(Word("awake")); // a at 0 and 2
    output << m.check(Word("sweet")); // no a
    output << m.check(Word("mamma")); // a at 1
    output << std::endl;
    expected << "1100001000" << std::endl;

    // gray s overridden everywhere, not just at the green position
    map<int, char> gs;
    gs[0] = 's';
    m = CMask::compile({'s', 'e'}, gs, no_yellow);
    output << m.check(Word("sonic"));
    output << m.check(Word("sissy"));
    output << m.check(Word("slate")); // e
    output << m.check(Word("bossy")); // no s at 0
    output << std::endl;
    expected << "1100" << std::endl;

    // contradictory, green and forbidden at the same position
    map<char, uint8_t> ys;
    ys['s'] = 0x1;
    m = CMask::compile(no_excluded, gs, ys);
    output << m.check(Word("slate")) << m.check(Word("sissy")) << m.check(Word("bossy")) << std::endl;
    expected << "000" << std::endl;

    output << CMask().check(Word("zzzzz")) << std::endl;
    expected << 1 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("CMask::test2() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

static string reasons(const CMask& m, const Word& w) {
    try {
        m.check_detail_reasons_exn(w);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "ok";
}

static void test3() {
    std::stringstream output;
    std::stringstream expected;

    map<int, char> gs;
    gs[0] = 's';
    map<char, uint8_t> ya;
    ya['a'] = 0x2;
    CMask m = CMask::compile({'q'}, gs, ya);
    output << reasons(m, Word("quack")) << std::endl;
    expected << "You know letter Q is absent. You need letter S. You need letter S in spot #1. " << std::endl;
    output << reasons(m, Word("sauce")) << std::endl;
    expected << "You can't have letter A in spot #2. " << std::endl;
    output << reasons(m, Word("slate")) << std::endl;
    expected << "ok" << std::endl;

    // parsers
    map<int, char> g = CMask::green_of_string("0:s, 4:e,,");
    output << g.size() << g[0] << g[4] << std::endl;
    expected << "2se" << std::endl;
    g = CMask::green_of_string("9:s");
    output << CMask::compile(no_excluded, g, no_yellow) << std::endl;
    expected << "_____" << std::endl;

    map<char, uint8_t> y = CMask::yellow_of_string("a:01,e,io,a:4");
    output << y.size() << " " << (int)y['a'] << (int)y['e'] << (int)y['i'] << (int)y['o'] << std::endl;
    expected << "4 19000" << std::endl;

    set<char> e = CMask::excluded_of_string("q, xz");
    output << e.size() << std::endl;
    expected << 3 << std::endl;

    const char* bad_greens[] = { "0s", "x:s", ":s", "0:", "0:se" };
    for (const char* b : bad_greens) {
        bool threw = false;
        try {
            CMask::green_of_string(b);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        output << threw;
    }
    const char* bad_yellows[] = { "ab:1", "a:9", "a:x" };
    for (const char* b : bad_yellows) {
        bool threw = false;
        try {
            CMask::yellow_of_string(b);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        output << threw;
    }
    output << std::endl;
    expected << "11111111" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("CMask::test3() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

void CMask::test() {
    test1();
    test2();
    test3();
}
