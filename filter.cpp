#include <sstream>
#include <stdexcept>
#include "filter.hpp"

using std::vector;
using std::string;
using std::map;
using std::set;

static const int L = Word::length;
static const int A = Word::alphabet_size;

struct Filter::Node {
    Kind kind;
    int32_t mask;
    int pos;
    uint8_t ascii;
    uint8_t forbidden;
    vector<Filter> children;
};

Filter::Filter(const std::shared_ptr<const Node>& n) : node(n) {}

std::shared_ptr<Filter::Node> Filter::make_node(Kind k) {
    std::shared_ptr<Node> n = std::make_shared<Node>();
    n->kind = k;
    n->mask = 0;
    n->pos = 0;
    n->ascii = 0;
    n->forbidden = 0;
    return n;
}

Filter::Filter() : node(make_node(Kind::all_of)) {}

Filter Filter::excluded_mask(int32_t mask) {
    std::shared_ptr<Node> n = make_node(Kind::excluded_mask);
    n->mask = mask;
    return Filter(n);
}

Filter Filter::required_mask(int32_t mask) {
    std::shared_ptr<Node> n = make_node(Kind::required_mask);
    n->mask = mask;
    return Filter(n);
}

Filter Filter::green(int pos, char letter) {
    uint8_t ascii = Word::ascii_of(letter);
    if (pos < 0 || pos >= L || ascii == 0) {
        throw std::invalid_argument("Filter::green: bad position or letter");
    }
    std::shared_ptr<Node> n = make_node(Kind::green);
    n->pos = pos;
    n->ascii = ascii;
    return Filter(n);
}

Filter Filter::yellow(char letter, uint8_t forbidden) {
    uint8_t ascii = Word::ascii_of(letter);
    if (ascii == 0) {
        throw std::invalid_argument("Filter::yellow: bad letter");
    }
    std::shared_ptr<Node> n = make_node(Kind::yellow);
    n->ascii = ascii;
    n->forbidden = forbidden & ((1 << L) - 1);
    return Filter(n);
}

Filter Filter::all_of(const vector<Filter>& children) {
    std::shared_ptr<Node> n = make_node(Kind::all_of);
    n->children = children;
    return Filter(n);
}

Filter Filter::any_of(const vector<Filter>& children) {
    std::shared_ptr<Node> n = make_node(Kind::any_of);
    n->children = children;
    return Filter(n);
}

Filter Filter::negate(const Filter& child) {
    std::shared_ptr<Node> n = make_node(Kind::negate);
    n->children.push_back(child);
    return Filter(n);
}

// cheapest checks first
Filter Filter::of_cmask(const CMask& m) {
    vector<Filter> parts;
    if (m.get_excluded()) parts.push_back(excluded_mask(m.get_excluded()));
    if (m.get_required()) parts.push_back(required_mask(m.get_required()));
    for (const CMask::Green& g : m.get_greens()) {
        parts.push_back(green(g.pos, static_cast<char>(g.ascii)));
    }
    for (const CMask::Yellow& y : m.get_yellows()) {
        if (y.forbidden) parts.push_back(yellow(static_cast<char>(y.ascii), y.forbidden));
    }
    return all_of(parts);
}

bool Filter::matches(const Word& w) const {
    const Node& n = *node;
    switch (n.kind) {
    case Kind::excluded_mask:
        return (w.get_presence() & n.mask) == 0;
    case Kind::required_mask:
        return (w.get_presence() & n.mask) == n.mask;
    case Kind::green:
        return static_cast<uint8_t>(w[n.pos]) == n.ascii;
    case Kind::yellow:
        for (int pos = 0; pos < L; pos++) {
            if ((n.forbidden & (1 << pos)) && static_cast<uint8_t>(w[pos]) == n.ascii) return false;
        }
        return true;
    case Kind::all_of:
        for (const Filter& c : n.children) {
            if (!c.matches(w)) return false;
        }
        return true;
    case Kind::any_of:
        for (const Filter& c : n.children) {
            if (c.matches(w)) return true;
        }
        return false;
    case Kind::negate:
        return !n.children[0].matches(w);
    }
    return false;
}

Filter::Kind Filter::get_kind() const {
    return node->kind;
}

const vector<Filter>& Filter::get_children() const {
    return node->children;
}

// (a && b) && c becomes one all_of, same for ||
static void append_flat(vector<Filter>& out, const Filter& f, Filter::Kind k) {
    if (f.get_kind() == k) {
        const vector<Filter>& c = f.get_children();
        out.insert(out.end(), c.begin(), c.end());
    } else {
        out.push_back(f);
    }
}

Filter operator&&(const Filter& a, const Filter& b) {
    vector<Filter> parts;
    append_flat(parts, a, Filter::Kind::all_of);
    append_flat(parts, b, Filter::Kind::all_of);
    return Filter::all_of(parts);
}

Filter operator||(const Filter& a, const Filter& b) {
    vector<Filter> parts;
    append_flat(parts, a, Filter::Kind::any_of);
    append_flat(parts, b, Filter::Kind::any_of);
    return Filter::any_of(parts);
}

Filter operator!(const Filter& f) {
    return Filter::negate(f);
}

static void print_letters(std::ostream& os, int32_t mask) {
    for (int zc = 0; zc < A; zc++) {
        if (mask & (1 << zc)) os << static_cast<char>('a' + zc);
    }
}

std::ostream& operator<<(std::ostream& os, const Filter& f) {
    const Filter::Node& n = *f.node;
    switch (n.kind) {
    case Filter::Kind::excluded_mask:
        os << "-";
        print_letters(os, n.mask);
        break;
    case Filter::Kind::required_mask:
        os << "+";
        print_letters(os, n.mask);
        break;
    case Filter::Kind::green:
        os << static_cast<char>(n.ascii) << "@" << n.pos;
        break;
    case Filter::Kind::yellow:
        os << static_cast<char>(n.ascii) << "!";
        for (int pos = 0; pos < L; pos++) {
            if (n.forbidden & (1 << pos)) os << pos;
        }
        break;
    case Filter::Kind::all_of:
    case Filter::Kind::any_of:
        if (n.children.empty()) {
            os << (n.kind == Filter::Kind::all_of ? "true" : "false");
            break;
        }
        os << "(";
        for (size_t i = 0; i < n.children.size(); i++) {
            if (i) os << (n.kind == Filter::Kind::all_of ? " && " : " || ");
            os << n.children[i];
        }
        os << ")";
        break;
    case Filter::Kind::negate:
        os << "!" << n.children[0];
        break;
    }
    return os;
}

static const char* test_words[] =
    { "slate", "crane", "adieu", "stare", "scale", "abbey", "zebra", "shake",
      "crate", "sweet", "eerie", "mamma", "sissy", "sonic", "quack", "jazzy",
      "fjord", "vivid", "awake", "abide", "about", "cigar", "rebut", "sauce" };

static void test1() {
    std::stringstream output;
    std::stringstream expected;

    output << Filter() << " " << Filter::any_of(vector<Filter>()) << std::endl;
    expected << "true false" << std::endl;

    map<int, char> g;
    g[0] = 's';
    map<char, uint8_t> y;
    y['a'] = 3;
    y['t'] = 0;
    output << Filter::of_cmask(CMask::compile({'q', 'x', 'z'}, g, y)) << std::endl;
    expected << "(-qxz && +ast && s@0 && a!01)" << std::endl;
    output << Filter::of_cmask(CMask()) << std::endl;
    expected << "true" << std::endl;

    int32_t a_bit = 1 << ('a' - 'a');
    Filter f = (Filter::green(0, 's') || Filter::green(4, 'E')) && !Filter::required_mask(a_bit);
    output << f << std::endl;
    expected << "((s@0 || e@4) && !+a)" << std::endl;

    Filter flat = Filter::green(0, 's') && Filter::green(1, 'l') && Filter::yellow('t', 0x21);
    output << flat << " " << flat.get_children().size() << std::endl;
    expected << "(s@0 && l@1 && t!0) 3" << std::endl;

    const char* words[] = { "slate", "sweet", "crane", "eerie", "fjord" };
    for (const char* w : words) {
        output << f.matches(Word(w));
    }
    output << Filter().matches(Word("zzzzz")) << Filter::any_of(vector<Filter>()).matches(Word("zzzzz"));
    output << std::endl;
    expected << "0101010" << std::endl;

    int threw = 0;
    try {
        Filter::green(5, 'a');
    } catch (const std::invalid_argument&) {
        threw++;
    }
    try {
        Filter::green(-1, 'a');
    } catch (const std::invalid_argument&) {
        threw++;
    }
    try {
        Filter::green(0, '1');
    } catch (const std::invalid_argument&) {
        threw++;
    }
    try {
        Filter::yellow('?', 1);
    } catch (const std::invalid_argument&) {
        threw++;
    }
    output << threw << std::endl;
    expected << 4 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Filter::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

// of_cmask agrees with CMask::check, and the combinators obey De Morgan
static void test2() {
    vector<CMask> masks;
    map<int, char> no_green;
    map<char, uint8_t> no_yellow;
    map<int, char> g1;
    g1[0] = 's';
    g1[4] = 'e';
    map<char, uint8_t> y1;
    y1['a'] = 0x3;
    y1['e'] = 0x10;
    map<int, char> g2;
    g2[1] = 'a';
    masks.push_back(CMask());
    masks.push_back(CMask::compile({'q', 'x', 'z', 'j', 'v'}, no_green, no_yellow));
    masks.push_back(CMask::compile(set<char>(), g1, no_yellow));
    masks.push_back(CMask::compile({'s'}, g2, y1));
    masks.push_back(CMask::compile({'r', 'n'}, no_green, y1));

    int mismatches = 0;
    for (const CMask& m : masks) {
        Filter f = Filter::of_cmask(m);
        for (const char* w : test_words) {
            if (f.matches(Word(w)) != m.check(Word(w))) mismatches++;
        }
    }

    Filter a = Filter::green(0, 's');
    Filter b = Filter::required_mask(1 << ('e' - 'a'));
    Filter lhs = !(a || b);
    Filter rhs = !a && !b;
    for (const char* w : test_words) {
        if (lhs.matches(Word(w)) != rhs.matches(Word(w))) mismatches++;
        if ((a && b).matches(Word(w)) != (a.matches(Word(w)) && b.matches(Word(w)))) mismatches++;
    }

    if (mismatches != 0) {
        std::stringstream ss;
        ss << mismatches;
        throw std::runtime_error("Filter::test2() failed, " + ss.str() + " mismatches");
    }
}

void Filter::test() {
    test1();
    test2();
}
