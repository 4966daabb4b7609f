#include <sstream>
#include <cstring>
#include "cachekey.hpp"

using std::map;
using std::set;

static const int L = Word::length;

const uint32_t CacheKey::no_green;

static uint32_t encode_greens(const CMask& m) {
    uint32_t rv = 0;
    for (int pos = 0; pos < L; pos++) {
        uint8_t g = m.green_at(pos);
        uint32_t v = g ? static_cast<uint32_t>(g - 'a') : CacheKey::no_green;
        rv |= v << (pos * 5);
    }
    return rv;
}

CacheKey::CacheKey() : CacheKey(CMask()) {}

CacheKey::CacheKey(const CMask& m) :
    excluded(m.get_excluded()),
    required(m.get_required()),
    green_encoded(encode_greens(m)),
    yellow_letters(0)
{
    for (int pos = 0; pos < L; pos++) yellow_by_pos[pos] = 0;
    for (const CMask::Yellow& y : m.get_yellows()) {
        int zc = y.ascii - 'a';
        yellow_letters |= 1 << zc;
        for (int pos = 0; pos < L; pos++) {
            if (y.forbidden & (1 << pos)) yellow_by_pos[pos] |= 1u << zc;
        }
    }
}

bool CacheKey::operator<(const CacheKey& k) const {
    if (excluded != k.excluded) return excluded < k.excluded;
    if (required != k.required) return required < k.required;
    if (green_encoded != k.green_encoded) return green_encoded < k.green_encoded;
    if (yellow_letters != k.yellow_letters) return yellow_letters < k.yellow_letters;
    for (int pos = 0; pos < L; pos++) {
        if (yellow_by_pos[pos] != k.yellow_by_pos[pos]) return yellow_by_pos[pos] < k.yellow_by_pos[pos];
    }
    return false;
}

bool CacheKey::operator==(const CacheKey& k) const {
    return std::memcmp(this, &k, sizeof(CacheKey)) == 0;
}

std::ostream& operator<<(std::ostream& os, const CacheKey& k) {
    os << std::hex << k.excluded << "/" << k.required << "/" << k.green_encoded << "/" << k.yellow_letters;
    for (int pos = 0; pos < L; pos++) {
        os << (pos == 0 ? "/" : ",") << k.yellow_by_pos[pos];
    }
    os << std::dec;
    return os;
}

void CacheKey::test() {
    std::stringstream output;
    std::stringstream expected;
    map<char, uint8_t> no_yellow;
    map<int, char> no_green;

    output << sizeof(CacheKey) << std::endl;
    expected << 36 << std::endl;

    output << CacheKey() << " " << (CacheKey() == CacheKey(CMask())) << std::endl;
    expected << "0/0/1ffffff/0/0,0,0,0,0 1" << std::endl;

    map<int, char> gs;
    gs[0] = 's';
    map<char, uint8_t> ya;
    ya['a'] = 3;
    output << CacheKey(CMask::compile({'q'}, gs, ya)) << std::endl;
    expected << "10000/40001/1fffff2/1/1,1,0,0,0" << std::endl;

    map<int, char> ge;
    ge[4] = 'e';
    output << CacheKey(CMask::compile(set<char>(), ge, no_yellow)) << std::endl;
    expected << "0/10/4fffff/0/0,0,0,0,0" << std::endl;

    // order and case of the inputs don't matter
    map<char, uint8_t> y1;
    y1['r'] = 0;
    y1['A'] = 1;
    y1['a'] = 2;
    map<char, uint8_t> y2;
    y2['a'] = 3;
    y2['R'] = 0;
    CacheKey k1(CMask::compile({'x', 'Q', 'z'}, gs, y1));
    CacheKey k2(CMask::compile({'z', 'q', 'X'}, gs, y2));
    output << (k1 == k2) << (k1 < k2) << (k2 < k1) << std::endl;
    expected << "100" << std::endl;

    // and different constraints give different keys
    map<char, uint8_t> a0;
    a0['a'] = 1;
    map<char, uint8_t> a1;
    a1['a'] = 2;
    map<char, uint8_t> ye;
    ye['e'] = 0;
    CacheKey d1(CMask::compile(set<char>(), no_green, a0));
    CacheKey d2(CMask::compile(set<char>(), no_green, a1));
    CacheKey d3(CMask::compile(set<char>(), ge, no_yellow));
    CacheKey d4(CMask::compile(set<char>(), no_green, ye));
    output << (d1 == d2) << (d3 == d4) << ((d1 < d2) != (d2 < d1)) << ((d3 < d4) != (d4 < d3)) << std::endl;
    expected << "0011" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("CacheKey::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}
