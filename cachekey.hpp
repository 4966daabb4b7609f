#pragma once
#include <iostream>
#include <cstdint>
#include "cmask.hpp"

// Canonical, fixed-width form of a CMask, used to look up results in the cache.
// Two CMasks that are == give equal keys, and different CMasks give different keys.
//
// green_encoded holds 5 bits per position, the letter index or no_green.
// yellow_by_pos[N] has bit zc set if yellow letter zc is forbidden at position N.
class CacheKey {
public:
    CacheKey();
    explicit CacheKey(const CMask& m);

    bool operator<(const CacheKey& k) const;
    bool operator==(const CacheKey& k) const;

    int32_t get_excluded() const { return excluded; }
    int32_t get_required() const { return required; }

    static const uint32_t no_green = 31;

    friend std::ostream& operator<<(std::ostream&, const CacheKey&);
    static void test();
private:
    int32_t excluded;
    int32_t required;
    uint32_t green_encoded;
    int32_t yellow_letters;
    uint32_t yellow_by_pos[Word::length];
};

std::ostream& operator<<(std::ostream&, const CacheKey&);
