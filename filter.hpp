/* Composable word predicates.

   A Filter is a small immutable expression tree. The leaves are the same four
   checks a CMask does (no excluded letter, every required letter, a letter at a
   position, a letter not at any of some positions) and the inner nodes are
   all_of (and), any_of (or) and negate (not). Copying a Filter is cheap, the
   nodes are shared.

   A yellow leaf only checks the forbidden positions, "the letter must be
   somewhere" is the required_mask leaf's job.
*/

#pragma once
#include <vector>
#include <memory>
#include <iostream>
#include <cstdint>
#include "word.hpp"
#include "cmask.hpp"

class Filter {
public:
    enum class Kind { excluded_mask, required_mask, green, yellow, all_of, any_of, negate };

    // matches everything, same as all_of({})
    Filter();

    static Filter excluded_mask(int32_t mask);
    static Filter required_mask(int32_t mask);
    // throws std::invalid_argument unless pos is 0..4 and letter is a letter
    static Filter green(int pos, char letter);
    // throws std::invalid_argument unless letter is a letter, forbidden bits above 4 are dropped
    static Filter yellow(char letter, uint8_t forbidden);

    static Filter all_of(const std::vector<Filter>& children);
    static Filter any_of(const std::vector<Filter>& children);
    static Filter negate(const Filter& child);

    // the conjunction that accepts exactly what m.check accepts
    static Filter of_cmask(const CMask& m);

    bool matches(const Word& w) const;

    Kind get_kind() const;
    const std::vector<Filter>& get_children() const;

    friend std::ostream& operator<<(std::ostream& os, const Filter& f);
    static void test();
private:
    struct Node;
    explicit Filter(const std::shared_ptr<const Node>& n);
    static std::shared_ptr<Node> make_node(Kind k);

    std::shared_ptr<const Node> node;
};

Filter operator&&(const Filter& a, const Filter& b);
Filter operator||(const Filter& a, const Filter& b);
Filter operator!(const Filter& f);

std::ostream& operator<<(std::ostream& os, const Filter& f);
