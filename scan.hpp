#pragma once
#include <vector>
#include <string>
#include <memory>
#include "dindex.hpp"
#include "cmask.hpp"

namespace Scan {
    // Checks a run of sorted (bucket order) positions against a CMask.
    class Scan_intf {
    public:
        virtual ~Scan_intf() {};
        // appends the WordIndex of every position in [begin, end) whose word passes m, in position order
        virtual void scan(const DictionaryIndex& x, const CMask& m, uint32_t begin, uint32_t end,
                          std::vector<Dictionary::WordIndex>& out) const = 0;
        virtual const char* name() const = 0;
    };

    // one word at a time, CMask::check on the sorted arrays
    class Scalar_scan : public Scan_intf {
    public:
        virtual void scan(const DictionaryIndex& x, const CMask& m, uint32_t begin, uint32_t end,
                          std::vector<Dictionary::WordIndex>& out) const;
        virtual const char* name() const { return "scalar"; }
    };

    // rejects on the presence masks eight words at a time, then does the byte
    // checks for whatever lanes survive
    class Batch_scan : public Scan_intf {
    public:
        virtual void scan(const DictionaryIndex& x, const CMask& m, uint32_t begin, uint32_t end,
                          std::vector<Dictionary::WordIndex>& out) const;
        virtual const char* name() const { return "batch"; }

        static const int lanes = 8;
    };

    // "scalar" or "batch", throws std::runtime_error otherwise
    std::unique_ptr<Scan_intf> of_string(const std::string& s);

    void test();
}
