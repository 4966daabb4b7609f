#pragma once
#include <map>
#include <vector>
#include <mutex>
#include <functional>
#include "dictionary.hpp"
#include "cmask.hpp"
#include "cachekey.hpp"
#include "queryresult.hpp"

namespace Db {
    typedef Solver::QueryResult Result;

    // Results are only valid for the DictionaryIndex they were computed against,
    // so every Engine owns its own db. A saved result keeps the algorithm that
    // computed it.
    class Db_intf {
    public:
        virtual ~Db_intf() {};
        virtual void save(const CacheKey& k, const Result& result) = 0;
        // returns true if we found the answer cached in the db. If we return false [result] was not touched.
        virtual bool query(const CacheKey& k, Result& result) const = 0;

        // other overloads
        void save(const CMask& m, const Result& result);
        bool query(const CMask& m, Result& result) const;
        bool query(const CacheKey& k) const;

        // Returns true on a hit. On a miss runs [compute] (without holding any lock) and saves
        // what it returns. Either way [result] ends up with the answer.
        bool get_or_compute(const CacheKey& k, const std::function<Result()>& compute, Result& result);
    };

    // Bounded in-memory cache. When it's full, the first half of the entries (in key
    // order) is dropped before inserting. A capacity of 0 stores nothing.
    class Memory_db : public Db_intf {
    public:
        Memory_db(size_t capacity, bool debug_output);

        using Db_intf::save;
        using Db_intf::query;
        virtual void save(const CacheKey& k, const Result& result);
        virtual bool query(const CacheKey& k, Result& result) const;

        size_t size() const;
        size_t get_capacity() const { return capacity; }
        uint64_t hits() const;
        uint64_t misses() const;
        // 0 if nothing was ever queried
        double hit_ratio() const;
        void clear();
    private:
        std::map<CacheKey, Result> data;
        size_t capacity;
        bool debug_output;

        mutable std::mutex lock;
        mutable uint64_t num_hits;
        mutable uint64_t num_misses;
    };

    // ignores save commands, never finds anything
    class Null_db : public Db_intf {
    public:
        using Db_intf::save;
        using Db_intf::query;
        virtual void save(const CacheKey& k, const Result& result);
        virtual bool query(const CacheKey& k, Result& result) const;
    };

    // turns off the eviction messages, only set by the tests
    extern bool silence;

    void test();
}
