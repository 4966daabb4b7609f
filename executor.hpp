#pragma once
#include <vector>
#include <functional>
#include <memory>
#include <thread>
#include "dictionary.hpp"

namespace Exec {
    typedef std::vector<Dictionary::WordIndex> Indices;

    // does units [begin, end) and appends what it finds to out
    typedef std::function<void(size_t begin, size_t end, Indices& out)> Chunk_fn;

    class Executor_intf {
    public:
        virtual ~Executor_intf() {};
        // Splits [0, num_units) into contiguous chunks, runs fn once per chunk and
        // concatenates the outputs in chunk order. If any chunk throws, the first
        // (in chunk order) exception is rethrown once every chunk is done.
        virtual Indices run(size_t num_units, const Chunk_fn& fn) const = 0;
        virtual int concurrency() const = 0;
    };

    // one chunk, on the calling thread
    class Sequential_executor : public Executor_intf {
    public:
        virtual Indices run(size_t num_units, const Chunk_fn& fn) const;
        virtual int concurrency() const { return 1; }
    };

    // One std::thread per chunk, each with its own output vector. Never makes
    // chunks smaller than min_units_per_chunk, so small inputs stay on the calling thread.
    class Threaded_executor : public Executor_intf {
    public:
        explicit Threaded_executor(int num_threads, size_t min_units_per_chunk = 1);
        virtual Indices run(size_t num_units, const Chunk_fn& fn) const;
        virtual int concurrency() const { return num_threads; }
    private:
        int num_threads;
        size_t min_units_per_chunk;
    };

    // Owns the threads it started. The destructor joins every one that's still joinable.
    class Thread_group {
    public:
        Thread_group() {}
        ~Thread_group();
        // throws std::system_error if the thread can't be started
        void spawn(const std::function<void()>& f);
        void join_all();
        size_t size() const { return threads.size(); }
    private:
        Thread_group(const Thread_group&);
        Thread_group& operator=(const Thread_group&);

        std::vector<std::thread> threads;
    };

    // Sequential_executor for num_threads <= 1
    std::unique_ptr<Executor_intf> of_num_threads(int num_threads);

    void test();
}
