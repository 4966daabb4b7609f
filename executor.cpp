#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>
#include "executor.hpp"

using std::vector;
typedef Dictionary::WordIndex WordIndex;

namespace Exec {
    Indices Sequential_executor::run(size_t num_units, const Chunk_fn& fn) const {
        Indices out;
        if (num_units > 0) fn(0, num_units, out);
        return out;
    }

    Threaded_executor::Threaded_executor(int num_threads_, size_t min_units_per_chunk_) :
        num_threads(num_threads_ < 1 ? 1 : num_threads_),
        min_units_per_chunk(min_units_per_chunk_ < 1 ? 1 : min_units_per_chunk_) {}

    Indices Threaded_executor::run(size_t num_units, const Chunk_fn& fn) const {
        size_t num_chunks = (num_units + min_units_per_chunk - 1) / min_units_per_chunk;
        if (num_chunks > static_cast<size_t>(num_threads)) num_chunks = num_threads;
        if (num_chunks <= 1) {
            return Sequential_executor().run(num_units, fn);
        }

        vector<Indices> outs(num_chunks);
        vector<std::exception_ptr> errors(num_chunks);
        {
            Thread_group threads;
            for (size_t c = 0; c < num_chunks; c++) {
                size_t begin = num_units * c / num_chunks;
                size_t end = num_units * (c + 1) / num_chunks;
                threads.spawn([&fn, &outs, &errors, c, begin, end] () {
                    try {
                        fn(begin, end, outs[c]);
                    } catch (...) {
                        // handed back to the caller below
                        errors[c] = std::current_exception();
                    }
                });
            }
        }
        for (const std::exception_ptr& e : errors) {
            if (e) std::rethrow_exception(e);
        }

        size_t total = 0;
        for (const Indices& o : outs) total += o.size();
        Indices rv;
        rv.reserve(total);
        for (const Indices& o : outs) rv.insert(rv.end(), o.begin(), o.end());
        return rv;
    }

    Thread_group::~Thread_group() {
        join_all();
    }

    void Thread_group::spawn(const std::function<void()>& f) {
        // the push_back of a running thread must not throw
        if (threads.size() == threads.capacity()) threads.reserve(threads.size() * 2 + 1);
        threads.push_back(std::thread(f));
    }

    void Thread_group::join_all() {
        for (std::thread& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    std::unique_ptr<Executor_intf> of_num_threads(int num_threads) {
        if (num_threads <= 1) return std::unique_ptr<Executor_intf>(new Sequential_executor());
        return std::unique_ptr<Executor_intf>(new Threaded_executor(num_threads));
    }

    // every unit divisible by 3, so the output order shows the chunk order
    static void multiples_of_3(size_t begin, size_t end, Indices& out) {
        for (size_t i = begin; i < end; i++) {
            if (i % 3 == 0) out.push_back(WordIndex(static_cast<uint32_t>(i)));
        }
    }

    static bool is_multiples_of_3(const Indices& r, size_t num_units) {
        if (r.size() != (num_units + 2) / 3) return false;
        for (size_t i = 0; i < r.size(); i++) {
            if (r[i].get() != 3 * i) return false;
        }
        return true;
    }

    void test() {
        std::stringstream output;
        std::stringstream expected;

        Sequential_executor seq;
        Threaded_executor four(4);
        Threaded_executor big_chunks(4, 50);
        size_t sizes[] = { 0, 1, 7, 100, 1001 };
        for (size_t n : sizes) {
            output << is_multiples_of_3(seq.run(n, multiples_of_3), n)
                   << is_multiples_of_3(four.run(n, multiples_of_3), n)
                   << is_multiples_of_3(big_chunks.run(n, multiples_of_3), n) << " ";
        }
        output << std::endl;
        expected << "111 111 111 111 111 " << std::endl;

        // how many chunks actually ran
        std::mutex m;
        int calls = 0;
        Chunk_fn counting = [&m, &calls] (size_t begin, size_t end, Indices& out) {
            std::lock_guard<std::mutex> guard(m);
            calls++;
        };
        four.run(100, counting);
        output << calls << " ";
        calls = 0;
        four.run(3, counting);
        output << calls << " ";
        calls = 0;
        big_chunks.run(120, counting);
        output << calls << " ";
        calls = 0;
        big_chunks.run(10, counting);
        output << calls << " ";
        calls = 0;
        seq.run(0, counting);
        output << calls << std::endl;
        expected << "4 3 3 1 0" << std::endl;

        // a failing chunk fails the whole run, after the others are done
        Chunk_fn failing = [] (size_t begin, size_t end, Indices& out) {
            if (begin > 0) throw std::runtime_error("chunk failed");
            out.push_back(WordIndex(0));
        };
        bool threw = false;
        try {
            four.run(100, failing);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "chunk failed";
        }
        output << threw << " " << seq.concurrency() << " " << four.concurrency() << " "
               << Threaded_executor(0).concurrency() << " "
               << of_num_threads(1)->concurrency() << " " << of_num_threads(8)->concurrency() << std::endl;
        expected << "1 1 4 1 1 8" << std::endl;

        // leaving a Thread_group early still waits for what it started
        std::atomic<int> finished(0);
        bool unwound = false;
        size_t started = 0;
        try {
            Thread_group group;
            for (int i = 0; i < 3; i++) {
                group.spawn([&finished] () {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    finished++;
                });
            }
            started = group.size();
            throw std::runtime_error("could not start thread");
        } catch (const std::runtime_error&) {
            unwound = true;
        }
        output << unwound << " " << started << " " << finished.load() << std::endl;
        expected << "1 3 3" << std::endl;

        Thread_group twice;
        twice.spawn([&finished] () { finished++; });
        twice.join_all();
        twice.join_all();
        output << finished.load() << std::endl;
        expected << 4 << std::endl;

        std::string output_str = output.str();
        std::string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Exec::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }
}
