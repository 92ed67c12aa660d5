// ============================================================================
// Example 01: Shared Counter Behind a Mutex
// ============================================================================
//
// Many tasks on a thread pool increment one counter. Tasks that find the
// mutex taken suspend instead of blocking a worker, and are resumed in
// arrival order as the guard ahead of them is dropped.
//
// RUN:
//   cd build && ./01_mutex_counter
//
// ============================================================================

#include "colock/colock.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace colock;

Task<void> AddOne(Mutex<long> counter, std::atomic<int>& finished) {
    {
        auto guard = co_await counter.Lock();
        ++*guard;
    }
    finished++;
}

int main() {
    std::cout << "=== colock Example 01: Mutex Counter ===" << std::endl;

    constexpr int kTasks = 10000;
    Mutex<long> counter(0);
    std::atomic<int> finished{0};

    {
        ThreadPoolExecutor::Options options;
        options.num_threads = 4;
        ThreadPoolExecutor pool(options);

        for (int i = 0; i < kTasks; ++i) {
            Spawn(pool, AddOne(counter, finished));
        }
        while (finished.load() < kTasks) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        pool.Stop();
    }

    // Every task and its handle copy are gone: the counter can be taken out.
    auto total = std::move(counter).TryUnwrap();
    if (total.IsErr()) {
        std::cerr << "counter still shared" << std::endl;
        return 1;
    }
    std::cout << "Counter: " << total.Value() << " (expected " << kTasks << ")" << std::endl;
    return total.Value() == kTasks ? 0 : 1;
}
