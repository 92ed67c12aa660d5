// ============================================================================
// Lock Benchmarks
// ============================================================================
//
// Uncontended paths go through SyncWait like ordinary callers. The contended
// pairs drive futures with Poll() so that every iteration takes the full
// enqueue -> grant -> wake -> collect round trip without scheduler noise.
//
// ============================================================================

#include "colock/core/spawn.hpp"
#include "colock/core/task.hpp"
#include "colock/io/thread_pool_executor.hpp"
#include "colock/sync/mutex.hpp"
#include "colock/sync/rwlock.hpp"
#include "colock/sync/sync_wait.hpp"

#include <atomic>
#include <benchmark/benchmark.h>
#include <mutex>
#include <shared_mutex>
#include <thread>

using namespace colock;

// ============================================================================
// Mutex Benchmarks
// ============================================================================

static void BM_MutexUncontended(benchmark::State& state) {
    Mutex<int> mutex(0);

    for (auto _ : state) {
        SyncWait([&mutex]() -> Task<void> {
            auto guard = co_await mutex.Lock();
            ++*guard;
        }());
    }
}
BENCHMARK(BM_MutexUncontended);

// Many acquisitions inside one SyncWait, leaving out coroutine creation.
static void BM_MutexUncontendedAmortized(benchmark::State& state) {
    Mutex<int> mutex(0);
    const int batch = 1000;

    for (auto _ : state) {
        SyncWait([&mutex, batch]() -> Task<void> {
            for (int i = 0; i < batch; ++i) {
                auto guard = co_await mutex.Lock();
            }
        }());
    }
    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_MutexUncontendedAmortized);

static void BM_MutexTryLock(benchmark::State& state) {
    Mutex<int> mutex(0);

    for (auto _ : state) {
        auto guard = mutex.TryLock();
        benchmark::DoNotOptimize(guard);
    }
}
BENCHMARK(BM_MutexTryLock);

static void BM_StdMutexUncontended(benchmark::State& state) {
    std::mutex mutex;
    int value = 0;

    for (auto _ : state) {
        std::lock_guard<std::mutex> lock(mutex);
        benchmark::DoNotOptimize(++value);
    }
}
BENCHMARK(BM_StdMutexUncontended);

Task<void> LockedAdd(Mutex<long>& mutex, std::atomic<int>& remaining) {
    {
        auto guard = co_await mutex.Lock();
        ++*guard;
    }
    remaining--;
}

// Tasks on a pool fighting over one mutex.
static void BM_MutexContendedThreadPool(benchmark::State& state) {
    const int tasks = static_cast<int>(state.range(0));
    Mutex<long> mutex(0);
    ThreadPoolExecutor executor(4);

    for (auto _ : state) {
        std::atomic<int> remaining{tasks};
        for (int i = 0; i < tasks; ++i) {
            Spawn(executor, LockedAdd(mutex, remaining));
        }
        while (remaining.load() > 0) {
            std::this_thread::yield();
        }
    }
    state.SetItemsProcessed(state.iterations() * tasks);
    executor.Stop();
}
BENCHMARK(BM_MutexContendedThreadPool)->Arg(64)->Arg(1024)->UseRealTime();

// ============================================================================
// RwLock Benchmarks
// ============================================================================

static void BM_RwLockReadUncontended(benchmark::State& state) {
    RwLock<int> lock(0);

    for (auto _ : state) {
        SyncWait([&lock]() -> Task<void> {
            auto guard = co_await lock.Read();
            benchmark::DoNotOptimize(*guard);
        }());
    }
}
BENCHMARK(BM_RwLockReadUncontended);

static void BM_RwLockWriteUncontended(benchmark::State& state) {
    RwLock<int> lock(0);

    for (auto _ : state) {
        SyncWait([&lock]() -> Task<void> {
            auto guard = co_await lock.Write();
            ++*guard;
        }());
    }
}
BENCHMARK(BM_RwLockWriteUncontended);

// Two reads queued behind a writer, granted together by one release.
static void BM_RwLockContendedReadPair(benchmark::State& state) {
    RwLock<int> lock(0);

    for (auto _ : state) {
        auto writer = lock.TryWrite();
        auto r1 = lock.Read();
        auto r2 = lock.Read();
        (void)r1.Poll(Waker{});
        (void)r2.Poll(Waker{});
        {
            auto release = std::move(writer).Value();
        }
        auto g1 = r1.Poll(Waker{});
        auto g2 = r2.Poll(Waker{});
        benchmark::DoNotOptimize(g1);
        benchmark::DoNotOptimize(g2);
    }
}
BENCHMARK(BM_RwLockContendedReadPair);

// Two writes queued behind a reader, granted one after the other.
static void BM_RwLockContendedWritePair(benchmark::State& state) {
    RwLock<int> lock(0);

    for (auto _ : state) {
        auto reader = lock.TryRead();
        auto w1 = lock.Write();
        auto w2 = lock.Write();
        (void)w1.Poll(Waker{});
        (void)w2.Poll(Waker{});
        {
            auto release = std::move(reader).Value();
        }
        {
            auto g1 = w1.Poll(Waker{});
            ++**g1;
        }
        auto g2 = w2.Poll(Waker{});
        ++**g2;
    }
}
BENCHMARK(BM_RwLockContendedWritePair);

static void BM_StdSharedMutexRead(benchmark::State& state) {
    std::shared_mutex mutex;
    int value = 0;

    for (auto _ : state) {
        std::shared_lock<std::shared_mutex> lock(mutex);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_StdSharedMutexRead);

static void BM_StdSharedMutexWrite(benchmark::State& state) {
    std::shared_mutex mutex;
    int value = 0;

    for (auto _ : state) {
        std::unique_lock<std::shared_mutex> lock(mutex);
        benchmark::DoNotOptimize(++value);
    }
}
BENCHMARK(BM_StdSharedMutexWrite);
