// ============================================================================
// Example 02: Read-Mostly Cache Behind an RwLock
// ============================================================================
//
// Readers share the cache; a miss upgrades to a write by dropping the read
// guard and taking a write guard, then re-checks because another writer may
// have filled the entry in between.
//
// The ManualExecutor keeps the interleaving deterministic: a writer queued
// behind readers holds back every reader that arrives after it.
//
// RUN:
//   cd build && ./02_rwlock_cache
//
// ============================================================================

#include "colock/colock.hpp"

#include <iostream>
#include <map>
#include <string>

using namespace colock;

using Cache = RwLock<std::map<int, std::string>>;

std::string Compute(int key) {
    return "value-" + std::to_string(key * key);
}

Task<std::string> Lookup(Cache cache, int key) {
    {
        auto reader = co_await cache.Read();
        auto it = reader->find(key);
        if (it != reader->end()) {
            co_return it->second;
        }
    }

    auto writer = co_await cache.Write();
    auto [it, inserted] = writer->try_emplace(key, Compute(key));
    if (inserted) {
        std::cout << "  filled key " << key << std::endl;
    }
    co_return it->second;
}

Task<void> Query(Cache cache, int key) {
    std::string value = co_await Lookup(cache, key);
    std::cout << "  key " << key << " -> " << value << std::endl;
}

int main() {
    std::cout << "=== colock Example 02: RwLock Cache ===" << std::endl;

    Cache cache(std::in_place);
    ManualExecutor executor;

    for (int key : {1, 2, 1, 3, 2, 1}) {
        Spawn(executor, Query(cache, key));
    }
    size_t steps = executor.RunUntilIdle();
    std::cout << "Ran " << steps << " steps" << std::endl;

    auto snapshot = cache.TryRead();
    if (snapshot.IsErr()) {
        std::cerr << "cache unexpectedly busy: " << snapshot.Error().message() << std::endl;
        return 1;
    }
    std::cout << "Cached entries: " << snapshot.Value()->size() << std::endl;
    return 0;
}
