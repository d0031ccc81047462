#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "recache/cache/point_cache.hpp"

using namespace recache::cache;
using recache::async::Context;
using namespace std::chrono_literals;

// Print cache statistics helper function
void print_stats(const PointCache<std::string, std::size_t>& cache) {
    auto stats = cache.statistics();
    std::cout << "Cache size: " << stats.size << ", hits: " << stats.hits
              << ", misses: " << stats.misses << ", loads: " << stats.loads
              << ", refreshes: " << stats.refreshes
              << ", evictions: " << stats.evictions << std::endl;
}

int main() {
    try {
        std::cout << "=== PointCache Usage Examples ===" << std::endl;

        // Values are recomputed after 2 seconds if still being read and
        // dropped after 6 seconds.
        CacheOptions options;
        options.refresh_interval = 2s;
        options.keep_time = 6s;
        options.name = "lengths";

        PointCache<std::string, std::size_t> cache(
            options,
            [](const std::string& key,
               const Context& ctx) -> std::optional<std::size_t> {
                // Simulate a slow backend that honours cancellation
                if (!ctx.sleepFor(100ms)) {
                    return std::nullopt;
                }
                if (key.empty()) {
                    return std::nullopt;
                }
                return key.size();
            });

        // First access computes the value on the caller's thread
        std::cout << "\n--- Lazy Loading ---" << std::endl;
        auto value = cache.get("hello");
        if (value) {
            std::cout << "Length of 'hello': " << *value << std::endl;
        }
        value = cache.get("hello");
        std::cout << "Second read served from cache: " << *value << std::endl;
        print_stats(cache);

        // Concurrent first reads share a single computation
        std::cout << "\n--- Coalesced Loading ---" << std::endl;
        std::vector<std::thread> readers;
        for (int i = 0; i < 8; ++i) {
            readers.emplace_back([&cache] { (void)cache.get("concurrent"); });
        }
        for (auto& reader : readers) {
            reader.join();
        }
        print_stats(cache);

        // Failed computations are reported as missing
        std::cout << "\n--- Failed Load ---" << std::endl;
        if (!cache.get("")) {
            std::cout << "Empty key could not be computed" << std::endl;
        }

        // Direct writes bypass the producer
        std::cout << "\n--- Direct Set ---" << std::endl;
        cache.set("manual", 42);
        std::cout << "Manual value: " << *cache.get("manual") << std::endl;

        // Readers can bound how long they wait for a pending computation
        std::cout << "\n--- Bounded Wait ---" << std::endl;
        std::thread loader([&cache] { (void)cache.get("slow key"); });
        std::this_thread::sleep_for(10ms);
        auto bounded = cache.get("slow key", Context{}.withTimeout(10ms));
        std::cout << "Bounded read "
                  << (bounded ? "returned a value" : "gave up") << std::endl;
        loader.join();

        // Keep reading one key so the background refresh picks it up
        std::cout << "\n--- Background Refresh ---" << std::endl;
        for (int i = 0; i < 30; ++i) {
            (void)cache.get("hello");
            std::this_thread::sleep_for(100ms);
        }
        print_stats(cache);

        // Unread keys age out after keep_time
        std::cout << "\n--- Eviction ---" << std::endl;
        std::this_thread::sleep_for(4s);
        std::cout << "Contains 'concurrent': "
                  << (cache.contains("concurrent") ? "yes" : "no")
                  << std::endl;
        print_stats(cache);

        cache.close();
        std::cout << "\nCache closed; get returns "
                  << (cache.get("hello") ? "a value" : "nothing") << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
