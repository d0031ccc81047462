#include <iostream>
#include <string>
#include <thread>

#include "recache/cache/bulk_cache.hpp"

using namespace recache::cache;
using recache::async::Context;
using namespace std::chrono_literals;

int main() {
    try {
        std::cout << "=== BulkCache Usage Examples ===" << std::endl;

        // Reload the whole table every second; drop rows not seen for 3
        // seconds.
        int generation = 0;
        BulkCache<std::string, int> table(
            1s, 3s,
            [&generation](const Context& ctx,
                          const BulkCache<std::string, int>::Setter& set) {
                // Simulate a slow bulk query
                if (!ctx.sleepFor(200ms)) {
                    return false;
                }
                ++generation;
                for (int i = 0; i < 10; ++i) {
                    set(std::to_string(i), i * generation);
                }
                // Rows only the first query returns
                if (generation == 1) {
                    set("legacy", -1);
                }
                return true;
            });

        // Readers block until the first query completes
        std::cout << "\n--- Initial Population ---" << std::endl;
        auto start = std::chrono::steady_clock::now();
        auto value = table.get("3");
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "Value of '3': " << value.value_or(-1) << " after "
                  << waited.count() << "ms" << std::endl;

        // A bounded read on a fresh cache can give up early
        std::cout << "\n--- Bounded Readiness ---" << std::endl;
        BulkCache<std::string, int> slow(
            10s, 0ms, [](const Context& ctx,
                         const BulkCache<std::string, int>::Setter& set) {
                if (!ctx.sleepFor(1s)) {
                    return false;
                }
                set("answer", 42);
                return true;
            });
        if (!slow.get("answer", Context{}.withTimeout(50ms))) {
            std::cout << "Slow cache not ready within 50ms" << std::endl;
        }
        std::cout << "Waiting without a bound: " << *slow.get("answer")
                  << std::endl;

        // Later queries merge into the existing rows
        std::cout << "\n--- Periodic Refresh ---" << std::endl;
        std::this_thread::sleep_for(2500ms);
        std::cout << "Value of '3' now: " << table.get("3").value_or(-1)
                  << std::endl;
        std::cout << "Legacy row still present: "
                  << (table.get("legacy") ? "yes" : "no") << std::endl;

        // Rows no query returns any more expire after keep_time
        std::cout << "\n--- Expiry ---" << std::endl;
        std::this_thread::sleep_for(2s);
        std::cout << "Legacy row still present: "
                  << (table.get("legacy") ? "yes" : "no") << std::endl;

        auto stats = table.statistics();
        std::cout << "\nRows: " << stats.size
                  << ", producer runs: " << stats.refreshes
                  << ", failures: " << stats.refresh_failures
                  << ", evictions: " << stats.evictions << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
