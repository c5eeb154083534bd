#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "core/cache/dynamic/BoundedLRUCache.hpp"

using fanws::core::cache::BoundedLRUCache;
using fanws::core::cache::SetResult;
using fanws::core::cache::TextLRUCache;

void smokeTestBoundedLRUCache() {
    TextLRUCache cache(100);
    assert(cache.set("a", std::string(40, 'a')) == SetResult::Stored);
    assert(cache.set("b", std::string(40, 'b')) == SetResult::Stored);
    assert(cache.set("c", std::string(40, 'c')) == SetResult::Stored);
    assert(!cache.get("a"));
    assert(cache.get("b"));
    assert(cache.get("c"));
    assert(cache.currentSizeBytes() == 80);
    assert(cache.size() == 2);

    // update и set взаимозаменяемы
    assert(cache.update("b", "short") == SetResult::Stored);
    assert(*cache.get("b") == "short");
    assert(cache.currentSizeBytes() == 45);

    assert(cache.remove("b"));
    assert(!cache.remove("b"));
    cache.clear();
    assert(cache.size() == 0);
    assert(cache.currentSizeBytes() == 0);
    std::cout << "[OK] BoundedLRUCache smoke test\n";
}

void recencyTestBoundedLRUCache() {
    TextLRUCache cache(30);
    cache.set("a", std::string(10, 'a'));
    cache.set("b", std::string(10, 'b'));
    cache.set("c", std::string(10, 'c'));
    // Чтение "a" делает самой старой запись "b"
    assert(cache.get("a"));
    cache.set("d", std::string(10, 'd'));
    assert(cache.contains("a"));
    assert(!cache.contains("b"));
    assert(cache.contains("c"));
    assert(cache.contains("d"));

    auto order = cache.keys();
    assert(order.size() == 3);
    assert(order.front() == "d");
    assert(order.back() == "c");
    std::cout << "[OK] BoundedLRUCache recency test\n";
}

void oversizedTestBoundedLRUCache() {
    TextLRUCache cache(50);
    cache.set("small", std::string(10, 's'));
    assert(cache.set("huge", std::string(51, 'h')) == SetResult::TooLarge);
    assert(!cache.contains("huge"));
    assert(cache.contains("small"));

    // Отказ для существующего ключа удаляет прежнее значение
    assert(cache.set("small", "x", 51) == SetResult::TooLarge);
    assert(!cache.get("small"));
    assert(cache.currentSizeBytes() == 0);

    // Значение ровно в ёмкость допустимо
    assert(cache.set("exact", std::string(50, 'e')) == SetResult::Stored);
    assert(cache.currentSizeBytes() == 50);
    assert(cache.getMetrics().rejectedCount == 2);
    std::cout << "[OK] BoundedLRUCache oversized value test\n";
}

void trimTestBoundedLRUCache() {
    TextLRUCache cache(100);
    for (int i = 0; i < 10; ++i) {
        cache.set("k" + std::to_string(i), std::string(10, 'x'));
    }
    assert(cache.evictOldest(3) == 30);
    assert(!cache.contains("k0"));
    assert(!cache.contains("k2"));
    assert(cache.contains("k3"));
    assert(cache.trimTo(25) == 50);
    assert(cache.currentSizeBytes() == 20);
    assert(cache.contains("k9"));
    // Запрошено больше, чем есть: сообщается реальное число
    size_t evicted = 0;
    assert(cache.evictOldest(100, evicted) == 20);
    assert(evicted == 2);
    assert(cache.size() == 0);
    assert(cache.evictOldest(5, evicted) == 0);
    assert(evicted == 0);

    auto metrics = cache.getMetrics();
    assert(metrics.evictionCount == 10);
    assert(metrics.toJson()["evictionCount"] == 10);
    std::cout << "[OK] BoundedLRUCache trim test\n";
}

void metricsTestBoundedLRUCache() {
    BoundedLRUCache<int, std::vector<uint8_t>> cache(16);
    cache.set(1, {1, 2, 3, 4});
    assert(cache.get(1));
    assert(!cache.get(2));
    auto metrics = cache.getMetrics();
    assert(metrics.hitCount == 1);
    assert(metrics.missCount == 1);
    assert(metrics.currentSize == 4);
    assert(metrics.maxSize == 16);
    assert(metrics.hitRate > 0.49 && metrics.hitRate < 0.51);
    std::cout << "[OK] BoundedLRUCache metrics test\n";
}

void stressTestBoundedLRUCache() {
    TextLRUCache cache(4096);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 5000; ++i) {
                const std::string key = std::to_string(t) + ":" + std::to_string(i % 300);
                cache.set(key, std::string(static_cast<size_t>(i % 64), 'v'));
                cache.get(std::to_string((t + 1) % 4) + ":" + std::to_string(i % 300));
                assert(cache.currentSizeBytes() <= cache.maxBytes());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(cache.currentSizeBytes() <= 4096);
    std::cout << "[OK] BoundedLRUCache stress test\n";
}

int main() {
    smokeTestBoundedLRUCache();
    recencyTestBoundedLRUCache();
    oversizedTestBoundedLRUCache();
    trimTestBoundedLRUCache();
    metricsTestBoundedLRUCache();
    stressTestBoundedLRUCache();
    std::cout << "All BoundedLRUCache tests passed!\n";
    return 0;
}
