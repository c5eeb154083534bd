#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/cache/manager/ProjectScopedCache.hpp"
#include "core/memory/MemoryManager.hpp"

using fanws::core::cache::LruCacheConfig;
using fanws::core::cache::ProjectCacheRegistry;
using fanws::core::cache::SetResult;
using fanws::core::memory::MemoryManager;

void smokeTestProjectScopedCache() {
    ProjectCacheRegistry registry;
    auto p = registry.getOrCreate("P");
    auto q = registry.getOrCreate("Q");
    assert(p->set("k", "v1") == SetResult::Stored);
    assert(q->set("k", "v2") == SetResult::Stored);
    assert(*p->get("k") == "v1");
    assert(*q->get("k") == "v2");

    // Повторный вызов возвращает тот же кэш
    assert(registry.getOrCreate("P") == p);
    assert(registry.projectCount() == 2);

    assert(registry.closeProject("P"));
    assert(!registry.hasProject("P"));
    assert(p->size() == 0);
    assert(*q->get("k") == "v2");
    assert(!registry.closeProject("P"));

    auto reopened = registry.getOrCreate("P");
    assert(reopened != p);
    assert(!reopened->get("k"));
    std::cout << "[OK] ProjectScopedCache smoke test\n";
}

void budgetTestProjectScopedCache() {
    LruCacheConfig config;
    config.projectMaxBytes = 64;
    ProjectCacheRegistry registry(config);
    auto cache = registry.getOrCreate("novel");
    assert(cache->maxBytes() == 64);
    assert(cache->set("big", std::string(65, 'x')) == SetResult::TooLarge);
    cache->set("a", std::string(40, 'a'));
    cache->set("b", std::string(40, 'b'));
    assert(!cache->contains("a"));
    assert(cache->currentSizeBytes() == 40);

    bool rejected = false;
    try {
        LruCacheConfig invalid;
        invalid.projectMaxBytes = 0;
        registry.setConfiguration(invalid);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    assert(registry.getConfiguration().projectMaxBytes == 64);
    std::cout << "[OK] ProjectScopedCache budget test\n";
}

void managerTestProjectScopedCache() {
    auto manager = std::make_shared<MemoryManager>();
    ProjectCacheRegistry registry;
    registry.setMemoryManager(manager);

    auto a = registry.getOrCreate("A");
    registry.getOrCreate("B");
    assert(manager->registeredCacheCount() == 2);
    assert(manager->isRegistered("A"));

    a->set("chapter", std::string(100, 'c'));
    assert(manager->getMemoryStats().cacheBytes == 100);

    registry.closeProject("A");
    assert(!manager->isRegistered("A"));
    assert(manager->registeredCacheCount() == 1);

    registry.closeAll();
    assert(registry.projectCount() == 0);
    assert(manager->registeredCacheCount() == 0);
    std::cout << "[OK] ProjectScopedCache memory manager test\n";
}

void reopenTestProjectScopedCache() {
    auto manager = std::make_shared<MemoryManager>();
    ProjectCacheRegistry first;
    ProjectCacheRegistry second;
    first.setMemoryManager(manager);
    second.setMemoryManager(manager);

    // Новый экземпляр проекта регистрируется раньше, чем закрывается прежний
    auto stale = first.getOrCreate("A");
    auto fresh = second.getOrCreate("A");
    assert(stale != fresh);
    assert(manager->isRegistered(fresh.get()));
    assert(!manager->isRegistered(stale.get()));

    assert(first.closeProject("A"));
    assert(manager->isRegistered("A"));
    assert(manager->isRegistered(fresh.get()));
    assert(manager->registeredCacheCount() == 1);

    fresh->set("chapter", std::string(50, 'c'));
    assert(manager->getMemoryStats().cacheBytes == 50);

    assert(second.closeProject("A"));
    assert(!manager->isRegistered("A"));
    std::cout << "[OK] ProjectScopedCache reopen test\n";
}

void concurrentReopenTestProjectScopedCache() {
    auto manager = std::make_shared<MemoryManager>();
    ProjectCacheRegistry registry;
    registry.setMemoryManager(manager);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&registry, t] {
            for (int i = 0; i < 1000; ++i) {
                if ((i + t) % 2 == 0) {
                    registry.closeProject("A");
                } else {
                    registry.getOrCreate("A")->set("key", std::to_string(i));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // Реестр и MemoryManager видят один и тот же экземпляр
    assert(registry.hasProject("A") == manager->isRegistered("A"));
    if (registry.hasProject("A")) {
        assert(manager->isRegistered(registry.getOrCreate("A").get()));
    }
    registry.closeAll();
    assert(manager->registeredCacheCount() == 0);
    std::cout << "[OK] ProjectScopedCache concurrent reopen test\n";
}

void stressTestProjectScopedCache() {
    ProjectCacheRegistry registry;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&registry, t] {
            for (int i = 0; i < 2000; ++i) {
                auto cache = registry.getOrCreate("project" + std::to_string(i % 8));
                cache->set("key" + std::to_string(t), std::to_string(i));
                if (i % 500 == 0) {
                    registry.closeProject("project" + std::to_string((i + t) % 8));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(registry.projectCount() <= 8);
    registry.closeAll();
    assert(registry.projectCount() == 0);
    std::cout << "[OK] ProjectScopedCache stress test\n";
}

int main() {
    smokeTestProjectScopedCache();
    budgetTestProjectScopedCache();
    managerTestProjectScopedCache();
    reopenTestProjectScopedCache();
    concurrentReopenTestProjectScopedCache();
    stressTestProjectScopedCache();
    std::cout << "All ProjectScopedCache tests passed!\n";
    return 0;
}
