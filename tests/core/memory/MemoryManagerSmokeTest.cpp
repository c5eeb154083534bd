#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include "core/cache/manager/ProjectScopedCache.hpp"
#include "core/memory/MemoryManager.hpp"
#include "core/text/LazyTextLoader.hpp"

using fanws::core::cache::LruCacheConfig;
using fanws::core::cache::MemoryConfig;
using fanws::core::cache::ProjectCacheRegistry;
using fanws::core::cache::TextLoaderConfig;
using fanws::core::memory::MemoryManager;
using fanws::core::memory::MemoryStats;
using fanws::core::memory::PressureLevel;

namespace {

MemoryConfig smallLimits(size_t maxCacheBytes) {
    MemoryConfig config;
    config.maxMemoryBytes = 1000;
    config.maxCacheBytes = maxCacheBytes;
    config.monitorInterval = std::chrono::seconds(1);
    return config;
}

LruCacheConfig projectBudget() {
    LruCacheConfig config;
    config.projectMaxBytes = 400;
    return config;
}

// 10 записей по 40 байт
void fill(ProjectCacheRegistry& registry, const std::string& projectId) {
    auto cache = registry.getOrCreate(projectId);
    for (int i = 0; i < 10; ++i) {
        cache->set("entry" + std::to_string(i), std::string(40, 'x'));
    }
}

} // namespace

void smokeTestMemoryManager() {
    auto manager = std::make_shared<MemoryManager>(smallLimits(1000));
    manager->setUsageProbe([] { return size_t(12345); });
    ProjectCacheRegistry registry(projectBudget());
    registry.setMemoryManager(manager);
    fill(registry, "A");
    fill(registry, "B");

    auto before = manager->getMemoryStats();
    assert(before.registeredCaches == 2);
    assert(before.cacheBytes == 800);
    assert(before.cacheEntries == 20);

    manager->cleanup();
    for (const auto& id : {"A", "B"}) {
        auto cache = registry.getOrCreate(id);
        assert(cache->currentSizeBytes() <= static_cast<size_t>(0.8 * cache->maxBytes()));
        // Вытеснены самые старые записи
        assert(!cache->contains("entry0"));
        assert(cache->contains("entry9"));
    }

    auto after = manager->getMemoryStats();
    assert(after.processRssBytes == 12345);
    assert(after.peakRssBytes == 12345);
    assert(after.cacheBytes < before.cacheBytes);
    assert(!after.degraded);
    assert(manager->averageRssBytes() == 12345.0);
    std::cout << "[OK] MemoryManager smoke test\n";
}

void aggregateLimitTestMemoryManager() {
    // Суммарный потолок меньше суммы бюджетов проектов
    auto manager = std::make_shared<MemoryManager>(smallLimits(400));
    manager->setUsageProbe([] { return size_t(1); });
    ProjectCacheRegistry registry(projectBudget());
    registry.setMemoryManager(manager);
    fill(registry, "A");
    fill(registry, "B");

    const size_t freed = manager->cleanup();
    auto stats = manager->getMemoryStats();
    assert(stats.cacheBytes <= 300);
    assert(freed == 800 - stats.cacheBytes);
    std::cout << "[OK] MemoryManager aggregate limit test\n";
}

void warningTestMemoryManager() {
    auto manager = std::make_shared<MemoryManager>(smallLimits(100000));
    std::atomic<size_t> rss{100};
    manager->setUsageProbe([&rss] { return rss.load(); });
    ProjectCacheRegistry registry(projectBudget());
    registry.setMemoryManager(manager);
    fill(registry, "A");
    fill(registry, "B");

    int warnings = 0;
    int criticals = 0;
    manager->addWarningCallback([&warnings](const MemoryStats&) { ++warnings; });
    manager->addCriticalCallback([&criticals](const MemoryStats&) { ++criticals; });

    assert(manager->checkMemoryPressure() == PressureLevel::Normal);
    assert(warnings == 0);

    rss = 850;
    assert(manager->checkMemoryPressure() == PressureLevel::Warning);
    assert(warnings == 1);
    assert(criticals == 0);
    // Из каждого кэша удалена четверть самых старых записей
    assert(registry.getOrCreate("A")->size() == 8);
    assert(registry.getOrCreate("B")->size() == 8);
    assert(!registry.getOrCreate("A")->contains("entry1"));
    assert(registry.getOrCreate("A")->contains("entry2"));

    // Повторная мягкая очистка: по две записи из восьми в каждом кэше
    assert(manager->softCleanup() == 2 * 2 * 40);
    assert(registry.getOrCreate("A")->size() == 6);
    assert(registry.getOrCreate("B")->size() == 6);
    std::cout << "[OK] MemoryManager warning test\n";
}

void criticalTestMemoryManager() {
    auto manager = std::make_shared<MemoryManager>(smallLimits(100000));
    manager->setUsageProbe([] { return size_t(950); });
    ProjectCacheRegistry registry(projectBudget());
    registry.setMemoryManager(manager);
    fill(registry, "active");
    fill(registry, "background");
    manager->setActiveProject("active");
    assert(manager->getActiveProject() == "active");

    int criticals = 0;
    manager->addCriticalCallback([&criticals](const MemoryStats& stats) {
        ++criticals;
        assert(stats.processRssBytes == 950);
    });

    const size_t gcBefore = manager->getMemoryStats().gcCount;
    assert(manager->checkMemoryPressure() == PressureLevel::Critical);
    assert(criticals == 1);
    assert(registry.getOrCreate("active")->size() == 10);
    assert(registry.getOrCreate("background")->size() == 0);
    assert(manager->getMemoryStats().gcCount == gcBefore + 1);
    std::cout << "[OK] MemoryManager critical test\n";
}

void failureTestMemoryManager() {
    auto manager = std::make_shared<MemoryManager>(smallLimits(100000));
    manager->setUsageProbe([]() -> size_t { throw std::runtime_error("probe failed"); });
    manager->addWarningCallback([](const MemoryStats&) { throw std::runtime_error("callback failed"); });

    // Ошибки измерения и колбэков не выходят наружу
    auto stats = manager->getMemoryStats();
    assert(stats.processRssBytes == 0);
    assert(manager->checkMemoryPressure() == PressureLevel::Normal);
    manager->cleanup();

    manager->setUsageProbe([] { return size_t(850); });
    assert(manager->checkMemoryPressure() == PressureLevel::Warning);
    assert(manager->forceGarbageCollection());

    bool rejected = false;
    try {
        MemoryConfig invalid;
        invalid.warningThreshold = 0.95;
        invalid.criticalThreshold = 0.9;
        MemoryManager broken(invalid);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] MemoryManager failure handling test\n";
}

void lazyLoaderTestMemoryManager() {
    TextLoaderConfig loaderConfig;
    loaderConfig.chunkSize = 16;
    loaderConfig.lazyThresholdBytes = 32;
    MemoryManager manager(MemoryConfig{}, loaderConfig);

    const auto dir = std::filesystem::temp_directory_path();
    const auto small = dir / ("fanws_mm_small_" + std::to_string(::getpid()) + ".txt");
    const auto large = dir / ("fanws_mm_large_" + std::to_string(::getpid()) + ".txt");
    std::ofstream(small) << "short";
    std::ofstream(large) << std::string(100, 'L');

    assert(!manager.shouldUseLazyLoading(small.string()));
    assert(manager.shouldUseLazyLoading(large.string()));
    assert(!manager.shouldUseLazyLoading("/nonexistent/fanws.txt"));

    auto first = manager.createLazyLoader(large.string());
    auto second = manager.createLazyLoader(large.string());
    assert(first == second);
    assert(first->chunkSize() == 16);
    assert(first->chunkCount() == 7);
    assert(manager.lazyLoaderCount() == 1);

    first.reset();
    second.reset();
    assert(manager.lazyLoaderCount() == 0);
    manager.forceGarbageCollection();

    std::filesystem::remove(small);
    std::filesystem::remove(large);
    std::cout << "[OK] MemoryManager lazy loader test\n";
}

void monitorTestMemoryManager() {
    auto manager = std::make_shared<MemoryManager>(smallLimits(100000));
    manager->setUsageProbe([] { return size_t(950); });
    ProjectCacheRegistry registry(projectBudget());
    registry.setMemoryManager(manager);
    fill(registry, "background");

    manager->start();
    assert(manager->isMonitoring());
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    manager->stop();
    assert(!manager->isMonitoring());
    assert(registry.getOrCreate("background")->size() == 0);

    auto report = manager->getSystemStats();
    assert(report["caches"].size() == 1);
    assert(report["memory"]["processRssBytes"] == 950);
    assert(report["config"]["maxMemoryBytes"] == 1000);
    std::cout << "[OK] MemoryManager monitor test\n";
}

void processInstanceTestMemoryManager() {
    MemoryConfig config;
    config.maxCacheBytes = 12345;
    TextLoaderConfig loaderConfig;

    auto instance = MemoryManager::initialize(config, loaderConfig);
    assert(instance == MemoryManager::getInstance());
    assert(instance->getConfiguration().maxCacheBytes == 12345);

    // Повторная инициализация не заменяет уже созданный экземпляр
    MemoryConfig other;
    other.maxCacheBytes = 999;
    assert(MemoryManager::initialize(other, loaderConfig) == instance);
    assert(MemoryManager::getInstance()->getConfiguration().maxCacheBytes == 12345);
    std::cout << "[OK] MemoryManager process instance test\n";
}

int main() {
    smokeTestMemoryManager();
    aggregateLimitTestMemoryManager();
    warningTestMemoryManager();
    criticalTestMemoryManager();
    failureTestMemoryManager();
    lazyLoaderTestMemoryManager();
    monitorTestMemoryManager();
    processInstanceTestMemoryManager();
    std::cout << "All MemoryManager tests passed!\n";
    return 0;
}
