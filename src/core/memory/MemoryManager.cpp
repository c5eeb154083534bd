#include "core/memory/MemoryManager.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "core/cache/manager/ProjectScopedCache.hpp"
#include "core/logging/Logging.hpp"
#include "core/text/LazyTextLoader.hpp"

#if defined(__linux__)
    #include <sys/sysinfo.h>
#endif
#if defined(__GLIBC__)
    #include <malloc.h>
#endif

namespace fanws {
namespace core {
namespace memory {

using cache::ProjectScopedCache;

namespace {

size_t readProcessRss() {
#if defined(__linux__)
    std::ifstream statm("/proc/self/statm");
    size_t size = 0;
    size_t resident = 0;
    if (statm >> size >> resident) {
        return resident * static_cast<size_t>(sysconf(_SC_PAGESIZE));
    }
#endif
    return 0;
}

double readSystemMemoryPercent() {
#if defined(__linux__)
    struct sysinfo info {};
    if (sysinfo(&info) == 0 && info.totalram > 0) {
        const double total = static_cast<double>(info.totalram) * info.mem_unit;
        const double free = static_cast<double>(info.freeram + info.bufferram) * info.mem_unit;
        return (total - free) / total * 100.0;
    }
#endif
    return 0.0;
}

} // namespace

const char* toString(PressureLevel level) {
    switch (level) {
        case PressureLevel::Normal:   return "normal";
        case PressureLevel::Warning:  return "warning";
        case PressureLevel::Critical: return "critical";
    }
    return "unknown";
}

// Реализация PIMPL
struct MemoryManager::Impl {
    cache::MemoryConfig config;
    cache::TextLoaderConfig loaderConfig;
    std::shared_ptr<spdlog::logger> logger;

    // Реестр кэшей и активный проект
    mutable std::mutex registryMutex;
    std::unordered_map<std::string, std::shared_ptr<ProjectScopedCache>> caches;
    std::string activeProject;

    // Статистика
    mutable std::mutex statsMutex;
    std::deque<size_t> rssHistory;
    size_t peakRss = 0;
    size_t gcCount = 0;
    bool degraded = false;
    UsageProbe usageProbe = readProcessRss;

    mutable std::mutex callbackMutex;
    std::vector<PressureCallback> warningCallbacks;
    std::vector<PressureCallback> criticalCallbacks;

    mutable std::mutex loaderMutex;
    std::unordered_map<std::string, std::weak_ptr<text::LazyTextLoader>> lazyLoaders;

    // Фоновый мониторинг
    std::thread monitorThread;
    std::mutex monitorMutex;
    std::condition_variable monitorCondition;
    bool stopMonitor = false;
    std::atomic<bool> monitoring{false};

    Impl(const cache::MemoryConfig& cfg, const cache::TextLoaderConfig& loaderCfg)
        : config(cfg)
        , loaderConfig(loaderCfg)
        , logger(logging::getLogger("memorymanager")) {
    }

    std::vector<std::shared_ptr<ProjectScopedCache>> snapshot() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        std::vector<std::shared_ptr<ProjectScopedCache>> result;
        result.reserve(caches.size());
        for (const auto& entry : caches) {
            result.push_back(entry.second);
        }
        return result;
    }

    void markDegraded(const std::string& operation, const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            degraded = true;
        }
        logger->error("{} failed, memory manager degraded: {}", operation, e.what());
    }

    void notify(const std::vector<PressureCallback>& callbacks, const MemoryStats& stats) {
        for (const auto& callback : callbacks) {
            try {
                callback(stats);
            } catch (const std::exception& e) {
                logger->error("Pressure callback error: {}", e.what());
            }
        }
    }

    size_t pruneLoaders() {
        std::lock_guard<std::mutex> lock(loaderMutex);
        size_t removed = 0;
        for (auto it = lazyLoaders.begin(); it != lazyLoaders.end();) {
            if (it->second.expired()) {
                it = lazyLoaders.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }
};

MemoryManager::MemoryManager(const cache::MemoryConfig& config,
                             const cache::TextLoaderConfig& loaderConfig) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация менеджера памяти");
    }
    if (!loaderConfig.validate()) {
        throw std::invalid_argument("Некорректная конфигурация загрузчика текста");
    }
    pImpl = std::make_unique<Impl>(config, loaderConfig);
    pImpl->logger->info("Memory manager initialized: limit {} bytes, cache limit {} bytes",
                        config.maxMemoryBytes, config.maxCacheBytes);
}

MemoryManager::~MemoryManager() {
    stop();
}

namespace {

std::mutex& instanceMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<MemoryManager>& instanceSlot() {
    static std::shared_ptr<MemoryManager> instance;
    return instance;
}

} // namespace

std::shared_ptr<MemoryManager> MemoryManager::getInstance() {
    std::lock_guard<std::mutex> lock(instanceMutex());
    auto& instance = instanceSlot();
    if (!instance) {
        instance = std::make_shared<MemoryManager>();
    }
    return instance;
}

std::shared_ptr<MemoryManager> MemoryManager::initialize(const cache::MemoryConfig& config,
                                                         const cache::TextLoaderConfig& loaderConfig) {
    std::lock_guard<std::mutex> lock(instanceMutex());
    auto& instance = instanceSlot();
    if (instance) {
        instance->pImpl->logger->warn("Memory manager already created, new configuration ignored");
        return instance;
    }
    instance = std::make_shared<MemoryManager>(config, loaderConfig);
    return instance;
}

void MemoryManager::registerCache(std::shared_ptr<ProjectScopedCache> cache) {
    if (!cache) return;
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    const std::string id = cache->projectId();
    auto it = pImpl->caches.find(id);
    if (it != pImpl->caches.end()) {
        if (it->second == cache) {
            pImpl->logger->warn("Cache for project '{}' already registered", id);
            return;
        }
        // Прежний экземпляр проекта закрывается, его место занимает новый
        it->second = std::move(cache);
        pImpl->logger->info("Cache for project '{}' replaced by a new instance", id);
        return;
    }
    pImpl->caches.emplace(id, std::move(cache));
    pImpl->logger->info("Cache for project '{}' registered", id);
}

void MemoryManager::unregisterCache(const std::string& projectId) {
    unregisterCache(projectId, nullptr);
}

void MemoryManager::unregisterCache(const std::string& projectId, const ProjectScopedCache* instance) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    auto it = pImpl->caches.find(projectId);
    if (it == pImpl->caches.end()) {
        pImpl->logger->warn("Cache for project '{}' not found", projectId);
        return;
    }
    if (instance && it->second.get() != instance) {
        pImpl->logger->debug("Cache for project '{}' already belongs to a newer instance", projectId);
        return;
    }
    pImpl->caches.erase(it);
    pImpl->logger->info("Cache for project '{}' unregistered", projectId);
}

bool MemoryManager::isRegistered(const ProjectScopedCache* instance) const {
    if (!instance) return false;
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    auto it = pImpl->caches.find(instance->projectId());
    return it != pImpl->caches.end() && it->second.get() == instance;
}

bool MemoryManager::isRegistered(const std::string& projectId) const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->caches.find(projectId) != pImpl->caches.end();
}

size_t MemoryManager::registeredCacheCount() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->caches.size();
}

void MemoryManager::setActiveProject(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    pImpl->activeProject = projectId;
}

std::string MemoryManager::getActiveProject() const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->activeProject;
}

MemoryStats MemoryManager::getMemoryStats() {
    MemoryStats stats;
    stats.timestamp = std::chrono::system_clock::now();

    const auto caches = pImpl->snapshot();
    stats.registeredCaches = caches.size();
    for (const auto& cache : caches) {
        stats.cacheBytes += cache->currentSizeBytes();
        stats.cacheEntries += cache->size();
    }

    UsageProbe probe;
    {
        std::lock_guard<std::mutex> lock(pImpl->statsMutex);
        probe = pImpl->usageProbe;
    }
    size_t rss = 0;
    try {
        rss = probe ? probe() : 0;
    } catch (const std::exception& e) {
        pImpl->logger->error("Failed to read process memory: {}", e.what());
    }
    stats.processRssBytes = rss;
    stats.systemMemoryPercent = readSystemMemoryPercent();
    stats.usageRatio = static_cast<double>(rss) / static_cast<double>(pImpl->config.maxMemoryBytes);

    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    pImpl->peakRss = std::max(pImpl->peakRss, rss);
    pImpl->rssHistory.push_back(rss);
    while (pImpl->rssHistory.size() > pImpl->config.historySize) {
        pImpl->rssHistory.pop_front();
    }
    stats.peakRssBytes = pImpl->peakRss;
    stats.gcCount = pImpl->gcCount;
    stats.degraded = pImpl->degraded;
    return stats;
}

double MemoryManager::averageRssBytes() const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    if (pImpl->rssHistory.empty()) return 0.0;
    double total = 0.0;
    for (size_t value : pImpl->rssHistory) {
        total += static_cast<double>(value);
    }
    return total / static_cast<double>(pImpl->rssHistory.size());
}

nlohmann::json MemoryManager::getSystemStats() {
    const MemoryStats stats = getMemoryStats();

    nlohmann::json caches = nlohmann::json::array();
    for (const auto& cache : pImpl->snapshot()) {
        auto metrics = cache->getMetrics().toJson();
        metrics["projectId"] = cache->projectId();
        caches.push_back(metrics);
    }

    const auto& cfg = pImpl->config;
    return {
        {"memory", stats.toJson()},
        {"averageRssBytes", averageRssBytes()},
        {"usagePercent", stats.usageRatio * 100.0},
        {"caches", caches},
        {"activeProject", getActiveProject()},
        {"lazyLoaders", lazyLoaderCount()},
        {"config", {
            {"maxMemoryBytes", cfg.maxMemoryBytes},
            {"maxCacheBytes", cfg.maxCacheBytes},
            {"warningThreshold", cfg.warningThreshold},
            {"criticalThreshold", cfg.criticalThreshold},
            {"chunkSize", pImpl->loaderConfig.chunkSize}
        }}
    };
}

size_t MemoryManager::cleanup() {
    size_t freed = 0;
    try {
        const auto caches = pImpl->snapshot();
        const double ratio = pImpl->config.cleanupTargetRatio;

        // Каждый кэш ужимается до своей целевой заполненности
        size_t total = 0;
        for (const auto& cache : caches) {
            const auto target = static_cast<size_t>(static_cast<double>(cache->maxBytes()) * ratio);
            freed += cache->trimTo(target);
            total += cache->currentSizeBytes();
        }

        // Суммарный потолок: вытеснение по кругу, пока сумма выше цели
        const auto aggregateTarget =
            static_cast<size_t>(static_cast<double>(pImpl->config.maxCacheBytes) * ratio);
        while (total > aggregateTarget) {
            bool evicted = false;
            for (const auto& cache : caches) {
                if (cache->size() == 0) continue;
                const size_t batch = std::max<size_t>(1, static_cast<size_t>(
                    static_cast<double>(cache->size()) * pImpl->config.softEvictionFraction));
                const size_t released = cache->evictOldest(batch);
                freed += released;
                total -= std::min(total, released);
                evicted = true;
                if (total <= aggregateTarget) break;
            }
            if (!evicted) break;
        }

        const MemoryStats stats = getMemoryStats();
        pImpl->logger->info("Cleanup freed {} bytes, cache now {} bytes, rss {} bytes",
                            freed, stats.cacheBytes, stats.processRssBytes);
    } catch (const std::exception& e) {
        pImpl->markDegraded("Cleanup", e);
    }
    return freed;
}

size_t MemoryManager::optimizeMemory() {
    const size_t freed = cleanup();
    forceGarbageCollection();
    return freed;
}

bool MemoryManager::forceGarbageCollection() {
    try {
        const size_t prunedLoaders = pImpl->pruneLoaders();
        bool trimmed = false;
#if defined(__GLIBC__)
        trimmed = malloc_trim(0) != 0;
#endif
        size_t cycles = 0;
        {
            std::lock_guard<std::mutex> lock(pImpl->statsMutex);
            cycles = ++pImpl->gcCount;
        }
        pImpl->logger->info("Forced collection #{}: {} stale loaders dropped, heap trimmed: {}",
                            cycles, prunedLoaders, trimmed);
        return true;
    } catch (const std::exception& e) {
        pImpl->markDegraded("Forced collection", e);
        return false;
    }
}

size_t MemoryManager::softCleanup() {
    size_t freed = 0;
    size_t entries = 0;
    try {
        for (const auto& cache : pImpl->snapshot()) {
            const size_t count = cache->size();
            if (count == 0) continue;
            const size_t batch = std::max<size_t>(1, static_cast<size_t>(
                static_cast<double>(count) * pImpl->config.softEvictionFraction));
            size_t evicted = 0;
            freed += cache->evictOldest(batch, evicted);
            entries += evicted;
        }
        pImpl->logger->warn("Memory warning cleanup: removed {} cache items ({} bytes)", entries, freed);
    } catch (const std::exception& e) {
        pImpl->markDegraded("Soft cleanup", e);
    }
    return freed;
}

size_t MemoryManager::hardCleanup() {
    size_t freed = 0;
    try {
        const std::string active = getActiveProject();
        size_t cleared = 0;
        for (const auto& cache : pImpl->snapshot()) {
            if (cache->projectId() == active) continue;
            freed += cache->currentSizeBytes();
            cache->clear();
            ++cleared;
        }
        pImpl->logger->critical("Critical memory cleanup: cleared {} caches ({} bytes), kept '{}'",
                                cleared, freed, active);
    } catch (const std::exception& e) {
        pImpl->markDegraded("Hard cleanup", e);
    }
    forceGarbageCollection();
    return freed;
}

PressureLevel MemoryManager::checkMemoryPressure() {
    PressureLevel level = PressureLevel::Normal;
    try {
        const MemoryStats stats = getMemoryStats();
        const auto& cfg = pImpl->config;
        const double cacheRatio =
            static_cast<double>(stats.cacheBytes) / static_cast<double>(cfg.maxCacheBytes);
        const double ratio = std::max(stats.usageRatio, cacheRatio);

        if (ratio >= cfg.criticalThreshold) {
            level = PressureLevel::Critical;
        } else if (ratio >= cfg.warningThreshold) {
            level = PressureLevel::Warning;
        }
        if (level == PressureLevel::Normal) return level;

        pImpl->logger->warn("Memory pressure {}: rss {} bytes ({:.1f}%), caches {} bytes",
                            toString(level), stats.processRssBytes,
                            stats.usageRatio * 100.0, stats.cacheBytes);

        std::vector<PressureCallback> callbacks;
        if (level == PressureLevel::Critical) {
            hardCleanup();
            std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
            callbacks = pImpl->criticalCallbacks;
        } else {
            softCleanup();
            std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
            callbacks = pImpl->warningCallbacks;
        }
        pImpl->notify(callbacks, getMemoryStats());
    } catch (const std::exception& e) {
        pImpl->markDegraded("Pressure check", e);
    }
    return level;
}

void MemoryManager::addWarningCallback(PressureCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
    pImpl->warningCallbacks.push_back(std::move(callback));
}

void MemoryManager::addCriticalCallback(PressureCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
    pImpl->criticalCallbacks.push_back(std::move(callback));
}

void MemoryManager::start() {
    std::lock_guard<std::mutex> lock(pImpl->monitorMutex);
    if (pImpl->monitorThread.joinable()) return;
    pImpl->stopMonitor = false;
    pImpl->monitoring = true;
    pImpl->monitorThread = std::thread([this] {
        std::unique_lock<std::mutex> lock(pImpl->monitorMutex);
        while (!pImpl->monitorCondition.wait_for(lock, pImpl->config.monitorInterval,
                                                 [this] { return pImpl->stopMonitor; })) {
            lock.unlock();
            checkMemoryPressure();
            lock.lock();
        }
    });
    pImpl->logger->info("Memory monitoring started");
}

void MemoryManager::stop() {
    {
        std::lock_guard<std::mutex> lock(pImpl->monitorMutex);
        pImpl->stopMonitor = true;
    }
    pImpl->monitorCondition.notify_all();
    if (pImpl->monitorThread.joinable()) {
        pImpl->monitorThread.join();
        pImpl->logger->info("Memory monitoring stopped");
    }
    pImpl->monitoring = false;
}

bool MemoryManager::isMonitoring() const {
    return pImpl->monitoring;
}

void MemoryManager::setUsageProbe(UsageProbe probe) {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    pImpl->usageProbe = probe ? std::move(probe) : UsageProbe(readProcessRss);
}

std::shared_ptr<text::LazyTextLoader> MemoryManager::createLazyLoader(const std::string& path) {
    std::lock_guard<std::mutex> lock(pImpl->loaderMutex);
    auto it = pImpl->lazyLoaders.find(path);
    if (it != pImpl->lazyLoaders.end()) {
        if (auto loader = it->second.lock()) {
            return loader;
        }
    }
    auto loader = text::LazyTextLoader::open(path, pImpl->loaderConfig.chunkSize,
                                             pImpl->loaderConfig.maxCachedChunks);
    pImpl->lazyLoaders[path] = loader;
    return loader;
}

bool MemoryManager::shouldUseLazyLoading(const std::string& path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return false;
    return size > pImpl->loaderConfig.lazyThresholdBytes;
}

size_t MemoryManager::lazyLoaderCount() const {
    std::lock_guard<std::mutex> lock(pImpl->loaderMutex);
    size_t alive = 0;
    for (const auto& entry : pImpl->lazyLoaders) {
        if (!entry.second.expired()) ++alive;
    }
    return alive;
}

cache::MemoryConfig MemoryManager::getConfiguration() const {
    return pImpl->config;
}

} // namespace memory
} // namespace core
} // namespace fanws
