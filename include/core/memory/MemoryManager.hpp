#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheConfig.hpp"

namespace fanws {
namespace core {
namespace cache {
class ProjectScopedCache;
}
namespace text {
class LazyTextLoader;
}

namespace memory {

// Снимок состояния памяти процесса и кэшей
struct MemoryStats {
    size_t processRssBytes = 0;      // Резидентная память процесса
    size_t peakRssBytes = 0;         // Максимум RSS за время наблюдения
    size_t cacheBytes = 0;           // Сумма по зарегистрированным кэшам
    size_t cacheEntries = 0;
    size_t registeredCaches = 0;
    size_t gcCount = 0;              // Количество принудительных сборок
    double systemMemoryPercent = 0.0;
    double usageRatio = 0.0;         // processRssBytes / maxMemoryBytes
    bool degraded = false;           // Последняя очистка завершилась ошибкой
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json toJson() const {
        return {
            {"processRssBytes", processRssBytes},
            {"peakRssBytes", peakRssBytes},
            {"cacheBytes", cacheBytes},
            {"cacheEntries", cacheEntries},
            {"registeredCaches", registeredCaches},
            {"gcCount", gcCount},
            {"systemMemoryPercent", systemMemoryPercent},
            {"usageRatio", usageRatio},
            {"degraded", degraded},
            {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()).count()}
        };
    }
};

enum class PressureLevel {
    Normal,
    Warning,
    Critical
};

const char* toString(PressureLevel level);

/**
 * @brief Менеджер памяти процесса.
 * @details Ведёт реестр кэшей проектов, собирает статистику памяти и при превышении
 *          порогов выполняет согласованную очистку:
 *          - warning (по умолчанию 80% потолка): из каждого кэша вытесняется доля самых
 *            старых записей;
 *          - critical (90%): очищаются все кэши, кроме кэша активного проекта, и
 *            выполняется принудительная сборка.
 *          Ни одна операция очистки не выбрасывает исключений: ошибка логируется и
 *          отмечается флагом degraded в статистике.
 *
 *          Экземпляр процесса доступен через getInstance(), но компоненты получают
 *          менеджер явно (std::shared_ptr / std::weak_ptr), что позволяет создавать
 *          независимые экземпляры в тестах.
 * @note Потокобезопасен
 */
class MemoryManager {
public:
    using UsageProbe = std::function<size_t()>;
    using PressureCallback = std::function<void(const MemoryStats&)>;

    explicit MemoryManager(const cache::MemoryConfig& config = cache::MemoryConfig{},
                           const cache::TextLoaderConfig& loaderConfig = cache::TextLoaderConfig{});
    ~MemoryManager();

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    // Экземпляр процесса, создаётся при первом обращении с конфигурацией по умолчанию
    static std::shared_ptr<MemoryManager> getInstance();
    // Создаёт экземпляр процесса с заданной конфигурацией; если он уже создан, возвращает его
    static std::shared_ptr<MemoryManager> initialize(const cache::MemoryConfig& config,
                                                     const cache::TextLoaderConfig& loaderConfig);

    // Реестр кэшей
    void registerCache(std::shared_ptr<cache::ProjectScopedCache> cache);
    void unregisterCache(const std::string& projectId);
    // Удаляет запись только если она принадлежит указанному экземпляру
    void unregisterCache(const std::string& projectId, const cache::ProjectScopedCache* instance);
    bool isRegistered(const std::string& projectId) const;
    bool isRegistered(const cache::ProjectScopedCache* instance) const;
    size_t registeredCacheCount() const;

    // Кэш активного проекта не очищается при критической нагрузке
    void setActiveProject(const std::string& projectId);
    std::string getActiveProject() const;

    // Статистика
    MemoryStats getMemoryStats();
    double averageRssBytes() const;
    nlohmann::json getSystemStats();

    // Очистка
    size_t cleanup();
    size_t optimizeMemory();
    bool forceGarbageCollection();
    PressureLevel checkMemoryPressure();
    size_t softCleanup();
    size_t hardCleanup();

    void addWarningCallback(PressureCallback callback);
    void addCriticalCallback(PressureCallback callback);

    // Фоновый мониторинг
    void start();
    void stop();
    bool isMonitoring() const;

    // Источник значения RSS; по умолчанию /proc/self/statm
    void setUsageProbe(UsageProbe probe);

    // Ленивые загрузчики, общие для одного пути, пока они живы
    std::shared_ptr<text::LazyTextLoader> createLazyLoader(const std::string& path);
    bool shouldUseLazyLoading(const std::string& path) const;
    size_t lazyLoaderCount() const;

    cache::MemoryConfig getConfiguration() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace memory
} // namespace core
} // namespace fanws
