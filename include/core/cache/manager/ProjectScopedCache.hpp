#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/dynamic/BoundedLRUCache.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"

namespace fanws {
namespace core {
namespace memory {
class MemoryManager;
}

namespace cache {

/**
 * @brief Кэш одного писательского проекта.
 * @details Каждый проект получает собственный экземпляр BoundedLRUCache со своим бюджетом
 *          байтов, поэтому одинаковые ключи разных проектов никогда не пересекаются, а
 *          закрытие проекта очищает кэш целиком. На MemoryManager хранится только слабая
 *          ссылка.
 */
class ProjectScopedCache : public BaseCache<std::string, std::string> {
public:
    ProjectScopedCache(std::string projectId, size_t maxBytes);
    ~ProjectScopedCache() override = default;

    ProjectScopedCache(const ProjectScopedCache&) = delete;
    ProjectScopedCache& operator=(const ProjectScopedCache&) = delete;

    const std::string& projectId() const { return projectId_; }

    std::optional<std::string> get(const std::string& key) override;
    SetResult set(const std::string& key, const std::string& value) override;
    SetResult set(const std::string& key, const std::string& value, size_t sizeBytes) override;
    bool remove(const std::string& key) override;
    void clear() override;
    bool contains(const std::string& key) const override;
    size_t currentSizeBytes() const override;
    size_t size() const override;

    size_t maxBytes() const;
    size_t evictOldest(size_t count);
    size_t evictOldest(size_t count, size_t& evictedEntries);
    size_t trimTo(size_t targetBytes);
    std::vector<std::string> keys() const;
    CacheMetrics getMetrics() const;

    void attachMemoryManager(std::weak_ptr<memory::MemoryManager> manager);
    // Очистка и снятие с учёта в MemoryManager
    void close();

private:
    const std::string projectId_;
    TextLRUCache cache_;
    std::weak_ptr<memory::MemoryManager> memoryManager_;
    mutable std::mutex managerMutex_;
};

/**
 * @brief Реестр кэшей проектов.
 * @details getOrCreate идемпотентен: первое обращение к неизвестному проекту создаёт пустой
 *          кэш. Реестр защищён своим мьютексом; операции с кэшами проектов его не захватывают.
 */
class ProjectCacheRegistry {
public:
    explicit ProjectCacheRegistry(const LruCacheConfig& config = LruCacheConfig{});
    ~ProjectCacheRegistry() = default;

    ProjectCacheRegistry(const ProjectCacheRegistry&) = delete;
    ProjectCacheRegistry& operator=(const ProjectCacheRegistry&) = delete;

    // Реестр процесса
    static ProjectCacheRegistry& getInstance();

    std::shared_ptr<ProjectScopedCache> getOrCreate(const std::string& projectId);
    bool closeProject(const std::string& projectId);
    void closeAll();

    bool hasProject(const std::string& projectId) const;
    size_t projectCount() const;
    std::vector<std::string> projectIds() const;

    // Новые кэши будут регистрироваться в менеджере памяти
    void setMemoryManager(std::weak_ptr<memory::MemoryManager> manager);
    // Действует на проекты, созданные после вызова
    void setConfiguration(const LruCacheConfig& config);
    LruCacheConfig getConfiguration() const;

private:
    LruCacheConfig config_;
    std::unordered_map<std::string, std::shared_ptr<ProjectScopedCache>> caches_;
    std::weak_ptr<memory::MemoryManager> memoryManager_;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Кэш проекта из реестра процесса
std::shared_ptr<ProjectScopedCache> projectCacheFor(const std::string& projectId);

} // namespace cache
} // namespace core
} // namespace fanws
