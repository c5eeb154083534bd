#include "core/cache/manager/ProjectScopedCache.hpp"
#include <stdexcept>
#include "core/logging/Logging.hpp"
#include "core/memory/MemoryManager.hpp"

namespace fanws {
namespace core {
namespace cache {

// ---------------------------
// ProjectScopedCache
// ---------------------------

ProjectScopedCache::ProjectScopedCache(std::string projectId, size_t maxBytes)
    : projectId_(std::move(projectId))
    , cache_(maxBytes, "projectcache") {
}

std::optional<std::string> ProjectScopedCache::get(const std::string& key) {
    return cache_.get(key);
}

SetResult ProjectScopedCache::set(const std::string& key, const std::string& value) {
    return cache_.set(key, value);
}

SetResult ProjectScopedCache::set(const std::string& key, const std::string& value, size_t sizeBytes) {
    return cache_.set(key, value, sizeBytes);
}

bool ProjectScopedCache::remove(const std::string& key) {
    return cache_.remove(key);
}

void ProjectScopedCache::clear() {
    cache_.clear();
}

bool ProjectScopedCache::contains(const std::string& key) const {
    return cache_.contains(key);
}

size_t ProjectScopedCache::currentSizeBytes() const {
    return cache_.currentSizeBytes();
}

size_t ProjectScopedCache::size() const {
    return cache_.size();
}

size_t ProjectScopedCache::maxBytes() const {
    return cache_.maxBytes();
}

size_t ProjectScopedCache::evictOldest(size_t count) {
    return cache_.evictOldest(count);
}

size_t ProjectScopedCache::evictOldest(size_t count, size_t& evictedEntries) {
    return cache_.evictOldest(count, evictedEntries);
}

size_t ProjectScopedCache::trimTo(size_t targetBytes) {
    return cache_.trimTo(targetBytes);
}

std::vector<std::string> ProjectScopedCache::keys() const {
    return cache_.keys();
}

CacheMetrics ProjectScopedCache::getMetrics() const {
    return cache_.getMetrics();
}

void ProjectScopedCache::attachMemoryManager(std::weak_ptr<memory::MemoryManager> manager) {
    std::lock_guard<std::mutex> lock(managerMutex_);
    memoryManager_ = std::move(manager);
}

void ProjectScopedCache::close() {
    cache_.clear();

    std::shared_ptr<memory::MemoryManager> manager;
    {
        std::lock_guard<std::mutex> lock(managerMutex_);
        manager = memoryManager_.lock();
        memoryManager_.reset();
    }
    if (manager) {
        manager->unregisterCache(projectId_, this);
    }
}

// ---------------------------
// ProjectCacheRegistry
// ---------------------------

ProjectCacheRegistry::ProjectCacheRegistry(const LruCacheConfig& config)
    : config_(config)
    , logger_(logging::getLogger("projectcache")) {
    if (!config_.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша проекта");
    }
}

ProjectCacheRegistry& ProjectCacheRegistry::getInstance() {
    static ProjectCacheRegistry instance;
    return instance;
}

std::shared_ptr<ProjectScopedCache> ProjectCacheRegistry::getOrCreate(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(projectId);
    if (it != caches_.end()) {
        return it->second;
    }

    auto cache = std::make_shared<ProjectScopedCache>(projectId, config_.projectMaxBytes);
    caches_.emplace(projectId, cache);
    logger_->info("Cache for project '{}' created ({} bytes budget)", projectId, config_.projectMaxBytes);

    if (auto manager = memoryManager_.lock()) {
        cache->attachMemoryManager(manager);
        manager->registerCache(cache);
    }
    return cache;
}

bool ProjectCacheRegistry::closeProject(const std::string& projectId) {
    std::shared_ptr<ProjectScopedCache> cache;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = caches_.find(projectId);
        if (it == caches_.end()) {
            logger_->warn("Cache for project '{}' not found", projectId);
            return false;
        }
        cache = std::move(it->second);
        caches_.erase(it);
    }

    cache->close();
    logger_->info("Cache for project '{}' closed", projectId);
    return true;
}

void ProjectCacheRegistry::closeAll() {
    std::unordered_map<std::string, std::shared_ptr<ProjectScopedCache>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(caches_);
    }
    for (auto& entry : closing) {
        entry.second->close();
    }
    if (!closing.empty()) {
        logger_->info("Closed {} project caches", closing.size());
    }
}

bool ProjectCacheRegistry::hasProject(const std::string& projectId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.find(projectId) != caches_.end();
}

size_t ProjectCacheRegistry::projectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.size();
}

std::vector<std::string> ProjectCacheRegistry::projectIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(caches_.size());
    for (const auto& entry : caches_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void ProjectCacheRegistry::setMemoryManager(std::weak_ptr<memory::MemoryManager> manager) {
    std::lock_guard<std::mutex> lock(mutex_);
    memoryManager_ = std::move(manager);
}

void ProjectCacheRegistry::setConfiguration(const LruCacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша проекта");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

LruCacheConfig ProjectCacheRegistry::getConfiguration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::shared_ptr<ProjectScopedCache> projectCacheFor(const std::string& projectId) {
    return ProjectCacheRegistry::getInstance().getOrCreate(projectId);
}

} // namespace cache
} // namespace core
} // namespace fanws
