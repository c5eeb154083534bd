#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <chrono>
#include <algorithm>
#include <list>
#include <optional>
#include <type_traits>
#include <spdlog/spdlog.h>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/logging/Logging.hpp"

namespace fanws {
namespace core {
namespace cache {

/**
 * @brief Оценка размера значения по умолчанию.
 * @details Для строк и байтовых векторов берётся длина данных, для остальных типов sizeof.
 */
template<typename Value>
struct CacheSizeEstimator {
    size_t operator()(const Value&) const { return sizeof(Value); }
};

template<>
struct CacheSizeEstimator<std::string> {
    size_t operator()(const std::string& value) const { return value.size(); }
};

template<>
struct CacheSizeEstimator<std::vector<uint8_t>> {
    size_t operator()(const std::vector<uint8_t>& value) const { return value.size(); }
};

/**
 * @brief Кэш с ограничением по байтам и строгим LRU-вытеснением.
 * @details Порядок доступа хранится в списке (в голове самая свежая запись),
 *          сумма размеров всегда не превышает maxBytes. Значение, которое само по себе
 *          больше maxBytes, не кэшируется: set возвращает SetResult::TooLarge.
 *          Один мьютекс на экземпляр защищает и порядок, и учёт размеров; get обновляет
 *          давность под тем же мьютексом.
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, std::string)
 * @tparam SizeOf Функтор оценки размера значения
 */
template<typename Key, typename Value, typename SizeOf = CacheSizeEstimator<Value>>
class BoundedLRUCache : public BaseCache<Key, Value> {
public:
    using DataType = Value;
    using KeyType = Key;
    struct Entry {
        KeyType key;
        DataType data;
        size_t sizeBytes;
        uint64_t accessOrder;
    };

    explicit BoundedLRUCache(size_t maxBytes, const std::string& loggerName = "lrucache");
    ~BoundedLRUCache() override = default;

    BoundedLRUCache(const BoundedLRUCache&) = delete;
    BoundedLRUCache& operator=(const BoundedLRUCache&) = delete;

    std::optional<Value> get(const Key& key) override;
    SetResult set(const Key& key, const Value& value) override;
    SetResult set(const Key& key, const Value& value, size_t sizeBytes) override;
    bool remove(const Key& key) override;
    void clear() override;
    bool contains(const Key& key) const override;
    size_t currentSizeBytes() const override;
    size_t size() const override;
    size_t maxBytes() const { return maxBytes_; }

    /// Вытеснить count самых старых записей. Возвращает освобождённые байты.
    size_t evictOldest(size_t count);
    /// То же, число действительно вытесненных записей пишется в evictedEntries.
    size_t evictOldest(size_t count, size_t& evictedEntries);
    /// Вытеснять старые записи, пока размер больше targetBytes. Возвращает освобождённые байты.
    size_t trimTo(size_t targetBytes);
    /// Ключи в порядке от самого свежего к самому старому.
    std::vector<Key> keys() const;

    CacheMetrics getMetrics() const;

private:
    // Вызывается под mutex_
    size_t evictTailLocked();

    const size_t maxBytes_;
    size_t currentBytes_ = 0;
    uint64_t accessCounter_ = 0;
    std::list<Entry> lruList_;
    std::unordered_map<KeyType, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
    SizeOf sizeOf_;
    std::shared_ptr<spdlog::logger> logger_;

    size_t hitCount_ = 0;
    size_t missCount_ = 0;
    size_t evictionCount_ = 0;
    size_t rejectedCount_ = 0;
};

// Алиас для текстовых кэшей проектов
using TextLRUCache = BoundedLRUCache<std::string, std::string>;

template<typename Key, typename Value, typename SizeOf>
BoundedLRUCache<Key, Value, SizeOf>::BoundedLRUCache(size_t maxBytes, const std::string& loggerName)
    : maxBytes_(maxBytes)
    , logger_(logging::getLogger(loggerName)) {
}

template<typename Key, typename Value, typename SizeOf>
std::optional<Value> BoundedLRUCache<Key, Value, SizeOf>::get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++missCount_;
        return std::nullopt;
    }
    ++hitCount_;
    // Перемещение в голову списка
    lruList_.splice(lruList_.begin(), lruList_, it->second);
    it->second->accessOrder = ++accessCounter_;
    return it->second->data;
}

template<typename Key, typename Value, typename SizeOf>
SetResult BoundedLRUCache<Key, Value, SizeOf>::set(const Key& key, const Value& value) {
    return set(key, value, sizeOf_(value));
}

template<typename Key, typename Value, typename SizeOf>
SetResult BoundedLRUCache<Key, Value, SizeOf>::set(const Key& key, const Value& value, size_t sizeBytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = index_.find(key);
    if (existing != index_.end()) {
        currentBytes_ -= existing->second->sizeBytes;
        lruList_.erase(existing->second);
        index_.erase(existing);
    }

    if (sizeBytes > maxBytes_) {
        // Старое значение уже удалено: после отказа ключ отсутствует
        ++rejectedCount_;
        logger_->warn("Value rejected: size {} exceeds capacity {}", sizeBytes, maxBytes_);
        return SetResult::TooLarge;
    }

    while (!lruList_.empty() && currentBytes_ + sizeBytes > maxBytes_) {
        evictTailLocked();
    }

    lruList_.push_front(Entry{key, value, sizeBytes, ++accessCounter_});
    index_[key] = lruList_.begin();
    currentBytes_ += sizeBytes;
    return SetResult::Stored;
}

template<typename Key, typename Value, typename SizeOf>
bool BoundedLRUCache<Key, Value, SizeOf>::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    currentBytes_ -= it->second->sizeBytes;
    lruList_.erase(it->second);
    index_.erase(it);
    return true;
}

template<typename Key, typename Value, typename SizeOf>
void BoundedLRUCache<Key, Value, SizeOf>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lruList_.clear();
    index_.clear();
    currentBytes_ = 0;
}

template<typename Key, typename Value, typename SizeOf>
bool BoundedLRUCache<Key, Value, SizeOf>::contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::currentSizeBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentBytes_;
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lruList_.size();
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::evictOldest(size_t count) {
    size_t evicted = 0;
    return evictOldest(count, evicted);
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::evictOldest(size_t count, size_t& evictedEntries) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t freed = 0;
    size_t evicted = 0;
    for (; evicted < count && !lruList_.empty(); ++evicted) {
        freed += evictTailLocked();
    }
    if (evicted > 0) {
        logger_->debug("Evicted {} oldest entries, freed {} bytes", evicted, freed);
    }
    evictedEntries = evicted;
    return freed;
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::trimTo(size_t targetBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t freed = 0;
    while (!lruList_.empty() && currentBytes_ > targetBytes) {
        freed += evictTailLocked();
    }
    return freed;
}

template<typename Key, typename Value, typename SizeOf>
std::vector<Key> BoundedLRUCache<Key, Value, SizeOf>::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> result;
    result.reserve(lruList_.size());
    for (const auto& entry : lruList_) {
        result.push_back(entry.key);
    }
    return result;
}

template<typename Key, typename Value, typename SizeOf>
CacheMetrics BoundedLRUCache<Key, Value, SizeOf>::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheMetrics metrics;
    metrics.currentSize = currentBytes_;
    metrics.maxSize = maxBytes_;
    metrics.entryCount = lruList_.size();
    metrics.hitCount = hitCount_;
    metrics.missCount = missCount_;
    metrics.evictionCount = evictionCount_;
    metrics.rejectedCount = rejectedCount_;
    metrics.requestCount = hitCount_ + missCount_;
    if (metrics.requestCount > 0) {
        metrics.hitRate = static_cast<double>(hitCount_) / metrics.requestCount;
        metrics.evictionRate = static_cast<double>(evictionCount_) / metrics.requestCount;
    }
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

template<typename Key, typename Value, typename SizeOf>
size_t BoundedLRUCache<Key, Value, SizeOf>::evictTailLocked() {
    auto& victim = lruList_.back();
    const size_t freed = victim.sizeBytes;
    currentBytes_ -= freed;
    index_.erase(victim.key);
    lruList_.pop_back();
    ++evictionCount_;
    return freed;
}

} // namespace cache
} // namespace core
} // namespace fanws
