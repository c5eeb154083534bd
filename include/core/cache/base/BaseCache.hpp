#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include "core/cache/base/CacheErrors.hpp"

namespace fanws {
namespace core {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс кэша с ограничением по байтам.
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, std::string)
 */
template<typename Key, typename Value>
class BaseCache {
public:
    virtual ~BaseCache() = default;
    /// Получить значение по ключу. Пустой std::optional означает промах.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Сохранить значение по ключу с обновлением давности доступа.
    virtual SetResult set(const Key& key, const Value& value) = 0;
    /// Сохранить значение с явно заданным размером в байтах.
    virtual SetResult set(const Key& key, const Value& value, size_t sizeBytes) = 0;
    /// Псевдоним set.
    SetResult update(const Key& key, const Value& value) { return set(key, value); }
    /// Псевдоним set с явным размером.
    SetResult update(const Key& key, const Value& value, size_t sizeBytes) {
        return set(key, value, sizeBytes);
    }
    /// Удалить значение по ключу.
    virtual bool remove(const Key& key) = 0;
    /// Очистить кэш полностью.
    virtual void clear() = 0;
    /// Проверить наличие ключа без изменения порядка вытеснения.
    virtual bool contains(const Key& key) const = 0;
    /// Учтённый объём значений в байтах.
    virtual size_t currentSizeBytes() const = 0;
    /// Количество элементов в кэше.
    virtual size_t size() const = 0;
};

} // namespace cache
} // namespace core
} // namespace fanws
