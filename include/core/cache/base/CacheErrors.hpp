#pragma once

#include <stdexcept>
#include <string>

namespace fanws {
namespace core {
namespace cache {

// Классы ошибок подсистемы кэширования
enum class CacheErrorCode {
    NotFound,       // Нет исходного файла или ключа
    TooLarge,       // Значение больше ёмкости кэша
    Stale,          // Исходный файл изменился после открытия
    IOFailure,      // Ошибка ввода-вывода
    Expired,        // Истёк TTL записи
    CorruptRecord   // Ошибка распаковки / десериализации
};

// Результат операций set/update
enum class SetResult {
    Stored,
    TooLarge
};

inline const char* toString(CacheErrorCode code) {
    switch (code) {
        case CacheErrorCode::NotFound:      return "NotFound";
        case CacheErrorCode::TooLarge:      return "TooLarge";
        case CacheErrorCode::Stale:         return "Stale";
        case CacheErrorCode::IOFailure:     return "IOFailure";
        case CacheErrorCode::Expired:       return "Expired";
        case CacheErrorCode::CorruptRecord: return "CorruptRecord";
    }
    return "Unknown";
}

/**
 * @brief Исключение подсистемы кэширования.
 * @note Наружу пробрасывается только LazyTextLoader (NotFound, Stale, IOFailure);
 *       остальные компоненты превращают ошибки в промах кэша.
 */
class CacheError : public std::runtime_error {
public:
    CacheError(CacheErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message)
        , code_(code) {}

    CacheErrorCode code() const noexcept { return code_; }

private:
    CacheErrorCode code_;
};

} // namespace cache
} // namespace core
} // namespace fanws
