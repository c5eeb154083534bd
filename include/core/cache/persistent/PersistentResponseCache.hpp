#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/persistent/ResponseFingerprint.hpp"

namespace fanws {
namespace core {
namespace cache {

// Строка хранилища ответов
struct ResponseCacheRecord {
    std::string key;                       // Отпечаток запроса
    std::vector<uint8_t> compressedPayload;
    uint64_t rawSize = 0;
    int64_t createdAtMs = 0;               // Unix-время записи, мс
    int64_t ttlSeconds = 0;

    // Верхняя граница срока жизни, 100 лет
    static constexpr int64_t kMaxTtlSeconds = 100LL * 365 * 24 * 3600;

    // Запись недействительна, как только now > created_at + ttl
    bool isExpired(int64_t nowMs) const {
        const int64_t ttlMs = std::min(std::max<int64_t>(ttlSeconds, 0), kMaxTtlSeconds) * 1000;
        if (createdAtMs > std::numeric_limits<int64_t>::max() - ttlMs) {
            return false;
        }
        return nowMs > createdAtMs + ttlMs;
    }
};

struct ResponseCacheStats {
    size_t totalEntries = 0;
    size_t expiredEntries = 0;
    uint64_t storedBytes = 0;      // Сжатый объём
    uint64_t rawBytes = 0;         // Объём до сжатия
    size_t hits = 0;
    size_t misses = 0;
    size_t expiredReads = 0;
    size_t writeFailures = 0;
    size_t corruptRecords = 0;
    size_t purgedRecords = 0;
    bool available = false;
    std::string databasePath;

    nlohmann::json toJson() const {
        return {
            {"totalEntries", totalEntries},
            {"expiredEntries", expiredEntries},
            {"storedBytes", storedBytes},
            {"rawBytes", rawBytes},
            {"hits", hits},
            {"misses", misses},
            {"expiredReads", expiredReads},
            {"writeFailures", writeFailures},
            {"corruptRecords", corruptRecords},
            {"purgedRecords", purgedRecords},
            {"available", available},
            {"databasePath", databasePath}
        };
    }
};

/**
 * @brief Постоянный кэш ответов AI-провайдеров (SQLite + zlib).
 * @details Ключом служит отпечаток ContextFingerprint. Полезная нагрузка сжимается zlib перед
 *          записью. Просроченная запись при чтении считается промахом и удаляется в фоне;
 *          периодическая очистка удаляет все просроченные строки.
 *
 *          Любая ошибка хранилища (диск заполнен, ошибка ввода-вывода, таймаут, битая
 *          запись) не пробрасывается: чтение возвращает промах, запись возвращает false.
 *          Каждая операция ограничена operationTimeout.
 * @note Потокобезопасен. Несколько процессов могут работать с одним файлом (WAL).
 */
class PersistentResponseCache {
public:
    explicit PersistentResponseCache(const ResponseCacheConfig& config = ResponseCacheConfig{});
    ~PersistentResponseCache();

    PersistentResponseCache(const PersistentResponseCache&) = delete;
    PersistentResponseCache& operator=(const PersistentResponseCache&) = delete;

    // Открытие базы; при неудаче кэш работает как всегда пустой
    bool initialize();
    void shutdown();
    bool isAvailable() const;

    std::string fingerprint(const RequestDescriptor& request, const PromptContext& context) const;

    std::optional<std::string> get(const std::string& fingerprint);
    bool put(const std::string& fingerprint, const std::string& payload,
             std::chrono::seconds ttl = std::chrono::seconds(0));

    // Хранение JSON-ответов провайдеров
    std::optional<nlohmann::json> getJson(const std::string& fingerprint);
    bool putJson(const std::string& fingerprint, const nlohmann::json& response,
                 std::chrono::seconds ttl = std::chrono::seconds(0));

    bool remove(const std::string& fingerprint);
    bool clear();
    // Удаление просроченных строк; возвращает количество удалённых
    size_t purgeExpired();

    void startSweeper();
    void stopSweeper();
    // Дождаться фоновых удалений
    void waitForPendingOperations();

    ResponseCacheStats getStats() const;
    ResponseCacheConfig getConfiguration() const;

    static int64_t nowMs();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace fanws
