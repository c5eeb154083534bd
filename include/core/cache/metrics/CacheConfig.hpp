#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace fanws {
namespace core {
namespace cache {

// Кэш одного проекта
struct LruCacheConfig {
    size_t projectMaxBytes = 1024 * 1024 * 32;   // 32MB на проект

    bool validate() const { return projectMaxBytes > 0; }
};

// Ленивая загрузка текстов
struct TextLoaderConfig {
    size_t chunkSize = 1024 * 1024;              // 1MB
    size_t maxCachedChunks = 10;
    size_t lazyThresholdBytes = 1024 * 1024;     // Файлы больше 1MB читаются лениво

    bool validate() const { return chunkSize > 0 && maxCachedChunks > 0; }
};

// Постоянный кэш ответов AI-провайдеров
struct ResponseCacheConfig {
    std::string databasePath = "cache/api_cache.db";
    std::chrono::seconds defaultTtl{7 * 24 * 3600};
    std::chrono::milliseconds operationTimeout{3000};
    std::chrono::seconds sweepInterval{24 * 3600};
    int compressionLevel = 6;                    // Уровень zlib (1..9)
    size_t recentContentExcerpt = 500;           // Хвост недавнего текста в отпечатке
    size_t outlineExcerpt = 1000;                // Начало плана в отпечатке
    size_t maxCharacters = 5;
    size_t deleteQueueSize = 256;

    bool validate() const {
        if (databasePath.empty()) return false;
        if (defaultTtl.count() <= 0) return false;
        if (operationTimeout.count() <= 0) return false;
        if (sweepInterval.count() <= 0) return false;
        if (compressionLevel < 1 || compressionLevel > 9) return false;
        return deleteQueueSize > 0;
    }
};

// Пороговые значения менеджера памяти
struct MemoryConfig {
    size_t maxMemoryBytes = 1024ull * 1024 * 512;   // Потолок процесса, 512MB
    size_t maxCacheBytes = 1024ull * 1024 * 128;    // Суммарный потолок кэшей, 128MB
    double warningThreshold = 0.8;
    double criticalThreshold = 0.9;
    double cleanupTargetRatio = 0.75;               // Целевая заполненность после cleanup()
    double softEvictionFraction = 0.25;             // Доля старых записей при мягкой очистке
    std::chrono::seconds monitorInterval{5};
    size_t historySize = 100;

    bool validate() const {
        if (maxMemoryBytes == 0 || maxCacheBytes == 0) return false;
        if (warningThreshold <= 0.0 || warningThreshold >= criticalThreshold) return false;
        if (criticalThreshold > 1.0) return false;
        if (cleanupTargetRatio <= 0.0 || cleanupTargetRatio > warningThreshold) return false;
        if (softEvictionFraction <= 0.0 || softEvictionFraction > 1.0) return false;
        return monitorInterval.count() > 0 && historySize > 0;
    }
};

// Унифицированная конфигурация подсистемы кэширования
struct CacheSubsystemConfig {
    LruCacheConfig lru;
    TextLoaderConfig textLoader;
    ResponseCacheConfig responseCache;
    MemoryConfig memory;

    bool validate() const {
        return lru.validate() && textLoader.validate() &&
               responseCache.validate() && memory.validate();
    }

    nlohmann::json toJson() const;
    // Отсутствующие ключи сохраняют значения по умолчанию
    static CacheSubsystemConfig fromJson(const nlohmann::json& j);
    // Отсутствующий файл даёт конфигурацию по умолчанию
    static CacheSubsystemConfig loadFromFile(const std::string& path);
};

} // namespace cache
} // namespace core
} // namespace fanws
