#include "core/cache/metrics/CacheConfig.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace fanws {
namespace core {
namespace cache {

namespace {

std::invalid_argument invalidValue(const char* name, const std::string& reason) {
    return std::invalid_argument(std::string("Invalid config value '") + name + "': " + reason);
}

template<typename T>
void readValue(const nlohmann::json& j, const char* name, T& target) {
    if (!j.contains(name) || j[name].is_null()) {
        return;
    }
    const auto& value = j[name];
    // Отрицательное число в беззнаковом поле превратилось бы в огромный размер
    if (std::is_unsigned<T>::value && value.is_number() && value.get<double>() < 0) {
        throw invalidValue(name, "must not be negative");
    }
    try {
        target = value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw invalidValue(name, e.what());
    }
}

template<typename Duration>
void readDuration(const nlohmann::json& j, const char* name, Duration& target) {
    if (!j.contains(name) || j[name].is_null()) {
        return;
    }
    const auto& value = j[name];
    if (value.is_number() && value.get<double>() < 0) {
        throw invalidValue(name, "must not be negative");
    }
    try {
        target = Duration(value.get<typename Duration::rep>());
    } catch (const nlohmann::json::exception& e) {
        throw invalidValue(name, e.what());
    }
}

} // namespace

nlohmann::json CacheSubsystemConfig::toJson() const {
    return {
        {"lru", {
            {"projectMaxBytes", lru.projectMaxBytes}
        }},
        {"textLoader", {
            {"chunkSize", textLoader.chunkSize},
            {"maxCachedChunks", textLoader.maxCachedChunks},
            {"lazyThresholdBytes", textLoader.lazyThresholdBytes}
        }},
        {"responseCache", {
            {"databasePath", responseCache.databasePath},
            {"defaultTtlSeconds", responseCache.defaultTtl.count()},
            {"operationTimeoutMs", responseCache.operationTimeout.count()},
            {"sweepIntervalSeconds", responseCache.sweepInterval.count()},
            {"compressionLevel", responseCache.compressionLevel},
            {"recentContentExcerpt", responseCache.recentContentExcerpt},
            {"outlineExcerpt", responseCache.outlineExcerpt},
            {"maxCharacters", responseCache.maxCharacters},
            {"deleteQueueSize", responseCache.deleteQueueSize}
        }},
        {"memory", {
            {"maxMemoryBytes", memory.maxMemoryBytes},
            {"maxCacheBytes", memory.maxCacheBytes},
            {"warningThreshold", memory.warningThreshold},
            {"criticalThreshold", memory.criticalThreshold},
            {"cleanupTargetRatio", memory.cleanupTargetRatio},
            {"softEvictionFraction", memory.softEvictionFraction},
            {"monitorIntervalSeconds", memory.monitorInterval.count()},
            {"historySize", memory.historySize}
        }}
    };
}

CacheSubsystemConfig CacheSubsystemConfig::fromJson(const nlohmann::json& j) {
    CacheSubsystemConfig config;

    if (j.contains("lru")) {
        const auto& lru = j["lru"];
        readValue(lru, "projectMaxBytes", config.lru.projectMaxBytes);
    }
    if (j.contains("textLoader")) {
        const auto& tl = j["textLoader"];
        readValue(tl, "chunkSize", config.textLoader.chunkSize);
        readValue(tl, "maxCachedChunks", config.textLoader.maxCachedChunks);
        readValue(tl, "lazyThresholdBytes", config.textLoader.lazyThresholdBytes);
    }
    if (j.contains("responseCache")) {
        const auto& rc = j["responseCache"];
        readValue(rc, "databasePath", config.responseCache.databasePath);
        readDuration(rc, "defaultTtlSeconds", config.responseCache.defaultTtl);
        readDuration(rc, "operationTimeoutMs", config.responseCache.operationTimeout);
        readDuration(rc, "sweepIntervalSeconds", config.responseCache.sweepInterval);
        readValue(rc, "compressionLevel", config.responseCache.compressionLevel);
        readValue(rc, "recentContentExcerpt", config.responseCache.recentContentExcerpt);
        readValue(rc, "outlineExcerpt", config.responseCache.outlineExcerpt);
        readValue(rc, "maxCharacters", config.responseCache.maxCharacters);
        readValue(rc, "deleteQueueSize", config.responseCache.deleteQueueSize);
    }
    if (j.contains("memory")) {
        const auto& mem = j["memory"];
        readValue(mem, "maxMemoryBytes", config.memory.maxMemoryBytes);
        readValue(mem, "maxCacheBytes", config.memory.maxCacheBytes);
        readValue(mem, "warningThreshold", config.memory.warningThreshold);
        readValue(mem, "criticalThreshold", config.memory.criticalThreshold);
        readValue(mem, "cleanupTargetRatio", config.memory.cleanupTargetRatio);
        readValue(mem, "softEvictionFraction", config.memory.softEvictionFraction);
        readDuration(mem, "monitorIntervalSeconds", config.memory.monitorInterval);
        readValue(mem, "historySize", config.memory.historySize);
    }

    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша");
    }
    return config;
}

CacheSubsystemConfig CacheSubsystemConfig::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::info("Config file '{}' not found, using defaults", path);
        return CacheSubsystemConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid config file '" + path + "': " + e.what());
    }
    return fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace fanws
