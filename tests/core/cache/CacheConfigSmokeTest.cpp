#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "core/cache/metrics/CacheConfig.hpp"

using fanws::core::cache::CacheSubsystemConfig;

void smokeTestCacheConfig() {
    CacheSubsystemConfig defaults;
    assert(defaults.validate());
    assert(defaults.textLoader.chunkSize == 1024 * 1024);
    assert(defaults.textLoader.maxCachedChunks == 10);
    assert(defaults.memory.warningThreshold == 0.8);
    assert(defaults.memory.criticalThreshold == 0.9);
    assert(defaults.responseCache.defaultTtl == std::chrono::hours(24 * 7));

    // Отсутствующие ключи сохраняют значения по умолчанию
    auto config = CacheSubsystemConfig::fromJson({
        {"lru", {{"projectMaxBytes", 4096}}},
        {"responseCache", {{"databasePath", "/tmp/fanws.db"}, {"defaultTtlSeconds", 60}}}
    });
    assert(config.lru.projectMaxBytes == 4096);
    assert(config.responseCache.databasePath == "/tmp/fanws.db");
    assert(config.responseCache.defaultTtl == std::chrono::seconds(60));
    assert(config.memory.maxMemoryBytes == defaults.memory.maxMemoryBytes);

    auto restored = CacheSubsystemConfig::fromJson(config.toJson());
    assert(restored.toJson() == config.toJson());
    std::cout << "[OK] CacheConfig smoke test\n";
}

void invalidTestCacheConfig() {
    bool rejected = false;
    try {
        CacheSubsystemConfig::fromJson({{"memory", {{"warningThreshold", 0.95}}}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
        CacheSubsystemConfig::fromJson({{"responseCache", {{"compressionLevel", 12}}}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    // Значение неверного типа
    rejected = false;
    try {
        CacheSubsystemConfig::fromJson({{"textLoader", {{"chunkSize", "big"}}}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    // Отрицательный размер не должен стать огромным беззнаковым числом
    rejected = false;
    try {
        CacheSubsystemConfig::fromJson({{"textLoader", {{"chunkSize", -1}}}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
        CacheSubsystemConfig::fromJson({{"responseCache", {{"defaultTtlSeconds", -60}}}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] CacheConfig validation test\n";
}

void fileTestCacheConfig() {
    const auto dir = std::filesystem::temp_directory_path();
    const auto missing = dir / ("fanws_missing_" + std::to_string(::getpid()) + ".json");
    auto config = CacheSubsystemConfig::loadFromFile(missing.string());
    assert(config.lru.projectMaxBytes == CacheSubsystemConfig{}.lru.projectMaxBytes);

    const auto valid = dir / ("fanws_config_" + std::to_string(::getpid()) + ".json");
    std::ofstream(valid) << R"({"textLoader": {"chunkSize": 2048}})";
    assert(CacheSubsystemConfig::loadFromFile(valid.string()).textLoader.chunkSize == 2048);

    const auto broken = dir / ("fanws_broken_" + std::to_string(::getpid()) + ".json");
    std::ofstream(broken) << "{ not json";
    bool rejected = false;
    try {
        CacheSubsystemConfig::loadFromFile(broken.string());
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    const auto mistyped = dir / ("fanws_mistyped_" + std::to_string(::getpid()) + ".json");
    std::ofstream(mistyped) << R"({"memory": {"historySize": [1, 2]}})";
    rejected = false;
    try {
        CacheSubsystemConfig::loadFromFile(mistyped.string());
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    std::filesystem::remove(valid);
    std::filesystem::remove(mistyped);
    std::filesystem::remove(broken);
    std::cout << "[OK] CacheConfig file test\n";
}

int main() {
    smokeTestCacheConfig();
    invalidTestCacheConfig();
    fileTestCacheConfig();
    std::cout << "All CacheConfig tests passed!\n";
    return 0;
}
