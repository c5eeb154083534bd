#include <iostream>
#include <memory>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

// Core components
#include "core/cache/manager/ProjectScopedCache.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/persistent/PersistentResponseCache.hpp"
#include "core/logging/Logging.hpp"
#include "core/memory/MemoryManager.hpp"

using namespace fanws::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::shared_ptr<memory::MemoryManager> g_memoryManager;
std::shared_ptr<cache::PersistentResponseCache> g_responseCache;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Initialize core components
void initializeComponents(const cache::CacheSubsystemConfig& config) {
    spdlog::info("Initializing cache components...");

    try {
        g_memoryManager = memory::MemoryManager::initialize(config.memory, config.textLoader);
        g_memoryManager->addWarningCallback([](const memory::MemoryStats& stats) {
            spdlog::warn("Memory warning: rss {} bytes, caches {} bytes",
                         stats.processRssBytes, stats.cacheBytes);
        });
        g_memoryManager->addCriticalCallback([](const memory::MemoryStats& stats) {
            spdlog::critical("Memory critical: rss {} bytes, caches {} bytes",
                             stats.processRssBytes, stats.cacheBytes);
        });
        spdlog::info("Memory manager initialized");

        auto& registry = cache::ProjectCacheRegistry::getInstance();
        registry.setConfiguration(config.lru);
        registry.setMemoryManager(g_memoryManager);
        spdlog::info("Project cache registry initialized ({} bytes per project)",
                     config.lru.projectMaxBytes);

        g_responseCache = std::make_shared<cache::PersistentResponseCache>(config.responseCache);
        if (g_responseCache->initialize()) {
            g_responseCache->startSweeper();
            spdlog::info("Response cache initialized at {}", config.responseCache.databasePath);
        } else {
            // Без хранилища сервис работает, все обращения к кэшу ответов дают промах
            spdlog::warn("Response cache unavailable, continuing without persistence");
        }

        g_memoryManager->start();
        spdlog::info("All components initialized successfully");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize components: {}", e.what());
        throw;
    }
}

// Main service loop
void runServiceLoop() {
    spdlog::info("Starting service loop...");

    auto lastStatsReport = std::chrono::steady_clock::now();

    while (g_running) {
        try {
            auto now = std::chrono::steady_clock::now();

            // Report statistics every minute
            if (now - lastStatsReport > std::chrono::seconds(60)) {
                spdlog::debug("Memory: {}", g_memoryManager->getSystemStats().dump());
                spdlog::debug("Response cache: {}", g_responseCache->getStats().toJson().dump());
                lastStatsReport = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Service loop stopped");
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");

    try {
        g_running = false;

        if (g_memoryManager) {
            g_memoryManager->stop();
        }

        cache::ProjectCacheRegistry::getInstance().closeAll();

        if (g_responseCache) {
            g_responseCache->shutdown();
        }

        spdlog::info("All components shut down successfully");

    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        // Set up signal handlers
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        logging::initializeServiceLogging("logs/fanws_cache.log");
        spdlog::info("=== FANWS Cache Service Starting ===");

        const std::string configPath = argc > 1 ? argv[1] : "config/cache.json";
        const auto config = cache::CacheSubsystemConfig::loadFromFile(configPath);
        spdlog::info("Configuration loaded from {}", configPath);

        initializeComponents(config);

        runServiceLoop();

        shutdown();

        spdlog::info("=== FANWS Cache Service Shutdown Complete ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get("fanws_cache")) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
