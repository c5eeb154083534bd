#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fanws {
namespace core {
namespace logging {

namespace {
std::mutex g_loggingMutex;
LoggingConfig g_config;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (logger) return logger;

    std::lock_guard<std::mutex> lock(g_loggingMutex);
    // Повторная проверка: логгер мог быть создан другим потоком
    logger = spdlog::get(name);
    if (logger) return logger;

    try {
        std::filesystem::path path = g_config.directory;
        path /= name + ".log";
        logger = spdlog::rotating_logger_mt(name, path.string(),
                                            g_config.maxFileSize, g_config.maxFiles);
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера '" << name << "': " << e.what() << std::endl;
        try {
            logger = spdlog::stdout_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            logger = spdlog::get(name);
        }
    }
    if (logger) {
        logger->set_level(g_config.level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    } else {
        logger = spdlog::default_logger();
    }
    return logger;
}

void setLoggingConfig(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_loggingMutex);
    g_config = config;
}

void initializeServiceLogging(const std::string& logFile) {
    try {
        std::filesystem::path logPath(logFile);
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 1024 * 1024 * 10, 5);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("fanws_cache",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
        spdlog::info("Logging system initialized");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace logging
} // namespace core
} // namespace fanws
