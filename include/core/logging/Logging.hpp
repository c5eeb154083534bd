#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace fanws {
namespace core {
namespace logging {

// Параметры файловых логгеров компонентов
struct LoggingConfig {
    std::string directory = "logs";
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;
    spdlog::level::level_enum level = spdlog::level::debug;
};

/**
 * @brief Возвращает именованный логгер компонента, создавая его при первом обращении.
 * @details Логгер пишет в logs/<name>.log с ротацией. Если файловый sink создать
 *          не удалось, возвращается цветной логгер в stdout: логирование не должно
 *          прерывать работу кэша.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Установка параметров для логгеров, создаваемых после вызова
void setLoggingConfig(const LoggingConfig& config);

// Логгер по умолчанию для исполняемого файла сервиса (консоль + файл)
void initializeServiceLogging(const std::string& logFile);

} // namespace logging
} // namespace core
} // namespace fanws
