#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace fanws {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество активных потоков
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
    size_t rejectedTasks;    // Задачи, не принятые в очередь
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 1;          // Количество рабочих потоков
    size_t queueSize = 256;          // Максимальный размер очереди
    std::string loggerName = "threadpool";

    bool validate() const {
        return threadCount > 0 && queueSize > 0;
    }
};

/**
 * @brief Пул потоков для фоновых задач кэша.
 * @details enqueue не бросает исключений при переполнении: задача отклоняется и
 *          возвращается false, вызывающий продолжает работу без фоновой операции.
 */
class ThreadPool {
public:
    // Конструктор с конфигурацией
    explicit ThreadPool(const ThreadPoolConfig& config);

    // Деструктор останавливает пул, дожидаясь задач из очереди
    ~ThreadPool();

    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавление задачи в очередь
    bool enqueue(std::function<void()> task);

    // Получение количества активных потоков
    size_t getActiveThreadCount() const;

    // Получение размера очереди
    size_t getQueueSize() const;

    // Ожидание завершения всех задач
    void waitForCompletion();

    // Остановка пула потоков
    void stop();

    bool isStopped() const;

    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace fanws
