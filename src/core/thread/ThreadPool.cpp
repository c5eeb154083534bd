#include "core/thread/ThreadPool.hpp"
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>
#include "core/logging/Logging.hpp"

namespace fanws {
namespace core {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;              // Мьютекс для очереди
    std::condition_variable condition;          // Новые задачи / остановка
    std::condition_variable idle;               // Очередь опустела
    bool stop = false;                          // Флаг остановки
    size_t activeThreads = 0;                   // Количество активных потоков
    size_t rejectedTasks = 0;
    ThreadPoolConfig config;                    // Конфигурация пула потоков
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const ThreadPoolConfig& cfg)
        : config(cfg)
        , logger(logging::getLogger(cfg.loggerName)) {
        for (size_t i = 0; i < config.threadCount; ++i) {
            workers.emplace_back([this] {
                processTasks();
            });
        }
        logger->debug("Пул потоков инициализирован: {} потоков", workers.size());
    }

    void shutdown() {
        std::vector<std::thread> joining;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            stop = true;
            joining.swap(workers);
        }
        condition.notify_all();

        // Рабочие потоки дорабатывают очередь до конца
        for (auto& worker : joining) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        idle.notify_all();
    }

    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] {
                    return stop || !tasks.empty();
                });

                if (stop && tasks.empty()) {
                    return;
                }

                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logger->error("Ошибка выполнения задачи: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(queueMutex);
                --activeThreads;
                if (tasks.empty() && activeThreads == 0) {
                    idle.notify_all();
                }
            }
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула потоков");
    }
    pImpl = std::make_unique<Impl>(config);
}

// Деструктор
ThreadPool::~ThreadPool() {
    stop();
}

// Добавление задачи в очередь
bool ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return false;

    {
        std::unique_lock<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stop || pImpl->tasks.size() >= pImpl->config.queueSize) {
            ++pImpl->rejectedTasks;
            pImpl->logger->warn("Задача отклонена: очередь {} ({} задач)",
                                pImpl->stop ? "остановлена" : "переполнена",
                                pImpl->tasks.size());
            return false;
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
    return true;
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->activeThreads;
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idle.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads == 0;
    });
}

// Остановка пула потоков
void ThreadPool::stop() {
    try {
        pImpl->shutdown();
        pImpl->logger->debug("Пул потоков остановлен");
    } catch (const std::system_error& e) {
        pImpl->logger->error("Ошибка остановки пула потоков: {}", e.what());
    }
}

bool ThreadPool::isStopped() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stop;
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.rejectedTasks = pImpl->rejectedTasks;
    return metrics;
}

} // namespace thread
} // namespace core
} // namespace fanws
