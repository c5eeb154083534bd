#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/cache/base/CacheErrors.hpp"
#include "core/cache/dynamic/BoundedLRUCache.hpp"

namespace fanws {
namespace core {
namespace text {

// Описание прочитанного фрагмента файла
struct LazyChunkHandle {
    uint64_t offset;   ///< Смещение фрагмента в файле
    size_t length;     ///< Длина фрагмента
    size_t index;      ///< Номер фрагмента
};

// Статистика файла, собранная потоковым чтением
struct TextStats {
    uint64_t sizeBytes = 0;
    size_t lineCount = 0;
    size_t wordCount = 0;
    size_t charCount = 0;
    double avgLineLength = 0.0;

    nlohmann::json toJson() const {
        return {
            {"sizeBytes", sizeBytes},
            {"lineCount", lineCount},
            {"wordCount", wordCount},
            {"charCount", charCount},
            {"avgLineLength", avgLineLength}
        };
    }
};

/**
 * @brief Ленивая последовательность строк файла.
 * @details Каждый вызов begin() заново открывает файл, поэтому последовательность
 *          можно обходить повторно. Окончания строк (\n, \r\n) отбрасываются.
 */
class LineSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(const std::string& path);

        reference operator*() const { return line_; }
        pointer operator->() const { return &line_; }
        iterator& operator++();
        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance();

        std::shared_ptr<std::ifstream> stream_;
        std::string line_;
    };

    explicit LineSequence(std::string path) : path_(std::move(path)) {}

    iterator begin() const { return iterator(path_); }
    iterator end() const { return iterator(); }

private:
    std::string path_;
};

/**
 * @brief Доступ к большим текстовым файлам по фрагментам без полной загрузки.
 * @details Размер и время модификации фиксируются при открытии. Если файл изменился,
 *          следующее чтение фрагмента завершается ошибкой Stale и загрузчик нужно открыть
 *          заново. Ошибка ввода-вывода повторяется один раз, затем выбрасывается IOFailure.
 *          Прочитанные фрагменты хранятся в небольшом LRU (по умолчанию 10 штук).
 * @note Потокобезопасен
 */
class LazyTextLoader {
public:
    static constexpr size_t kDefaultChunkSize = 1024 * 1024;
    static constexpr size_t kDefaultCachedChunks = 10;

    /// Открыть файл. Бросает CacheError(NotFound), если файла нет.
    static std::shared_ptr<LazyTextLoader> open(const std::string& path,
                                                size_t chunkSize = kDefaultChunkSize,
                                                size_t maxCachedChunks = kDefaultCachedChunks);

    LazyTextLoader(const LazyTextLoader&) = delete;
    LazyTextLoader& operator=(const LazyTextLoader&) = delete;

    const std::string& path() const { return path_; }
    /// Размер файла на момент открытия (без чтения содержимого)
    uint64_t size() const { return size_; }
    size_t chunkSize() const { return chunkSize_; }
    size_t chunkCount() const;

    /// Фрагмент с номером index; за концом файла возвращается пустая строка
    std::string readChunk(size_t index);
    LazyChunkHandle chunkHandle(size_t index) const;
    size_t cachedChunkCount() const { return chunks_.size(); }
    // Число повторных чтений после ошибки ввода-вывода
    size_t readRetryCount() const { return readRetries_.load(); }

    /// Перезапускаемая ленивая последовательность строк
    LineSequence iterate() const { return LineSequence(path_); }

    // Поиск подстроки построчно, номера строк с единицы
    std::vector<std::pair<size_t, std::string>> search(const std::string& pattern,
                                                       bool caseSensitive = false) const;
    TextStats analyze() const;

private:
    LazyTextLoader(std::string path, size_t chunkSize, size_t maxCachedChunks,
                   uint64_t size, int64_t mtimeNs);

    void checkNotStale() const;
    std::string readChunkFromDisk(size_t index) const;

    std::string path_;
    size_t chunkSize_;
    uint64_t size_;
    int64_t mtimeNs_;
    // Ёмкость в байтах = maxCachedChunks * chunkSize, каждый фрагмент учитывается как chunkSize
    cache::BoundedLRUCache<size_t, std::string> chunks_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<size_t> readRetries_{0};
};

} // namespace text
} // namespace core
} // namespace fanws
