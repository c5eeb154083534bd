#include "core/text/LazyTextLoader.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include "core/logging/Logging.hpp"

namespace fanws {
namespace core {
namespace text {

using cache::CacheError;
using cache::CacheErrorCode;

namespace {

inline int64_t to_ns(time_t s, long ns) {
    return static_cast<int64_t>(s) * 1000000000LL + static_cast<int64_t>(ns);
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// ---------------------------
// LineSequence::iterator
// ---------------------------

LineSequence::iterator::iterator(const std::string& path)
    : stream_(std::make_shared<std::ifstream>(path, std::ios::binary)) {
    if (!*stream_) {
        stream_.reset();
        throw CacheError(CacheErrorCode::NotFound, "cannot reopen " + path);
    }
    advance();
}

LineSequence::iterator& LineSequence::iterator::operator++() {
    advance();
    return *this;
}

void LineSequence::iterator::advance() {
    if (!stream_) return;
    if (!std::getline(*stream_, line_)) {
        stream_.reset();
        line_.clear();
        return;
    }
    if (!line_.empty() && line_.back() == '\r') {
        line_.pop_back();
    }
}

// ---------------------------
// LazyTextLoader
// ---------------------------

std::shared_ptr<LazyTextLoader> LazyTextLoader::open(const std::string& path,
                                                     size_t chunkSize,
                                                     size_t maxCachedChunks) {
    if (chunkSize == 0 || maxCachedChunks == 0) {
        throw std::invalid_argument("chunkSize and maxCachedChunks must be positive");
    }

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            throw CacheError(CacheErrorCode::NotFound, path);
        }
        throw CacheError(CacheErrorCode::IOFailure, path + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw CacheError(CacheErrorCode::NotFound, path + " is not a regular file");
    }

    return std::shared_ptr<LazyTextLoader>(new LazyTextLoader(
        path, chunkSize, maxCachedChunks,
        static_cast<uint64_t>(st.st_size),
        to_ns(st.st_mtim.tv_sec, st.st_mtim.tv_nsec)));
}

LazyTextLoader::LazyTextLoader(std::string path, size_t chunkSize, size_t maxCachedChunks,
                               uint64_t size, int64_t mtimeNs)
    : path_(std::move(path))
    , chunkSize_(chunkSize)
    , size_(size)
    , mtimeNs_(mtimeNs)
    , chunks_(chunkSize * maxCachedChunks, "textloader")
    , logger_(logging::getLogger("textloader")) {
    logger_->debug("Opened '{}': {} bytes, {} chunks", path_, size_, chunkCount());
}

size_t LazyTextLoader::chunkCount() const {
    return static_cast<size_t>((size_ + chunkSize_ - 1) / chunkSize_);
}

LazyChunkHandle LazyTextLoader::chunkHandle(size_t index) const {
    const uint64_t offset = static_cast<uint64_t>(index) * chunkSize_;
    const size_t length = offset >= size_
        ? 0
        : static_cast<size_t>(std::min<uint64_t>(chunkSize_, size_ - offset));
    return LazyChunkHandle{offset, length, index};
}

void LazyTextLoader::checkNotStale() const {
    struct stat st {};
    if (::stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw CacheError(CacheErrorCode::NotFound, path_ + " was removed");
        }
        throw CacheError(CacheErrorCode::IOFailure, path_ + ": " + std::strerror(errno));
    }
    const int64_t curMtime = to_ns(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    if (static_cast<uint64_t>(st.st_size) != size_ || curMtime != mtimeNs_) {
        throw CacheError(CacheErrorCode::Stale, path_ + " changed since open");
    }
}

std::string LazyTextLoader::readChunk(size_t index) {
    checkNotStale();

    const LazyChunkHandle handle = chunkHandle(index);
    if (handle.length == 0) {
        return std::string();
    }

    if (auto cached = chunks_.get(index)) {
        return *cached;
    }

    std::string chunk;
    try {
        chunk = readChunkFromDisk(index);
    } catch (const std::ios_base::failure& e) {
        logger_->warn("Read of chunk {} in '{}' failed, retrying: {}", index, path_, e.what());
        // Файл мог измениться между проверкой и чтением
        checkNotStale();
        ++readRetries_;
        try {
            chunk = readChunkFromDisk(index);
        } catch (const std::ios_base::failure& retryError) {
            logger_->error("Read of chunk {} in '{}' failed: {}", index, path_, retryError.what());
            throw CacheError(CacheErrorCode::IOFailure,
                             path_ + " chunk " + std::to_string(index) + ": " + retryError.what());
        }
    }

    chunks_.set(index, chunk, chunkSize_);
    return chunk;
}

std::string LazyTextLoader::readChunkFromDisk(size_t index) const {
    const LazyChunkHandle handle = chunkHandle(index);

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw std::ios_base::failure("cannot open file");
    }
    file.seekg(static_cast<std::streamoff>(handle.offset));
    if (!file) {
        throw std::ios_base::failure("seek failed");
    }

    std::string chunk(handle.length, '\0');
    file.read(&chunk[0], static_cast<std::streamsize>(handle.length));
    if (static_cast<size_t>(file.gcount()) != handle.length) {
        throw std::ios_base::failure("short read");
    }
    return chunk;
}

std::vector<std::pair<size_t, std::string>> LazyTextLoader::search(const std::string& pattern,
                                                                   bool caseSensitive) const {
    std::vector<std::pair<size_t, std::string>> results;
    const std::string needle = caseSensitive ? pattern : toLowerAscii(pattern);

    size_t lineNumber = 0;
    for (const auto& line : iterate()) {
        ++lineNumber;
        const std::string haystack = caseSensitive ? line : toLowerAscii(line);
        if (haystack.find(needle) != std::string::npos) {
            results.emplace_back(lineNumber, line);
        }
    }
    return results;
}

TextStats LazyTextLoader::analyze() const {
    TextStats stats;
    stats.sizeBytes = size_;

    for (const auto& line : iterate()) {
        ++stats.lineCount;
        stats.charCount += line.size();
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            ++stats.wordCount;
        }
    }
    stats.avgLineLength = static_cast<double>(stats.charCount) /
                          static_cast<double>(std::max<size_t>(stats.lineCount, 1));
    return stats;
}

} // namespace text
} // namespace core
} // namespace fanws
