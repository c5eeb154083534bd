#include "core/cache/persistent/PersistentResponseCache.hpp"
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <sqlite3.h>
#include <zlib.h>
#include <spdlog/spdlog.h>
#include "core/logging/Logging.hpp"
#include "core/thread/ThreadPool.hpp"

namespace fanws {
namespace core {
namespace cache {

namespace fs = std::filesystem;

namespace {

const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS api_cache ("
    "  key TEXT PRIMARY KEY,"
    "  payload BLOB NOT NULL,"
    "  raw_size INTEGER NOT NULL,"
    "  created_at INTEGER NOT NULL,"
    "  ttl_seconds INTEGER NOT NULL,"
    "  expires_at INTEGER NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_api_cache_expires ON api_cache(expires_at);";

// Финализация подготовленного выражения при выходе из области видимости
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

bool compressPayload(const std::string& input, int level, std::vector<uint8_t>& out) {
    uLongf destLen = compressBound(static_cast<uLong>(input.size()));
    out.resize(destLen);
    const int rc = compress2(out.data(), &destLen,
                             reinterpret_cast<const Bytef*>(input.data()),
                             static_cast<uLong>(input.size()), level);
    if (rc != Z_OK) {
        out.clear();
        return false;
    }
    out.resize(destLen);
    return true;
}

bool decompressPayload(const std::vector<uint8_t>& input, uint64_t rawSize, std::string& out) {
    // deflate не сжимает сильнее ~1032:1; больший raw_size означает битую строку
    if (input.empty() || rawSize > static_cast<uint64_t>(input.size()) * 1032 + 64) {
        return false;
    }
    out.assign(static_cast<size_t>(rawSize), '\0');
    uLongf destLen = static_cast<uLongf>(rawSize);
    // Для пустого ответа zlib всё равно требует ненулевой буфер
    Bytef empty = 0;
    Bytef* dest = rawSize > 0 ? reinterpret_cast<Bytef*>(&out[0]) : &empty;
    if (rawSize == 0) destLen = 1;
    const int rc = uncompress(dest, &destLen, input.data(), static_cast<uLong>(input.size()));
    if (rc != Z_OK) return false;
    return rawSize == 0 ? destLen == 0 : destLen == rawSize;
}

} // namespace

// Реализация PIMPL
struct PersistentResponseCache::Impl {
    ResponseCacheConfig config;
    ContextFingerprint fingerprinter;
    std::shared_ptr<spdlog::logger> logger;

    sqlite3* db = nullptr;
    mutable std::timed_mutex dbMutex;       // Одно соединение на экземпляр
    std::chrono::steady_clock::time_point deadline;

    std::unique_ptr<thread::ThreadPool> deleter;

    std::thread sweeper;
    std::mutex sweeperMutex;
    std::condition_variable sweeperCondition;
    bool stopSweep = false;

    std::atomic<bool> available{false};
    std::atomic<size_t> hits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> expiredReads{0};
    std::atomic<size_t> writeFailures{0};
    std::atomic<size_t> corruptRecords{0};
    std::atomic<size_t> purgedRecords{0};

    explicit Impl(const ResponseCacheConfig& cfg)
        : config(cfg)
        , fingerprinter(cfg)
        , logger(logging::getLogger("responsecache")) {
    }

    // Прерывает выполнение SQL после истечения deadline
    static int onProgress(void* ctx) {
        auto* impl = static_cast<Impl*>(ctx);
        return std::chrono::steady_clock::now() > impl->deadline ? 1 : 0;
    }

    // Захват соединения с ограничением по времени; вызывается без блокировки
    bool acquire(std::unique_lock<std::timed_mutex>& lock) {
        lock = std::unique_lock<std::timed_mutex>(dbMutex, std::defer_lock);
        if (!lock.try_lock_for(config.operationTimeout)) {
            logger->warn("Cache store busy for more than {} ms", config.operationTimeout.count());
            return false;
        }
        if (!db) return false;
        deadline = std::chrono::steady_clock::now() + config.operationTimeout;
        return true;
    }

    bool exec(const char* sql) {
        char* errmsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            logger->error("SQLite exec failed: {}", errmsg ? errmsg : sqlite3_errstr(rc));
            sqlite3_free(errmsg);
            return false;
        }
        return true;
    }

    void closeDb() {
        if (db) {
            sqlite3_close_v2(db);
            db = nullptr;
        }
    }

    bool openDb() {
        const std::string& path = config.databasePath;
        const int rc = sqlite3_open_v2(path.c_str(), &db,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to open cache database '{}': {}", path,
                          db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
            closeDb();
            return false;
        }
        sqlite3_busy_timeout(db, static_cast<int>(config.operationTimeout.count()));
        sqlite3_progress_handler(db, 1000, &Impl::onProgress, this);
        deadline = std::chrono::steady_clock::now() + config.operationTimeout;

        if (!exec("PRAGMA journal_mode=WAL;"
                  "PRAGMA synchronous=NORMAL;") ||
            !exec(kSchemaSql)) {
            closeDb();
            return false;
        }
        return true;
    }

    bool open() {
        std::lock_guard<std::timed_mutex> lock(dbMutex);
        if (db) return true;

        fs::path dbPath(config.databasePath);
        if (dbPath.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(dbPath.parent_path(), ec);
            if (ec) {
                logger->error("Failed to create cache directory '{}': {}",
                              dbPath.parent_path().string(), ec.message());
                return false;
            }
        }

        if (openDb()) return true;

        // Повреждённый файл: удаляем и пробуем ещё раз
        logger->warn("Recreating cache database '{}'", config.databasePath);
        std::error_code ec;
        fs::remove(dbPath, ec);
        fs::remove(config.databasePath + "-wal", ec);
        fs::remove(config.databasePath + "-shm", ec);
        return openDb();
    }

    bool deleteRow(const std::string& key, int64_t createdAt) {
        std::unique_lock<std::timed_mutex> lock;
        if (!acquire(lock)) return false;

        // created_at защищает запись, перезаписанную после чтения
        Statement stmt(db, "DELETE FROM api_cache WHERE key=? AND created_at=?;");
        if (!stmt.ok()) return false;
        sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, createdAt);
        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            logger->warn("Failed to delete cache row: {}", sqlite3_errstr(rc));
            return false;
        }
        return true;
    }

    void scheduleDelete(const std::string& key, int64_t createdAt) {
        if (deleter && deleter->enqueue([this, key, createdAt] { deleteRow(key, createdAt); })) {
            return;
        }
        deleteRow(key, createdAt);
    }

    void sweepLoop() {
        std::unique_lock<std::mutex> lock(sweeperMutex);
        while (!stopSweep) {
            if (sweeperCondition.wait_for(lock, config.sweepInterval, [this] { return stopSweep; })) {
                break;
            }
            lock.unlock();
            purgeExpired();
            lock.lock();
        }
    }

    size_t purgeExpired() {
        std::unique_lock<std::timed_mutex> lock;
        if (!acquire(lock)) return 0;

        Statement stmt(db, "DELETE FROM api_cache WHERE expires_at < ?;");
        if (!stmt.ok()) return 0;
        sqlite3_bind_int64(stmt.get(), 1, PersistentResponseCache::nowMs());
        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            logger->warn("Expired rows sweep failed: {}", sqlite3_errstr(rc));
            return 0;
        }
        const size_t removed = static_cast<size_t>(sqlite3_changes(db));
        purgedRecords += removed;
        if (removed > 0) {
            logger->info("Cleared {} expired cache entries", removed);
        }
        return removed;
    }
};

PersistentResponseCache::PersistentResponseCache(const ResponseCacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша ответов");
    }
    pImpl = std::make_unique<Impl>(config);
}

PersistentResponseCache::~PersistentResponseCache() {
    shutdown();
}

int64_t PersistentResponseCache::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool PersistentResponseCache::initialize() {
    if (pImpl->available) return true;

    if (!pImpl->open()) {
        pImpl->logger->error("Response cache disabled: database '{}' unavailable",
                             pImpl->config.databasePath);
        return false;
    }

    thread::ThreadPoolConfig poolConfig;
    poolConfig.threadCount = 1;
    poolConfig.queueSize = pImpl->config.deleteQueueSize;
    poolConfig.loggerName = "responsecache";
    pImpl->deleter = std::make_unique<thread::ThreadPool>(poolConfig);

    pImpl->available = true;
    pImpl->logger->info("Response cache initialized: {}", pImpl->config.databasePath);
    return true;
}

void PersistentResponseCache::shutdown() {
    stopSweeper();
    if (pImpl->deleter) {
        pImpl->deleter->stop();
    }
    pImpl->available = false;

    std::lock_guard<std::timed_mutex> lock(pImpl->dbMutex);
    if (pImpl->db) {
        pImpl->closeDb();
        pImpl->logger->info("Response cache closed");
    }
}

bool PersistentResponseCache::isAvailable() const {
    return pImpl->available;
}

std::string PersistentResponseCache::fingerprint(const RequestDescriptor& request,
                                                 const PromptContext& context) const {
    return pImpl->fingerprinter.compute(request, context);
}

std::optional<std::string> PersistentResponseCache::get(const std::string& fingerprint) {
    if (!pImpl->available) {
        ++pImpl->misses;
        return std::nullopt;
    }

    ResponseCacheRecord record;
    record.key = fingerprint;
    {
        std::unique_lock<std::timed_mutex> lock;
        if (!pImpl->acquire(lock)) {
            ++pImpl->misses;
            return std::nullopt;
        }

        Statement stmt(pImpl->db,
            "SELECT payload, raw_size, created_at, ttl_seconds FROM api_cache WHERE key=?;");
        if (!stmt.ok()) {
            pImpl->logger->warn("Cache get failed: {}", sqlite3_errmsg(pImpl->db));
            ++pImpl->misses;
            return std::nullopt;
        }
        sqlite3_bind_text(stmt.get(), 1, fingerprint.c_str(),
                          static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            ++pImpl->misses;
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            pImpl->logger->warn("Cache get failed: {}", sqlite3_errstr(rc));
            ++pImpl->misses;
            return std::nullopt;
        }

        const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 0));
        const int blobSize = sqlite3_column_bytes(stmt.get(), 0);
        if (blob && blobSize > 0) {
            record.compressedPayload.assign(blob, blob + blobSize);
        }
        record.rawSize = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        record.createdAtMs = sqlite3_column_int64(stmt.get(), 2);
        record.ttlSeconds = sqlite3_column_int64(stmt.get(), 3);
    }

    if (record.isExpired(nowMs())) {
        ++pImpl->expiredReads;
        ++pImpl->misses;
        pImpl->scheduleDelete(record.key, record.createdAtMs);
        return std::nullopt;
    }

    std::string payload;
    if (!decompressPayload(record.compressedPayload, record.rawSize, payload)) {
        ++pImpl->corruptRecords;
        ++pImpl->misses;
        pImpl->logger->error("Corrupt cache record {}, removing", fingerprint);
        pImpl->scheduleDelete(record.key, record.createdAtMs);
        return std::nullopt;
    }

    ++pImpl->hits;
    return payload;
}

bool PersistentResponseCache::put(const std::string& fingerprint, const std::string& payload,
                                  std::chrono::seconds ttl) {
    if (!pImpl->available) {
        ++pImpl->writeFailures;
        return false;
    }
    if (ttl.count() <= 0) {
        ttl = pImpl->config.defaultTtl;
    }
    ttl = std::min(ttl, std::chrono::seconds(ResponseCacheRecord::kMaxTtlSeconds));

    // Сжатие выполняется до захвата соединения
    std::vector<uint8_t> compressed;
    if (!compressPayload(payload, pImpl->config.compressionLevel, compressed)) {
        ++pImpl->writeFailures;
        pImpl->logger->warn("Payload compression failed for {}", fingerprint);
        return false;
    }

    const int64_t createdAt = nowMs();
    std::unique_lock<std::timed_mutex> lock;
    if (!pImpl->acquire(lock)) {
        ++pImpl->writeFailures;
        return false;
    }

    Statement stmt(pImpl->db,
        "INSERT OR REPLACE INTO api_cache "
        "(key, payload, raw_size, created_at, ttl_seconds, expires_at) "
        "VALUES (?, ?, ?, ?, ?, ?);");
    if (!stmt.ok()) {
        ++pImpl->writeFailures;
        pImpl->logger->warn("Cache put failed: {}", sqlite3_errmsg(pImpl->db));
        return false;
    }
    sqlite3_bind_text(stmt.get(), 1, fingerprint.c_str(),
                      static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 2, compressed.data(),
                      static_cast<int>(compressed.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(payload.size()));
    sqlite3_bind_int64(stmt.get(), 4, createdAt);
    sqlite3_bind_int64(stmt.get(), 5, ttl.count());
    sqlite3_bind_int64(stmt.get(), 6, createdAt + ttl.count() * 1000);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        ++pImpl->writeFailures;
        pImpl->logger->warn("Cache write dropped for {}: {}", fingerprint, sqlite3_errstr(rc));
        return false;
    }
    return true;
}

std::optional<nlohmann::json> PersistentResponseCache::getJson(const std::string& fingerprint) {
    auto payload = get(fingerprint);
    if (!payload) return std::nullopt;

    try {
        return nlohmann::json::parse(*payload);
    } catch (const nlohmann::json::parse_error& e) {
        ++pImpl->corruptRecords;
        pImpl->logger->error("Cached response {} is not valid JSON: {}", fingerprint, e.what());
        remove(fingerprint);
        return std::nullopt;
    }
}

bool PersistentResponseCache::putJson(const std::string& fingerprint, const nlohmann::json& response,
                                      std::chrono::seconds ttl) {
    return put(fingerprint, response.dump(), ttl);
}

bool PersistentResponseCache::remove(const std::string& fingerprint) {
    if (!pImpl->available) return false;

    std::unique_lock<std::timed_mutex> lock;
    if (!pImpl->acquire(lock)) return false;

    Statement stmt(pImpl->db, "DELETE FROM api_cache WHERE key=?;");
    if (!stmt.ok()) return false;
    sqlite3_bind_text(stmt.get(), 1, fingerprint.c_str(),
                      static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        pImpl->logger->warn("Cache delete failed: {}", sqlite3_errstr(rc));
        return false;
    }
    return sqlite3_changes(pImpl->db) > 0;
}

bool PersistentResponseCache::clear() {
    if (!pImpl->available) return false;

    std::unique_lock<std::timed_mutex> lock;
    if (!pImpl->acquire(lock)) return false;
    if (!pImpl->exec("DELETE FROM api_cache;")) return false;
    pImpl->logger->info("Cleared all API response cache");
    return true;
}

size_t PersistentResponseCache::purgeExpired() {
    if (!pImpl->available) return 0;
    return pImpl->purgeExpired();
}

void PersistentResponseCache::startSweeper() {
    std::lock_guard<std::mutex> lock(pImpl->sweeperMutex);
    if (pImpl->sweeper.joinable()) return;
    pImpl->stopSweep = false;
    pImpl->sweeper = std::thread([this] { pImpl->sweepLoop(); });
    pImpl->logger->info("Expired rows sweep every {} s", pImpl->config.sweepInterval.count());
}

void PersistentResponseCache::stopSweeper() {
    {
        std::lock_guard<std::mutex> lock(pImpl->sweeperMutex);
        pImpl->stopSweep = true;
    }
    pImpl->sweeperCondition.notify_all();
    if (pImpl->sweeper.joinable()) {
        pImpl->sweeper.join();
    }
}

void PersistentResponseCache::waitForPendingOperations() {
    if (pImpl->deleter) {
        pImpl->deleter->waitForCompletion();
    }
}

ResponseCacheStats PersistentResponseCache::getStats() const {
    ResponseCacheStats stats;
    stats.hits = pImpl->hits;
    stats.misses = pImpl->misses;
    stats.expiredReads = pImpl->expiredReads;
    stats.writeFailures = pImpl->writeFailures;
    stats.corruptRecords = pImpl->corruptRecords;
    stats.purgedRecords = pImpl->purgedRecords;
    stats.available = pImpl->available;
    stats.databasePath = pImpl->config.databasePath;
    if (!pImpl->available) return stats;

    std::unique_lock<std::timed_mutex> lock;
    if (!pImpl->acquire(lock)) return stats;

    Statement stmt(pImpl->db,
        "SELECT COUNT(*), COALESCE(SUM(LENGTH(payload)), 0), COALESCE(SUM(raw_size), 0), "
        "COALESCE(SUM(CASE WHEN expires_at < ? THEN 1 ELSE 0 END), 0) FROM api_cache;");
    if (!stmt.ok()) return stats;
    sqlite3_bind_int64(stmt.get(), 1, nowMs());
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        stats.totalEntries = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
        stats.storedBytes = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        stats.rawBytes = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2));
        stats.expiredEntries = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 3));
    } else {
        pImpl->logger->warn("Cache stats query failed: {}", sqlite3_errmsg(pImpl->db));
    }
    return stats;
}

ResponseCacheConfig PersistentResponseCache::getConfiguration() const {
    return pImpl->config;
}

} // namespace cache
} // namespace core
} // namespace fanws
