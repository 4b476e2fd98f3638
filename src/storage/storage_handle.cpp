#include <spdlog/spdlog.h>
#include <tally/storage/migration.h>
#include <tally/storage/storage_handle.h>

namespace tally::storage {

StorageHandle::StorageHandle(StorageConfig config) : StorageHandle(std::move(config), nullptr) {}

StorageHandle::StorageHandle(StorageConfig config, ConnectionFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {}

StorageHandle::~StorageHandle() {
    close();
}

Result<void> StorageHandle::acquire() {
    return execute([](Database&) -> Result<void> { return {}; });
}

void StorageHandle::close() {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    if (connection_) {
        connection_.reset();
        spdlog::debug("Ledger storage connection closed");
    }
}

bool StorageHandle::isConnected() const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    return connection_ != nullptr && connection_->isOpen();
}

StorageHandle::Stats StorageHandle::getStats() const {
    return {connectionsOpened_.load(), connectionsDiscarded_.load(), retries_.load(),
            exhausted_.load()};
}

void StorageHandle::setSleepFunction(SleepFunction sleep) {
    std::lock_guard<std::mutex> work(workMutex_);
    sleep_ = std::move(sleep);
}

bool StorageHandle::isInMemory() const {
    return config_.path.empty() || config_.path == ":memory:" ||
           config_.path.rfind("file::memory:", 0) == 0;
}

bool StorageHandle::isRetryable(const Error& error) {
    switch (error.code) {
        case ErrorCode::DatabaseError:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

Result<std::shared_ptr<Database>> StorageHandle::connection() {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    if (connection_) {
        if (connection_->ping())
            return connection_;
        if (isInMemory()) {
            spdlog::error("In-memory ledger connection is dead; reopening with an empty ledger");
        } else {
            spdlog::warn("Ledger storage connection failed liveness check; reopening");
        }
        connection_.reset();
        connectionsDiscarded_++;
    }

    auto opened = openConnection();
    if (!opened) {
        spdlog::error("Failed to establish ledger storage connection: {}",
                      opened.error().message);
        return opened.error();
    }

    connection_ = std::shared_ptr<Database>(std::move(opened).value());
    connectionsOpened_++;
    spdlog::info("Ledger storage connection established ({})", config_.path);
    return connection_;
}

Result<std::unique_ptr<Database>> StorageHandle::openConnection() {
    std::unique_ptr<Database> db;
    if (factory_) {
        auto made = factory_();
        if (!made)
            return made.error();
        db = std::move(made).value();
    } else {
        db = std::make_unique<Database>();
        auto openResult = db->open(config_.path, config_.mode);
        if (!openResult)
            return openResult.error();
    }

    if (!db || !db->isOpen()) {
        return Error{ErrorCode::DatabaseError, "Connection factory returned a closed database"};
    }

    auto configured = configureConnection(*db);
    if (!configured)
        return configured.error();

    return db;
}

Result<void> StorageHandle::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult)
        return timeoutResult;

    if (config_.enableForeignKeys) {
        auto r = db.execute("PRAGMA foreign_keys = ON");
        if (!r)
            return r;
    }

    if (config_.enableWAL) {
        auto r = db.enableWAL();
        if (!r)
            return r;
        r = db.execute("PRAGMA synchronous = NORMAL");
        if (!r)
            return r;
    }

    if (config_.tempStoreMemory) {
        auto r = db.execute("PRAGMA temp_store = MEMORY");
        if (!r)
            return r;
    }

    auto cacheResult = db.execute("PRAGMA cache_size = -2000");
    if (!cacheResult)
        return cacheResult;

    if (config_.runMigrations) {
        MigrationManager mm(db);
        auto initResult = mm.initialize();
        if (!initResult)
            return initResult;
        mm.registerMigrations(LedgerMigrations::getAllMigrations());
        auto migrateResult = mm.migrate();
        if (!migrateResult) {
            spdlog::error("Ledger schema migration failed: {}", migrateResult.error().message);
            return migrateResult;
        }
    }

    return {};
}

void StorageHandle::discardConnection() {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    if (connection_) {
        connection_.reset();
        connectionsDiscarded_++;
    }
}

bool StorageHandle::onFailure(const Error& error, int attempt) {
    if (!isRetryable(error)) {
        return false;
    }
    spdlog::warn("Ledger storage attempt {} failed: {}. Retrying in {}ms...", attempt,
                 error.message, backoffDelay(config_.retry, attempt).count());
    // Reopening an in-memory database would start from an empty ledger, so the retry
    // reuses the live connection; the failed unit has already been rolled back.
    if (!isInMemory())
        discardConnection();
    retries_++;
    return true;
}

Error StorageHandle::exhausted(const Error& last) {
    exhausted_++;
    spdlog::error("Ledger storage unavailable after {} attempts: {}", config_.retry.maxAttempts,
                  last.message);
    return Error{ErrorCode::StorageUnavailable, last.message};
}

void StorageHandle::rollbackQuietly(Database& db) {
    if (db.inTransaction()) {
        auto rb = db.rollback();
        if (!rb) {
            spdlog::warn("Ledger rollback failed: {}", rb.error().message);
        }
    }
}

} // namespace tally::storage
