#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <tally/core/retry.h>
#include <tally/storage/database.h>

namespace tally::storage {

/**
 * @brief Configuration for the shared storage connection
 */
struct StorageConfig {
    std::string path;                                   ///< SQLite file (or ":memory:")
    ConnectionMode mode = ConnectionMode::Create;       ///< Open mode for new connections
    RetryPolicy retry{5, std::chrono::milliseconds(100), 2.0, std::chrono::milliseconds(5000)};
    std::chrono::milliseconds busyTimeout{30000};       ///< SQLite busy timeout
    bool enableWAL = true;                              ///< journal_mode=WAL
    bool tempStoreMemory = true;                        ///< temp_store=MEMORY
    bool enableForeignKeys = true;                      ///< foreign_keys=ON
    bool runMigrations = true;                          ///< Apply ledger schema on connect
};

using ConnectionFactory = std::function<Result<std::unique_ptr<Database>>()>;

/**
 * @brief Owner of the single connection to the backing store
 *
 * Only one caller (re)creates the connection at a time; units of work submitted through
 * execute() or transaction() run one after another on that connection. A retryable
 * failure drops the connection and the unit is attempted again after an exponentially
 * growing delay. Once attempts are exhausted the caller receives StorageUnavailable.
 * An in-memory ledger keeps its connection across retries. A connection that fails
 * Database::ping() is replaced before the next unit runs.
 */
class StorageHandle {
public:
    explicit StorageHandle(StorageConfig config);
    StorageHandle(StorageConfig config, ConnectionFactory factory);
    ~StorageHandle();

    StorageHandle(const StorageHandle&) = delete;
    StorageHandle& operator=(const StorageHandle&) = delete;
    StorageHandle(StorageHandle&&) = delete;
    StorageHandle& operator=(StorageHandle&&) = delete;

    /**
     * @brief Open the connection if it does not exist yet
     */
    Result<void> acquire();

    /**
     * @brief Run fn(Database&) with retry; fn must be safe to repeat
     */
    template <typename Func>
    auto execute(Func&& fn) -> std::invoke_result_t<Func&, Database&> {
        using R = std::invoke_result_t<Func&, Database&>;
        std::lock_guard<std::mutex> work(workMutex_);
        return runWithRetry<R>([&](Database& db) -> R { return fn(db); });
    }

    /**
     * @brief Run fn(Database&) inside BEGIN ... COMMIT
     *
     * A failed attempt is always rolled back before it is retried, so a retry never
     * repeats writes that were already committed.
     */
    template <typename Func>
    auto transaction(Func&& fn, TransactionMode mode = TransactionMode::Immediate)
        -> std::invoke_result_t<Func&, Database&> {
        using R = std::invoke_result_t<Func&, Database&>;
        std::lock_guard<std::mutex> work(workMutex_);
        return runWithRetry<R>([&](Database& db) -> R {
            auto begin = db.beginTransaction(mode);
            if (!begin)
                return R(begin.error());

            auto result = [&]() -> R {
                try {
                    return fn(db);
                } catch (const std::exception& e) {
                    return R(Error{ErrorCode::InternalError, e.what()});
                }
            }();
            if (!result) {
                rollbackQuietly(db);
                return result;
            }

            auto commit = db.commit();
            if (!commit) {
                rollbackQuietly(db);
                return R(commit.error());
            }
            return result;
        });
    }

    /**
     * @brief Drop the connection; the next unit of work reopens it
     */
    void close();

    [[nodiscard]] bool isConnected() const;

    struct Stats {
        std::uint64_t connectionsOpened;
        std::uint64_t connectionsDiscarded;
        std::uint64_t retries;
        std::uint64_t exhaustedOperations;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] const StorageConfig& config() const { return config_; }

    /// True when the ledger lives only in this process and is lost if the connection drops.
    [[nodiscard]] bool isInMemory() const;

    /**
     * @brief Replace the backoff sleep (tests record delays instead of waiting)
     */
    void setSleepFunction(SleepFunction sleep);

    static bool isRetryable(const Error& error);

private:
    StorageConfig config_;
    ConnectionFactory factory_;
    SleepFunction sleep_;

    mutable std::mutex connectionMutex_; // held only while (re)creating the connection
    std::mutex workMutex_;               // one unit of work on the connection at a time
    std::shared_ptr<Database> connection_;

    std::atomic<std::uint64_t> connectionsOpened_{0};
    std::atomic<std::uint64_t> connectionsDiscarded_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> exhausted_{0};

    template <typename R, typename Unit> R runWithRetry(Unit&& unit) {
        auto result = retryWithBackoff(
            config_.retry,
            [&]() -> R {
                auto conn = connection();
                if (!conn)
                    return R(conn.error());
                try {
                    return unit(*conn.value());
                } catch (const std::exception& e) {
                    return R(Error{ErrorCode::DatabaseError, e.what()});
                }
            },
            [&](const Error& error, int attempt) { return onFailure(error, attempt); }, sleep_);
        if (!result && isRetryable(result.error())) {
            return R(exhausted(result.error()));
        }
        return result;
    }

    Result<std::shared_ptr<Database>> connection();
    Result<std::unique_ptr<Database>> openConnection();
    Result<void> configureConnection(Database& db);
    void discardConnection();
    bool onFailure(const Error& error, int attempt);
    Error exhausted(const Error& last);
    static void rollbackQuietly(Database& db);
};

} // namespace tally::storage
