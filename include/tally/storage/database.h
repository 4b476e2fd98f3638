#pragma once

#include <tally/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tally::storage {

/**
 * @brief How a ledger database file is opened
 */
enum class ConnectionMode {
    ReadWrite, ///< Existing file only
    Create     ///< Create the file when missing (also used for ":memory:")
};

/**
 * @brief Transaction locking behaviour
 */
enum class TransactionMode {
    Deferred,  ///< BEGIN (lock taken on first access)
    Immediate  ///< BEGIN IMMEDIATE (write lock taken up front)
};

/**
 * @brief Prepared SQLite statement, finalized on destruction.
 *
 * Parameters are 1-based. Steps retry briefly on SQLITE_BUSY/SQLITE_LOCKED; a lock
 * that outlasts the retries is reported as ErrorCode::Timeout, a constraint violation
 * as ErrorCode::InvalidData, and any other failure as ErrorCode::DatabaseError.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::optional<std::string>& value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind every argument in order starting at parameter 1; stops at the first failure
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        Result<void> status;
        int index = 0;
        auto bindNext = [&](auto&& value) {
            status = bind(++index, std::forward<decltype(value)>(value));
            return status.has_value();
        };
        (void)(bindNext(std::forward<Args>(args)) && ...);
        return status;
    }

    /// Run to completion, ignoring any rows produced.
    Result<void> execute();

    /// Advance one row; false once the statement is done.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    bool isNull(int column) const;

    /// Rewind and clear bindings so the statement can run again.
    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning handle to one SQLite connection.
 *
 * Not thread-safe on its own; StorageHandle serializes access.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /// Run one or more statements that take no parameters (DDL, PRAGMA, BEGIN...).
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Run @p func between BEGIN and COMMIT.
     *
     * A failed Result from @p func, or an exception, rolls the transaction back and is
     * passed on to the caller unchanged.
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        auto beginResult = beginTransaction(mode);
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                // The caller's error wins; rollback() logs its own failure.
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Read a single integer or text PRAGMA value
     */
    Result<std::string> pragmaValue(const std::string& pragma);

    /// Rejects negative values and values SQLite's int parameter cannot hold.
    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    /**
     * @brief Cheap liveness check; StorageHandle reopens a connection that fails it
     */
    bool ping();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace tally::storage
