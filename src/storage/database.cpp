#include <spdlog/spdlog.h>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>
#include <tally/storage/database.h>

namespace tally::storage {

namespace {

// Attempts made when SQLite reports a lock the busy handler did not absorb.
constexpr int kLockAttempts = 5;
constexpr auto kLockBackoff = std::chrono::milliseconds(10);

constexpr std::size_t kSqlContextChars = 120;

Result<void> checkBind(int rc, const char* kind, int index) {
    if (rc == SQLITE_OK)
        return {};
    return Error{ErrorCode::DatabaseError, std::string("Cannot bind ") + kind + " to parameter " +
                                               std::to_string(index) + ": " + sqlite3_errstr(rc)};
}

bool isLockCode(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

// Steps the statement, resetting and backing off while the database stays locked.
int stepThroughLocks(sqlite3_stmt* stmt) {
    auto delay = kLockBackoff;
    int rc = sqlite3_step(stmt);
    for (int attempt = 1; isLockCode(rc) && attempt < kLockAttempts; ++attempt) {
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(delay);
        delay *= 2;
        rc = sqlite3_step(stmt);
    }
    return rc;
}

// Constraint violations are caller data problems, everything else is a storage fault.
Error stepError(sqlite3_stmt* stmt, int rc) {
    std::string message = std::string("Statement failed: ") + sqlite3_errstr(rc);
    if (sqlite3* db = sqlite3_db_handle(stmt)) {
        message += " (";
        message += sqlite3_errmsg(db);
        message += ")";
    }
    if ((rc & 0xff) != SQLITE_CONSTRAINT)
        return Error{isLockCode(rc) ? ErrorCode::Timeout : ErrorCode::DatabaseError, message};

    if (const char* sql = sqlite3_sql(stmt)) {
        std::string_view text(sql);
        message += " [SQL: ";
        message += text.substr(0, kSqlContextChars);
        if (text.size() > kSqlContextChars)
            message += "...";
        message += "]";
    }
    return Error{ErrorCode::InvalidData, message};
}

} // namespace

Statement::Statement(sqlite3* db, const std::string& sql) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        stmt_ = nullptr;
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), "NULL", index);
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), "integer", index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), "integer", index);
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    return checkBind(rc, "text", index);
}

Result<void> Statement::bind(int index, const std::optional<std::string>& value) {
    if (!value)
        return bind(index, nullptr);
    return bind(index, *value);
}

Result<void> Statement::execute() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};

    int rc = stepThroughLocks(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    return stepError(stmt_, rc);
}

Result<bool> Statement::step() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};

    int rc = stepThroughLocks(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return stepError(stmt_, rc);
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    auto text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    return std::string(reinterpret_cast<const char*>(text), size);
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    // sqlite3_reset repeats the last step error; a clean reset is all we report.
    sqlite3_reset(stmt_);
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot clear statement bindings"};
    return {};
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_)
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};

    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (mode) {
        case ConnectionMode::ReadWrite:
            flags |= SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
    }

    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close_v2(handle);
        return Error{ErrorCode::DatabaseError, "Cannot open " + path + ": " + reason};
    }

    db_ = handle;
    path_ = path;
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);
    spdlog::debug("Opened SQLite database {}", path_);
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};

    try {
        return Statement(db_, sql);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};

    char* raw = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw);
    if (rc == SQLITE_OK)
        return {};

    std::string reason = raw ? raw : sqlite3_errstr(rc);
    sqlite3_free(raw);
    spdlog::error("SQLite exec failed: {} [{}]", reason, sql);

    ErrorCode code = ErrorCode::DatabaseError;
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        code = ErrorCode::InvalidData;
    else if (isLockCode(rc))
        code = ErrorCode::Timeout;
    return Error{code, "SQL failed: " + reason};
}

Result<void> Database::beginTransaction(TransactionMode mode) {
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "Transaction already open"};

    auto begun = execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    if (begun)
        inTransaction_ = true;
    return begun;
}

Result<void> Database::commit() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "No open transaction to commit"};

    auto committed = execute("COMMIT");
    // A failed COMMIT may leave the transaction open; autocommit tells us whether it was undone.
    if (committed || (db_ && sqlite3_get_autocommit(db_)))
        inTransaction_ = false;
    return committed;
}

Result<void> Database::rollback() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "No open transaction to roll back"};

    auto rolledBack = execute("ROLLBACK");
    inTransaction_ = false;
    if (!rolledBack)
        spdlog::warn("ROLLBACK on {} failed: {}", path_, rolledBack.error().message);
    return rolledBack;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt)
        return stmt.error();

    auto& query = stmt.value();
    if (auto bound = query.bind(1, table); !bound)
        return bound.error();
    return query.step();
}

Result<std::string> Database::pragmaValue(const std::string& pragma) {
    auto stmt = prepare("PRAGMA " + pragma);
    if (!stmt)
        return stmt.error();

    auto& query = stmt.value();
    auto row = query.step();
    if (!row)
        return row.error();
    if (!row.value())
        return Error{ErrorCode::NotFound, "PRAGMA " + pragma + " returned no rows"};
    return query.getString(0);
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};

    if (timeout.count() < 0 || timeout.count() > std::numeric_limits<int>::max()) {
        return Error{ErrorCode::InvalidArgument,
                     "Busy timeout out of range: " + std::to_string(timeout.count()) + "ms"};
    }
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Cannot set busy timeout"};
    return {};
}

Result<void> Database::enableWAL() {
    auto mode = pragmaValue("journal_mode=WAL");
    if (!mode)
        return mode.error();
    // In-memory databases keep their "memory" journal.
    if (mode.value() != "wal" && mode.value() != "memory")
        return Error{ErrorCode::DatabaseError, "journal_mode stayed " + mode.value()};
    return {};
}

bool Database::ping() {
    if (!db_)
        return false;
    return sqlite3_exec(db_, "SELECT 1", nullptr, nullptr, nullptr) == SQLITE_OK;
}

} // namespace tally::storage
