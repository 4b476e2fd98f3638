#include <spdlog/spdlog.h>
#include <tally/storage/migration.h>

namespace tally::storage {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion == targetVersion) {
        spdlog::debug("Ledger schema already at version {}", targetVersion);
        return {};
    }

    if (currentVersion > targetVersion) {
        return Error{ErrorCode::InvalidState,
                     "Schema version " + std::to_string(currentVersion) +
                         " is newer than requested " + std::to_string(targetVersion)};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Failed to record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY id ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        } else {
            return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
        }
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();

    auto bindResult = stmt.bindAll(version, name, static_cast<int64_t>(seconds),
                                   static_cast<int64_t>(duration.count()), success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

// LedgerMigrations implementation
std::vector<Migration> LedgerMigrations::getAllMigrations() {
    return {createContributionLedger(), createQuantityChangeLog(), createArchiveTable(),
            createLedgerIndexes()};
}

Migration LedgerMigrations::createContributionLedger() {
    Migration m;
    m.version = 1;
    m.name = "Create contribution ledger";

    m.upSQL = R"(
        -- Ledger-wide insertion order shared by every event table
        CREATE TABLE ledger_sequence (
            name TEXT PRIMARY KEY,
            value INTEGER NOT NULL
        );
        INSERT INTO ledger_sequence (name, value) VALUES ('events', 0);

        CREATE TABLE contributions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            guild_id INTEGER NOT NULL,
            user_id INTEGER NOT NULL,
            category TEXT NOT NULL,
            item_name TEXT NOT NULL,
            quantity INTEGER NOT NULL CHECK (quantity >= 0),
            created_at INTEGER NOT NULL,
            seq INTEGER NOT NULL UNIQUE
        );
    )";

    return m;
}

Migration LedgerMigrations::createQuantityChangeLog() {
    Migration m;
    m.version = 2;
    m.name = "Create quantity change log";

    m.upSQL = R"(
        CREATE TABLE quantity_changes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            guild_id INTEGER NOT NULL,
            item_name TEXT NOT NULL,
            category TEXT NOT NULL,
            old_quantity INTEGER NOT NULL,
            new_quantity INTEGER NOT NULL CHECK (new_quantity >= 0),
            reason TEXT NOT NULL,
            notes TEXT,
            changed_at INTEGER NOT NULL,
            changed_by_id INTEGER NOT NULL,
            seq INTEGER NOT NULL UNIQUE
        );
    )";

    return m;
}

Migration LedgerMigrations::createArchiveTable() {
    Migration m;
    m.version = 3;
    m.name = "Create ledger archives";

    m.upSQL = R"(
        CREATE TABLE ledger_archives (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            guild_id INTEGER NOT NULL,
            archive_name TEXT NOT NULL,
            description TEXT NOT NULL,
            notes TEXT,
            archived_data TEXT NOT NULL,
            contribution_count INTEGER NOT NULL,
            quantity_change_count INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            created_by_id INTEGER NOT NULL
        );
    )";

    return m;
}

Migration LedgerMigrations::createLedgerIndexes() {
    Migration m;
    m.version = 4;
    m.name = "Add ledger ordering indexes";

    m.upSQL = R"(
        CREATE INDEX idx_contributions_item
            ON contributions(guild_id, category, item_name, created_at, seq);
        CREATE INDEX idx_contributions_guild_time ON contributions(guild_id, created_at, seq);
        CREATE INDEX idx_quantity_changes_item
            ON quantity_changes(guild_id, category, item_name, changed_at, seq);
        CREATE INDEX idx_quantity_changes_guild_time
            ON quantity_changes(guild_id, changed_at, seq);
        CREATE INDEX idx_ledger_archives_guild ON ledger_archives(guild_id, created_at);
    )";

    return m;
}

} // namespace tally::storage
