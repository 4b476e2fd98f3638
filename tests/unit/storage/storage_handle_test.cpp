#include <gtest/gtest.h>
#include <tally/storage/storage_handle.h>

#include "common/test_helpers.h"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace tally;
using namespace tally::storage;
using namespace std::chrono_literals;

namespace {

Result<int64_t> countRows(Database& db, const std::string& table) {
    auto prepared = db.prepare("SELECT COUNT(*) FROM " + table);
    if (!prepared)
        return prepared.error();
    Statement stmt = std::move(prepared).value();
    auto step = stmt.step();
    if (!step)
        return step.error();
    return stmt.getInt64(0);
}

} // namespace

class StorageHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = tests::make_temp_dir("tally_storage_test_");
        config_ = tests::test_storage_config(tempDir_ / "ledger.db");
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    ConnectionFactory realFactory() {
        auto path = config_.path;
        return [path]() -> Result<std::unique_ptr<Database>> {
            auto db = std::make_unique<Database>();
            auto opened = db->open(path, ConnectionMode::Create);
            if (!opened)
                return opened.error();
            return db;
        };
    }

    std::string pragma(StorageHandle& handle, const std::string& name) {
        auto value = handle.execute(
            [&name](Database& db) -> Result<std::string> { return db.pragmaValue(name); });
        EXPECT_TRUE(value.has_value()) << name;
        return value ? value.value() : std::string();
    }

    void expectConfigured(StorageHandle& handle) {
        EXPECT_EQ(pragma(handle, "busy_timeout"), std::to_string(config_.busyTimeout.count()));
        EXPECT_EQ(pragma(handle, "journal_mode"), "wal");
        EXPECT_EQ(pragma(handle, "synchronous"), "1");  // NORMAL
        EXPECT_EQ(pragma(handle, "temp_store"), "2");   // MEMORY
        EXPECT_EQ(pragma(handle, "foreign_keys"), "1");
    }

    std::filesystem::path tempDir_;
    StorageConfig config_;
};

TEST_F(StorageHandleTest, AcquireOpensAndMigrates) {
    StorageHandle handle(config_);
    EXPECT_FALSE(handle.isConnected());

    ASSERT_TRUE(handle.acquire().has_value());
    EXPECT_TRUE(handle.isConnected());

    auto exists = handle.execute(
        [](Database& db) -> Result<bool> { return db.tableExists("contributions"); });
    ASSERT_TRUE(exists.has_value());
    EXPECT_TRUE(exists.value());

    expectConfigured(handle);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.connectionsOpened, 1u);
    EXPECT_EQ(stats.retries, 0u);
}

TEST_F(StorageHandleTest, ReconnectAfterRetryableFailureIsConfiguredAgain) {
    StorageHandle handle(config_);
    handle.setSleepFunction([](Duration) {});
    ASSERT_TRUE(handle.acquire().has_value());

    int attempts = 0;
    auto result = handle.execute([&attempts](Database&) -> Result<void> {
        if (++attempts == 1)
            return Error{ErrorCode::DatabaseError, "disk I/O error"};
        return {};
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(attempts, 2);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.connectionsOpened, 2u);
    EXPECT_EQ(stats.connectionsDiscarded, 1u);
    expectConfigured(handle);
}

TEST_F(StorageHandleTest, DeadConnectionIsReplacedBeforeReuse) {
    StorageHandle handle(config_);
    ASSERT_TRUE(handle.execute([](Database& db) {
                          return db.execute("UPDATE ledger_sequence SET value = 11");
                      })
                    .has_value());

    ASSERT_TRUE(handle.execute([](Database& db) -> Result<void> {
                          db.close();
                          return {};
                      })
                    .has_value());

    auto value = handle.execute([](Database& db) -> Result<int64_t> {
        auto stmt = db.prepare("SELECT value FROM ledger_sequence WHERE name = 'events'");
        if (!stmt)
            return stmt.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        return stmt.value().getInt64(0);
    });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 11);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.connectionsOpened, 2u);
    EXPECT_EQ(stats.connectionsDiscarded, 1u);
    EXPECT_EQ(stats.retries, 0u);
    expectConfigured(handle);
}

TEST_F(StorageHandleTest, InMemoryRetryKeepsLedgerContents) {
    config_.path = ":memory:";
    StorageHandle handle(config_);
    handle.setSleepFunction([](Duration) {});
    EXPECT_TRUE(handle.isInMemory());
    ASSERT_TRUE(handle.execute([](Database& db) {
                          return db.execute("UPDATE ledger_sequence SET value = 5");
                      })
                    .has_value());

    int attempts = 0;
    auto value = handle.execute([&attempts](Database& db) -> Result<int64_t> {
        if (++attempts == 1)
            return Error{ErrorCode::DatabaseError, "transient failure"};
        auto stmt = db.prepare("SELECT value FROM ledger_sequence WHERE name = 'events'");
        if (!stmt)
            return stmt.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        return stmt.value().getInt64(0);
    });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 5);
    EXPECT_EQ(attempts, 2);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.retries, 1u);
    EXPECT_EQ(stats.connectionsDiscarded, 0u);
    EXPECT_EQ(stats.connectionsOpened, 1u);
}

TEST_F(StorageHandleTest, InMemoryStoreIsUsable) {
    config_.path = ":memory:";
    StorageHandle handle(config_);
    ASSERT_TRUE(handle.acquire().has_value());

    auto count = handle.execute([](Database& db) { return countRows(db, "contributions"); });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 0);
}

TEST_F(StorageHandleTest, ExhaustedRetriesReportStorageUnavailable) {
    int opens = 0;
    StorageHandle handle(config_, [&opens]() -> Result<std::unique_ptr<Database>> {
        ++opens;
        return Error{ErrorCode::DatabaseError, "disk unavailable"};
    });
    std::vector<Duration> sleeps;
    handle.setSleepFunction([&sleeps](Duration d) { sleeps.push_back(d); });

    auto result = handle.acquire();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StorageUnavailable);
    EXPECT_NE(result.error().message.find("disk unavailable"), std::string::npos);

    EXPECT_EQ(opens, 3);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], 1ms);
    EXPECT_EQ(sleeps[1], 2ms);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.connectionsOpened, 0u);
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.exhaustedOperations, 1u);
    EXPECT_FALSE(handle.isConnected());
}

TEST_F(StorageHandleTest, RecoversAfterTransientFailures) {
    int opens = 0;
    auto real = realFactory();
    StorageHandle handle(config_, [&opens, real]() -> Result<std::unique_ptr<Database>> {
        if (++opens <= 2)
            return Error{ErrorCode::DatabaseError, "database is locked"};
        return real();
    });
    handle.setSleepFunction([](Duration) {});

    ASSERT_TRUE(handle.acquire().has_value());
    EXPECT_EQ(opens, 3);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.connectionsOpened, 1u);
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.exhaustedOperations, 0u);
}

TEST_F(StorageHandleTest, NonRetryableErrorsAreReturnedImmediately) {
    StorageHandle handle(config_);
    std::vector<Duration> sleeps;
    handle.setSleepFunction([&sleeps](Duration d) { sleeps.push_back(d); });

    int calls = 0;
    auto result = handle.execute([&calls](Database&) -> Result<void> {
        ++calls;
        return Error{ErrorCode::InvalidData, "constraint failed"};
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(handle.getStats().retries, 0u);
    EXPECT_TRUE(handle.isConnected());
}

TEST_F(StorageHandleTest, FailedTransactionIsRolledBackBeforeRetry) {
    StorageHandle handle(config_);
    handle.setSleepFunction([](Duration) {});

    int attempts = 0;
    auto result = handle.transaction([&attempts](Database& db) -> Result<void> {
        ++attempts;
        auto insert = db.execute("INSERT INTO contributions "
                                 "(guild_id, user_id, category, item_name, quantity, created_at, seq) "
                                 "VALUES (1, 7, 'Tools', 'Rope', 5, 0, 1)");
        if (!insert)
            return insert;
        if (attempts == 1)
            return Error{ErrorCode::DatabaseError, "connection reset"};
        return {};
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(attempts, 2);

    auto count = handle.execute([](Database& db) { return countRows(db, "contributions"); });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 1);

    auto stats = handle.getStats();
    EXPECT_EQ(stats.retries, 1u);
    EXPECT_EQ(stats.connectionsDiscarded, 1u);
    EXPECT_EQ(stats.connectionsOpened, 2u);
}

TEST_F(StorageHandleTest, ExceptionInsideTransactionRollsBack) {
    StorageHandle handle(config_);

    auto result = handle.transaction([](Database& db) -> Result<void> {
        auto insert = db.execute("INSERT INTO contributions "
                                 "(guild_id, user_id, category, item_name, quantity, created_at, seq) "
                                 "VALUES (1, 7, 'Tools', 'Rope', 5, 0, 1)");
        if (!insert)
            return insert;
        throw std::runtime_error("unexpected");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InternalError);

    auto count = handle.execute([](Database& db) { return countRows(db, "contributions"); });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 0);
}

TEST_F(StorageHandleTest, CloseAndReopen) {
    StorageHandle handle(config_);
    ASSERT_TRUE(handle.acquire().has_value());
    handle.close();
    EXPECT_FALSE(handle.isConnected());

    auto count = handle.execute([](Database& db) { return countRows(db, "quantity_changes"); });
    ASSERT_TRUE(count.has_value());
    EXPECT_TRUE(handle.isConnected());
    EXPECT_EQ(handle.getStats().connectionsOpened, 2u);
}

TEST_F(StorageHandleTest, ConcurrentUnitsAreSerialized) {
    StorageHandle handle(config_);
    ASSERT_TRUE(handle.acquire().has_value());

    const int numThreads = 8;
    const int incrementsPerThread = 50;
    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&handle]() {
            for (int j = 0; j < incrementsPerThread; ++j) {
                auto r = handle.transaction([](Database& db) -> Result<void> {
                    return db.execute(
                        "UPDATE ledger_sequence SET value = value + 1 WHERE name = 'events'");
                });
                EXPECT_TRUE(r.has_value());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto value = handle.execute([](Database& db) -> Result<int64_t> {
        auto prepared = db.prepare("SELECT value FROM ledger_sequence WHERE name = 'events'");
        if (!prepared)
            return prepared.error();
        Statement stmt = std::move(prepared).value();
        auto step = stmt.step();
        if (!step)
            return step.error();
        return stmt.getInt64(0);
    });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), numThreads * incrementsPerThread);
}

TEST(StorageHandleRetryable, ClassifiesErrors) {
    EXPECT_TRUE(StorageHandle::isRetryable(Error{ErrorCode::DatabaseError, ""}));
    EXPECT_TRUE(StorageHandle::isRetryable(Error{ErrorCode::Timeout, ""}));
    EXPECT_FALSE(StorageHandle::isRetryable(Error{ErrorCode::InvalidData, ""}));
    EXPECT_FALSE(StorageHandle::isRetryable(Error{ErrorCode::InvalidQuantity, ""}));
    EXPECT_FALSE(StorageHandle::isRetryable(Error{ErrorCode::NotFound, ""}));
}
