#include <spdlog/spdlog.h>
#include <tally/ledger/event_store.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <variant>

namespace tally::ledger {

using storage::Database;
using storage::Statement;

namespace {

constexpr const char* kContributionColumns =
    "id, guild_id, user_id, category, item_name, quantity, created_at, seq";

constexpr const char* kQuantityChangeColumns =
    "id, guild_id, item_name, category, old_quantity, new_quantity, reason, notes, "
    "changed_at, changed_by_id, seq";

using SqlParam = std::variant<std::int64_t, std::string>;

struct WhereClause {
    std::string sql;
    std::vector<SqlParam> params;
};

WhereClause buildWhere(const EventQuery& query, const char* timeColumn) {
    WhereClause where;
    where.sql = " WHERE guild_id = ?";
    where.params.emplace_back(query.guildId);
    if (query.itemName) {
        where.sql += " AND item_name = ?";
        where.params.emplace_back(*query.itemName);
    }
    if (query.category) {
        where.sql += " AND category = ?";
        where.params.emplace_back(*query.category);
    }
    if (query.asOf) {
        where.sql += " AND ";
        where.sql += timeColumn;
        where.sql += " <= ?";
        where.params.emplace_back(toUnixMillis(*query.asOf));
    }
    return where;
}

Result<void> bindParams(Statement& stmt, const std::vector<SqlParam>& params, int first = 1) {
    int index = first;
    for (const auto& param : params) {
        auto r = std::visit([&](const auto& v) { return stmt.bind(index, v); }, param);
        if (!r)
            return r;
        ++index;
    }
    return {};
}

ContributionEvent mapContributionRow(const Statement& stmt) {
    ContributionEvent e;
    e.id = stmt.getInt64(0);
    e.guildId = stmt.getInt64(1);
    e.actorId = stmt.getInt64(2);
    e.category = stmt.getString(3);
    e.itemName = stmt.getString(4);
    e.quantity = stmt.getInt64(5);
    e.createdAt = fromUnixMillis(stmt.getInt64(6));
    e.sequence = stmt.getInt64(7);
    return e;
}

QuantityChangeEvent mapQuantityChangeRow(const Statement& stmt) {
    QuantityChangeEvent e;
    e.id = stmt.getInt64(0);
    e.guildId = stmt.getInt64(1);
    e.itemName = stmt.getString(2);
    e.category = stmt.getString(3);
    e.oldQuantity = stmt.getInt64(4);
    e.newQuantity = stmt.getInt64(5);
    e.reason = stmt.getString(6);
    e.notes = stmt.getOptionalString(7);
    e.changedAt = fromUnixMillis(stmt.getInt64(8));
    e.actorId = stmt.getInt64(9);
    e.sequence = stmt.getInt64(10);
    return e;
}

template <typename Row, typename Mapper>
Result<std::vector<Row>> collectRows(Statement& stmt, Mapper&& map) {
    std::vector<Row> rows;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        rows.push_back(map(stmt));
    }
    return rows;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

Result<void> validateText(const std::string& text, const char* field) {
    if (!isValidUtf8(text))
        return Error{ErrorCode::InvalidArgument, std::string(field) + " is not valid UTF-8"};
    return {};
}

Result<void> validateKey(const ItemKey& key) {
    if (key.itemName.empty())
        return Error{ErrorCode::InvalidArgument, "Item name is required"};
    if (key.category.empty())
        return Error{ErrorCode::InvalidArgument, "Category is required"};
    if (auto r = validateText(key.itemName, "Item name"); !r)
        return r;
    return validateText(key.category, "Category");
}

const char* tableFor(EventKind kind) {
    return kind == EventKind::Contribution ? "contributions" : "quantity_changes";
}

} // namespace

EventStore::EventStore(storage::StorageHandle& storage, Clock clock)
    : storage_(storage), clock_(std::move(clock)) {}

TimePoint EventStore::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

Result<void> EventStore::validate(const NewContribution& contribution) {
    if (contribution.quantity <= 0 || contribution.quantity > kMaxQuantity) {
        return Error{ErrorCode::InvalidQuantity,
                     "Contribution quantity must be between 1 and " +
                         std::to_string(kMaxQuantity) + ", got " +
                         std::to_string(contribution.quantity)};
    }
    return validateKey(contribution.key);
}

Result<void> EventStore::validate(const NewQuantityChange& change) {
    if (change.newQuantity < 0 || change.newQuantity > kMaxQuantity) {
        return Error{ErrorCode::InvalidQuantity, "New quantity must be between 0 and " +
                                                     std::to_string(kMaxQuantity) + ", got " +
                                                     std::to_string(change.newQuantity)};
    }
    if (isBlank(change.reason)) {
        return Error{ErrorCode::MissingReason, "A reason is required for a quantity change"};
    }
    if (auto r = validateText(change.reason, "Reason"); !r)
        return r;
    if (change.notes) {
        if (auto r = validateText(*change.notes, "Notes"); !r)
            return r;
    }
    return validateKey(change.key);
}

Result<std::int64_t> EventStore::nextSequence(Database& db) {
    auto update = db.execute("UPDATE ledger_sequence SET value = value + 1 WHERE name = 'events'");
    if (!update)
        return update.error();

    auto stmtResult = db.prepare("SELECT value FROM ledger_sequence WHERE name = 'events'");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::InvalidState, "Ledger sequence counter is missing"};
    }
    return stmt.getInt64(0);
}

Result<EventId> EventStore::appendContributionIn(Database& db, const NewContribution& c,
                                                 TimePoint at) {
    auto seq = nextSequence(db);
    if (!seq)
        return seq.error();

    auto stmtResult = db.prepare(R"(
        INSERT INTO contributions (guild_id, user_id, category, item_name, quantity,
                                   created_at, seq)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(c.guildId, c.actorId, c.key.category, c.key.itemName,
                                   c.quantity, toUnixMillis(at), seq.value());
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    return db.lastInsertRowId();
}

Result<EventId> EventStore::appendQuantityChangeIn(Database& db, const NewQuantityChange& c,
                                                   TimePoint at) {
    auto seq = nextSequence(db);
    if (!seq)
        return seq.error();

    auto stmtResult = db.prepare(R"(
        INSERT INTO quantity_changes (guild_id, item_name, category, old_quantity, new_quantity,
                                      reason, notes, changed_at, changed_by_id, seq)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult =
        stmt.bindAll(c.guildId, c.key.itemName, c.key.category, c.oldQuantity, c.newQuantity,
                     c.reason, c.notes, toUnixMillis(at), c.actorId, seq.value());
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    return db.lastInsertRowId();
}

Result<EventId> EventStore::appendContribution(const NewContribution& contribution) {
    auto valid = validate(contribution);
    if (!valid)
        return valid.error();

    auto at = now();
    auto result = storage_.transaction([&](Database& db) -> Result<EventId> {
        return appendContributionIn(db, contribution, at);
    });
    if (result) {
        spdlog::debug("Recorded contribution {} of {} x {}/{} by {} in guild {}", result.value(),
                      contribution.quantity, contribution.key.category, contribution.key.itemName,
                      contribution.actorId, contribution.guildId);
    }
    return result;
}

Result<EventId> EventStore::appendQuantityChange(const NewQuantityChange& change) {
    auto valid = validate(change);
    if (!valid)
        return valid.error();

    auto at = now();
    auto result = storage_.transaction([&](Database& db) -> Result<EventId> {
        return appendQuantityChangeIn(db, change, at);
    });
    if (result) {
        spdlog::debug("Recorded quantity change {} for {}/{}: {} -> {} in guild {}",
                      result.value(), change.key.category, change.key.itemName,
                      change.oldQuantity, change.newQuantity, change.guildId);
    }
    return result;
}

Result<std::vector<LedgerEvent>> EventStore::queryEventsIn(Database& db, const EventQuery& query) {
    if (query.limit && *query.limit == 0) {
        return std::vector<LedgerEvent>{};
    }

    // With a limit each table contributes at most `limit` newest rows; the merge below
    // keeps the newest `limit` overall.
    const bool newestFirst = query.limit.has_value();
    std::vector<LedgerEvent> events;

    if (query.includeContributions) {
        auto where = buildWhere(query, "created_at");
        std::string sql = std::string("SELECT ") + kContributionColumns + " FROM contributions" +
                          where.sql +
                          (newestFirst ? " ORDER BY created_at DESC, seq DESC LIMIT ?"
                                       : " ORDER BY created_at ASC, seq ASC");
        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = bindParams(stmt, where.params);
        if (!bindResult)
            return bindResult.error();
        if (newestFirst) {
            bindResult = stmt.bind(static_cast<int>(where.params.size()) + 1,
                                   static_cast<std::int64_t>(*query.limit));
            if (!bindResult)
                return bindResult.error();
        }

        auto rows = collectRows<ContributionEvent>(stmt, mapContributionRow);
        if (!rows)
            return rows.error();
        for (auto& row : rows.value())
            events.emplace_back(std::move(row));
    }

    if (query.includeQuantityChanges) {
        auto where = buildWhere(query, "changed_at");
        std::string sql = std::string("SELECT ") + kQuantityChangeColumns +
                          " FROM quantity_changes" + where.sql +
                          (newestFirst ? " ORDER BY changed_at DESC, seq DESC LIMIT ?"
                                       : " ORDER BY changed_at ASC, seq ASC");
        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = bindParams(stmt, where.params);
        if (!bindResult)
            return bindResult.error();
        if (newestFirst) {
            bindResult = stmt.bind(static_cast<int>(where.params.size()) + 1,
                                   static_cast<std::int64_t>(*query.limit));
            if (!bindResult)
                return bindResult.error();
        }

        auto rows = collectRows<QuantityChangeEvent>(stmt, mapQuantityChangeRow);
        if (!rows)
            return rows.error();
        for (auto& row : rows.value())
            events.emplace_back(std::move(row));
    }

    std::sort(events.begin(), events.end(), chronologicallyBefore);
    if (query.limit && events.size() > *query.limit) {
        events.erase(events.begin(),
                     events.begin() + static_cast<std::ptrdiff_t>(events.size() - *query.limit));
    }
    return events;
}

Result<std::vector<LedgerEvent>> EventStore::queryEvents(const EventQuery& query) {
    return storage_.execute(
        [&](Database& db) -> Result<std::vector<LedgerEvent>> { return queryEventsIn(db, query); });
}

Result<std::vector<ContributionEvent>>
EventStore::contributionsForIn(Database& db, GuildId guildId, const ItemKey& key) {
    auto stmtResult = db.prepare(std::string("SELECT ") + kContributionColumns +
                                 " FROM contributions"
                                 " WHERE guild_id = ? AND category = ? AND item_name = ?"
                                 " ORDER BY created_at ASC, seq ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(guildId, key.category, key.itemName);
    if (!bindResult)
        return bindResult.error();

    return collectRows<ContributionEvent>(stmt, mapContributionRow);
}

Result<std::vector<ContributionEvent>> EventStore::contributionsFor(GuildId guildId,
                                                                   const ItemKey& key) {
    return storage_.execute([&](Database& db) -> Result<std::vector<ContributionEvent>> {
        return contributionsForIn(db, guildId, key);
    });
}

Result<std::vector<ContributionEvent>> EventStore::allContributionsIn(Database& db,
                                                                     GuildId guildId) {
    auto stmtResult = db.prepare(std::string("SELECT ") + kContributionColumns +
                                 " FROM contributions WHERE guild_id = ?"
                                 " ORDER BY created_at ASC, seq ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, guildId);
    if (!bindResult)
        return bindResult.error();

    return collectRows<ContributionEvent>(stmt, mapContributionRow);
}

Result<std::vector<QuantityChangeEvent>> EventStore::allQuantityChangesIn(Database& db,
                                                                         GuildId guildId) {
    auto stmtResult = db.prepare(std::string("SELECT ") + kQuantityChangeColumns +
                                 " FROM quantity_changes WHERE guild_id = ?"
                                 " ORDER BY changed_at ASC, seq ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, guildId);
    if (!bindResult)
        return bindResult.error();

    return collectRows<QuantityChangeEvent>(stmt, mapQuantityChangeRow);
}

Result<std::vector<QuantityChangeEvent>>
EventStore::quantityChangeHistory(GuildId guildId, const std::string& itemName,
                                  const std::optional<std::string>& category) {
    return storage_.execute([&](Database& db) -> Result<std::vector<QuantityChangeEvent>> {
        std::string sql = std::string("SELECT ") + kQuantityChangeColumns +
                          " FROM quantity_changes WHERE guild_id = ? AND item_name = ?";
        if (category)
            sql += " AND category = ?";
        sql += " ORDER BY changed_at DESC, seq DESC";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(guildId, itemName);
        if (!bindResult)
            return bindResult.error();
        if (category) {
            bindResult = stmt.bind(3, *category);
            if (!bindResult)
                return bindResult.error();
        }

        return collectRows<QuantityChangeEvent>(stmt, mapQuantityChangeRow);
    });
}

Result<std::optional<LedgerEvent>> EventStore::getEvent(EventKind kind, EventId id,
                                                        std::optional<GuildId> guildId) {
    return storage_.execute([&](Database& db) -> Result<std::optional<LedgerEvent>> {
        std::string sql = std::string("SELECT ") +
                          (kind == EventKind::Contribution ? kContributionColumns
                                                           : kQuantityChangeColumns) +
                          " FROM " + tableFor(kind) + " WHERE id = ?";
        if (guildId)
            sql += " AND guild_id = ?";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, id);
        if (!bindResult)
            return bindResult.error();
        if (guildId) {
            bindResult = stmt.bind(2, *guildId);
            if (!bindResult)
                return bindResult.error();
        }

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value()) {
            return std::optional<LedgerEvent>{};
        }

        if (kind == EventKind::Contribution)
            return std::optional<LedgerEvent>{mapContributionRow(stmt)};
        return std::optional<LedgerEvent>{mapQuantityChangeRow(stmt)};
    });
}

Result<bool> EventStore::deleteEventIn(Database& db, EventKind kind, EventId id,
                                       std::optional<GuildId> guildId) {
    std::string sql = std::string("DELETE FROM ") + tableFor(kind) + " WHERE id = ?";
    if (guildId)
        sql += " AND guild_id = ?";

    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();
    if (guildId) {
        bindResult = stmt.bind(2, *guildId);
        if (!bindResult)
            return bindResult.error();
    }

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    return db.changes() > 0;
}

Result<bool> EventStore::deleteEvent(EventKind kind, EventId id, std::optional<GuildId> guildId) {
    auto result = storage_.transaction(
        [&](Database& db) -> Result<bool> { return deleteEventIn(db, kind, id, guildId); });
    if (!result)
        return result;

    if (result.value()) {
        spdlog::info("Removed {} entry {}", toString(kind), id);
    } else {
        spdlog::warn("No {} entry found with ID {}", toString(kind), id);
    }
    return result;
}

Result<RemovalReport> EventStore::deleteEvents(const std::vector<EventRef>& refs,
                                               std::optional<GuildId> guildId) {
    auto result = storage_.transaction([&](Database& db) -> Result<RemovalReport> {
        RemovalReport report;
        for (const auto& ref : refs) {
            RemovalOutcome outcome{ref, false, {}};
            auto removed = deleteEventIn(db, ref.kind, ref.id, guildId);
            if (!removed) {
                if (removed.error().code != ErrorCode::InvalidData)
                    return removed.error();
                outcome.error = removed.error().message;
            } else if (removed.value()) {
                outcome.removed = true;
                if (ref.kind == EventKind::Contribution)
                    ++report.contributionsRemoved;
                else
                    ++report.quantityChangesRemoved;
            } else {
                outcome.error = std::string(toString(ref.kind)) + " " + std::to_string(ref.id) +
                                " not found";
            }
            report.outcomes.push_back(std::move(outcome));
        }
        return report;
    });

    if (result) {
        const auto& report = result.value();
        spdlog::info("Bulk removed {} ledger entries ({} contributions, {} quantity changes)",
                     report.totalRemoved(), report.contributionsRemoved,
                     report.quantityChangesRemoved);
    }
    return result;
}

} // namespace tally::ledger
