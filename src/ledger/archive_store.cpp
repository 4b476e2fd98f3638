#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tally/ledger/archive_store.h>

namespace tally::ledger {

using json = nlohmann::json;
using storage::Database;
using storage::Statement;

namespace {

json contributionToJson(const ContributionEvent& e) {
    return json{{"id", e.id},
                {"guild_id", e.guildId},
                {"user_id", e.actorId},
                {"category", e.category},
                {"item_name", e.itemName},
                {"quantity", e.quantity},
                {"created_at", toUnixMillis(e.createdAt)},
                {"seq", e.sequence}};
}

ContributionEvent contributionFromJson(const json& j) {
    ContributionEvent e;
    e.id = j.at("id").get<std::int64_t>();
    e.guildId = j.at("guild_id").get<std::int64_t>();
    e.actorId = j.at("user_id").get<std::int64_t>();
    e.category = j.at("category").get<std::string>();
    e.itemName = j.at("item_name").get<std::string>();
    e.quantity = j.at("quantity").get<std::int64_t>();
    e.createdAt = fromUnixMillis(j.at("created_at").get<std::int64_t>());
    e.sequence = j.at("seq").get<std::int64_t>();
    return e;
}

json quantityChangeToJson(const QuantityChangeEvent& e) {
    json j{{"id", e.id},
           {"guild_id", e.guildId},
           {"item_name", e.itemName},
           {"category", e.category},
           {"old_quantity", e.oldQuantity},
           {"new_quantity", e.newQuantity},
           {"reason", e.reason},
           {"notes", nullptr},
           {"changed_at", toUnixMillis(e.changedAt)},
           {"changed_by_id", e.actorId},
           {"seq", e.sequence}};
    if (e.notes)
        j["notes"] = *e.notes;
    return j;
}

QuantityChangeEvent quantityChangeFromJson(const json& j) {
    QuantityChangeEvent e;
    e.id = j.at("id").get<std::int64_t>();
    e.guildId = j.at("guild_id").get<std::int64_t>();
    e.itemName = j.at("item_name").get<std::string>();
    e.category = j.at("category").get<std::string>();
    e.oldQuantity = j.at("old_quantity").get<std::int64_t>();
    e.newQuantity = j.at("new_quantity").get<std::int64_t>();
    e.reason = j.at("reason").get<std::string>();
    if (j.contains("notes") && !j["notes"].is_null())
        e.notes = j["notes"].get<std::string>();
    e.changedAt = fromUnixMillis(j.at("changed_at").get<std::int64_t>());
    e.actorId = j.at("changed_by_id").get<std::int64_t>();
    e.sequence = j.at("seq").get<std::int64_t>();
    return e;
}

ArchiveInfo mapArchiveRow(const Statement& stmt) {
    ArchiveInfo info;
    info.id = stmt.getInt64(0);
    info.guildId = stmt.getInt64(1);
    info.name = stmt.getString(2);
    info.description = stmt.getString(3);
    info.notes = stmt.getOptionalString(4);
    info.contributionCount = stmt.getInt64(5);
    info.quantityChangeCount = stmt.getInt64(6);
    info.createdAt = fromUnixMillis(stmt.getInt64(7));
    info.createdBy = stmt.getInt64(8);
    return info;
}

constexpr const char* kArchiveColumns =
    "id, guild_id, archive_name, description, notes, contribution_count, "
    "quantity_change_count, created_at, created_by_id";

} // namespace

ArchiveStore::ArchiveStore(storage::StorageHandle& storage, Clock clock)
    : storage_(storage), clock_(std::move(clock)) {}

std::string ArchiveStore::serializeSnapshot(const ArchiveSnapshot& snapshot) {
    json contributions = json::array();
    for (const auto& c : snapshot.contributions)
        contributions.push_back(contributionToJson(c));

    json changes = json::array();
    for (const auto& qc : snapshot.quantityChanges)
        changes.push_back(quantityChangeToJson(qc));

    json j{{"archived_at", toUnixMillis(snapshot.archivedAt)},
           {"total_contributions", snapshot.contributions.size()},
           {"total_quantity_changes", snapshot.quantityChanges.size()},
           {"contributions", std::move(contributions)},
           {"quantity_changes", std::move(changes)}};
    return j.dump();
}

Result<ArchiveSnapshot> ArchiveStore::parseSnapshot(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "Archive snapshot is not a JSON object"};
    }

    try {
        ArchiveSnapshot snapshot;
        snapshot.archivedAt = fromUnixMillis(j.at("archived_at").get<std::int64_t>());
        for (const auto& c : j.at("contributions"))
            snapshot.contributions.push_back(contributionFromJson(c));
        if (j.contains("quantity_changes")) {
            for (const auto& qc : j["quantity_changes"])
                snapshot.quantityChanges.push_back(quantityChangeFromJson(qc));
        }
        return snapshot;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed archive snapshot: ") + e.what()};
    }
}

Result<std::int64_t> ArchiveStore::createArchive(GuildId guildId, const ArchiveMetadata& metadata,
                                                 const ArchiveOptions& options) {
    if (metadata.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Archive name is required"};
    }
    if (!isValidUtf8(metadata.name) || !isValidUtf8(metadata.description) ||
        (metadata.notes && !isValidUtf8(*metadata.notes))) {
        return Error{ErrorCode::InvalidArgument, "Archive metadata is not valid UTF-8"};
    }

    const auto at = clock_ ? clock_() : std::chrono::system_clock::now();

    auto result = storage_.transaction([&](Database& db) -> Result<std::int64_t> {
        ArchiveSnapshot snapshot;
        snapshot.archivedAt = at;

        auto contributions = EventStore::allContributionsIn(db, guildId);
        if (!contributions)
            return contributions.error();
        snapshot.contributions = std::move(contributions).value();

        if (options.includeOverrides) {
            auto changes = EventStore::allQuantityChangesIn(db, guildId);
            if (!changes)
                return changes.error();
            snapshot.quantityChanges = std::move(changes).value();
        }

        // Rows written before text validation existed may still hold invalid UTF-8.
        std::string payload;
        try {
            payload = serializeSnapshot(snapshot);
        } catch (const json::type_error& e) {
            return Error{ErrorCode::InvalidData,
                         std::string("Ledger rows cannot be archived: ") + e.what()};
        }

        auto stmtResult = db.prepare(R"(
            INSERT INTO ledger_archives (guild_id, archive_name, description, notes,
                                         archived_data, contribution_count,
                                         quantity_change_count, created_at, created_by_id)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(
            guildId, metadata.name, metadata.description, metadata.notes,
            payload, static_cast<std::int64_t>(snapshot.contributions.size()),
            static_cast<std::int64_t>(snapshot.quantityChanges.size()), toUnixMillis(at),
            metadata.createdBy);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        const std::int64_t archiveId = db.lastInsertRowId();

        auto clearStmt = db.prepare("DELETE FROM contributions WHERE guild_id = ?");
        if (!clearStmt)
            return clearStmt.error();
        Statement clear = std::move(clearStmt).value();
        auto clearBind = clear.bind(1, guildId);
        if (!clearBind)
            return clearBind.error();
        auto cleared = clear.execute();
        if (!cleared)
            return cleared.error();

        if (options.includeOverrides) {
            auto clearChanges = db.prepare("DELETE FROM quantity_changes WHERE guild_id = ?");
            if (!clearChanges)
                return clearChanges.error();
            Statement clearQc = std::move(clearChanges).value();
            auto qcBind = clearQc.bind(1, guildId);
            if (!qcBind)
                return qcBind.error();
            auto qcCleared = clearQc.execute();
            if (!qcCleared)
                return qcCleared.error();
        }

        spdlog::info("Created archive '{}' (ID: {}) for guild {} - cleared {} contributions and "
                     "{} quantity changes",
                     metadata.name, archiveId, guildId, snapshot.contributions.size(),
                     snapshot.quantityChanges.size());
        return archiveId;
    });

    if (!result) {
        spdlog::error("Failed to create archive for guild {}: {}", guildId,
                      result.error().message);
    }
    return result;
}

Result<std::vector<ArchiveInfo>> ArchiveStore::listArchives(GuildId guildId) {
    return storage_.execute([&](Database& db) -> Result<std::vector<ArchiveInfo>> {
        auto stmtResult = db.prepare(std::string("SELECT ") + kArchiveColumns +
                                     " FROM ledger_archives WHERE guild_id = ?"
                                     " ORDER BY created_at DESC, id DESC");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, guildId);
        if (!bindResult)
            return bindResult.error();

        std::vector<ArchiveInfo> archives;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            archives.push_back(mapArchiveRow(stmt));
        }
        return archives;
    });
}

Result<std::optional<Archive>> ArchiveStore::getArchive(std::int64_t archiveId) {
    return storage_.execute([&](Database& db) -> Result<std::optional<Archive>> {
        auto stmtResult = db.prepare(std::string("SELECT ") + kArchiveColumns +
                                     ", archived_data FROM ledger_archives WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, archiveId);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<Archive>{};

        Archive archive;
        archive.info = mapArchiveRow(stmt);
        auto snapshot = parseSnapshot(stmt.getString(9));
        if (!snapshot)
            return snapshot.error();
        archive.snapshot = std::move(snapshot).value();
        return std::optional<Archive>{std::move(archive)};
    });
}

} // namespace tally::ledger
