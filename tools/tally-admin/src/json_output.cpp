#include <spdlog/fmt/fmt.h>
#include <tally/tools/json_output.h>

#include <ctime>

namespace tally::tools {

using nlohmann::json;

std::string formatTimestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

json toJson(const ledger::LedgerEvent& event) {
    if (const auto* c = std::get_if<ledger::ContributionEvent>(&event)) {
        return json{{"type", "contribution"},
                    {"id", c->id},
                    {"guild_id", c->guildId},
                    {"actor_id", c->actorId},
                    {"category", c->category},
                    {"item_name", c->itemName},
                    {"quantity", c->quantity},
                    {"occurred_at", formatTimestamp(c->createdAt)},
                    {"seq", c->sequence}};
    }
    const auto& qc = std::get<ledger::QuantityChangeEvent>(event);
    json j{{"type", "quantity_change"},
           {"id", qc.id},
           {"guild_id", qc.guildId},
           {"actor_id", qc.actorId},
           {"category", qc.category},
           {"item_name", qc.itemName},
           {"old_quantity", qc.oldQuantity},
           {"new_quantity", qc.newQuantity},
           {"reason", qc.reason},
           {"notes", nullptr},
           {"occurred_at", formatTimestamp(qc.changedAt)},
           {"seq", qc.sequence}};
    if (qc.notes)
        j["notes"] = *qc.notes;
    return j;
}

json toJson(const ledger::AuditEntry& entry) {
    json j = toJson(entry.event);
    j["running_balance"] = entry.runningBalance;
    return j;
}

json toJson(const ledger::StockLevel& level) {
    return json{{"category", level.key.category},
                {"item_name", level.key.itemName},
                {"quantity", level.quantity},
                {"last_changed", formatTimestamp(level.lastChanged)}};
}

json toJson(const ledger::RedistributionSummary& summary) {
    json j{{"applied", summary.applied},
           {"old_total", summary.oldTotal},
           {"new_total", summary.newTotal},
           {"records_updated", summary.recordsUpdated},
           {"records_deleted", summary.recordsDeleted},
           {"correction_event_id", nullptr}};
    if (summary.correctionEventId)
        j["correction_event_id"] = *summary.correctionEventId;
    return j;
}

json toJson(const ledger::ArchiveInfo& info) {
    json j{{"id", info.id},
           {"guild_id", info.guildId},
           {"name", info.name},
           {"description", info.description},
           {"notes", nullptr},
           {"contribution_count", info.contributionCount},
           {"quantity_change_count", info.quantityChangeCount},
           {"created_at", formatTimestamp(info.createdAt)},
           {"created_by", info.createdBy}};
    if (info.notes)
        j["notes"] = *info.notes;
    return j;
}

json toJson(const ledger::RemovalReport& report) {
    json failures = json::array();
    for (const auto& outcome : report.outcomes) {
        if (!outcome.removed)
            failures.push_back(outcome.error);
    }
    return json{{"total_removed", report.totalRemoved()},
                {"contributions_removed", report.contributionsRemoved},
                {"quantity_changes_removed", report.quantityChangesRemoved},
                {"failed_removals", std::move(failures)}};
}

std::string describe(const ledger::AuditEntry& entry) {
    if (const auto* c = std::get_if<ledger::ContributionEvent>(&entry.event)) {
        return fmt::format("{}  #{:<6} +{:<8} {}/{}  by {}  (total {})",
                           formatTimestamp(c->createdAt), c->id, c->quantity, c->category,
                           c->itemName, c->actorId, entry.runningBalance);
    }
    const auto& qc = std::get<ledger::QuantityChangeEvent>(entry.event);
    return fmt::format("{}  #{:<6} ={:<8} {}/{}  by {}  ({} -> {}: {})",
                       formatTimestamp(qc.changedAt), qc.id, qc.newQuantity, qc.category,
                       qc.itemName, qc.actorId, qc.oldQuantity, qc.newQuantity, qc.reason);
}

} // namespace tally::tools
