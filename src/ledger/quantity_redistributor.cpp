#include <spdlog/spdlog.h>
#include <tally/ledger/quantity_redistributor.h>

#include <algorithm>

namespace tally::ledger {

using storage::Database;
using storage::Statement;

std::int64_t RedistributionPlan::resultingTotal() const {
    std::int64_t total = 0;
    for (const auto& change : changes)
        total += change.newQuantity;
    return total;
}

QuantityRedistributor::QuantityRedistributor(storage::StorageHandle& storage,
                                             ItemLockTable& locks, Clock clock)
    : storage_(storage), locks_(locks), clock_(std::move(clock)) {}

Result<RedistributionPlan> QuantityRedistributor::plan(const std::vector<ContributionEvent>& records,
                                                       std::int64_t newTotal) {
    if (newTotal < 0 || newTotal > kMaxQuantity) {
        return Error{ErrorCode::InvalidQuantity, "New total must be between 0 and " +
                                                     std::to_string(kMaxQuantity) + ", got " +
                                                     std::to_string(newTotal)};
    }

    RedistributionPlan plan;
    plan.newTotal = newTotal;
    for (const auto& record : records) {
        if (record.quantity < 0) {
            return Error{ErrorCode::InvalidData,
                         "Contribution " + std::to_string(record.id) + " has negative quantity"};
        }
        plan.currentTotal += record.quantity;
    }
    if (records.empty())
        return plan;

    plan.changes.reserve(records.size());

    if (newTotal == 0) {
        for (const auto& record : records)
            plan.changes.push_back({record.id, record.quantity, 0});
        return plan;
    }

    if (plan.currentTotal == 0) {
        plan.changes.push_back({records.front().id, records.front().quantity, newTotal});
        for (std::size_t i = 1; i < records.size(); ++i)
            plan.changes.push_back({records[i].id, records[i].quantity, 0});
        return plan;
    }

    // Both factors are bounded by kMaxQuantity, so the product fits in 64 bits.
    std::int64_t assigned = 0;
    const std::size_t last = records.size() - 1;
    for (std::size_t i = 0; i < last; ++i) {
        std::int64_t share = newTotal * records[i].quantity / plan.currentTotal;
        assigned += share;
        plan.changes.push_back({records[i].id, records[i].quantity, share});
    }
    plan.changes.push_back(
        {records[last].id, records[last].quantity, std::max<std::int64_t>(0, newTotal - assigned)});
    return plan;
}

Result<RedistributionSummary> QuantityRedistributor::applyIn(Database& db,
                                                             const RedistributionRequest& request,
                                                             TimePoint at) {
    auto records = EventStore::contributionsForIn(db, request.guildId, request.key);
    if (!records)
        return records.error();

    auto planned = plan(records.value(), request.newTotal);
    if (!planned)
        return planned.error();

    const auto& p = planned.value();
    RedistributionSummary summary;
    summary.oldTotal = p.currentTotal;
    summary.newTotal = p.newTotal;
    if (p.empty())
        return summary;

    auto updateResult = db.prepare("UPDATE contributions SET quantity = ? WHERE id = ?");
    if (!updateResult)
        return updateResult.error();
    auto deleteResult = db.prepare("DELETE FROM contributions WHERE id = ?");
    if (!deleteResult)
        return deleteResult.error();

    Statement update = std::move(updateResult).value();
    Statement remove = std::move(deleteResult).value();

    for (const auto& change : p.changes) {
        Statement& stmt = change.deletes() ? remove : update;
        auto resetResult = stmt.reset();
        if (!resetResult)
            return resetResult.error();

        Result<void> bindResult = change.deletes() ? stmt.bind(1, change.id)
                                                   : stmt.bindAll(change.newQuantity, change.id);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        if (change.deletes())
            ++summary.recordsDeleted;
        else
            ++summary.recordsUpdated;
    }

    NewQuantityChange correction;
    correction.guildId = request.guildId;
    correction.actorId = request.actorId;
    correction.key = request.key;
    correction.oldQuantity = p.currentTotal;
    correction.newQuantity = p.newTotal;
    correction.reason = request.reason;
    correction.notes = request.notes;

    auto correctionId = EventStore::appendQuantityChangeIn(db, correction, at);
    if (!correctionId)
        return correctionId.error();

    summary.applied = true;
    summary.correctionEventId = correctionId.value();
    return summary;
}

Result<RedistributionSummary>
QuantityRedistributor::redistribute(const RedistributionRequest& request) {
    NewQuantityChange shape;
    shape.key = request.key;
    shape.newQuantity = request.newTotal;
    shape.reason = request.reason;
    auto valid = EventStore::validate(shape);
    if (!valid)
        return valid.error();

    auto guard = locks_.lock(request.guildId, request.key);
    auto at = clock_ ? clock_() : std::chrono::system_clock::now();

    auto result = storage_.transaction([&](Database& db) -> Result<RedistributionSummary> {
        return applyIn(db, request, at);
    });
    if (!result) {
        spdlog::error("Failed to redistribute {}/{} in guild {}: {}", request.key.category,
                      request.key.itemName, request.guildId, result.error().message);
        return result;
    }

    const auto& summary = result.value();
    if (summary.applied) {
        spdlog::info("Redistributed {}/{} in guild {} from {} to {} ({} updated, {} deleted)",
                     request.key.category, request.key.itemName, request.guildId,
                     summary.oldTotal, summary.newTotal, summary.recordsUpdated,
                     summary.recordsDeleted);
    } else {
        spdlog::debug("Nothing to redistribute for {}/{} in guild {}", request.key.category,
                      request.key.itemName, request.guildId);
    }
    return result;
}

} // namespace tally::ledger
