#pragma once

#include <tally/ledger/event_store.h>
#include <tally/ledger/item_lock_table.h>

#include <optional>
#include <string>
#include <vector>

namespace tally::ledger {

/**
 * @brief Administrator-declared new aggregate total for one item key
 */
struct RedistributionRequest {
    GuildId guildId = 0;
    ActorId actorId = 0;
    ItemKey key;
    std::int64_t newTotal = 0;
    std::string reason;
    std::optional<std::string> notes;
};

/**
 * @brief New quantity for one underlying contribution; zero means the row is deleted
 */
struct RecordChange {
    EventId id = 0;
    std::int64_t oldQuantity = 0;
    std::int64_t newQuantity = 0;

    [[nodiscard]] bool deletes() const { return newQuantity == 0; }
};

/**
 * @brief Outcome of the arithmetic step, computed without touching storage
 */
struct RedistributionPlan {
    std::int64_t currentTotal = 0;
    std::int64_t newTotal = 0;
    std::vector<RecordChange> changes; ///< One entry per input record, same order

    [[nodiscard]] bool empty() const { return changes.empty(); }
    [[nodiscard]] std::int64_t resultingTotal() const;
};

struct RedistributionSummary {
    bool applied = false; ///< false when the key had no records
    std::int64_t oldTotal = 0;
    std::int64_t newTotal = 0;
    std::size_t recordsUpdated = 0;
    std::size_t recordsDeleted = 0;
    std::optional<EventId> correctionEventId;
};

/**
 * @brief Re-maps a new aggregate total onto the contributions of one item key
 *
 * Records are taken oldest first. With a positive current total every record but the last
 * receives floor(newTotal * qty / currentTotal) and the last absorbs the remainder, so the
 * surviving quantities sum to newTotal exactly. Records that end at zero are deleted. When
 * the current total is zero the first record receives newTotal and the rest are deleted.
 * A correction QuantityChangeEvent (old = current total, new = newTotal) is appended in the
 * same transaction, with the item-key lock held throughout.
 */
class QuantityRedistributor {
public:
    QuantityRedistributor(storage::StorageHandle& storage, ItemLockTable& locks,
                          Clock clock = {});

    Result<RedistributionSummary> redistribute(const RedistributionRequest& request);

    static Result<RedistributionPlan> plan(const std::vector<ContributionEvent>& records,
                                           std::int64_t newTotal);

    /**
     * @brief Read, rewrite and record the correction on a connection inside a transaction
     */
    static Result<RedistributionSummary> applyIn(storage::Database& db,
                                                 const RedistributionRequest& request,
                                                 TimePoint at);

private:
    storage::StorageHandle& storage_;
    ItemLockTable& locks_;
    Clock clock_;
};

} // namespace tally::ledger
