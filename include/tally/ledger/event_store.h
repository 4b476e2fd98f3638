#pragma once

#include <tally/ledger/events.h>
#include <tally/storage/storage_handle.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tally::ledger {

using Clock = std::function<TimePoint()>;

/**
 * @brief A contribution to be appended
 */
struct NewContribution {
    GuildId guildId = 0;
    ActorId actorId = 0;
    ItemKey key;
    std::int64_t quantity = 0;
};

/**
 * @brief An override to be appended
 */
struct NewQuantityChange {
    GuildId guildId = 0;
    ActorId actorId = 0;
    ItemKey key;
    std::int64_t oldQuantity = 0;
    std::int64_t newQuantity = 0;
    std::string reason;
    std::optional<std::string> notes;
};

/**
 * @brief Aggregate result of a bulk removal
 */
struct RemovalReport {
    std::vector<RemovalOutcome> outcomes;
    std::size_t contributionsRemoved = 0;
    std::size_t quantityChangesRemoved = 0;

    [[nodiscard]] std::size_t totalRemoved() const {
        return contributionsRemoved + quantityChangesRemoved;
    }
};

/**
 * @brief Writer and reader for the two ledger event tables
 *
 * Instance methods each run as one unit of work on the StorageHandle. The static
 * *In(Database&) variants perform the same statements on a connection that is already
 * inside a transaction, so larger operations (redistribution, archival) can compose them
 * atomically.
 */
class EventStore {
public:
    explicit EventStore(storage::StorageHandle& storage, Clock clock = {});

    Result<EventId> appendContribution(const NewContribution& contribution);
    Result<EventId> appendQuantityChange(const NewQuantityChange& change);

    /**
     * @brief Events ordered ascending by (occurred_at, sequence)
     *
     * With a limit, the most recent events are kept; the result is still ascending.
     */
    Result<std::vector<LedgerEvent>> queryEvents(const EventQuery& query);

    /**
     * @brief Contributions for one item key, oldest first
     */
    Result<std::vector<ContributionEvent>> contributionsFor(GuildId guildId, const ItemKey& key);

    /**
     * @brief Overrides for an item name (any category when category is empty), newest first
     */
    Result<std::vector<QuantityChangeEvent>>
    quantityChangeHistory(GuildId guildId, const std::string& itemName,
                          const std::optional<std::string>& category = std::nullopt);

    Result<std::optional<LedgerEvent>> getEvent(EventKind kind, EventId id,
                                                std::optional<GuildId> guildId = std::nullopt);

    /**
     * @brief Delete one event; false when no matching row exists
     */
    Result<bool> deleteEvent(EventKind kind, EventId id,
                             std::optional<GuildId> guildId = std::nullopt);

    /**
     * @brief Delete several events in one transaction, reporting each outcome
     */
    Result<RemovalReport> deleteEvents(const std::vector<EventRef>& refs,
                                       std::optional<GuildId> guildId = std::nullopt);

    [[nodiscard]] TimePoint now() const;

    static Result<void> validate(const NewContribution& contribution);
    static Result<void> validate(const NewQuantityChange& change);

    static Result<EventId> appendContributionIn(storage::Database& db,
                                                const NewContribution& contribution,
                                                TimePoint at);
    static Result<EventId> appendQuantityChangeIn(storage::Database& db,
                                                  const NewQuantityChange& change, TimePoint at);
    static Result<std::vector<LedgerEvent>> queryEventsIn(storage::Database& db,
                                                          const EventQuery& query);
    static Result<std::vector<ContributionEvent>>
    contributionsForIn(storage::Database& db, GuildId guildId, const ItemKey& key);
    static Result<std::vector<ContributionEvent>> allContributionsIn(storage::Database& db,
                                                                     GuildId guildId);
    static Result<std::vector<QuantityChangeEvent>> allQuantityChangesIn(storage::Database& db,
                                                                         GuildId guildId);
    static Result<bool> deleteEventIn(storage::Database& db, EventKind kind, EventId id,
                                      std::optional<GuildId> guildId);

private:
    storage::StorageHandle& storage_;
    Clock clock_;

    static Result<std::int64_t> nextSequence(storage::Database& db);
};

} // namespace tally::ledger
