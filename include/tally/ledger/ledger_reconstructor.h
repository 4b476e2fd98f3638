#pragma once

#include <tally/ledger/events.h>

#include <optional>
#include <vector>

namespace tally::ledger {

/**
 * @brief Balance of one item immediately after an event
 */
struct BalancePoint {
    TimePoint at;
    std::int64_t balance = 0;
    EventKind kind = EventKind::Contribution;
    EventId eventId = 0;
};

/**
 * @brief Current stock of one item key
 */
struct StockLevel {
    ItemKey key;
    std::int64_t quantity = 0;
    TimePoint lastChanged;
};

/**
 * @brief An event together with its item's balance after applying it
 */
struct AuditEntry {
    LedgerEvent event;
    std::int64_t runningBalance = 0;
};

/**
 * @brief Folds ordered ledger events into stock levels
 *
 * Events are replayed in (occurred_at, sequence) order. A contribution adds its quantity;
 * a quantity change sets the balance to its new quantity. oldQuantity never participates.
 * All functions are pure and accept events in any order.
 */
class LedgerReconstructor {
public:
    /**
     * @brief Balance of key after every event up to asOf (inclusive); 0 when none match
     */
    static std::int64_t stockLevel(const std::vector<LedgerEvent>& events, const ItemKey& key,
                                   std::optional<TimePoint> asOf = std::nullopt);

    /**
     * @brief (timestamp, balance) after each event for key, chronological
     */
    static std::vector<BalancePoint> runningBalance(const std::vector<LedgerEvent>& events,
                                                    const ItemKey& key);

    /**
     * @brief Final balance of every item key present in events
     *
     * Ordered by category then item name. Items whose balance is zero are omitted unless
     * includeEmpty is set.
     */
    static std::vector<StockLevel> stockLevels(const std::vector<LedgerEvent>& events,
                                               bool includeEmpty = false);

    /**
     * @brief Every event in chronological order, annotated with its own item's balance
     */
    static std::vector<AuditEntry> annotate(const std::vector<LedgerEvent>& events);

    /**
     * @brief Apply one event to a running balance
     */
    static std::int64_t apply(std::int64_t balance, const LedgerEvent& event);

private:
    static std::vector<const LedgerEvent*> ordered(const std::vector<LedgerEvent>& events,
                                                   const ItemKey* key,
                                                   std::optional<TimePoint> asOf);
};

} // namespace tally::ledger
