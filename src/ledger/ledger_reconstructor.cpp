#include <tally/ledger/ledger_reconstructor.h>

#include <algorithm>
#include <map>

namespace tally::ledger {

std::vector<const LedgerEvent*>
LedgerReconstructor::ordered(const std::vector<LedgerEvent>& events, const ItemKey* key,
                             std::optional<TimePoint> asOf) {
    std::vector<const LedgerEvent*> selected;
    selected.reserve(events.size());
    for (const auto& event : events) {
        if (key && itemKeyOf(event) != *key)
            continue;
        if (asOf && occurredAt(event) > *asOf)
            continue;
        selected.push_back(&event);
    }
    std::stable_sort(selected.begin(), selected.end(),
                     [](const LedgerEvent* a, const LedgerEvent* b) {
                         return chronologicallyBefore(*a, *b);
                     });
    return selected;
}

std::int64_t LedgerReconstructor::apply(std::int64_t balance, const LedgerEvent& event) {
    if (const auto* c = std::get_if<ContributionEvent>(&event))
        return balance + c->quantity;
    return std::get<QuantityChangeEvent>(event).newQuantity;
}

std::int64_t LedgerReconstructor::stockLevel(const std::vector<LedgerEvent>& events,
                                             const ItemKey& key, std::optional<TimePoint> asOf) {
    std::int64_t balance = 0;
    for (const auto* event : ordered(events, &key, asOf))
        balance = apply(balance, *event);
    return balance;
}

std::vector<BalancePoint> LedgerReconstructor::runningBalance(const std::vector<LedgerEvent>& events,
                                                              const ItemKey& key) {
    std::vector<BalancePoint> series;
    std::int64_t balance = 0;
    for (const auto* event : ordered(events, &key, std::nullopt)) {
        balance = apply(balance, *event);
        series.push_back({occurredAt(*event), balance, kindOf(*event), idOf(*event)});
    }
    return series;
}

std::vector<StockLevel> LedgerReconstructor::stockLevels(const std::vector<LedgerEvent>& events,
                                                         bool includeEmpty) {
    std::map<ItemKey, StockLevel> levels;
    for (const auto* event : ordered(events, nullptr, std::nullopt)) {
        auto key = itemKeyOf(*event);
        auto& level = levels[key];
        level.key = std::move(key);
        level.quantity = apply(level.quantity, *event);
        level.lastChanged = occurredAt(*event);
    }

    std::vector<StockLevel> result;
    result.reserve(levels.size());
    for (auto& [key, level] : levels) {
        if (level.quantity == 0 && !includeEmpty)
            continue;
        result.push_back(std::move(level));
    }
    return result;
}

std::vector<AuditEntry> LedgerReconstructor::annotate(const std::vector<LedgerEvent>& events) {
    std::map<ItemKey, std::int64_t> balances;
    std::vector<AuditEntry> entries;
    entries.reserve(events.size());
    for (const auto* event : ordered(events, nullptr, std::nullopt)) {
        auto& balance = balances[itemKeyOf(*event)];
        balance = apply(balance, *event);
        entries.push_back({*event, balance});
    }
    return entries;
}

} // namespace tally::ledger
