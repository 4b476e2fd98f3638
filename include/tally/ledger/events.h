#pragma once

#include <tally/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tally::ledger {

/**
 * @brief Identity of a trackable stock unit
 *
 * Exact-string match on both fields; no case folding or whitespace trimming.
 */
struct ItemKey {
    std::string category;
    std::string itemName;

    bool operator==(const ItemKey& other) const = default;
    bool operator<(const ItemKey& other) const {
        if (category != other.category)
            return category < other.category;
        return itemName < other.itemName;
    }
};

/**
 * @brief A donation of a positive quantity of one item
 */
struct ContributionEvent {
    EventId id = 0;
    GuildId guildId = 0;
    ActorId actorId = 0;
    std::string category;
    std::string itemName;
    std::int64_t quantity = 0;
    TimePoint createdAt;
    std::int64_t sequence = 0; ///< Ledger-wide insertion order
};

/**
 * @brief An absolute override of the aggregate stock of one item
 *
 * oldQuantity is audit metadata only and never feeds reconstruction.
 */
struct QuantityChangeEvent {
    EventId id = 0;
    GuildId guildId = 0;
    ActorId actorId = 0;
    std::string category;
    std::string itemName;
    std::int64_t oldQuantity = 0;
    std::int64_t newQuantity = 0;
    std::string reason;
    std::optional<std::string> notes;
    TimePoint changedAt;
    std::int64_t sequence = 0;
};

using LedgerEvent = std::variant<ContributionEvent, QuantityChangeEvent>;

enum class EventKind { Contribution, QuantityChange };

const char* toString(EventKind kind);
std::optional<EventKind> parseEventKind(std::string_view text);

EventKind kindOf(const LedgerEvent& event);
EventId idOf(const LedgerEvent& event);
TimePoint occurredAt(const LedgerEvent& event);
std::int64_t sequenceOf(const LedgerEvent& event);
ItemKey itemKeyOf(const LedgerEvent& event);

/**
 * @brief Strict UTF-8 check: no overlong forms, surrogates or code points past U+10FFFF
 *
 * Ledger text ends up in JSON (archives, CLI output), which cannot carry other bytes.
 */
bool isValidUtf8(std::string_view text);

/**
 * @brief Strict-weak ordering used for replay: (occurred_at, sequence)
 */
bool chronologicallyBefore(const LedgerEvent& a, const LedgerEvent& b);

/**
 * @brief Filter for event queries
 */
struct EventQuery {
    GuildId guildId = 0;
    std::optional<std::string> itemName;
    std::optional<std::string> category;
    std::optional<TimePoint> asOf;          ///< Inclusive upper bound on occurred_at
    std::optional<std::size_t> limit;       ///< Keep the most recent N events
    bool includeContributions = true;
    bool includeQuantityChanges = true;
};

/**
 * @brief Identifies one stored event for removal
 */
struct EventRef {
    EventKind kind = EventKind::Contribution;
    EventId id = 0;
};

/**
 * @brief Outcome of removing one event in a bulk request
 */
struct RemovalOutcome {
    EventRef ref;
    bool removed = false;
    std::string error;
};

} // namespace tally::ledger
