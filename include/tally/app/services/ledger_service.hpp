#pragma once

// LedgerService: the read/write contract consumed by chat and reporting front-ends.
// Every front-end (the admin CLI, bot integrations, the async facade) goes through this
// interface so validation, locking and logging stay in one place.

#include <tally/core/types.h>
#include <tally/ledger/archive_store.h>
#include <tally/ledger/event_store.h>
#include <tally/ledger/ledger_reconstructor.h>
#include <tally/ledger/quantity_redistributor.h>
#include <tally/storage/storage_handle.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tally::app::services {

/**
 * @brief Shared dependencies for ledger services
 */
struct LedgerContext {
    std::shared_ptr<storage::StorageHandle> storage;
    ledger::Clock clock;                          ///< Empty means system_clock::now
    ledger::ArchiveOptions archiveDefaults;       ///< Used when archiveEpoch gets no options
};

// ----------------------------------------------------------------------------
// Requests / responses
// ----------------------------------------------------------------------------

struct AddContributionRequest {
    GuildId guildId{0};
    ActorId actorId{0};
    std::string category;
    std::string itemName;
    std::int64_t quantity{0};
};

struct QuantityOverrideRequest {
    GuildId guildId{0};
    ActorId actorId{0};
    std::string category;
    std::string itemName;
    std::int64_t newQuantity{0};
    std::string reason;
    std::optional<std::string> notes;
};

struct RedistributeRequest {
    GuildId guildId{0};
    ActorId actorId{0};
    std::string category;
    std::string itemName;
    std::int64_t newTotal{0};
    std::string reason{"Quantity redistribution"};
    std::optional<std::string> notes;
};

struct AuditTrailRequest {
    GuildId guildId{0};
    std::optional<std::string> itemName;
    std::optional<std::string> category;
    std::optional<std::size_t> limit; ///< Most recent N entries
};

struct AuditTrailResponse {
    std::vector<ledger::AuditEntry> entries; ///< Ascending; runningBalance is per item
    std::size_t totalMatching{0};            ///< Entries before the limit was applied
};

struct OverrideResponse {
    EventId eventId{0};
    std::int64_t previousQuantity{0}; ///< Replayed stock when the override was recorded
};

// ----------------------------------------------------------------------------
// Service interface
// ----------------------------------------------------------------------------

class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    virtual Result<EventId> addContribution(const AddContributionRequest& req) = 0;
    virtual Result<OverrideResponse> recordQuantityOverride(const QuantityOverrideRequest& req) = 0;
    virtual Result<ledger::RedistributionSummary> redistribute(const RedistributeRequest& req) = 0;

    virtual Result<std::int64_t> currentStock(GuildId guildId, const std::string& itemName,
                                              const std::string& category) = 0;
    virtual Result<std::vector<ledger::StockLevel>> stockLevels(GuildId guildId) = 0;
    virtual Result<std::vector<ledger::BalancePoint>> stockHistory(GuildId guildId,
                                                                   const ledger::ItemKey& key) = 0;
    virtual Result<AuditTrailResponse> auditTrail(const AuditTrailRequest& req) = 0;
    virtual Result<std::vector<ledger::QuantityChangeEvent>>
    quantityChangeHistory(GuildId guildId, const std::string& itemName,
                          const std::optional<std::string>& category) = 0;
    virtual Result<std::optional<ledger::LedgerEvent>>
    getEvent(ledger::EventKind kind, EventId id, std::optional<GuildId> guildId) = 0;

    virtual Result<std::int64_t>
    archiveEpoch(GuildId guildId, const ledger::ArchiveMetadata& metadata,
                 std::optional<ledger::ArchiveOptions> options = std::nullopt) = 0;
    virtual Result<std::vector<ledger::ArchiveInfo>> listArchives(GuildId guildId) = 0;
    virtual Result<std::optional<ledger::Archive>> getArchive(std::int64_t archiveId) = 0;

    virtual Result<bool> removeEvent(ledger::EventKind kind, EventId id,
                                     std::optional<GuildId> guildId = std::nullopt) = 0;
    virtual Result<ledger::RemovalReport>
    removeEvents(const std::vector<ledger::EventRef>& refs,
                 std::optional<GuildId> guildId = std::nullopt) = 0;
};

/**
 * @brief Construct the ledger service; nullptr when ctx.storage is missing
 */
[[nodiscard]] std::shared_ptr<ILedgerService> makeLedgerService(const LedgerContext& ctx);

} // namespace tally::app::services
