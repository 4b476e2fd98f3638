#include <spdlog/spdlog.h>
#include <tally/app/services/ledger_service.hpp>
#include <tally/ledger/item_lock_table.h>

namespace tally::app::services {

using ledger::EventQuery;
using ledger::ItemKey;
using ledger::LedgerReconstructor;
using storage::Database;

namespace {

class LedgerServiceImpl final : public ILedgerService {
public:
    explicit LedgerServiceImpl(const LedgerContext& ctx)
        : storage_(ctx.storage), clock_(ctx.clock), archiveDefaults_(ctx.archiveDefaults),
          events_(*storage_, clock_), redistributor_(*storage_, locks_, clock_),
          archives_(*storage_, clock_) {}

    Result<EventId> addContribution(const AddContributionRequest& req) override {
        ledger::NewContribution contribution{req.guildId, req.actorId,
                                             ItemKey{req.category, req.itemName}, req.quantity};
        auto valid = ledger::EventStore::validate(contribution);
        if (!valid)
            return valid.error();

        auto guard = locks_.lock(req.guildId, contribution.key);
        return events_.appendContribution(contribution);
    }

    Result<OverrideResponse> recordQuantityOverride(const QuantityOverrideRequest& req) override {
        ledger::NewQuantityChange change;
        change.guildId = req.guildId;
        change.actorId = req.actorId;
        change.key = ItemKey{req.category, req.itemName};
        change.newQuantity = req.newQuantity;
        change.reason = req.reason;
        change.notes = req.notes;

        auto valid = ledger::EventStore::validate(change);
        if (!valid)
            return valid.error();

        auto guard = locks_.lock(req.guildId, change.key);
        const auto at = events_.now();

        auto result = storage_->transaction([&](Database& db) -> Result<OverrideResponse> {
            auto history = ledger::EventStore::queryEventsIn(db, keyQuery(req.guildId, change.key));
            if (!history)
                return history.error();

            ledger::NewQuantityChange stamped = change;
            stamped.oldQuantity = LedgerReconstructor::stockLevel(history.value(), change.key);

            auto id = ledger::EventStore::appendQuantityChangeIn(db, stamped, at);
            if (!id)
                return id.error();
            return OverrideResponse{id.value(), stamped.oldQuantity};
        });

        if (result) {
            spdlog::info("Set {}/{} in guild {} from {} to {} ({})", req.category, req.itemName,
                         req.guildId, result.value().previousQuantity, req.newQuantity,
                         req.reason);
        }
        return result;
    }

    Result<ledger::RedistributionSummary> redistribute(const RedistributeRequest& req) override {
        ledger::RedistributionRequest request;
        request.guildId = req.guildId;
        request.actorId = req.actorId;
        request.key = ItemKey{req.category, req.itemName};
        request.newTotal = req.newTotal;
        request.reason = req.reason;
        request.notes = req.notes;
        return redistributor_.redistribute(request);
    }

    Result<std::int64_t> currentStock(GuildId guildId, const std::string& itemName,
                                      const std::string& category) override {
        ItemKey key{category, itemName};
        auto events = events_.queryEvents(keyQuery(guildId, key));
        if (!events)
            return events.error();
        return LedgerReconstructor::stockLevel(events.value(), key);
    }

    Result<std::vector<ledger::StockLevel>> stockLevels(GuildId guildId) override {
        EventQuery query;
        query.guildId = guildId;
        auto events = events_.queryEvents(query);
        if (!events)
            return events.error();
        return LedgerReconstructor::stockLevels(events.value());
    }

    Result<std::vector<ledger::BalancePoint>> stockHistory(GuildId guildId,
                                                           const ItemKey& key) override {
        auto events = events_.queryEvents(keyQuery(guildId, key));
        if (!events)
            return events.error();
        return LedgerReconstructor::runningBalance(events.value(), key);
    }

    Result<AuditTrailResponse> auditTrail(const AuditTrailRequest& req) override {
        // Running balances need the full history of each item, so the limit is applied
        // after annotation rather than in SQL.
        EventQuery query;
        query.guildId = req.guildId;
        query.itemName = req.itemName;
        query.category = req.category;
        auto events = events_.queryEvents(query);
        if (!events)
            return events.error();

        AuditTrailResponse response;
        response.entries = LedgerReconstructor::annotate(events.value());
        response.totalMatching = response.entries.size();
        if (req.limit && response.entries.size() > *req.limit) {
            auto drop = static_cast<std::ptrdiff_t>(response.entries.size() - *req.limit);
            response.entries.erase(response.entries.begin(), response.entries.begin() + drop);
        }
        return response;
    }

    Result<std::vector<ledger::QuantityChangeEvent>>
    quantityChangeHistory(GuildId guildId, const std::string& itemName,
                          const std::optional<std::string>& category) override {
        return events_.quantityChangeHistory(guildId, itemName, category);
    }

    Result<std::optional<ledger::LedgerEvent>> getEvent(ledger::EventKind kind, EventId id,
                                                        std::optional<GuildId> guildId) override {
        return events_.getEvent(kind, id, guildId);
    }

    Result<std::int64_t> archiveEpoch(GuildId guildId, const ledger::ArchiveMetadata& metadata,
                                      std::optional<ledger::ArchiveOptions> options) override {
        return archives_.createArchive(guildId, metadata, options.value_or(archiveDefaults_));
    }

    Result<std::vector<ledger::ArchiveInfo>> listArchives(GuildId guildId) override {
        return archives_.listArchives(guildId);
    }

    Result<std::optional<ledger::Archive>> getArchive(std::int64_t archiveId) override {
        return archives_.getArchive(archiveId);
    }

    Result<bool> removeEvent(ledger::EventKind kind, EventId id,
                             std::optional<GuildId> guildId) override {
        return events_.deleteEvent(kind, id, guildId);
    }

    Result<ledger::RemovalReport> removeEvents(const std::vector<ledger::EventRef>& refs,
                                               std::optional<GuildId> guildId) override {
        return events_.deleteEvents(refs, guildId);
    }

private:
    std::shared_ptr<storage::StorageHandle> storage_;
    ledger::Clock clock_;
    ledger::ArchiveOptions archiveDefaults_;
    ledger::ItemLockTable locks_;
    ledger::EventStore events_;
    ledger::QuantityRedistributor redistributor_;
    ledger::ArchiveStore archives_;

    static EventQuery keyQuery(GuildId guildId, const ItemKey& key) {
        EventQuery query;
        query.guildId = guildId;
        query.itemName = key.itemName;
        query.category = key.category;
        return query;
    }
};

} // namespace

std::shared_ptr<ILedgerService> makeLedgerService(const LedgerContext& ctx) {
    if (!ctx.storage) {
        spdlog::warn("makeLedgerService: no storage handle supplied");
        return nullptr;
    }
    return std::make_shared<LedgerServiceImpl>(ctx);
}

} // namespace tally::app::services
