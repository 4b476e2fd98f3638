#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <tally/app/services/async_ledger_service.hpp>

#include <optional>

namespace tally::app::services {

namespace {

// Result<T> has no default constructor, so the worker coroutine returns void and hands
// the value back through a shared slot.
template <typename T, typename Fn>
boost::asio::awaitable<Result<T>> runOn(boost::asio::any_io_executor worker, Fn fn) {
    auto slot = std::make_shared<std::optional<Result<T>>>();
    co_await boost::asio::co_spawn(
        worker,
        [slot, fn = std::move(fn)]() mutable -> boost::asio::awaitable<void> {
            slot->emplace(fn());
            co_return;
        },
        boost::asio::use_awaitable);
    if (!slot->has_value()) {
        co_return Result<T>(Error{ErrorCode::InternalError, "Ledger operation produced no result"});
    }
    co_return std::move(**slot);
}

} // namespace

AsyncLedgerService::AsyncLedgerService(std::shared_ptr<ILedgerService> service,
                                       boost::asio::any_io_executor worker)
    : service_(std::move(service)), worker_(std::move(worker)) {}

boost::asio::awaitable<Result<EventId>>
AsyncLedgerService::addContribution(AddContributionRequest req) {
    auto svc = service_;
    co_return co_await runOn<EventId>(
        worker_, [svc, req = std::move(req)]() { return svc->addContribution(req); });
}

boost::asio::awaitable<Result<OverrideResponse>>
AsyncLedgerService::recordQuantityOverride(QuantityOverrideRequest req) {
    auto svc = service_;
    co_return co_await runOn<OverrideResponse>(
        worker_, [svc, req = std::move(req)]() { return svc->recordQuantityOverride(req); });
}

boost::asio::awaitable<Result<ledger::RedistributionSummary>>
AsyncLedgerService::redistribute(RedistributeRequest req) {
    auto svc = service_;
    co_return co_await runOn<ledger::RedistributionSummary>(
        worker_, [svc, req = std::move(req)]() { return svc->redistribute(req); });
}

boost::asio::awaitable<Result<std::int64_t>>
AsyncLedgerService::currentStock(GuildId guildId, std::string itemName, std::string category) {
    auto svc = service_;
    co_return co_await runOn<std::int64_t>(
        worker_, [svc, guildId, itemName = std::move(itemName), category = std::move(category)]() {
            return svc->currentStock(guildId, itemName, category);
        });
}

boost::asio::awaitable<Result<std::vector<ledger::StockLevel>>>
AsyncLedgerService::stockLevels(GuildId guildId) {
    auto svc = service_;
    co_return co_await runOn<std::vector<ledger::StockLevel>>(
        worker_, [svc, guildId]() { return svc->stockLevels(guildId); });
}

boost::asio::awaitable<Result<std::vector<ledger::BalancePoint>>>
AsyncLedgerService::stockHistory(GuildId guildId, ledger::ItemKey key) {
    auto svc = service_;
    co_return co_await runOn<std::vector<ledger::BalancePoint>>(
        worker_, [svc, guildId, key = std::move(key)]() { return svc->stockHistory(guildId, key); });
}

boost::asio::awaitable<Result<AuditTrailResponse>>
AsyncLedgerService::auditTrail(AuditTrailRequest req) {
    auto svc = service_;
    co_return co_await runOn<AuditTrailResponse>(
        worker_, [svc, req = std::move(req)]() { return svc->auditTrail(req); });
}

boost::asio::awaitable<Result<std::vector<ledger::QuantityChangeEvent>>>
AsyncLedgerService::quantityChangeHistory(GuildId guildId, std::string itemName,
                                          std::optional<std::string> category) {
    auto svc = service_;
    co_return co_await runOn<std::vector<ledger::QuantityChangeEvent>>(
        worker_, [svc, guildId, itemName = std::move(itemName), category = std::move(category)]() {
            return svc->quantityChangeHistory(guildId, itemName, category);
        });
}

boost::asio::awaitable<Result<std::optional<ledger::LedgerEvent>>>
AsyncLedgerService::getEvent(ledger::EventKind kind, EventId id, std::optional<GuildId> guildId) {
    auto svc = service_;
    co_return co_await runOn<std::optional<ledger::LedgerEvent>>(
        worker_, [svc, kind, id, guildId]() { return svc->getEvent(kind, id, guildId); });
}

boost::asio::awaitable<Result<std::int64_t>>
AsyncLedgerService::archiveEpoch(GuildId guildId, ledger::ArchiveMetadata metadata,
                                 std::optional<ledger::ArchiveOptions> options) {
    auto svc = service_;
    co_return co_await runOn<std::int64_t>(
        worker_, [svc, guildId, metadata = std::move(metadata), options]() {
            return svc->archiveEpoch(guildId, metadata, options);
        });
}

boost::asio::awaitable<Result<std::vector<ledger::ArchiveInfo>>>
AsyncLedgerService::listArchives(GuildId guildId) {
    auto svc = service_;
    co_return co_await runOn<std::vector<ledger::ArchiveInfo>>(
        worker_, [svc, guildId]() { return svc->listArchives(guildId); });
}

boost::asio::awaitable<Result<std::optional<ledger::Archive>>>
AsyncLedgerService::getArchive(std::int64_t archiveId) {
    auto svc = service_;
    co_return co_await runOn<std::optional<ledger::Archive>>(
        worker_, [svc, archiveId]() { return svc->getArchive(archiveId); });
}

boost::asio::awaitable<Result<bool>>
AsyncLedgerService::removeEvent(ledger::EventKind kind, EventId id, std::optional<GuildId> guildId) {
    auto svc = service_;
    co_return co_await runOn<bool>(
        worker_, [svc, kind, id, guildId]() { return svc->removeEvent(kind, id, guildId); });
}

boost::asio::awaitable<Result<ledger::RemovalReport>>
AsyncLedgerService::removeEvents(std::vector<ledger::EventRef> refs,
                                 std::optional<GuildId> guildId) {
    auto svc = service_;
    co_return co_await runOn<ledger::RemovalReport>(
        worker_, [svc, refs = std::move(refs), guildId]() { return svc->removeEvents(refs, guildId); });
}

} // namespace tally::app::services
