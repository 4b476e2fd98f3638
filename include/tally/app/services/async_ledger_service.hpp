#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <tally/app/services/ledger_service.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tally::app::services {

/**
 * @brief Coroutine facade over ILedgerService
 *
 * Each call runs the blocking ledger operation on the worker executor and resumes the
 * awaiting coroutine with its Result. Ordering and atomicity are those of the wrapped
 * service.
 */
class AsyncLedgerService {
public:
    AsyncLedgerService(std::shared_ptr<ILedgerService> service,
                       boost::asio::any_io_executor worker);

    boost::asio::awaitable<Result<EventId>> addContribution(AddContributionRequest req);
    boost::asio::awaitable<Result<OverrideResponse>>
    recordQuantityOverride(QuantityOverrideRequest req);
    boost::asio::awaitable<Result<ledger::RedistributionSummary>>
    redistribute(RedistributeRequest req);

    boost::asio::awaitable<Result<std::int64_t>> currentStock(GuildId guildId, std::string itemName,
                                                              std::string category);
    boost::asio::awaitable<Result<std::vector<ledger::StockLevel>>> stockLevels(GuildId guildId);
    boost::asio::awaitable<Result<std::vector<ledger::BalancePoint>>>
    stockHistory(GuildId guildId, ledger::ItemKey key);
    boost::asio::awaitable<Result<AuditTrailResponse>> auditTrail(AuditTrailRequest req);
    boost::asio::awaitable<Result<std::vector<ledger::QuantityChangeEvent>>>
    quantityChangeHistory(GuildId guildId, std::string itemName,
                          std::optional<std::string> category);
    boost::asio::awaitable<Result<std::optional<ledger::LedgerEvent>>>
    getEvent(ledger::EventKind kind, EventId id, std::optional<GuildId> guildId = std::nullopt);

    boost::asio::awaitable<Result<std::int64_t>>
    archiveEpoch(GuildId guildId, ledger::ArchiveMetadata metadata,
                 std::optional<ledger::ArchiveOptions> options = std::nullopt);
    boost::asio::awaitable<Result<std::vector<ledger::ArchiveInfo>>> listArchives(GuildId guildId);
    boost::asio::awaitable<Result<std::optional<ledger::Archive>>> getArchive(std::int64_t archiveId);

    boost::asio::awaitable<Result<bool>> removeEvent(ledger::EventKind kind, EventId id,
                                                     std::optional<GuildId> guildId = std::nullopt);
    boost::asio::awaitable<Result<ledger::RemovalReport>>
    removeEvents(std::vector<ledger::EventRef> refs, std::optional<GuildId> guildId = std::nullopt);

    [[nodiscard]] const std::shared_ptr<ILedgerService>& service() const { return service_; }

private:
    std::shared_ptr<ILedgerService> service_;
    boost::asio::any_io_executor worker_;
};

} // namespace tally::app::services
