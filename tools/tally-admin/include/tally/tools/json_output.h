#pragma once

#include <nlohmann/json.hpp>
#include <tally/app/services/ledger_service.hpp>

#include <string>

namespace tally::tools {

// UTC "YYYY-MM-DD HH:MM:SS"
std::string formatTimestamp(TimePoint tp);

nlohmann::json toJson(const ledger::LedgerEvent& event);
nlohmann::json toJson(const ledger::AuditEntry& entry);
nlohmann::json toJson(const ledger::StockLevel& level);
nlohmann::json toJson(const ledger::RedistributionSummary& summary);
nlohmann::json toJson(const ledger::ArchiveInfo& info);
nlohmann::json toJson(const ledger::RemovalReport& report);

// One human-readable line per audit entry
std::string describe(const ledger::AuditEntry& entry);

} // namespace tally::tools
