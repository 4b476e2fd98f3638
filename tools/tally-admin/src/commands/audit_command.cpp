#include <tally/tools/command.h>
#include <tally/tools/json_output.h>

#include <optional>

namespace tally::tools {

class AuditCommand : public Command {
public:
    AuditCommand() : Command("audit", "List ledger events with running balances") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--category", category_, "Only events for this category");
        cmd->add_option("-i,--item", item_, "Only events for this item");
        cmd->add_option("-l,--limit", limit_, "Show only the most recent N events (0 = all)")
            ->default_val(50);
        cmd->add_option("--changes-for", changesFor_,
                        "Show only quantity changes for this item, newest first");
        addCommonOptions(*cmd);
    }

    int execute() override {
        auto service = openService();
        if (!service)
            return 1;

        if (!changesFor_.empty())
            return showChanges(*service);

        app::services::AuditTrailRequest req;
        req.guildId = guild();
        if (!item_.empty())
            req.itemName = item_;
        if (!category_.empty())
            req.category = category_;
        if (limit_ > 0)
            req.limit = limit_;

        auto trail = service->auditTrail(req);
        if (!trail)
            return fail("Audit query failed", trail.error());

        const auto& response = trail.value();
        if (wantsJson()) {
            nlohmann::json entries = nlohmann::json::array();
            for (const auto& entry : response.entries)
                entries.push_back(toJson(entry));
            printJson({{"total_matching", response.totalMatching}, {"entries", entries}});
            return 0;
        }

        if (response.entries.empty()) {
            log("No ledger events found");
            return 0;
        }
        for (const auto& entry : response.entries)
            log(describe(entry));
        if (response.entries.size() < response.totalMatching) {
            log("(" + std::to_string(response.entries.size()) + " of " +
                std::to_string(response.totalMatching) + " events shown)");
        }
        return 0;
    }

private:
    std::string category_;
    std::string item_;
    std::size_t limit_ = 50;
    std::string changesFor_;

    int showChanges(app::services::ILedgerService& service) {
        std::optional<std::string> category;
        if (!category_.empty())
            category = category_;

        auto changes = service.quantityChangeHistory(guild(), changesFor_, category);
        if (!changes)
            return fail("Quantity change lookup failed", changes.error());

        nlohmann::json out = nlohmann::json::array();
        for (const auto& change : changes.value()) {
            if (wantsJson()) {
                out.push_back(toJson(ledger::LedgerEvent{change}));
            } else {
                log(describe(ledger::AuditEntry{change, change.newQuantity}));
            }
        }
        if (wantsJson())
            printJson(out);
        return 0;
    }
};

std::unique_ptr<Command> createAuditCommand() {
    return std::make_unique<AuditCommand>();
}

} // namespace tally::tools
