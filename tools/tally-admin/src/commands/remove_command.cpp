#include <tally/tools/command.h>
#include <tally/tools/json_output.h>

#include <vector>

namespace tally::tools {

class RemoveCommand : public Command {
public:
    RemoveCommand() : Command("remove", "Remove ledger events by id") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-k,--kind", kind_, "Event kind: contribution or quantity_change")
            ->required()
            ->check(CLI::IsMember({"contribution", "quantity_change"}));
        cmd->add_option("ids", ids_, "Event ids to remove")->required();
        addCommonOptions(*cmd);
    }

    int execute() override {
        auto kind = ledger::parseEventKind(kind_);
        if (!kind) {
            logError("Unknown event kind: " + kind_);
            return 2;
        }

        auto service = openService();
        if (!service)
            return 1;

        if (ids_.size() == 1) {
            auto removed = service->removeEvent(*kind, ids_.front(), guild());
            if (!removed)
                return fail("Removal failed", removed.error());
            if (wantsJson()) {
                printJson({{"removed", removed.value()}});
            } else if (removed.value()) {
                log("Removed " + kind_ + " #" + std::to_string(ids_.front()));
            } else {
                log("No " + kind_ + " #" + std::to_string(ids_.front()) + " in this guild");
            }
            return removed.value() ? 0 : 3;
        }

        std::vector<ledger::EventRef> refs;
        refs.reserve(ids_.size());
        for (auto id : ids_)
            refs.push_back({*kind, id});

        auto report = service->removeEvents(refs, guild());
        if (!report)
            return fail("Removal failed", report.error());

        if (wantsJson()) {
            printJson(toJson(report.value()));
        } else {
            log("Removed " + std::to_string(report.value().totalRemoved()) + " of " +
                std::to_string(refs.size()) + " entries");
            for (const auto& outcome : report.value().outcomes) {
                if (!outcome.removed)
                    logError("  " + outcome.error);
            }
        }
        return report.value().totalRemoved() == refs.size() ? 0 : 3;
    }

private:
    std::string kind_;
    std::vector<EventId> ids_;
};

std::unique_ptr<Command> createRemoveCommand() {
    return std::make_unique<RemoveCommand>();
}

} // namespace tally::tools
