#include <tally/tools/command.h>
#include <tally/tools/json_output.h>

namespace tally::tools {

class RedistributeCommand : public Command {
public:
    RedistributeCommand()
        : Command("redistribute",
                  "Scale every contribution of an item so they sum to a new total") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-a,--actor", actor_, "Administrator making the change")->required();
        cmd->add_option("--category", category_, "Item category")->required();
        cmd->add_option("-i,--item", item_, "Item name")->required();
        cmd->add_option("-t,--total", total_, "New aggregate total")->required();
        cmd->add_option("-r,--reason", reason_, "Reason recorded on the correction event")
            ->default_val("Quantity redistribution");
        cmd->add_option("--notes", notes_, "Additional notes");
        addCommonOptions(*cmd);
    }

    int execute() override {
        auto service = openService();
        if (!service)
            return 1;

        app::services::RedistributeRequest req;
        req.guildId = guild();
        req.actorId = actor_;
        req.category = category_;
        req.itemName = item_;
        req.newTotal = total_;
        req.reason = reason_;
        if (!notes_.empty())
            req.notes = notes_;

        auto result = service->redistribute(req);
        if (!result)
            return fail("Redistribution failed", result.error());

        const auto& summary = result.value();
        if (wantsJson()) {
            printJson(toJson(summary));
        } else if (!summary.applied) {
            log("No contributions recorded for " + category_ + "/" + item_ + "; nothing to do");
        } else {
            log("Redistributed " + category_ + "/" + item_ + ": " +
                std::to_string(summary.oldTotal) + " -> " + std::to_string(summary.newTotal) +
                " (" + std::to_string(summary.recordsUpdated) + " updated, " +
                std::to_string(summary.recordsDeleted) + " removed)");
        }
        return 0;
    }

private:
    ActorId actor_ = 0;
    std::string category_;
    std::string item_;
    std::int64_t total_ = 0;
    std::string reason_;
    std::string notes_;
};

std::unique_ptr<Command> createRedistributeCommand() {
    return std::make_unique<RedistributeCommand>();
}

} // namespace tally::tools
