#include <tally/tools/command.h>

namespace tally::tools {

class ContributeCommand : public Command {
public:
    ContributeCommand() : Command("contribute", "Record a contribution of an item") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-a,--actor", actor_, "Member making the contribution")->required();
        cmd->add_option("--category", category_, "Item category")->required();
        cmd->add_option("-i,--item", item_, "Item name")->required();
        cmd->add_option("-n,--quantity", quantity_, "Number of units contributed")->required();
        addCommonOptions(*cmd);
    }

    int execute() override {
        auto service = openService();
        if (!service)
            return 1;

        app::services::AddContributionRequest req;
        req.guildId = guild();
        req.actorId = actor_;
        req.category = category_;
        req.itemName = item_;
        req.quantity = quantity_;

        auto id = service->addContribution(req);
        if (!id)
            return fail("Failed to record contribution", id.error());

        auto stock = service->currentStock(guild(), item_, category_);
        if (!stock)
            return fail("Contribution recorded but stock lookup failed", stock.error());

        if (wantsJson()) {
            printJson({{"event_id", id.value()}, {"current_stock", stock.value()}});
        } else {
            log("Recorded contribution #" + std::to_string(id.value()) + ": " +
                std::to_string(quantity_) + " x " + category_ + "/" + item_ + " (now " +
                std::to_string(stock.value()) + ")");
        }
        return 0;
    }

private:
    ActorId actor_ = 0;
    std::string category_;
    std::string item_;
    std::int64_t quantity_ = 0;
};

std::unique_ptr<Command> createContributeCommand() {
    return std::make_unique<ContributeCommand>();
}

} // namespace tally::tools
