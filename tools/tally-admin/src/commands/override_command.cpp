#include <tally/tools/command.h>

namespace tally::tools {

class OverrideCommand : public Command {
public:
    OverrideCommand() : Command("override", "Set the absolute stock of an item") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("-a,--actor", actor_, "Administrator making the change")->required();
        cmd->add_option("--category", category_, "Item category")->required();
        cmd->add_option("-i,--item", item_, "Item name")->required();
        cmd->add_option("-n,--quantity", quantity_, "New absolute quantity")->required();
        cmd->add_option("-r,--reason", reason_, "Why the stock is being changed")->required();
        cmd->add_option("--notes", notes_, "Additional notes");
        addCommonOptions(*cmd);
    }

    int execute() override {
        auto service = openService();
        if (!service)
            return 1;

        app::services::QuantityOverrideRequest req;
        req.guildId = guild();
        req.actorId = actor_;
        req.category = category_;
        req.itemName = item_;
        req.newQuantity = quantity_;
        req.reason = reason_;
        if (!notes_.empty())
            req.notes = notes_;

        auto result = service->recordQuantityOverride(req);
        if (!result)
            return fail("Failed to record quantity change", result.error());

        const auto& response = result.value();
        if (wantsJson()) {
            printJson({{"event_id", response.eventId},
                       {"old_quantity", response.previousQuantity},
                       {"new_quantity", quantity_}});
        } else {
            log("Set " + category_ + "/" + item_ + " from " +
                std::to_string(response.previousQuantity) + " to " + std::to_string(quantity_) +
                " (change #" + std::to_string(response.eventId) + ")");
        }
        return 0;
    }

private:
    ActorId actor_ = 0;
    std::string category_;
    std::string item_;
    std::int64_t quantity_ = 0;
    std::string reason_;
    std::string notes_;
};

std::unique_ptr<Command> createOverrideCommand() {
    return std::make_unique<OverrideCommand>();
}

} // namespace tally::tools
