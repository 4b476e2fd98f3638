#include <tally/tools/command.h>
#include <tally/tools/json_output.h>

#include <spdlog/fmt/fmt.h>

namespace tally::tools {

class StockCommand : public Command {
public:
    StockCommand() : Command("stock", "Show current stock levels reconstructed from the ledger") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--category", category_, "Item category");
        cmd->add_option("-i,--item", item_, "Item name");
        cmd->add_flag("--history", history_, "Show the running balance after every event");
        addCommonOptions(*cmd);
    }

    int execute() override {
        if (category_.empty() != item_.empty()) {
            logError("--category and --item must be given together");
            return 2;
        }

        auto service = openService();
        if (!service)
            return 1;

        if (item_.empty())
            return showAll(*service);
        if (history_)
            return showHistory(*service);

        auto stock = service->currentStock(guild(), item_, category_);
        if (!stock)
            return fail("Stock lookup failed", stock.error());

        if (wantsJson()) {
            printJson({{"category", category_}, {"item_name", item_}, {"quantity", stock.value()}});
        } else {
            log(category_ + "/" + item_ + ": " + std::to_string(stock.value()));
        }
        return 0;
    }

private:
    std::string category_;
    std::string item_;
    bool history_ = false;

    int showAll(app::services::ILedgerService& service) {
        auto levels = service.stockLevels(guild());
        if (!levels)
            return fail("Stock lookup failed", levels.error());

        if (wantsJson()) {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& level : levels.value())
                items.push_back(toJson(level));
            printJson(items);
            return 0;
        }

        if (levels.value().empty()) {
            log("No stock recorded");
            return 0;
        }
        std::string current;
        for (const auto& level : levels.value()) {
            if (level.key.category != current) {
                current = level.key.category;
                log(current + ":");
            }
            log(fmt::format("  {:<32} {:>10}", level.key.itemName, level.quantity));
        }
        return 0;
    }

    int showHistory(app::services::ILedgerService& service) {
        auto series = service.stockHistory(guild(), ledger::ItemKey{category_, item_});
        if (!series)
            return fail("History lookup failed", series.error());

        if (wantsJson()) {
            nlohmann::json points = nlohmann::json::array();
            for (const auto& point : series.value()) {
                points.push_back({{"at", formatTimestamp(point.at)},
                                  {"balance", point.balance},
                                  {"type", ledger::toString(point.kind)},
                                  {"event_id", point.eventId}});
            }
            printJson(points);
            return 0;
        }

        for (const auto& point : series.value()) {
            log(fmt::format("{}  {:<16} #{:<6} {:>10}", formatTimestamp(point.at),
                            ledger::toString(point.kind), point.eventId, point.balance));
        }
        return 0;
    }
};

std::unique_ptr<Command> createStockCommand() {
    return std::make_unique<StockCommand>();
}

} // namespace tally::tools
