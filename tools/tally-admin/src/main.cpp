#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <tally/tools/command.h>

#include <iostream>
#include <memory>
#include <vector>

namespace tally::tools {

class TallyAdmin {
public:
    TallyAdmin() : app_("tally-admin", "Contribution ledger administration") {
        setupApp();
        registerCommands();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        spdlog::set_level(debug_ ? spdlog::level::debug : spdlog::level::warn);

        try {
            for (auto& cmd : commands_) {
                if (cmd->selected()) {
                    return cmd->execute();
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        std::cout << app_.help() << std::endl;
        return 0;
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", "1.0.0");
        app_.require_subcommand(0, 1);

        // Global options
        app_.add_flag("--debug", debug_, "Enable debug logging");
    }

    void registerCommands() {
        registerCommand(createContributeCommand());
        registerCommand(createOverrideCommand());
        registerCommand(createRedistributeCommand());
        registerCommand(createStockCommand());
        registerCommand(createAuditCommand());
        registerCommand(createArchiveCommand());
        registerCommand(createRemoveCommand());
    }

    void registerCommand(std::unique_ptr<Command> cmd) {
        if (!cmd)
            return;
        cmd->setupOptions(app_);
        commands_.push_back(std::move(cmd));
    }

    CLI::App app_;
    std::vector<std::unique_ptr<Command>> commands_;
    bool debug_ = false;
};

} // namespace tally::tools

int main(int argc, char** argv) {
    // stdout carries command output (including --json); diagnostics go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("tally-admin"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    tally::tools::TallyAdmin app;
    return app.run(argc, argv);
}
