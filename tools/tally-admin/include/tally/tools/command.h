#pragma once

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <tally/app/services/ledger_service.hpp>
#include <tally/core/types.h>

#include <iostream>
#include <memory>
#include <string>

namespace tally::tools {

/**
 * Base class for all tally-admin subcommands
 *
 * Provides the shared --db/--config/--json/--guild options and the ledger service
 * construction every command needs.
 */
class Command {
public:
    Command(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    virtual ~Command() = default;

    // Setup command-specific options
    virtual void setupOptions(CLI::App& app) = 0;

    // Execute the command; returns the process exit code
    virtual int execute() = 0;

    const std::string& getName() const { return name_; }
    const std::string& getDescription() const { return description_; }

    // True once CLI11 selected this subcommand
    bool selected() const { return selected_; }

protected:
    struct CommonOptions {
        std::string dbPath;
        std::string configFile;
        bool json = false;
        bool quiet = false;
        GuildId guildId = 0;
    };

    // Add common options to the subcommand and mark it selected when parsed
    void addCommonOptions(CLI::App& sub);

    /**
     * Resolve settings and construct the ledger service; logs and returns nullptr on failure
     */
    std::shared_ptr<app::services::ILedgerService> openService();

    bool wantsJson() const { return options_.json; }
    bool isQuiet() const { return options_.quiet; }
    GuildId guild() const { return options_.guildId; }

    void log(const std::string& message) const {
        if (!isQuiet()) {
            std::cout << message << std::endl;
        }
    }

    void logError(const std::string& message) const {
        std::cerr << "[ERROR] " << message << std::endl;
    }

    // Older ledgers may hold rows with invalid UTF-8; print U+FFFD for those bytes.
    void printJson(const nlohmann::json& j) const {
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

    // Report a failed Result and return the exit code for it
    int fail(const std::string& what, const Error& error) const;

private:
    std::string name_;
    std::string description_;
    CommonOptions options_;
    bool selected_ = false;
    std::shared_ptr<storage::StorageHandle> storage_;
};

// Command factory functions (defined in each command file)
std::unique_ptr<Command> createContributeCommand();
std::unique_ptr<Command> createOverrideCommand();
std::unique_ptr<Command> createRedistributeCommand();
std::unique_ptr<Command> createStockCommand();
std::unique_ptr<Command> createAuditCommand();
std::unique_ptr<Command> createArchiveCommand();
std::unique_ptr<Command> createRemoveCommand();

} // namespace tally::tools
