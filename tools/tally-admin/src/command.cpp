#include <spdlog/spdlog.h>
#include <tally/config/config_helpers.h>
#include <tally/tools/command.h>

#include <filesystem>
#include <system_error>

namespace tally::tools {

void Command::addCommonOptions(CLI::App& sub) {
    sub.add_option("--db", options_.dbPath, "Path to the ledger database (overrides TALLY_DB)");
    sub.add_option("-c,--config", options_.configFile, "Path to configuration file");
    sub.add_option("-g,--guild", options_.guildId, "Guild the command applies to")->required();
    sub.add_flag("--json", options_.json, "Emit machine-readable JSON");
    sub.add_flag("-q,--quiet", options_.quiet, "Suppress all output except errors");
    sub.callback([this]() { selected_ = true; });
}

std::shared_ptr<app::services::ILedgerService> Command::openService() {
    auto settings = config::load_settings(options_.configFile, options_.dbPath);
    if (!settings) {
        logError(settings.error().message);
        return nullptr;
    }

    const auto& storageConfig = settings.value().storage;
    if (storageConfig.path != ":memory:") {
        auto parent = std::filesystem::path(storageConfig.path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                logError("Cannot create data directory " + parent.string() + ": " + ec.message());
                return nullptr;
            }
        }
    }

    spdlog::debug("Using ledger database {}", storageConfig.path);
    storage_ = std::make_shared<storage::StorageHandle>(storageConfig);
    auto connected = storage_->acquire();
    if (!connected) {
        logError("Cannot open ledger database: " + connected.error().message);
        return nullptr;
    }

    app::services::LedgerContext ctx;
    ctx.storage = storage_;
    ctx.archiveDefaults.includeOverrides = settings.value().includeOverridesInArchive;
    return app::services::makeLedgerService(ctx);
}

int Command::fail(const std::string& what, const Error& error) const {
    if (wantsJson()) {
        printJson(nlohmann::json{{"error", errorToString(error.code)}, {"message", error.message}});
    } else {
        logError(what + ": " + error.message);
    }
    switch (error.code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidQuantity:
        case ErrorCode::MissingReason:
            return 2;
        case ErrorCode::NotFound:
            return 3;
        default:
            return 1;
    }
}

} // namespace tally::tools
