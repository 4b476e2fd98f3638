#include <tally/tools/command.h>
#include <tally/tools/json_output.h>

namespace tally::tools {

class ArchiveCommand : public Command {
public:
    ArchiveCommand()
        : Command("archive", "Snapshot and clear a guild's contributions, or inspect archives") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--name", name_, "Archive name");
        cmd->add_option("--description", description_, "Archive description");
        cmd->add_option("--notes", notes_, "Additional notes");
        cmd->add_option("-a,--actor", actor_, "Administrator creating the archive");
        cmd->add_flag("--include-overrides", includeOverrides_,
                      "Also snapshot and clear quantity changes");
        cmd->add_flag("--list", list_, "List existing archives");
        cmd->add_option("--show", showId_, "Show one archive by id");
        addCommonOptions(*cmd);
    }

    int execute() override {
        if (!list_ && showId_ == 0 && name_.empty()) {
            logError("--name is required to create an archive");
            return 2;
        }

        auto service = openService();
        if (!service)
            return 1;

        if (list_)
            return listArchives(*service);
        if (showId_ != 0)
            return showArchive(*service);

        ledger::ArchiveMetadata metadata;
        metadata.name = name_;
        metadata.description = description_;
        if (!notes_.empty())
            metadata.notes = notes_;
        metadata.createdBy = actor_;

        std::optional<ledger::ArchiveOptions> options;
        if (includeOverrides_)
            options = ledger::ArchiveOptions{true};

        auto id = service->archiveEpoch(guild(), metadata, options);
        if (!id)
            return fail("Archive failed", id.error());

        if (wantsJson()) {
            printJson({{"archive_id", id.value()}});
        } else {
            log("Created archive '" + name_ + "' (ID: " + std::to_string(id.value()) + ")");
        }
        return 0;
    }

private:
    std::string name_;
    std::string description_;
    std::string notes_;
    ActorId actor_ = 0;
    bool includeOverrides_ = false;
    bool list_ = false;
    std::int64_t showId_ = 0;

    int listArchives(app::services::ILedgerService& service) {
        auto archives = service.listArchives(guild());
        if (!archives)
            return fail("Archive listing failed", archives.error());

        if (wantsJson()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& info : archives.value())
                out.push_back(toJson(info));
            printJson(out);
            return 0;
        }
        if (archives.value().empty()) {
            log("No archives");
            return 0;
        }
        for (const auto& info : archives.value()) {
            log("#" + std::to_string(info.id) + "  " + formatTimestamp(info.createdAt) + "  " +
                info.name + "  (" + std::to_string(info.contributionCount) + " contributions, " +
                std::to_string(info.quantityChangeCount) + " quantity changes)");
        }
        return 0;
    }

    int showArchive(app::services::ILedgerService& service) {
        auto archive = service.getArchive(showId_);
        if (!archive)
            return fail("Archive lookup failed", archive.error());
        if (!archive.value() || archive.value()->info.guildId != guild()) {
            return fail("Archive lookup failed",
                        Error{ErrorCode::NotFound, "No archive with ID " + std::to_string(showId_)});
        }

        const auto& a = *archive.value();
        nlohmann::json contributions = nlohmann::json::array();
        for (const auto& c : a.snapshot.contributions)
            contributions.push_back(toJson(ledger::LedgerEvent{c}));
        nlohmann::json changes = nlohmann::json::array();
        for (const auto& qc : a.snapshot.quantityChanges)
            changes.push_back(toJson(ledger::LedgerEvent{qc}));

        nlohmann::json out = toJson(a.info);
        out["contributions"] = contributions;
        out["quantity_changes"] = changes;
        printJson(out);
        return 0;
    }
};

std::unique_ptr<Command> createArchiveCommand() {
    return std::make_unique<ArchiveCommand>();
}

} // namespace tally::tools
