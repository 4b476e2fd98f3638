#pragma once

#include <tally/ledger/event_store.h>

#include <optional>
#include <string>
#include <vector>

namespace tally::ledger {

/**
 * @brief Caller-supplied description of an epoch archive
 */
struct ArchiveMetadata {
    std::string name;
    std::string description;
    std::optional<std::string> notes;
    ActorId createdBy = 0;
};

struct ArchiveOptions {
    /// Also snapshot and clear the guild's quantity changes (contributions always are)
    bool includeOverrides = false;
};

/**
 * @brief Stored archive row without its payload
 */
struct ArchiveInfo {
    std::int64_t id = 0;
    GuildId guildId = 0;
    std::string name;
    std::string description;
    std::optional<std::string> notes;
    std::int64_t contributionCount = 0;
    std::int64_t quantityChangeCount = 0;
    TimePoint createdAt;
    ActorId createdBy = 0;
};

/**
 * @brief Live rows captured by an archive
 */
struct ArchiveSnapshot {
    TimePoint archivedAt;
    std::vector<ContributionEvent> contributions;
    std::vector<QuantityChangeEvent> quantityChanges;
};

struct Archive {
    ArchiveInfo info;
    ArchiveSnapshot snapshot;
};

/**
 * @brief Epoch archival: snapshot a guild's live ledger rows to JSON and clear them
 */
class ArchiveStore {
public:
    explicit ArchiveStore(storage::StorageHandle& storage, Clock clock = {});

    /**
     * @brief Snapshot, insert the archive row and delete the archived rows atomically
     * @return id of the new archive
     */
    Result<std::int64_t> createArchive(GuildId guildId, const ArchiveMetadata& metadata,
                                       const ArchiveOptions& options = {});

    /**
     * @brief Archives of a guild, newest first
     */
    Result<std::vector<ArchiveInfo>> listArchives(GuildId guildId);

    Result<std::optional<Archive>> getArchive(std::int64_t archiveId);

    static std::string serializeSnapshot(const ArchiveSnapshot& snapshot);
    static Result<ArchiveSnapshot> parseSnapshot(const std::string& json);

private:
    storage::StorageHandle& storage_;
    Clock clock_;
};

} // namespace tally::ledger
