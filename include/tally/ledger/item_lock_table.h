#pragma once

#include <tally/ledger/events.h>

#include <map>
#include <mutex>
#include <tuple>

namespace tally::ledger {

/**
 * @brief In-process mutual exclusion keyed by (guild, category, item)
 *
 * Entries exist only while held or awaited; the last release removes the entry.
 */
class ItemLockTable {
    struct Entry {
        std::mutex mutex;
        std::size_t users = 0;
    };
    using Key = std::tuple<GuildId, std::string, std::string>;

public:
    /**
     * @brief RAII holder of one item-key lock
     */
    class Guard {
    public:
        Guard() = default;
        ~Guard() { release(); }

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        [[nodiscard]] bool ownsLock() const { return table_ != nullptr; }
        void release();

    private:
        friend class ItemLockTable;
        Guard(ItemLockTable* table, std::map<Key, Entry>::iterator entry)
            : table_(table), entry_(entry) {}

        ItemLockTable* table_ = nullptr;
        std::map<Key, Entry>::iterator entry_;
    };

    ItemLockTable() = default;
    ItemLockTable(const ItemLockTable&) = delete;
    ItemLockTable& operator=(const ItemLockTable&) = delete;

    /**
     * @brief Block until the lock for (guild, key) is held
     */
    Guard lock(GuildId guildId, const ItemKey& key);

    /**
     * @brief Number of keys currently held or awaited
     */
    [[nodiscard]] std::size_t activeKeys() const;

private:
    mutable std::mutex tableMutex_;
    std::map<Key, Entry> entries_;

    void unlock(std::map<Key, Entry>::iterator entry);
};

} // namespace tally::ledger
