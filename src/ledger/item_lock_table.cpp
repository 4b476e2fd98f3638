#include <tally/ledger/item_lock_table.h>

namespace tally::ledger {

ItemLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), entry_(other.entry_) {
    other.table_ = nullptr;
}

ItemLockTable::Guard& ItemLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        entry_ = other.entry_;
        other.table_ = nullptr;
    }
    return *this;
}

void ItemLockTable::Guard::release() {
    if (table_) {
        table_->unlock(entry_);
        table_ = nullptr;
    }
}

ItemLockTable::Guard ItemLockTable::lock(GuildId guildId, const ItemKey& key) {
    std::map<Key, Entry>::iterator entry;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        entry = entries_.try_emplace(Key{guildId, key.category, key.itemName}).first;
        ++entry->second.users;
    }
    // std::map iterators stay valid while users > 0 keeps the entry alive.
    entry->second.mutex.lock();
    return Guard(this, entry);
}

void ItemLockTable::unlock(std::map<Key, Entry>::iterator entry) {
    entry->second.mutex.unlock();
    std::lock_guard<std::mutex> lock(tableMutex_);
    if (--entry->second.users == 0) {
        entries_.erase(entry);
    }
}

std::size_t ItemLockTable::activeKeys() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return entries_.size();
}

} // namespace tally::ledger
