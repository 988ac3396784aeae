#include "tus/core/keyed_mutex.hpp"

namespace tus {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, Entry* entry)
    : owner_(owner), key_(std::move(key)), entry_(entry) {}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), entry_(other.entry_) {
    other.owner_ = nullptr;
    other.entry_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (owner_ != nullptr && entry_ != nullptr) {
        owner_->release(key_, entry_);
    }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
    Entry* entry = nullptr;
    {
        std::lock_guard table_lock(table_mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        ++slot->refs;
        entry = slot.get();
    }

    // Wait outside the table lock so other keys stay available
    entry->mutex.lock();
    return Guard(this, key, entry);
}

std::size_t KeyedMutex::size() const {
    std::lock_guard table_lock(table_mutex_);
    return entries_.size();
}

void KeyedMutex::release(const std::string& key, Entry* entry) {
    entry->mutex.unlock();

    std::lock_guard table_lock(table_mutex_);
    if (--entry->refs == 0) {
        entries_.erase(key);
    }
}

} // namespace tus
