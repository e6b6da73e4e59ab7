#include "pfs/protocol/keyed_mutex.hpp"

namespace pfs::protocol {

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_)
    , key_(std::move(other.key_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (owner_) {
        owner_->Release(key_);
    }
}

KeyedMutex::Guard KeyedMutex::Lock(const std::string& key) {
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> guard(entries_lock_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        slot->references += 1;
        entry = slot.get();
    }
    // Entry stays alive: its reference count is non-zero until Release.
    entry->mutex.lock();
    return Guard(this, key);
}

void KeyedMutex::Release(const std::string& key) noexcept {
    std::lock_guard<std::mutex> guard(entries_lock_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    it->second->mutex.unlock();
    it->second->references -= 1;
    if (it->second->references == 0) {
        entries_.erase(it);
    }
}

size_t KeyedMutex::ActiveKeys() const {
    std::lock_guard<std::mutex> guard(entries_lock_);
    return entries_.size();
}

}
