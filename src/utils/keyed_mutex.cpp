#include "utils/keyed_mutex.hpp"

namespace bxfer {
namespace utils {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Entry> entry)
  : owner_(owner)
  , key_(std::move(key))
  , entry_(std::move(entry)) {
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
  : owner_(other.owner_)
  , key_(std::move(other.key_))
  , entry_(std::move(other.entry_)) {
  other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
  if (owner_ && entry_) {
    entry_->mutex.unlock();
    owner_->release(key_);
  }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    ++slot->users;
    entry = slot;
  }

  // Wait for the key outside the map lock
  entry->mutex.lock();
  return Guard(this, key, std::move(entry));
}

void KeyedMutex::release(const std::string& key) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end() && --it->second->users == 0) {
    entries_.erase(it);
  }
}

std::size_t KeyedMutex::size() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return entries_.size();
}

} // namespace utils
} // namespace bxfer
