#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bxfer {
namespace utils {

// Hands out one mutex per key, entries live only while a lock is held or awaited
class KeyedMutex {
private:
  struct Entry {
    std::mutex mutex;
    std::size_t users = 0;
  };

public:
  // Releases the key lock when destroyed
  class Guard {
  public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

    const std::string& key() const { return key_; }

  private:
    friend class KeyedMutex;
    Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Entry> entry);

    KeyedMutex* owner_;
    std::string key_;
    std::shared_ptr<Entry> entry_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex&) = delete;
  KeyedMutex& operator=(const KeyedMutex&) = delete;

  // Blocks until the key is free
  Guard lock(const std::string& key);

  // Number of keys currently locked or awaited
  std::size_t size() const;

private:
  void release(const std::string& key);

  mutable std::mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace utils
} // namespace bxfer
