#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "store/storage_manager.hpp"
#include "utils/keyed_mutex.hpp"

namespace bxfer {
namespace store {

// Identifies the destination a resumable transfer writes to
struct ResumeKey {
  std::string client_id;
  std::string target_directory;
  std::string file_name;

  // Stable textual form used for hashing and locking
  std::string to_string() const;
};

// Persisted progress of one transfer session
struct ResumeMarker {
  ResumeKey key;
  std::string session_id;
  std::string source_digest;
  uint64_t total_bytes = 0;
  uint32_t total_chunks = 0;
  uint32_t chunk_size = 0;
  // -1 until the first chunk is acknowledged
  int64_t last_acknowledged_index = -1;
  std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
  std::chrono::system_clock::time_point updated_at = std::chrono::system_clock::now();

  // Same source content cut into the same chunks
  bool is_compatible(const std::string& digest, uint32_t chunk_size, uint32_t total_chunks) const;
};

class ResumeStore {
public:
  virtual ~ResumeStore() = default;

  // Throws StoreError if a marker already exists for the key
  virtual void add(const ResumeMarker& marker) = 0;
  virtual std::optional<ResumeMarker> get(const ResumeKey& key) const = 0;
  // Inserts when absent
  virtual void update(const ResumeMarker& marker) = 0;
  // Returns false when no marker existed
  virtual bool remove(const ResumeKey& key) = 0;
};

// One JSON document per key under a content-addressed path:
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}.json
class FileResumeStore : public ResumeStore {
public:
  explicit FileResumeStore(const std::filesystem::path& base_path);

  void add(const ResumeMarker& marker) override;
  std::optional<ResumeMarker> get(const ResumeKey& key) const override;
  void update(const ResumeMarker& marker) override;
  bool remove(const ResumeKey& key) override;

  // Deletes markers not updated within max_age and markers that cannot be read.
  // Returns the number of files removed.
  std::size_t purge_stale(std::chrono::seconds max_age);

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  mutable utils::KeyedMutex key_locks_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const ResumeKey& key) const;
  std::filesystem::path resolve_key_path(const ResumeKey& key) const;


  // ---- SERIALIZATION ----
  // Caller holds the key lock
  void write_marker(const std::filesystem::path& path, const ResumeMarker& marker) const;
  std::optional<ResumeMarker> read_marker(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace bxfer
