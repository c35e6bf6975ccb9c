#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/checksum.hpp"
#include "utils/keyed_mutex.hpp"

namespace bxfer {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Assembled file does not hash to the expected digest
class ChecksumMismatchError : public StoreError {
public:
  explicit ChecksumMismatchError(const std::string& actual_digest)
    : StoreError("Store: Assembled file checksum mismatch")
    , actual_digest_(actual_digest) {}

  const std::string& actual_digest() const { return actual_digest_; }

private:
  std::string actual_digest_;
};

struct FinalizeOutcome {
  std::filesystem::path final_path;
  std::string file_digest;
};

class StorageManager {
public:
  // Returns the bytes available to unprivileged writers below a directory
  using SpaceQuery = std::function<std::uintmax_t(const std::filesystem::path&)>;

  // Free space must exceed the declared size by this fraction
  static constexpr double SPACE_BUFFER_RATIO = 0.10;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StorageManager(const std::filesystem::path& base_path);

  
  // ---- TARGET LAYOUT ----
  // Maps a client supplied directory below the storage root, throws StoreError
  // for absolute paths and parent references
  std::filesystem::path resolve_target_directory(const std::string& target_directory) const;
  // Resolves and creates the directory, throws StoreError if it is not writable
  std::filesystem::path prepare_target_directory(const std::string& target_directory);
  static bool is_valid_file_name(const std::string& file_name);


  // ---- CAPACITY ----
  bool has_space_for(const std::filesystem::path& directory, std::uintmax_t bytes) const;
  void set_space_query(SpaceQuery query) { space_query_ = std::move(query); }


  // ---- FINALIZE ----
  // Concatenates parts into a temporary file in directory, verifies the digest and
  // renames it into place. An existing file is never replaced, a numbered sibling
  // name is used instead. Exclusive per target path.
  // Throws ChecksumMismatchError or StoreError, leaving no partial output behind.
  FinalizeOutcome finalize(const std::filesystem::path& directory, const std::string& file_name,
                           const std::vector<std::filesystem::path>& parts,
                           const std::string& expected_digest);

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  SpaceQuery space_query_;
  utils::KeyedMutex path_locks_;

  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // First of name, name_1, name_2... that does not exist yet
  std::filesystem::path unique_target_path(const std::filesystem::path& directory,
                                           const std::string& file_name) const;
  // Streams parts into output, returns the digest of everything written
  std::string assemble(const std::vector<std::filesystem::path>& parts,
                       const std::filesystem::path& output) const;
};

} // namespace store
} // namespace bxfer
