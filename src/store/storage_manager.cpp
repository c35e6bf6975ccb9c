#include "store/storage_manager.hpp"
#include <array>
#include <cmath>
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace bxfer {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StorageManager::StorageManager(const std::filesystem::path& base_path)
  : base_path_(base_path)
  , space_query_([](const std::filesystem::path& path) { return std::filesystem::space(path).available; }) {
  BOOST_LOG_TRIVIAL(info) << "Storage: Initializing storage with base path: " << base_path_.string();
  check_directory_exists(base_path_);
}


//==============================================
// TARGET LAYOUT
//==============================================

std::filesystem::path StorageManager::resolve_target_directory(const std::string& target_directory) const {
  const std::filesystem::path relative(target_directory);
  if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
    BOOST_LOG_TRIVIAL(warning) << "Storage: Rejected absolute target directory: " << target_directory;
    throw StoreError("Target directory must be relative to the storage root");
  }
  for (const auto& component : relative) {
    if (component == "..") {
      BOOST_LOG_TRIVIAL(warning) << "Storage: Rejected target directory escaping the root: " << target_directory;
      throw StoreError("Target directory must not contain parent references");
    }
  }
  return (base_path_ / relative).lexically_normal();
}

std::filesystem::path StorageManager::prepare_target_directory(const std::string& target_directory) {
  auto directory = resolve_target_directory(target_directory);
  try {
    check_directory_exists(directory);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage: Failed to create target directory " << directory.string() << ": " << e.what();
    throw StoreError("Target directory is not accessible");
  }
  if (!std::filesystem::is_directory(directory)) {
    throw StoreError("Target path exists and is not a directory");
  }
  return directory;
}

bool StorageManager::is_valid_file_name(const std::string& file_name) {
  if (file_name.empty() || file_name.size() > 255 || file_name == "." || file_name == "..") {
    return false;
  }
  return file_name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}


//==============================================
// CAPACITY
//==============================================

bool StorageManager::has_space_for(const std::filesystem::path& directory, std::uintmax_t bytes) const {
  const auto required = bytes + static_cast<std::uintmax_t>(std::ceil(static_cast<double>(bytes) * SPACE_BUFFER_RATIO));

  std::uintmax_t available = 0;
  try {
    available = space_query_(directory);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage: Failed to query free space of " << directory.string() << ": " << e.what();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Storage: Space check for " << directory.string() << ": required " << required
                           << " bytes, available " << available << " bytes";
  return available >= required;
}


//==============================================
// FINALIZE
//==============================================

FinalizeOutcome StorageManager::finalize(const std::filesystem::path& directory, const std::string& file_name,
                                         const std::vector<std::filesystem::path>& parts,
                                         const std::string& expected_digest) {
  if (!is_valid_file_name(file_name)) {
    throw StoreError("Invalid target file name");
  }

  auto guard = path_locks_.lock((directory / file_name).lexically_normal().string());
  BOOST_LOG_TRIVIAL(info) << "Storage: Finalizing " << file_name << " from " << parts.size() << " part(s)";

  check_directory_exists(directory);
  const auto temp_path = directory / ("." + file_name + "." +
                                      boost::uuids::to_string(boost::uuids::random_generator()()) + ".part");

  std::string digest;
  try {
    digest = assemble(parts, temp_path);
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw;
  }

  if (!crypto::ChecksumService::digests_equal(digest, expected_digest)) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Storage: Checksum mismatch for " << file_name << ": expected "
                             << expected_digest << ", computed " << digest;
    throw ChecksumMismatchError(digest);
  }

  const auto final_path = unique_target_path(directory, file_name);
  std::error_code ec;
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Storage: Failed to move " << temp_path.string() << " into place: " << ec.message();
    throw StoreError("Failed to move assembled file into place");
  }

  BOOST_LOG_TRIVIAL(info) << "Storage: Finalized " << final_path.string() << " (sha256 " << digest << ")";
  return FinalizeOutcome{final_path, digest};
}

std::string StorageManager::assemble(const std::vector<std::filesystem::path>& parts,
                                     const std::filesystem::path& output) const {
  std::ofstream file(output, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Store: Failed to create file: " + output.string());
  }

  crypto::DigestContext digest;
  std::array<char, 64 * 1024> buffer;
  std::uintmax_t bytes_written = 0;

  for (const auto& part : parts) {
    std::ifstream input(part, std::ios::binary);
    if (!input) {
      throw StoreError("Store: Missing part: " + part.filename().string());
    }
    while (input) {
      input.read(buffer.data(), buffer.size());
      const auto count = input.gcount();
      if (count <= 0) {
        break;
      }
      file.write(buffer.data(), count);
      digest.update(buffer.data(), static_cast<size_t>(count));
      bytes_written += static_cast<std::uintmax_t>(count);
    }
    if (input.bad()) {
      throw StoreError("Store: Failed to read part: " + part.filename().string());
    }
  }

  file.flush();
  if (!file.good()) {
    throw StoreError("Store: Failed to write file: " + output.string());
  }
  file.close();

  BOOST_LOG_TRIVIAL(debug) << "Storage: Assembled " << bytes_written << " bytes into " << output.string();
  return digest.final_hex();
}

std::filesystem::path StorageManager::unique_target_path(const std::filesystem::path& directory,
                                                         const std::string& file_name) const {
  auto candidate = directory / file_name;
  if (!std::filesystem::exists(candidate)) {
    return candidate;
  }

  const std::filesystem::path name(file_name);
  const auto stem = name.stem().string();
  const auto extension = name.extension().string();
  for (int suffix = 1;; ++suffix) {
    candidate = directory / (stem + "_" + std::to_string(suffix) + extension);
    if (!std::filesystem::exists(candidate)) {
      BOOST_LOG_TRIVIAL(info) << "Storage: " << file_name << " exists, using " << candidate.filename().string();
      return candidate;
    }
  }
}

void StorageManager::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace bxfer
