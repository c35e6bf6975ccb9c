#include "store/resume_store.hpp"
#include "crypto/checksum.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <vector>

namespace bxfer {
namespace store {

namespace {

int64_t to_epoch_seconds(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

std::string ResumeKey::to_string() const {
  // Length prefixes keep ("a:b", "c") and ("a", "b:c") apart
  return std::to_string(client_id.size()) + ":" + client_id + "|" +
         std::to_string(target_directory.size()) + ":" + target_directory + "|" +
         std::to_string(file_name.size()) + ":" + file_name;
}

bool ResumeMarker::is_compatible(const std::string& digest, uint32_t size, uint32_t chunks) const {
  return crypto::ChecksumService::digests_equal(source_digest, digest) &&
         chunk_size == size && total_chunks == chunks;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileResumeStore::FileResumeStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Resume store: Initializing resume store at: " << base_path_.string();
  std::filesystem::create_directories(base_path_);
}


//==============================================
// MARKER OPERATIONS
//==============================================

void FileResumeStore::add(const ResumeMarker& marker) {
  const auto path = resolve_key_path(marker.key);
  auto guard = key_locks_.lock(marker.key.to_string());

  if (std::filesystem::exists(path)) {
    throw StoreError("Resume store: Marker already exists for " + marker.key.file_name);
  }
  write_marker(path, marker);
  BOOST_LOG_TRIVIAL(debug) << "Resume store: Added marker for session " << marker.session_id;
}

std::optional<ResumeMarker> FileResumeStore::get(const ResumeKey& key) const {
  const auto path = resolve_key_path(key);
  auto guard = key_locks_.lock(key.to_string());
  return read_marker(path);
}

void FileResumeStore::update(const ResumeMarker& marker) {
  const auto path = resolve_key_path(marker.key);
  auto guard = key_locks_.lock(marker.key.to_string());

  ResumeMarker updated = marker;
  updated.updated_at = std::chrono::system_clock::now();
  write_marker(path, updated);
  BOOST_LOG_TRIVIAL(trace) << "Resume store: Session " << marker.session_id << " acknowledged through "
                           << marker.last_acknowledged_index;
}

bool FileResumeStore::remove(const ResumeKey& key) {
  const auto path = resolve_key_path(key);
  auto guard = key_locks_.lock(key.to_string());

  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw StoreError("Resume store: Failed to remove marker: " + ec.message());
  }
  if (removed) {
    BOOST_LOG_TRIVIAL(debug) << "Resume store: Removed marker for " << key.file_name;
  }
  return removed;
}

std::size_t FileResumeStore::purge_stale(std::chrono::seconds max_age) {
  const auto cutoff = std::chrono::system_clock::now() - max_age;

  std::vector<std::filesystem::path> markers;
  std::error_code ec;
  for (std::filesystem::recursive_directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == ".json") {
      markers.push_back(it->path());
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Resume store: Failed to scan " << base_path_.string() << ": " << ec.message();
  }

  std::size_t removed = 0;
  for (const auto& path : markers) {
    auto marker = read_marker(path);
    std::error_code remove_ec;
    if (!marker) {
      if (std::filesystem::remove(path, remove_ec)) {
        ++removed;
      }
      continue;
    }

    auto guard = key_locks_.lock(marker->key.to_string());
    // Reread under the key lock
    marker = read_marker(path);
    if (marker && marker->updated_at < cutoff && std::filesystem::remove(path, remove_ec)) {
      ++removed;
      BOOST_LOG_TRIVIAL(debug) << "Resume store: Purged stale marker for " << marker->key.file_name;
    }
    if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Resume store: Failed to purge " << path.string() << ": " << remove_ec.message();
    }
  }

  if (removed > 0) {
    BOOST_LOG_TRIVIAL(info) << "Resume store: Purged " << removed << " stale marker(s)";
  }
  return removed;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string FileResumeStore::hash_key(const ResumeKey& key) const {
  const auto text = key.to_string();
  return crypto::ChecksumService().digest(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::filesystem::path FileResumeStore::resolve_key_path(const ResumeKey& key) const {
  const auto hash = hash_key(key);
  return base_path_ / hash.substr(0, 2) / hash.substr(2, 2) / hash.substr(4, 2) / (hash.substr(6) + ".json");
}


//==============================================
// SERIALIZATION
//==============================================

void FileResumeStore::write_marker(const std::filesystem::path& path, const ResumeMarker& marker) const {
  boost::property_tree::ptree root;
  root.put("client_id", marker.key.client_id);
  root.put("target_directory", marker.key.target_directory);
  root.put("file_name", marker.key.file_name);
  root.put("session_id", marker.session_id);
  root.put("source_digest", marker.source_digest);
  root.put("total_bytes", marker.total_bytes);
  root.put("total_chunks", marker.total_chunks);
  root.put("chunk_size", marker.chunk_size);
  root.put("last_acknowledged_index", marker.last_acknowledged_index);
  root.put("created_at", to_epoch_seconds(marker.created_at));
  root.put("updated_at", to_epoch_seconds(marker.updated_at));

  std::filesystem::create_directories(path.parent_path());
  auto temp_path = path;
  temp_path += ".tmp";
  try {
    boost::property_tree::write_json(temp_path.string(), root);
  } catch (const boost::property_tree::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Resume store: Failed to write marker: " << e.what();
    throw StoreError("Resume store: Failed to write marker");
  }
  std::filesystem::rename(temp_path, path);
}

std::optional<ResumeMarker> FileResumeStore::read_marker(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  try {
    boost::property_tree::ptree root;
    boost::property_tree::read_json(path.string(), root);

    ResumeMarker marker;
    marker.key.client_id = root.get<std::string>("client_id");
    marker.key.target_directory = root.get<std::string>("target_directory");
    marker.key.file_name = root.get<std::string>("file_name");
    marker.session_id = root.get<std::string>("session_id");
    marker.source_digest = root.get<std::string>("source_digest");
    marker.total_bytes = root.get<uint64_t>("total_bytes");
    marker.total_chunks = root.get<uint32_t>("total_chunks");
    marker.chunk_size = root.get<uint32_t>("chunk_size");
    marker.last_acknowledged_index = root.get<int64_t>("last_acknowledged_index");
    marker.created_at = from_epoch_seconds(root.get<int64_t>("created_at"));
    marker.updated_at = from_epoch_seconds(root.get<int64_t>("updated_at"));
    return marker;
  } catch (const boost::property_tree::ptree_error& e) {
    // Corrupt markers are treated as absent
    BOOST_LOG_TRIVIAL(warning) << "Resume store: Ignoring unreadable marker " << path.string() << ": " << e.what();
    return std::nullopt;
  }
}

} // namespace store
} // namespace bxfer
