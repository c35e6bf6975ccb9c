#include "transfer/chunk_manager.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace bxfer {
namespace transfer {

namespace {

ChunkResult reject(network::NackReason reason, const std::string& message) {
  return ChunkResult{false, reason, message};
}

FinalizeResult finalize_failure(const std::string& message) {
  FinalizeResult result;
  result.message = message;
  return result;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkManager::ChunkManager(store::StorageManager& storage, const crypto::ChecksumService& checksum,
                           const std::filesystem::path& scratch_root)
  : storage_(storage)
  , checksum_(checksum)
  , scratch_root_(scratch_root) {
  BOOST_LOG_TRIVIAL(info) << "Chunk manager: Using scratch directory " << scratch_root_.string();
  std::filesystem::create_directories(scratch_root_);
}


//==============================================
// SESSION LIFECYCLE
//==============================================

OpenResult ChunkManager::open_session(const SessionRequest& request) {
  OpenResult result;

  const auto error = validate_request(request);
  if (!error.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Rejected session request from " << request.client_id << ": " << error;
    result.message = error;
    return result;
  }

  std::filesystem::path target_directory;
  try {
    target_directory = storage_.prepare_target_directory(request.target_directory);
  } catch (const store::StoreError& e) {
    result.message = e.what();
    return result;
  }

  if (!request.session_id.empty()) {
    auto guard = session_locks_.lock(request.session_id);

    if (answer_completed(request, result)) {
      return result;
    }

    auto state = find(request.session_id);
    if (!state) {
      state = restore(request.session_id);
    }
    if (state) {
      std::unique_lock<std::mutex> state_lock(state->mutex);
      if (state->finalized) {
        // Finalized while this request waited for the session
        state_lock.unlock();
        if (answer_completed(request, result)) {
          return result;
        }
      } else if (state->request.client_id == request.client_id && same_transfer(state->request, request)) {
        if (state->lease != 0) {
          BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Session " << request.session_id
                                     << " taken over by a new connection";
        }
        state->lease = ++lease_counter_;
        state->last_activity = Clock::now();
        result.accepted = true;
        result.session_id = request.session_id;
        result.next_index = state->next_index;
        result.lease = state->lease;
        result.message = "Resuming session";
        BOOST_LOG_TRIVIAL(info) << "Chunk manager: Resuming session " << request.session_id << " at chunk "
                                << state->next_index << "/" << state->request.total_chunks;
        return result;
      } else if (state->request.client_id == request.client_id && state->lease == 0) {
        // Same client sent different content under an old session, start over
        BOOST_LOG_TRIVIAL(info) << "Chunk manager: Discarding incompatible session " << request.session_id;
        if (unregister(request.session_id, state)) {
          remove_scratch(*state);
        }
      }
    }
  }

  if (!storage_.has_space_for(target_directory, request.total_bytes) ||
      !storage_.has_space_for(scratch_root_, request.total_bytes)) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Insufficient disk space for " << request.total_bytes << " bytes";
    result.message = "Insufficient disk space for a transfer of " + std::to_string(request.total_bytes) + " bytes";
    return result;
  }

  auto state = std::make_shared<SessionState>();
  state->request = request;
  state->request.session_id = generate_session_id();
  state->target_directory = target_directory;
  state->directory = scratch_root_ / state->request.session_id;
  state->lease = ++lease_counter_;

  // Keeps the expiry sweep off the directory until the session is registered
  auto guard = session_locks_.lock(state->request.session_id);
  try {
    std::filesystem::create_directories(state->directory);
    write_manifest(*state);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk manager: Failed to create scratch state: " << e.what();
    std::error_code ignored;
    std::filesystem::remove_all(state->directory, ignored);
    result.message = "Receiver storage is not accessible";
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[state->request.session_id] = state;
  }
  result.accepted = true;
  result.session_id = state->request.session_id;
  result.next_index = 0;
  result.lease = state->lease;
  result.message = "Session created";
  BOOST_LOG_TRIVIAL(info) << "Chunk manager: Opened session " << result.session_id << " for "
                          << request.file_name << " (" << request.total_bytes << " bytes, "
                          << request.total_chunks << " chunks) from client " << request.client_id;
  return result;
}

void ChunkManager::release_session(const std::string& session_id, uint64_t lease) {
  auto state = find(session_id);
  if (!state) {
    return;
  }
  std::lock_guard<std::mutex> lock(state->mutex);
  if (state->lease == lease) {
    state->lease = 0;
    state->last_activity = Clock::now();
    BOOST_LOG_TRIVIAL(debug) << "Chunk manager: Released session " << session_id << " at chunk " << state->next_index;
  }
}

void ChunkManager::discard_session(const std::string& session_id) {
  auto guard = session_locks_.lock(session_id);
  auto state = find(session_id);
  if (!state) {
    return;
  }

  std::lock_guard<std::mutex> lock(state->mutex);
  if (unregister(session_id, state)) {
    remove_scratch(*state);
    BOOST_LOG_TRIVIAL(info) << "Chunk manager: Discarded session " << session_id;
  }
}

std::size_t ChunkManager::expire_idle_sessions(std::chrono::milliseconds max_idle) {
  std::vector<std::pair<std::string, std::shared_ptr<SessionState>>> candidates;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    candidates.assign(sessions_.begin(), sessions_.end());
  }

  std::size_t removed = 0;
  for (const auto& [session_id, state] : candidates) {
    auto guard = session_locks_.lock(session_id);
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->lease != 0 || state->finalized || Clock::now() - state->last_activity < max_idle) {
      continue;
    }
    if (unregister(session_id, state)) {
      remove_scratch(*state);
      ++removed;
      BOOST_LOG_TRIVIAL(info) << "Chunk manager: Expired idle session " << session_id << " at chunk "
                              << state->next_index << "/" << state->request.total_chunks;
    }
  }

  // Scratch of sessions nobody reopened since the receiver started
  std::vector<std::filesystem::path> directories;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(scratch_root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec) && is_valid_session_id(it->path().filename().string())) {
      directories.push_back(it->path());
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Failed to scan " << scratch_root_.string() << ": " << ec.message();
  }

  for (const auto& directory : directories) {
    const auto session_id = directory.filename().string();
    auto guard = session_locks_.lock(session_id);
    if (find(session_id)) {
      continue;
    }
    std::error_code time_ec;
    const auto modified = std::filesystem::last_write_time(directory, time_ec);
    if (time_ec || std::filesystem::file_time_type::clock::now() - modified < max_idle) {
      continue;
    }
    std::error_code remove_ec;
    std::filesystem::remove_all(directory, remove_ec);
    if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Failed to remove stale scratch " << directory.string()
                                 << ": " << remove_ec.message();
      continue;
    }
    ++removed;
    BOOST_LOG_TRIVIAL(info) << "Chunk manager: Removed stale scratch of session " << session_id;
  }

  if (removed > 0) {
    BOOST_LOG_TRIVIAL(info) << "Chunk manager: Expired " << removed << " idle session(s)";
  }
  return removed;
}


//==============================================
// CHUNK HANDLING
//==============================================

ChunkResult ChunkManager::receive_chunk(const std::string& session_id, uint64_t lease, uint32_t index,
                                        const std::vector<uint8_t>& payload, const std::string& checksum) {
  auto state = find(session_id);
  if (!state) {
    return reject(network::NackReason::INVALID_CHUNK, "Unknown transfer session");
  }

  std::lock_guard<std::mutex> lock(state->mutex);
  if (state->lease != lease) {
    return reject(network::NackReason::SESSION_SUPERSEDED, "Session is driven by another connection");
  }
  if (state->finalized) {
    return reject(network::NackReason::INVALID_CHUNK, "Session already finalized");
  }

  const auto& request = state->request;
  if (index >= request.total_chunks) {
    return reject(network::NackReason::INVALID_CHUNK, "Chunk index out of range");
  }
  if (index < state->next_index) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk manager: Chunk " << index << " of " << session_id << " already stored";
    return ChunkResult{true, network::NackReason::INVALID_CHUNK, {}};
  }
  if (index > state->next_index) {
    return reject(network::NackReason::OUT_OF_SEQUENCE, "Expected chunk " + std::to_string(state->next_index));
  }
  if (payload.size() != expected_chunk_size(request, index)) {
    return reject(network::NackReason::INVALID_CHUNK, "Unexpected chunk size");
  }
  if (!checksum_.verify(payload, checksum)) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Checksum mismatch on chunk " << index << " of " << session_id;
    return reject(network::NackReason::CHECKSUM_MISMATCH, "Chunk checksum mismatch");
  }

  const auto path = chunk_path(*state, index);
  auto temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    file.close();
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Chunk manager: Failed to write " << temp_path.string();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      return reject(network::NackReason::STORAGE_FAILURE, "Receiver failed to store chunk");
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunk manager: Failed to commit chunk " << index << ": " << ec.message();
    return reject(network::NackReason::STORAGE_FAILURE, "Receiver failed to store chunk");
  }

  ++state->next_index;
  state->last_activity = Clock::now();
  BOOST_LOG_TRIVIAL(trace) << "Chunk manager: Stored chunk " << index << " of " << session_id;
  return ChunkResult{true, network::NackReason::INVALID_CHUNK, {}};
}

FinalizeResult ChunkManager::finalize(const std::string& session_id, uint64_t lease,
                                      const std::string& expected_digest) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto done = completed_.find(session_id);
    if (done != completed_.end()) {
      if (done->second.lease != lease) {
        return finalize_failure("Session is driven by another connection");
      }
      return done->second.result;
    }
  }

  auto state = find(session_id);
  if (!state) {
    return finalize_failure("Unknown transfer session");
  }

  FinalizeResult result;
  std::lock_guard<std::mutex> lock(state->mutex);
  if (state->lease != lease) {
    return finalize_failure("Session is driven by another connection");
  }
  const auto& request = state->request;
  if (state->next_index < request.total_chunks) {
    return finalize_failure("Transfer incomplete: received " + std::to_string(state->next_index) +
                            " of " + std::to_string(request.total_chunks) + " chunks");
  }
  if (!crypto::ChecksumService::digests_equal(expected_digest, request.file_digest)) {
    return finalize_failure("File checksum does not match the announced checksum");
  }

  std::vector<std::filesystem::path> parts;
  parts.reserve(request.total_chunks);
  for (uint32_t index = 0; index < request.total_chunks; ++index) {
    parts.push_back(chunk_path(*state, index));
  }

  try {
    auto outcome = storage_.finalize(state->target_directory, request.file_name, parts, expected_digest);
    result.success = true;
    result.file_digest = outcome.file_digest;
    result.final_path = outcome.final_path;
    result.message = "File stored";
    state->finalized = true;
  } catch (const store::ChecksumMismatchError& e) {
    result.file_digest = e.actual_digest();
    result.message = "Whole-file checksum mismatch";
    state->finalized = true;
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk manager: Finalize of " << session_id << " failed: " << e.what();
    result.message = "Receiver failed to store the file";
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk manager: Finalize of " << session_id << " failed: " << e.what();
    result.message = "Receiver failed to store the file";
  }

  if (state->finalized) {
    // Scratch goes first so a later restore cannot bring the session back
    remove_scratch(*state);
    std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second == state) {
      sessions_.erase(it);
    }
    if (result.success) {
      remember_completed(session_id, CompletedSession{request.client_id, state->lease, result});
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk manager: Session " << session_id << (result.success ? " finalized" : " failed to finalize")
                          << ": " << result.message;
  return result;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkManager::has_session(const std::string& session_id) const {
  return find(session_id) != nullptr;
}

std::size_t ChunkManager::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

uint32_t ChunkManager::expected_chunk_count(uint64_t total_bytes, uint32_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  if (total_bytes == 0) {
    return 1;
  }
  return static_cast<uint32_t>((total_bytes + chunk_size - 1) / chunk_size);
}


//==============================================
// SESSION SUPPORT
//==============================================

std::shared_ptr<ChunkManager::SessionState> ChunkManager::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<ChunkManager::SessionState> ChunkManager::restore(const std::string& session_id) {
  if (!is_valid_session_id(session_id)) {
    return nullptr;
  }

  const auto directory = scratch_root_ / session_id;
  const auto manifest = directory / MANIFEST_FILE;
  if (!std::filesystem::exists(manifest)) {
    return nullptr;
  }

  auto state = std::make_shared<SessionState>();
  try {
    boost::property_tree::ptree root;
    boost::property_tree::read_json(manifest.string(), root);
    auto& request = state->request;
    request.session_id = root.get<std::string>("session_id");
    request.client_id = root.get<std::string>("client_id");
    request.target_directory = root.get<std::string>("target_directory");
    request.file_name = root.get<std::string>("file_name");
    request.total_bytes = root.get<uint64_t>("total_bytes");
    request.total_chunks = root.get<uint32_t>("total_chunks");
    request.chunk_size = root.get<uint32_t>("chunk_size");
    request.file_digest = root.get<std::string>("file_digest");
    state->target_directory = storage_.resolve_target_directory(request.target_directory);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Ignoring unreadable manifest of " << session_id << ": " << e.what();
    return nullptr;
  }
  if (state->request.session_id != session_id || !validate_request(state->request).empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Ignoring inconsistent manifest of " << session_id;
    return nullptr;
  }
  state->directory = directory;

  // Chunk files are committed by rename, count the contiguous prefix
  while (state->next_index < state->request.total_chunks) {
    const auto path = chunk_path(*state, state->next_index);
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size != expected_chunk_size(state->request, state->next_index)) {
      break;
    }
    ++state->next_index;
  }

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[session_id] = state;
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk manager: Restored session " << session_id << " with "
                          << state->next_index << "/" << state->request.total_chunks << " chunks";
  return state;
}

bool ChunkManager::answer_completed(const SessionRequest& request, OpenResult& result) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto done = completed_.find(request.session_id);
  if (done == completed_.end() || done->second.client_id != request.client_id) {
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk manager: Session " << request.session_id << " was already finalized";
  done->second.lease = ++lease_counter_;
  result.accepted = true;
  result.session_id = request.session_id;
  result.next_index = request.total_chunks;
  result.lease = done->second.lease;
  result.message = "Session already finalized";
  return true;
}

bool ChunkManager::unregister(const std::string& session_id, const std::shared_ptr<SessionState>& state) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second != state) {
    return false;
  }
  sessions_.erase(it);
  return true;
}

void ChunkManager::remember_completed(const std::string& session_id, CompletedSession completed) {
  completed_[session_id] = std::move(completed);
  completed_order_.push_back(session_id);
  while (completed_order_.size() > MAX_COMPLETED_SESSIONS) {
    completed_.erase(completed_order_.front());
    completed_order_.pop_front();
  }
}

void ChunkManager::remove_scratch(const SessionState& state) const {
  std::error_code ec;
  std::filesystem::remove_all(state.directory, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk manager: Failed to remove scratch of " << state.request.session_id
                               << ": " << ec.message();
  }
}

void ChunkManager::write_manifest(const SessionState& state) const {
  const auto& request = state.request;
  boost::property_tree::ptree root;
  root.put("session_id", request.session_id);
  root.put("client_id", request.client_id);
  root.put("target_directory", request.target_directory);
  root.put("file_name", request.file_name);
  root.put("total_bytes", request.total_bytes);
  root.put("total_chunks", request.total_chunks);
  root.put("chunk_size", request.chunk_size);
  root.put("file_digest", request.file_digest);
  root.put("created_at", std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());

  const auto manifest = state.directory / MANIFEST_FILE;
  auto temp_path = manifest;
  temp_path += ".tmp";
  boost::property_tree::write_json(temp_path.string(), root);
  std::filesystem::rename(temp_path, manifest);
}

std::filesystem::path ChunkManager::chunk_path(const SessionState& state, uint32_t index) const {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%06u.dat", index);
  return state.directory / name;
}

std::size_t ChunkManager::expected_chunk_size(const SessionRequest& request, uint32_t index) const {
  if (index + 1 < request.total_chunks) {
    return request.chunk_size;
  }
  return static_cast<std::size_t>(request.total_bytes - static_cast<uint64_t>(request.chunk_size) * index);
}

std::string ChunkManager::validate_request(const SessionRequest& request) {
  if (request.client_id.empty()) {
    return "Session requires an authenticated client";
  }
  if (request.chunk_size == 0 || request.chunk_size > network::MAX_CHUNK_SIZE) {
    return "Invalid chunk size";
  }
  if (request.total_chunks != expected_chunk_count(request.total_bytes, request.chunk_size)) {
    return "Chunk count does not match the declared file size";
  }
  if (!store::StorageManager::is_valid_file_name(request.file_name)) {
    return "Invalid target file name";
  }
  if (request.file_digest.size() != crypto::ChecksumService::DIGEST_HEX_LENGTH) {
    return "Invalid file checksum";
  }
  return {};
}

bool ChunkManager::same_transfer(const SessionRequest& lhs, const SessionRequest& rhs) {
  return lhs.target_directory == rhs.target_directory &&
         lhs.file_name == rhs.file_name &&
         lhs.total_bytes == rhs.total_bytes &&
         lhs.total_chunks == rhs.total_chunks &&
         lhs.chunk_size == rhs.chunk_size &&
         crypto::ChecksumService::digests_equal(lhs.file_digest, rhs.file_digest);
}

bool ChunkManager::is_valid_session_id(const std::string& session_id) {
  if (session_id.size() != 36) {
    return false;
  }
  for (char c : session_id) {
    if (!std::isxdigit(static_cast<unsigned char>(c)) && c != '-') {
      return false;
    }
  }
  return true;
}

std::string ChunkManager::generate_session_id() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

} // namespace transfer
} // namespace bxfer
