#ifndef BXFER_TRANSFER_CHUNK_MANAGER_HPP
#define BXFER_TRANSFER_CHUNK_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "crypto/checksum.hpp"
#include "network/message_frame.hpp"
#include "store/storage_manager.hpp"
#include "utils/keyed_mutex.hpp"

namespace bxfer {
namespace transfer {

struct SessionRequest {
  // Empty opens a new session
  std::string session_id;
  std::string client_id;
  std::string target_directory;
  std::string file_name;
  uint64_t total_bytes = 0;
  uint32_t total_chunks = 0;
  uint32_t chunk_size = 0;
  std::string file_digest;
};

struct OpenResult {
  bool accepted = false;
  std::string session_id;
  uint32_t next_index = 0;
  // Identifies the connection currently driving the session
  uint64_t lease = 0;
  std::string message;
};

struct ChunkResult {
  bool accepted = false;
  network::NackReason reason = network::NackReason::INVALID_CHUNK;
  std::string message;
};

struct FinalizeResult {
  bool success = false;
  std::string file_digest;
  std::filesystem::path final_path;
  std::string message;
};

// Receiver side session bookkeeping. Verified chunks are kept in scratch files
// under {scratch_root}/{session_id}/ until the session is finalized, so a
// session survives dropped connections and receiver restarts.
class ChunkManager {
public:
  static constexpr const char* MANIFEST_FILE = "manifest.json";
  static constexpr std::size_t MAX_COMPLETED_SESSIONS = 256;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkManager(store::StorageManager& storage, const crypto::ChecksumService& checksum,
               const std::filesystem::path& scratch_root);


  // ---- SESSION LIFECYCLE ----
  // Resumes a compatible session of the same client or opens a new one after
  // checking the target directory and free space. A newer lease supersedes the
  // connection that held the session before.
  OpenResult open_session(const SessionRequest& request);
  // Drops the lease if it still owns the session, scratch data is kept
  void release_session(const std::string& session_id, uint64_t lease);
  // Removes the session and its scratch data
  void discard_session(const std::string& session_id);
  // Discards sessions no connection holds that saw no activity for max_idle,
  // including scratch directories left behind by an earlier run. Returns the
  // number of sessions removed.
  std::size_t expire_idle_sessions(std::chrono::milliseconds max_idle);


  // ---- CHUNK HANDLING ----
  // Strictly sequential: earlier indices are acknowledged again, later ones rejected
  ChunkResult receive_chunk(const std::string& session_id, uint64_t lease, uint32_t index,
                            const std::vector<uint8_t>& payload, const std::string& checksum);
  // Assembles all chunks into the target file once every chunk is present
  FinalizeResult finalize(const std::string& session_id, uint64_t lease, const std::string& expected_digest);


  // ---- QUERY OPERATIONS ----
  bool has_session(const std::string& session_id) const;
  std::size_t session_count() const;
  static uint32_t expected_chunk_count(uint64_t total_bytes, uint32_t chunk_size);

private:
  using Clock = std::chrono::steady_clock;

  struct SessionState {
    std::mutex mutex;
    SessionRequest request;
    std::filesystem::path target_directory;
    std::filesystem::path directory;
    uint32_t next_index = 0;
    uint64_t lease = 0;
    bool finalized = false;
    Clock::time_point last_activity = Clock::now();
  };

  struct CompletedSession {
    std::string client_id;
    // Lease allowed to ask for the result again
    uint64_t lease = 0;
    FinalizeResult result;
  };

  // ---- PARAMETERS ----
  store::StorageManager& storage_;
  const crypto::ChecksumService& checksum_;
  std::filesystem::path scratch_root_;
  std::atomic<uint64_t> lease_counter_{0};

  // Guards the maps only, never held across disk I/O or a session mutex wait
  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;
  std::unordered_map<std::string, CompletedSession> completed_;
  std::deque<std::string> completed_order_;
  // Serializes open, restore and expiry of one session id
  utils::KeyedMutex session_locks_;


  // ---- SESSION SUPPORT ----
  std::shared_ptr<SessionState> find(const std::string& session_id) const;
  // Caller holds the session id lock
  std::shared_ptr<SessionState> restore(const std::string& session_id);
  // Fills result when the client already finalized this session
  bool answer_completed(const SessionRequest& request, OpenResult& result);
  // Removes the map entry if it still refers to state
  bool unregister(const std::string& session_id, const std::shared_ptr<SessionState>& state);
  // Caller holds sessions_mutex_
  void remember_completed(const std::string& session_id, CompletedSession completed);
  // Caller holds the session mutex
  void remove_scratch(const SessionState& state) const;
  void write_manifest(const SessionState& state) const;
  std::filesystem::path chunk_path(const SessionState& state, uint32_t index) const;
  std::size_t expected_chunk_size(const SessionRequest& request, uint32_t index) const;

  static std::string validate_request(const SessionRequest& request);
  static bool same_transfer(const SessionRequest& lhs, const SessionRequest& rhs);
  static bool is_valid_session_id(const std::string& session_id);
  static std::string generate_session_id();
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_CHUNK_MANAGER_HPP
