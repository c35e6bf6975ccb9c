#ifndef BXFER_TRANSFER_TYPES_HPP
#define BXFER_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "auth/credentials.hpp"
#include "transfer/transfer_state.hpp"

namespace bxfer {
namespace transfer {

constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

// Where and how to send one file, fixed once a session starts
struct TransferConfig {
  // ---- ENDPOINT ----
  std::string host = "127.0.0.1";
  uint16_t port = 0;
  bool use_tls = false;
  bool tls_verify_peer = true;
  std::string tls_ca_file;

  // ---- DESTINATION ----
  std::string target_directory;
  // Empty uses the source file name
  std::string file_name;

  // Non-positive values fall back to DEFAULT_CHUNK_SIZE
  int64_t chunk_size = DEFAULT_CHUNK_SIZE;

  // ---- IDENTITY ----
  auth::ClientConfiguration client;

  // ---- TIMEOUTS ----
  std::chrono::milliseconds connect_timeout{10000};
  // Bounds each frame exchange
  std::chrono::milliseconds chunk_timeout{30000};
  // Bounds the whole transfer call including retries
  std::optional<std::chrono::milliseconds> session_timeout;
};

enum class ChunkStatus {
  PENDING,
  SENT,
  ACKNOWLEDGED,
  REJECTED
};

struct Chunk {
  uint32_t index = 0;
  std::vector<uint8_t> payload;
  std::size_t size = 0;
  std::string checksum;
  ChunkStatus status = ChunkStatus::PENDING;
};

struct TransferSession {
  std::string session_id;
  std::filesystem::path source_path;
  uint32_t total_chunks = 0;
  uint64_t total_bytes = 0;
  std::string file_digest;
  std::string client_id;
  std::string token;
  std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
  TransferState state;
};

struct TransferProgress {
  std::string session_id;
  uint32_t chunks_acknowledged = 0;
  uint32_t total_chunks = 0;
  uint64_t bytes_acknowledged = 0;
  uint64_t total_bytes = 0;
};

struct TransferResult {
  bool success = false;
  bool cancelled = false;
  std::string error_message;
  TransferState::State state = TransferState::State::INITIATED;
  std::string session_id;
  // First index sent by this call, non-zero when resumed
  uint32_t resumed_from = 0;
  uint32_t chunks_sent = 0;
  uint64_t bytes_transferred = 0;
  std::string file_digest;
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_TYPES_HPP
