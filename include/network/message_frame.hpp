#ifndef BXFER_NETWORK_MESSAGE_FRAME_HPP
#define BXFER_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace bxfer {
namespace network {

class PayloadWriter;
class PayloadReader;

// ---- FRAMING CONSTANTS ----
// Frame: type (u8) | payload length (u32, big endian) | payload
constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr uint32_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;
constexpr uint32_t MAX_FRAME_PAYLOAD = MAX_CHUNK_SIZE + 64 * 1024;

// Frame type used to differentiate protocol messages
enum class FrameType : uint8_t {
  AUTH = 0x01,
  AUTH_RESULT = 0x02,
  BEGIN = 0x03,
  BEGIN_RESULT = 0x04,
  CHUNK = 0x05,
  CHUNK_ACK = 0x06,
  CHUNK_NACK = 0x07,
  COMPLETE = 0x08,
  COMPLETE_RESULT = 0x09,
  ERROR = 0x0F
};

const char* frame_type_to_string(FrameType type);
bool is_known_frame_type(uint8_t value);

enum class NackReason : uint8_t {
  CHECKSUM_MISMATCH = 1,
  OUT_OF_SEQUENCE = 2,
  INVALID_CHUNK = 3,
  STORAGE_FAILURE = 4,
  SESSION_SUPERSEDED = 5
};

const char* nack_reason_to_string(NackReason reason);

// Raw frame as it travels on the wire
struct Frame {
  FrameType type;
  std::vector<uint8_t> payload;
};


// ---- PROTOCOL MESSAGES ----

struct AuthRequest {
  static constexpr FrameType TYPE = FrameType::AUTH;
  std::string token;

  void write(PayloadWriter& writer) const;
  static AuthRequest read(PayloadReader& reader);
};

struct AuthResponse {
  static constexpr FrameType TYPE = FrameType::AUTH_RESULT;
  bool ok = false;
  std::string client_id;
  std::string message;

  void write(PayloadWriter& writer) const;
  static AuthResponse read(PayloadReader& reader);
};

// Opens a new session (empty session_id) or resumes an existing one
struct BeginRequest {
  static constexpr FrameType TYPE = FrameType::BEGIN;
  std::string session_id;
  std::string target_directory;
  std::string file_name;
  uint64_t total_bytes = 0;
  uint32_t total_chunks = 0;
  uint32_t chunk_size = 0;
  std::string file_digest;

  void write(PayloadWriter& writer) const;
  static BeginRequest read(PayloadReader& reader);
};

struct BeginResponse {
  static constexpr FrameType TYPE = FrameType::BEGIN_RESULT;
  bool ok = false;
  std::string session_id;
  // First chunk the receiver does not hold yet
  uint32_t next_index = 0;
  std::string message;

  void write(PayloadWriter& writer) const;
  static BeginResponse read(PayloadReader& reader);
};

struct ChunkMessage {
  static constexpr FrameType TYPE = FrameType::CHUNK;
  uint32_t index = 0;
  std::vector<uint8_t> payload;
  std::string checksum;

  void write(PayloadWriter& writer) const;
  static ChunkMessage read(PayloadReader& reader);
};

struct ChunkAck {
  static constexpr FrameType TYPE = FrameType::CHUNK_ACK;
  uint32_t index = 0;

  void write(PayloadWriter& writer) const;
  static ChunkAck read(PayloadReader& reader);
};

struct ChunkNack {
  static constexpr FrameType TYPE = FrameType::CHUNK_NACK;
  uint32_t index = 0;
  NackReason reason = NackReason::INVALID_CHUNK;
  std::string message;

  void write(PayloadWriter& writer) const;
  static ChunkNack read(PayloadReader& reader);
};

struct CompleteRequest {
  static constexpr FrameType TYPE = FrameType::COMPLETE;
  std::string file_digest;

  void write(PayloadWriter& writer) const;
  static CompleteRequest read(PayloadReader& reader);
};

struct CompleteResponse {
  static constexpr FrameType TYPE = FrameType::COMPLETE_RESULT;
  bool ok = false;
  // Digest computed by the receiver over the assembled file
  std::string file_digest;
  std::string message;

  void write(PayloadWriter& writer) const;
  static CompleteResponse read(PayloadReader& reader);
};

struct ErrorMessage {
  static constexpr FrameType TYPE = FrameType::ERROR;
  std::string message;

  void write(PayloadWriter& writer) const;
  static ErrorMessage read(PayloadReader& reader);
};

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_MESSAGE_FRAME_HPP
