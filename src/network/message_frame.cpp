#include "network/message_frame.hpp"
#include "network/codec.hpp"

namespace bxfer {
namespace network {

const char* frame_type_to_string(FrameType type) {
  switch (type) {
    case FrameType::AUTH:            return "AUTH";
    case FrameType::AUTH_RESULT:     return "AUTH_RESULT";
    case FrameType::BEGIN:           return "BEGIN";
    case FrameType::BEGIN_RESULT:    return "BEGIN_RESULT";
    case FrameType::CHUNK:           return "CHUNK";
    case FrameType::CHUNK_ACK:       return "CHUNK_ACK";
    case FrameType::CHUNK_NACK:      return "CHUNK_NACK";
    case FrameType::COMPLETE:        return "COMPLETE";
    case FrameType::COMPLETE_RESULT: return "COMPLETE_RESULT";
    case FrameType::ERROR:           return "ERROR";
    default:                         return "UNKNOWN";
  }
}

bool is_known_frame_type(uint8_t value) {
  return (value >= static_cast<uint8_t>(FrameType::AUTH) &&
          value <= static_cast<uint8_t>(FrameType::COMPLETE_RESULT)) ||
         value == static_cast<uint8_t>(FrameType::ERROR);
}

const char* nack_reason_to_string(NackReason reason) {
  switch (reason) {
    case NackReason::CHECKSUM_MISMATCH:  return "checksum mismatch";
    case NackReason::OUT_OF_SEQUENCE:    return "out of sequence";
    case NackReason::INVALID_CHUNK:      return "invalid chunk";
    case NackReason::STORAGE_FAILURE:    return "storage failure";
    case NackReason::SESSION_SUPERSEDED: return "session superseded";
    default:                             return "unknown";
  }
}


//==============================================
// AUTHENTICATION
//==============================================

void AuthRequest::write(PayloadWriter& writer) const {
  writer.write_string(token);
}

AuthRequest AuthRequest::read(PayloadReader& reader) {
  AuthRequest message;
  message.token = reader.read_string();
  return message;
}

void AuthResponse::write(PayloadWriter& writer) const {
  writer.write_u8(ok ? 1 : 0);
  writer.write_string(client_id);
  writer.write_string(message);
}

AuthResponse AuthResponse::read(PayloadReader& reader) {
  AuthResponse response;
  response.ok = reader.read_u8() != 0;
  response.client_id = reader.read_string();
  response.message = reader.read_string();
  return response;
}


//==============================================
// SESSION SETUP
//==============================================

void BeginRequest::write(PayloadWriter& writer) const {
  writer.write_string(session_id);
  writer.write_string(target_directory);
  writer.write_string(file_name);
  writer.write_u64(total_bytes);
  writer.write_u32(total_chunks);
  writer.write_u32(chunk_size);
  writer.write_string(file_digest);
}

BeginRequest BeginRequest::read(PayloadReader& reader) {
  BeginRequest request;
  request.session_id = reader.read_string();
  request.target_directory = reader.read_string();
  request.file_name = reader.read_string();
  request.total_bytes = reader.read_u64();
  request.total_chunks = reader.read_u32();
  request.chunk_size = reader.read_u32();
  request.file_digest = reader.read_string();
  return request;
}

void BeginResponse::write(PayloadWriter& writer) const {
  writer.write_u8(ok ? 1 : 0);
  writer.write_string(session_id);
  writer.write_u32(next_index);
  writer.write_string(message);
}

BeginResponse BeginResponse::read(PayloadReader& reader) {
  BeginResponse response;
  response.ok = reader.read_u8() != 0;
  response.session_id = reader.read_string();
  response.next_index = reader.read_u32();
  response.message = reader.read_string();
  return response;
}


//==============================================
// CHUNK TRANSFER
//==============================================

void ChunkMessage::write(PayloadWriter& writer) const {
  writer.write_u32(index);
  writer.write_bytes(payload);
  writer.write_string(checksum);
}

ChunkMessage ChunkMessage::read(PayloadReader& reader) {
  ChunkMessage message;
  message.index = reader.read_u32();
  message.payload = reader.read_bytes();
  message.checksum = reader.read_string();
  return message;
}

void ChunkAck::write(PayloadWriter& writer) const {
  writer.write_u32(index);
}

ChunkAck ChunkAck::read(PayloadReader& reader) {
  ChunkAck ack;
  ack.index = reader.read_u32();
  return ack;
}

void ChunkNack::write(PayloadWriter& writer) const {
  writer.write_u32(index);
  writer.write_u8(static_cast<uint8_t>(reason));
  writer.write_string(message);
}

ChunkNack ChunkNack::read(PayloadReader& reader) {
  ChunkNack nack;
  nack.index = reader.read_u32();
  const uint8_t reason = reader.read_u8();
  if (reason < static_cast<uint8_t>(NackReason::CHECKSUM_MISMATCH) ||
      reason > static_cast<uint8_t>(NackReason::SESSION_SUPERSEDED)) {
    throw CodecError("Unknown nack reason " + std::to_string(static_cast<int>(reason)));
  }
  nack.reason = static_cast<NackReason>(reason);
  nack.message = reader.read_string();
  return nack;
}


//==============================================
// COMPLETION
//==============================================

void CompleteRequest::write(PayloadWriter& writer) const {
  writer.write_string(file_digest);
}

CompleteRequest CompleteRequest::read(PayloadReader& reader) {
  CompleteRequest request;
  request.file_digest = reader.read_string();
  return request;
}

void CompleteResponse::write(PayloadWriter& writer) const {
  writer.write_u8(ok ? 1 : 0);
  writer.write_string(file_digest);
  writer.write_string(message);
}

CompleteResponse CompleteResponse::read(PayloadReader& reader) {
  CompleteResponse response;
  response.ok = reader.read_u8() != 0;
  response.file_digest = reader.read_string();
  response.message = reader.read_string();
  return response;
}

void ErrorMessage::write(PayloadWriter& writer) const {
  writer.write_string(message);
}

ErrorMessage ErrorMessage::read(PayloadReader& reader) {
  ErrorMessage error;
  error.message = reader.read_string();
  return error;
}

} // namespace network
} // namespace bxfer
