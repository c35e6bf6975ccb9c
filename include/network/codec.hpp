#ifndef BXFER_NETWORK_CODEC_HPP
#define BXFER_NETWORK_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "network/message_frame.hpp"

namespace bxfer {
namespace network {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error("Codec: " + message) {}
};

// Appends big-endian fields to a payload buffer
class PayloadWriter {
public:
  void write_u8(uint8_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  // u32 length prefix followed by the bytes
  void write_string(const std::string& value);
  void write_bytes(const std::vector<uint8_t>& value);

  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  void append(const void* data, std::size_t size);

  std::vector<uint8_t> buffer_;
};

// Reads fields written by PayloadWriter, throws CodecError on truncation
class PayloadReader {
public:
  explicit PayloadReader(const std::vector<uint8_t>& payload) : payload_(payload) {}

  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  std::string read_string();
  std::vector<uint8_t> read_bytes();

  std::size_t remaining() const { return payload_.size() - offset_; }
  // Throws CodecError if unread bytes remain
  void expect_end() const;

private:
  void read_raw(void* data, std::size_t size);

  const std::vector<uint8_t>& payload_;
  std::size_t offset_ = 0;
};

struct FrameHeader {
  FrameType type;
  uint32_t payload_length;
};

class Codec {
public:
  // ---- FRAME SERIALIZATION ----
  // Header followed by payload, ready to be written to a stream
  static std::vector<uint8_t> serialize(const Frame& frame);
  // Parses FRAME_HEADER_SIZE bytes, rejects unknown types and oversized payloads
  static FrameHeader parse_header(const uint8_t* data);


  // ---- MESSAGE ENCODING ----
  template <typename Message>
  static Frame encode(const Message& message) {
    PayloadWriter writer;
    message.write(writer);
    return Frame{Message::TYPE, writer.take()};
  }

  // Throws CodecError when the frame type or payload does not match Message
  template <typename Message>
  static Message decode(const Frame& frame) {
    if (frame.type != Message::TYPE) {
      throw CodecError(std::string("Expected ") + frame_type_to_string(Message::TYPE) +
                       " frame, received " + frame_type_to_string(frame.type));
    }
    PayloadReader reader(frame.payload);
    Message message = Message::read(reader);
    reader.expect_end();
    return message;
  }

private:
  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_CODEC_HPP
