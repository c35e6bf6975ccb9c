#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace bxfer {
namespace network {

//==============================================
// PAYLOAD WRITER
//==============================================

void PayloadWriter::write_u8(uint8_t value) {
  append(&value, sizeof(value));
}

void PayloadWriter::write_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
}

void PayloadWriter::write_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
}

void PayloadWriter::write_string(const std::string& value) {
  write_u32(static_cast<uint32_t>(value.size()));
  append(value.data(), value.size());
}

void PayloadWriter::write_bytes(const std::vector<uint8_t>& value) {
  write_u32(static_cast<uint32_t>(value.size()));
  append(value.data(), value.size());
}

void PayloadWriter::append(const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  const auto* bytes = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), bytes, bytes + size);
}


//==============================================
// PAYLOAD READER
//==============================================

uint8_t PayloadReader::read_u8() {
  uint8_t value = 0;
  read_raw(&value, sizeof(value));
  return value;
}

uint32_t PayloadReader::read_u32() {
  uint32_t network_value = 0;
  read_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t PayloadReader::read_u64() {
  uint64_t network_value = 0;
  read_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

std::string PayloadReader::read_string() {
  const uint32_t length = read_u32();
  if (length > remaining()) {
    throw CodecError("String length " + std::to_string(length) + " exceeds payload");
  }
  std::string value(reinterpret_cast<const char*>(payload_.data() + offset_), length);
  offset_ += length;
  return value;
}

std::vector<uint8_t> PayloadReader::read_bytes() {
  const uint32_t length = read_u32();
  if (length > remaining()) {
    throw CodecError("Byte field length " + std::to_string(length) + " exceeds payload");
  }
  std::vector<uint8_t> value(payload_.begin() + static_cast<std::ptrdiff_t>(offset_),
                             payload_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
  offset_ += length;
  return value;
}

void PayloadReader::expect_end() const {
  if (remaining() != 0) {
    throw CodecError(std::to_string(remaining()) + " unexpected trailing bytes");
  }
}

void PayloadReader::read_raw(void* data, std::size_t size) {
  if (size > remaining()) {
    throw CodecError("Payload truncated");
  }
  std::memcpy(data, payload_.data() + offset_, size);
  offset_ += size;
}


//==============================================
// FRAME SERIALIZATION
//==============================================

std::vector<uint8_t> Codec::serialize(const Frame& frame) {
  if (frame.payload.size() > MAX_FRAME_PAYLOAD) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload of " << frame.payload.size() << " bytes exceeds frame limit";
    throw CodecError("Payload exceeds maximum frame size");
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(FRAME_HEADER_SIZE + frame.payload.size());
  bytes.push_back(static_cast<uint8_t>(frame.type));

  uint32_t network_length = to_network_order(static_cast<uint32_t>(frame.payload.size()));
  const auto* length_bytes = reinterpret_cast<const uint8_t*>(&network_length);
  bytes.insert(bytes.end(), length_bytes, length_bytes + sizeof(network_length));
  bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << frame_type_to_string(frame.type)
                           << " frame with " << frame.payload.size() << " payload bytes";
  return bytes;
}

FrameHeader Codec::parse_header(const uint8_t* data) {
  if (!is_known_frame_type(data[0])) {
    throw CodecError("Unknown frame type " + std::to_string(static_cast<int>(data[0])));
  }

  uint32_t network_length = 0;
  std::memcpy(&network_length, data + 1, sizeof(network_length));
  const uint32_t payload_length = from_network_order(network_length);
  if (payload_length > MAX_FRAME_PAYLOAD) {
    throw CodecError("Declared payload length " + std::to_string(payload_length) + " exceeds limit");
  }

  return FrameHeader{static_cast<FrameType>(data[0]), payload_length};
}

} // namespace network
} // namespace bxfer
