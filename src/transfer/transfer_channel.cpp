#include "transfer/transfer_channel.hpp"
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace bxfer {
namespace transfer {

TransferChannel::TransferChannel(std::unique_ptr<network::Transport> transport,
                                 std::chrono::milliseconds frame_timeout)
  : transport_(std::move(transport))
  , frame_timeout_(frame_timeout) {}

TransferChannel::~TransferChannel() {
  close();
}


//==============================================
// PROTOCOL EXCHANGES
//==============================================

std::string TransferChannel::authenticate(const std::string& token) {
  send(network::Codec::encode(network::AuthRequest{token}));
  auto response = decode<network::AuthResponse>(receive());
  if (!response.ok) {
    BOOST_LOG_TRIVIAL(error) << "Channel: Authentication rejected by " << transport_->remote_address()
                             << ": " << response.message;
    throw AuthenticationError(response.message.empty() ? "Authentication failed" : response.message);
  }
  BOOST_LOG_TRIVIAL(debug) << "Channel: Authenticated as " << response.client_id;
  return response.client_id;
}

network::BeginResponse TransferChannel::begin(const network::BeginRequest& request) {
  send(network::Codec::encode(request));
  auto response = decode<network::BeginResponse>(receive());
  if (!response.ok) {
    BOOST_LOG_TRIVIAL(error) << "Channel: Session refused: " << response.message;
    throw ResourceError(response.message.empty() ? "Receiver refused the transfer session" : response.message);
  }
  if (response.next_index > request.total_chunks) {
    throw ProtocolError("Receiver reported an invalid resume index");
  }
  return response;
}

ChunkReply TransferChannel::send_chunk(const Chunk& chunk) {
  network::ChunkMessage message;
  message.index = chunk.index;
  message.payload = chunk.payload;
  message.checksum = chunk.checksum;
  send(network::Codec::encode(message));

  auto frame = receive();
  ChunkReply reply;
  if (frame.type == network::FrameType::CHUNK_ACK) {
    auto ack = decode<network::ChunkAck>(frame);
    reply.acknowledged = true;
    reply.index = ack.index;
  } else if (frame.type == network::FrameType::CHUNK_NACK) {
    auto nack = decode<network::ChunkNack>(frame);
    reply.index = nack.index;
    reply.reason = nack.reason;
    reply.message = nack.message;
  } else {
    throw ProtocolError(std::string("Unexpected ") + network::frame_type_to_string(frame.type) +
                        " reply to a chunk");
  }

  if (reply.index != chunk.index) {
    throw ProtocolError("Receiver replied for chunk " + std::to_string(reply.index) +
                        " while chunk " + std::to_string(chunk.index) + " was sent");
  }
  return reply;
}

network::CompleteResponse TransferChannel::complete(const std::string& file_digest) {
  send(network::Codec::encode(network::CompleteRequest{file_digest}));
  return decode<network::CompleteResponse>(receive());
}


//==============================================
// CONNECTION CONTROL
//==============================================

void TransferChannel::close() {
  if (transport_) {
    transport_->close();
  }
}

bool TransferChannel::is_open() const {
  return transport_ && transport_->is_open();
}


//==============================================
// FRAME HELPERS
//==============================================

void TransferChannel::send(const network::Frame& frame) {
  transport_->send_frame(frame, frame_timeout_);
}

network::Frame TransferChannel::receive() {
  auto frame = transport_->receive_frame(frame_timeout_);
  if (frame.type == network::FrameType::ERROR) {
    auto error = decode<network::ErrorMessage>(frame);
    BOOST_LOG_TRIVIAL(error) << "Channel: Receiver reported error: " << error.message;
    close();
    throw ProtocolError("Receiver error: " + error.message);
  }
  return frame;
}

template <typename Reply>
Reply TransferChannel::decode(const network::Frame& frame) {
  try {
    return network::Codec::decode<Reply>(frame);
  } catch (const network::CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Channel: " << e.what();
    close();
    throw ProtocolError("Malformed reply from receiver");
  }
}

} // namespace transfer
} // namespace bxfer
