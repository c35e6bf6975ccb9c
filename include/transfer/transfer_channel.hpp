#ifndef BXFER_TRANSFER_CHANNEL_HPP
#define BXFER_TRANSFER_CHANNEL_HPP

#include <chrono>
#include <memory>
#include <string>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "network/transport.hpp"
#include "transfer/transfer_types.hpp"

namespace bxfer {
namespace transfer {

struct ChunkReply {
  bool acknowledged = false;
  uint32_t index = 0;
  network::NackReason reason = network::NackReason::INVALID_CHUNK;
  std::string message;
};

// Client end of one receiver connection. Each call is a single request/reply
// exchange bounded by the frame timeout.
// Transport failures surface as network::TransportError, receiver errors and
// malformed replies as ProtocolError.
class TransferChannel {
public:
  TransferChannel(std::unique_ptr<network::Transport> transport, std::chrono::milliseconds frame_timeout);
  ~TransferChannel();

  TransferChannel(const TransferChannel&) = delete;
  TransferChannel& operator=(const TransferChannel&) = delete;

  // ---- PROTOCOL EXCHANGES ----
  // Returns the client id resolved by the receiver, throws AuthenticationError when rejected
  std::string authenticate(const std::string& token);
  // Throws ResourceError when the receiver refuses the session
  network::BeginResponse begin(const network::BeginRequest& request);
  ChunkReply send_chunk(const Chunk& chunk);
  network::CompleteResponse complete(const std::string& file_digest);

  void close();
  bool is_open() const;
  network::Transport& transport() { return *transport_; }

private:
  void send(const network::Frame& frame);
  // Receives the next frame, an ERROR frame is rethrown as ProtocolError
  network::Frame receive();

  template <typename Reply>
  Reply decode(const network::Frame& frame);

  std::unique_ptr<network::Transport> transport_;
  std::chrono::milliseconds frame_timeout_;
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_CHANNEL_HPP
