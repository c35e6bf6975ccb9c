#ifndef BXFER_NETWORK_RECEIVER_SESSION_HPP
#define BXFER_NETWORK_RECEIVER_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "auth/token_validator.hpp"
#include "network/message_frame.hpp"
#include "network/transport.hpp"
#include "transfer/chunk_manager.hpp"

namespace bxfer {
namespace network {

// Server end of one accepted connection:
// AUTH -> AUTH_RESULT -> BEGIN -> BEGIN_RESULT -> (CHUNK -> ACK | NACK)* -> COMPLETE -> COMPLETE_RESULT
// A frame that does not fit the current phase is answered with ERROR and ends the connection.
class ReceiverSession {
public:
  enum class Phase {
    AWAIT_AUTH,
    AWAIT_BEGIN,
    TRANSFERRING,
    CLOSED
  };

  ReceiverSession(Transport& transport, auth::AuthenticationValidator& validator,
                  transfer::ChunkManager& chunk_manager,
                  std::chrono::milliseconds receive_timeout, std::chrono::milliseconds send_timeout);
  // Releases the session lease, scratch state stays for a later resume
  ~ReceiverSession();

  ReceiverSession(const ReceiverSession&) = delete;
  ReceiverSession& operator=(const ReceiverSession&) = delete;

  // Serves frames until the conversation ends or the connection fails
  void run();

  Phase phase() const { return phase_; }
  const std::string& client_id() const { return client_id_; }

private:
  // ---- FRAME HANDLERS ----
  void dispatch(const Frame& frame);
  void handle_auth(const Frame& frame);
  void handle_begin(const Frame& frame);
  void handle_chunk(const Frame& frame);
  void handle_complete(const Frame& frame);

  // ---- REPLIES ----
  template <typename Message>
  void reply(const Message& message);
  // Sends ERROR and closes the connection
  void reject(const std::string& message);
  void release_lease();

  // ---- PARAMETERS ----
  Transport& transport_;
  auth::AuthenticationValidator& validator_;
  transfer::ChunkManager& chunk_manager_;
  std::chrono::milliseconds receive_timeout_;
  std::chrono::milliseconds send_timeout_;
  std::string remote_;

  Phase phase_ = Phase::AWAIT_AUTH;
  std::string client_id_;
  std::string session_id_;
  uint64_t lease_ = 0;
};

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_RECEIVER_SESSION_HPP
