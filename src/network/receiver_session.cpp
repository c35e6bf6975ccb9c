#include "network/receiver_session.hpp"
#include <boost/log/trivial.hpp>
#include "network/codec.hpp"

namespace bxfer {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ReceiverSession::ReceiverSession(Transport& transport, auth::AuthenticationValidator& validator,
                                 transfer::ChunkManager& chunk_manager,
                                 std::chrono::milliseconds receive_timeout, std::chrono::milliseconds send_timeout)
  : transport_(transport)
  , validator_(validator)
  , chunk_manager_(chunk_manager)
  , receive_timeout_(receive_timeout)
  , send_timeout_(send_timeout)
  , remote_(transport.remote_address()) {}

ReceiverSession::~ReceiverSession() {
  release_lease();
}


//==============================================
// CONVERSATION LOOP
//==============================================

void ReceiverSession::run() {
  BOOST_LOG_TRIVIAL(info) << "Receiver session: Connection from " << remote_;
  try {
    while (phase_ != Phase::CLOSED) {
      dispatch(transport_.receive_frame(receive_timeout_));
    }
  } catch (const TransportError& e) {
    if (e.code() == TransportErrorCode::CONNECTION_CLOSED) {
      BOOST_LOG_TRIVIAL(debug) << "Receiver session: " << remote_ << " disconnected";
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Receiver session: Connection from " << remote_ << " failed: " << e.what();
    }
  }
  release_lease();
  transport_.close();
  phase_ = Phase::CLOSED;
}

void ReceiverSession::dispatch(const Frame& frame) {
  try {
    switch (phase_) {
      case Phase::AWAIT_AUTH:
        if (frame.type == FrameType::AUTH) {
          return handle_auth(frame);
        }
        break;
      case Phase::AWAIT_BEGIN:
        if (frame.type == FrameType::BEGIN) {
          return handle_begin(frame);
        }
        break;
      case Phase::TRANSFERRING:
        if (frame.type == FrameType::CHUNK) {
          return handle_chunk(frame);
        }
        if (frame.type == FrameType::COMPLETE) {
          return handle_complete(frame);
        }
        break;
      case Phase::CLOSED:
        return;
    }
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Receiver session: Malformed frame from " << remote_ << ": " << e.what();
    return reject(std::string("Malformed ") + frame_type_to_string(frame.type) + " frame");
  }

  BOOST_LOG_TRIVIAL(warning) << "Receiver session: Unexpected " << frame_type_to_string(frame.type)
                             << " frame from " << remote_;
  reject(std::string("Unexpected ") + frame_type_to_string(frame.type) + " frame");
}


//==============================================
// FRAME HANDLERS
//==============================================

void ReceiverSession::handle_auth(const Frame& frame) {
  auto request = Codec::decode<AuthRequest>(frame);
  auto result = validator_.validate_token(request.token);

  AuthResponse response;
  response.ok = result.is_valid;
  response.client_id = result.is_valid ? result.client_id : std::string();
  response.message = result.is_valid ? "Authenticated" : result.error_message;
  reply(response);

  if (!result.is_valid) {
    BOOST_LOG_TRIVIAL(warning) << "Receiver session: Authentication failed for " << remote_;
    transport_.close();
    phase_ = Phase::CLOSED;
    return;
  }
  client_id_ = result.client_id;
  phase_ = Phase::AWAIT_BEGIN;
  BOOST_LOG_TRIVIAL(info) << "Receiver session: " << remote_ << " authenticated as " << client_id_;
}

void ReceiverSession::handle_begin(const Frame& frame) {
  auto request = Codec::decode<BeginRequest>(frame);

  transfer::SessionRequest session;
  session.session_id = request.session_id;
  session.client_id = client_id_;
  session.target_directory = request.target_directory;
  session.file_name = request.file_name;
  session.total_bytes = request.total_bytes;
  session.total_chunks = request.total_chunks;
  session.chunk_size = request.chunk_size;
  session.file_digest = request.file_digest;

  auto opened = chunk_manager_.open_session(session);

  BeginResponse response;
  response.ok = opened.accepted;
  response.session_id = opened.session_id;
  response.next_index = opened.next_index;
  response.message = opened.message;
  if (opened.accepted) {
    session_id_ = opened.session_id;
    lease_ = opened.lease;
    phase_ = Phase::TRANSFERRING;
  }
  reply(response);
}

void ReceiverSession::handle_chunk(const Frame& frame) {
  auto chunk = Codec::decode<ChunkMessage>(frame);
  auto result = chunk_manager_.receive_chunk(session_id_, lease_, chunk.index, chunk.payload, chunk.checksum);
  if (result.accepted) {
    reply(ChunkAck{chunk.index});
    return;
  }

  ChunkNack nack;
  nack.index = chunk.index;
  nack.reason = result.reason;
  nack.message = result.message;
  reply(nack);
}

void ReceiverSession::handle_complete(const Frame& frame) {
  auto request = Codec::decode<CompleteRequest>(frame);
  auto result = chunk_manager_.finalize(session_id_, lease_, request.file_digest);

  CompleteResponse response;
  response.ok = result.success;
  response.file_digest = result.file_digest;
  response.message = result.message;
  reply(response);

  if (result.success) {
    // Another file may follow on the same connection
    session_id_.clear();
    lease_ = 0;
    phase_ = Phase::AWAIT_BEGIN;
  }
}


//==============================================
// REPLIES
//==============================================

template <typename Message>
void ReceiverSession::reply(const Message& message) {
  transport_.send_frame(Codec::encode(message), send_timeout_);
}

void ReceiverSession::reject(const std::string& message) {
  try {
    reply(ErrorMessage{message});
  } catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Receiver session: Failed to deliver error to " << remote_ << ": " << e.what();
  }
  transport_.close();
  phase_ = Phase::CLOSED;
}

void ReceiverSession::release_lease() {
  if (lease_ != 0) {
    chunk_manager_.release_session(session_id_, lease_);
    lease_ = 0;
  }
}

} // namespace network
} // namespace bxfer
