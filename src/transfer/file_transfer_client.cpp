#include "transfer/file_transfer_client.hpp"
#include <algorithm>
#include <optional>
#include <boost/log/trivial.hpp>
#include "network/message_frame.hpp"
#include "store/storage_manager.hpp"
#include "transfer/transfer_channel.hpp"
#include "transfer/transfer_error.hpp"

namespace bxfer {
namespace transfer {

struct FileTransferClient::SessionContext {
  SessionContext(const std::filesystem::path& file_path, TransferConfig& transfer_config,
                 const utils::CancellationToken& caller_token)
    : config(transfer_config)
    , cancellation(&caller_token, deadline_for(transfer_config)) {
    session.source_path = file_path;
  }

  static std::optional<utils::CancellationToken::Clock::time_point> deadline_for(const TransferConfig& config) {
    if (!config.session_timeout) {
      return std::nullopt;
    }
    return utils::CancellationToken::Clock::now() + *config.session_timeout;
  }

  TransferConfig& config;
  // Fires on caller cancellation or when the session timeout passes
  utils::CancellationToken cancellation;

  TransferSession session;
  std::unique_ptr<FileChunker> chunker;
  uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
  store::ResumeKey key;
  std::optional<store::ResumeMarker> marker;
  network::BeginRequest begin;
  std::unique_ptr<TransferChannel> channel;
  // First chunk the receiver does not hold
  uint32_t next_index = 0;
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileTransferClient::FileTransferClient(auth::AuthenticationTokenService& token_service,
                                       const crypto::ChecksumService& checksum,
                                       store::ResumeStore& resume_store,
                                       network::NetworkRetryService& retry_service,
                                       TransportFactory transport_factory)
  : token_service_(token_service)
  , checksum_(checksum)
  , resume_store_(resume_store)
  , retry_service_(retry_service)
  , transport_factory_(transport_factory ? std::move(transport_factory) : default_transport_factory()) {}


//==============================================
// TRANSFER OPERATIONS
//==============================================

TransferResult FileTransferClient::transfer(const std::filesystem::path& file_path, TransferConfig& config,
                                            const utils::CancellationToken& cancellation) {
  SessionContext context(file_path, config, cancellation);
  TransferResult result;

  BOOST_LOG_TRIVIAL(info) << "Transfer: Starting transfer of " << file_path.string() << " to "
                          << config.host << ":" << config.port;
  try {
    run(context, result);
  } catch (const utils::OperationCancelled& e) {
    if (context.cancellation.deadline_expired() && !cancellation.is_cancelled()) {
      BOOST_LOG_TRIVIAL(error) << "Transfer: Session timed out: " << e.what();
      fail(context, result, "Transfer session timed out");
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Cancelled: " << e.what();
      context.session.state.transition_to(TransferState::State::CANCELLED);
      result.cancelled = true;
      result.error_message = "Transfer cancelled";
    }
  } catch (const network::RetryExhaustedError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: " << e.what();
    fail(context, result, "Network transfer failed after " + std::to_string(e.attempts()) + " attempts");
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: " << e.what();
    fail(context, result, std::string("Network transfer failed: ") + network::transport_error_to_string(e.code()));
  } catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: " << e.what();
    fail(context, result, e.what());
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Resume state error: " << e.what();
    fail(context, result, "Local transfer state is not accessible");
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Unexpected error: " << e.what();
    fail(context, result, "Unexpected transfer error");
  }

  result.state = context.session.state.get_state();
  result.session_id = context.session.session_id;
  result.file_digest = context.session.file_digest;
  return result;
}

uint32_t FileTransferClient::effective_chunk_size(int64_t requested) {
  if (requested <= 0) {
    return DEFAULT_CHUNK_SIZE;
  }
  return static_cast<uint32_t>(std::min<int64_t>(requested, network::MAX_CHUNK_SIZE));
}

FileTransferClient::TransportFactory FileTransferClient::default_transport_factory() {
  return [](const TransferConfig& config, const utils::CancellationToken* cancellation) {
    network::TransportOptions options;
    options.host = config.host;
    options.port = config.port;
    options.use_tls = config.use_tls;
    options.verify_peer = config.tls_verify_peer;
    options.ca_file = config.tls_ca_file;
    options.connect_timeout = config.connect_timeout;
    return network::connect_transport(options, cancellation);
  };
}


//==============================================
// TRANSFER STEPS
//==============================================

void FileTransferClient::run(SessionContext& context, TransferResult& result) {
  auto& session = context.session;
  prepare(context);

  session.state.transition_to(TransferState::State::AUTHENTICATING);
  try {
    session.token = token_service_.create_token(&context.config.client);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Failed to create authentication token: " << e.what();
    throw AuthenticationError("Failed to create authentication token");
  }
  session.client_id = context.config.client.client_id;

  context.key = store::ResumeKey{session.client_id, context.config.target_directory, context.begin.file_name};
  context.marker = resume_store_.get(context.key);
  if (context.marker &&
      !context.marker->is_compatible(session.file_digest, context.chunk_size, session.total_chunks)) {
    BOOST_LOG_TRIVIAL(info) << "Transfer: Source changed since session " << context.marker->session_id
                            << ", starting over";
    resume_store_.remove(context.key);
    context.marker.reset();
  }
  if (context.marker) {
    context.begin.session_id = context.marker->session_id;
    BOOST_LOG_TRIVIAL(info) << "Transfer: Resuming session " << context.marker->session_id << " after chunk "
                            << context.marker->last_acknowledged_index;
  }

  retry_service_.execute_with_retry([&](int) { ensure_channel(context); },
                                    "Open transfer session", &context.cancellation);
  result.resumed_from = context.next_index;

  session.state.transition_to(TransferState::State::TRANSFERRING);
  while (context.next_index < session.total_chunks) {
    context.cancellation.throw_if_cancelled("Transfer");
    auto chunk = context.chunker->read_chunk(context.next_index, checksum_);
    send_chunk(context, chunk, result);
    persist_marker(context);
    report_progress(context);
  }

  session.state.transition_to(TransferState::State::VERIFYING);
  complete(context, result);
}

void FileTransferClient::prepare(SessionContext& context) {
  auto& session = context.session;
  const auto& path = session.source_path;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ResourceError("Source file does not exist or is not a regular file");
  }

  const auto file_name = context.config.file_name.empty() ? path.filename().string() : context.config.file_name;
  if (!store::StorageManager::is_valid_file_name(file_name)) {
    throw ResourceError("Invalid target file name");
  }

  context.chunk_size = effective_chunk_size(context.config.chunk_size);
  try {
    context.chunker = std::make_unique<FileChunker>(path, context.chunk_size);
  } catch (const std::runtime_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: " << e.what();
    throw ResourceError("Source file could not be read");
  }
  session.total_chunks = context.chunker->chunk_count();
  session.total_bytes = context.chunker->file_size();
  session.file_digest = checksum_.digest_file(path);

  auto& begin = context.begin;
  begin.target_directory = context.config.target_directory;
  begin.file_name = file_name;
  begin.total_bytes = session.total_bytes;
  begin.total_chunks = session.total_chunks;
  begin.chunk_size = context.chunk_size;
  begin.file_digest = session.file_digest;

  BOOST_LOG_TRIVIAL(debug) << "Transfer: " << file_name << " is " << session.total_bytes << " bytes in "
                           << session.total_chunks << " chunks of " << context.chunk_size;
}

void FileTransferClient::ensure_channel(SessionContext& context) {
  if (context.channel && context.channel->is_open()) {
    return;
  }
  context.channel.reset();

  auto transport = transport_factory_(context.config, &context.cancellation);
  transport->set_cancellation(&context.cancellation);
  auto channel = std::make_unique<TransferChannel>(std::move(transport), context.config.chunk_timeout);

  channel->authenticate(context.session.token);
  auto response = channel->begin(context.begin);

  if (response.session_id != context.begin.session_id) {
    if (!context.begin.session_id.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Receiver no longer knows session " << context.begin.session_id
                                 << ", started " << response.session_id;
    }
    context.begin.session_id = response.session_id;
    context.session.session_id = response.session_id;
    context.next_index = response.next_index;
    persist_marker(context);
  } else {
    context.session.session_id = response.session_id;
    context.next_index = response.next_index;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer: Session " << response.session_id << " open at chunk "
                          << response.next_index << "/" << context.session.total_chunks;
  context.channel = std::move(channel);
}

void FileTransferClient::send_chunk(SessionContext& context, const Chunk& chunk, TransferResult& result) {
  int checksum_rejections = 0;

  retry_service_.execute_with_retry([&](int) {
    ensure_channel(context);
    if (context.next_index != chunk.index) {
      // Reopened session already holds this chunk or restarted from an earlier one
      return;
    }

    try {
      for (;;) {
        auto reply = context.channel->send_chunk(chunk);
        if (reply.acknowledged) {
          context.next_index = chunk.index + 1;
          ++result.chunks_sent;
          result.bytes_transferred += chunk.size;
          return;
        }

        BOOST_LOG_TRIVIAL(warning) << "Transfer: Chunk " << chunk.index << " rejected ("
                                   << network::nack_reason_to_string(reply.reason) << "): " << reply.message;
        switch (reply.reason) {
          case network::NackReason::CHECKSUM_MISMATCH:
            if (++checksum_rejections > 1) {
              throw IntegrityError("Chunk " + std::to_string(chunk.index) +
                                   " failed checksum verification twice");
            }
            continue;
          case network::NackReason::STORAGE_FAILURE:
            throw ResourceError("Receiver failed to store chunk " + std::to_string(chunk.index));
          case network::NackReason::SESSION_SUPERSEDED:
            throw ProtocolError("Transfer session was taken over by another connection");
          case network::NackReason::OUT_OF_SEQUENCE:
          case network::NackReason::INVALID_CHUNK:
            throw ProtocolError("Receiver rejected chunk " + std::to_string(chunk.index) + ": " + reply.message);
        }
        throw ProtocolError("Receiver rejected chunk " + std::to_string(chunk.index));
      }
    } catch (const network::TransportError&) {
      context.channel.reset();
      throw;
    }
  }, "Send chunk " + std::to_string(chunk.index), &context.cancellation);
}

void FileTransferClient::complete(SessionContext& context, TransferResult& result) {
  auto& session = context.session;

  auto response = retry_service_.execute_with_retry([&](int) {
    ensure_channel(context);
    if (context.next_index < session.total_chunks) {
      throw ProtocolError("Receiver lost acknowledged chunks of session " + session.session_id);
    }
    try {
      return context.channel->complete(session.file_digest);
    } catch (const network::TransportError&) {
      context.channel.reset();
      throw;
    }
  }, "Complete transfer", &context.cancellation);

  if (!response.ok) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Receiver failed to finalize " << session.session_id << ": "
                             << response.message;
    throw IntegrityError("Receiver failed to finalize the file: " + response.message);
  }
  if (!crypto::ChecksumService::digests_equal(response.file_digest, session.file_digest)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Receiver digest " << response.file_digest
                             << " does not match source digest " << session.file_digest;
    throw IntegrityError("Stored file checksum does not match the source file");
  }

  resume_store_.remove(context.key);
  context.channel.reset();
  session.state.transition_to(TransferState::State::COMPLETED);
  result.success = true;
  BOOST_LOG_TRIVIAL(info) << "Transfer: Completed session " << session.session_id << " ("
                          << session.total_bytes << " bytes, " << result.chunks_sent << " chunks sent)";
}


//==============================================
// RESUME STATE
//==============================================

void FileTransferClient::persist_marker(SessionContext& context) {
  const auto& session = context.session;
  const int64_t last_acknowledged = static_cast<int64_t>(context.next_index) - 1;

  if (!context.marker) {
    store::ResumeMarker marker;
    marker.key = context.key;
    marker.session_id = session.session_id;
    marker.source_digest = session.file_digest;
    marker.total_bytes = session.total_bytes;
    marker.total_chunks = session.total_chunks;
    marker.chunk_size = context.chunk_size;
    marker.last_acknowledged_index = last_acknowledged;
    resume_store_.add(marker);
    context.marker = marker;
    return;
  }

  if (context.marker->session_id == session.session_id &&
      context.marker->last_acknowledged_index == last_acknowledged) {
    return;
  }
  context.marker->session_id = session.session_id;
  context.marker->last_acknowledged_index = last_acknowledged;
  resume_store_.update(*context.marker);
}

void FileTransferClient::report_progress(const SessionContext& context) const {
  if (!progress_callback_) {
    return;
  }
  const auto& session = context.session;
  TransferProgress progress;
  progress.session_id = session.session_id;
  progress.chunks_acknowledged = context.next_index;
  progress.total_chunks = session.total_chunks;
  progress.bytes_acknowledged = std::min<uint64_t>(
    static_cast<uint64_t>(context.next_index) * context.chunk_size, session.total_bytes);
  progress.total_bytes = session.total_bytes;
  progress_callback_(progress);
}

void FileTransferClient::fail(SessionContext& context, TransferResult& result, const std::string& message) const {
  context.session.state.transition_to(TransferState::State::FAILED);
  result.success = false;
  result.error_message = message;
}

} // namespace transfer
} // namespace bxfer
