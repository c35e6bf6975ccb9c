#ifndef BXFER_TRANSFER_FILE_TRANSFER_CLIENT_HPP
#define BXFER_TRANSFER_FILE_TRANSFER_CLIENT_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include "auth/token_service.hpp"
#include "crypto/checksum.hpp"
#include "network/retry_service.hpp"
#include "network/transport.hpp"
#include "store/resume_store.hpp"
#include "transfer/file_chunker.hpp"
#include "transfer/transfer_types.hpp"
#include "utils/cancellation.hpp"

namespace bxfer {
namespace transfer {

// Sends one file to a receiver as a resumable session of checksummed chunks.
// Every failure is reported through the returned TransferResult.
class FileTransferClient {
public:
  using TransportFactory = std::function<std::unique_ptr<network::Transport>(
    const TransferConfig&, const utils::CancellationToken*)>;
  using ProgressCallback = std::function<void(const TransferProgress&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // An empty factory connects TCP or TLS transports from the TransferConfig endpoint
  FileTransferClient(auth::AuthenticationTokenService& token_service,
                     const crypto::ChecksumService& checksum,
                     store::ResumeStore& resume_store,
                     network::NetworkRetryService& retry_service,
                     TransportFactory transport_factory = {});


  // ---- TRANSFER OPERATIONS ----
  // config.client is resolved in place when it carries no identity
  TransferResult transfer(const std::filesystem::path& file_path, TransferConfig& config,
                          const utils::CancellationToken& cancellation);

  // Invoked after every acknowledged chunk on the transferring thread
  void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

  // Non-positive sizes fall back to the default, oversized ones are clamped
  static uint32_t effective_chunk_size(int64_t requested);
  static TransportFactory default_transport_factory();

private:
  struct SessionContext;

  // ---- TRANSFER STEPS ----
  void run(SessionContext& context, TransferResult& result);
  void prepare(SessionContext& context);
  // Connects, authenticates and (re)opens the session unless a live channel exists
  void ensure_channel(SessionContext& context);
  void send_chunk(SessionContext& context, const Chunk& chunk, TransferResult& result);
  void complete(SessionContext& context, TransferResult& result);

  // ---- RESUME STATE ----
  void persist_marker(SessionContext& context);
  void report_progress(const SessionContext& context) const;

  void fail(SessionContext& context, TransferResult& result, const std::string& message) const;

  // ---- PARAMETERS ----
  auth::AuthenticationTokenService& token_service_;
  const crypto::ChecksumService& checksum_;
  store::ResumeStore& resume_store_;
  network::NetworkRetryService& retry_service_;
  TransportFactory transport_factory_;
  ProgressCallback progress_callback_;
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_FILE_TRANSFER_CLIENT_HPP
