#include <csignal>
#include <iostream>
#include <thread>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "auth/credential_store.hpp"
#include "auth/token_service.hpp"
#include "config/options.hpp"
#include "crypto/checksum.hpp"
#include "logger/logger.hpp"
#include "network/retry_service.hpp"
#include "store/resume_store.hpp"
#include "transfer/file_transfer_client.hpp"
#include "utils/cancellation.hpp"

namespace {

constexpr int EXIT_CANCELLED = 2;

void print_result(const bxfer::transfer::TransferResult& result) {
  std::cout << "state: " << result.state << '\n'
            << "session: " << (result.session_id.empty() ? "-" : result.session_id) << '\n'
            << "chunks sent: " << result.chunks_sent << " (resumed from " << result.resumed_from << ")\n"
            << "bytes sent: " << result.bytes_transferred << '\n';
  if (!result.file_digest.empty()) {
    std::cout << "sha256: " << result.file_digest << '\n';
  }
  if (!result.error_message.empty()) {
    std::cout << "error: " << result.error_message << '\n';
  }
}

int run_client(bxfer::config::ClientOptions& options) {
  bxfer::auth::FileCredentialStore credentials(options.credentials_file, options.passphrase);
  bxfer::auth::AuthenticationTokenService token_service(credentials);
  bxfer::crypto::ChecksumService checksum;
  bxfer::store::FileResumeStore resume_store(options.resume_dir);
  if (options.resume_max_age.count() > 0) {
    resume_store.purge_stale(options.resume_max_age);
  }
  bxfer::network::NetworkRetryService retry_service(options.retry);

  bxfer::transfer::FileTransferClient client(token_service, checksum, resume_store, retry_service);
  client.set_progress_callback([](const bxfer::transfer::TransferProgress& progress) {
    BOOST_LOG_TRIVIAL(info) << "Client: " << progress.chunks_acknowledged << "/" << progress.total_chunks
                            << " chunks (" << progress.bytes_acknowledged << "/" << progress.total_bytes << " bytes)";
  });

  // SIGINT or SIGTERM cancels the transfer, the resume marker is kept
  bxfer::utils::CancellationToken cancellation;
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Received signal " << signal_number << ", cancelling transfer";
      cancellation.cancel();
    }
  });
  std::thread signal_thread([&]() { signals_context.run(); });

  auto result = client.transfer(options.file_path, options.transfer, cancellation);

  signals_context.stop();
  signal_thread.join();

  print_result(result);
  if (result.success) {
    return 0;
  }
  return result.cancelled ? EXIT_CANCELLED : 1;
}

} // namespace

int main(int argc, char* argv[]) {
  bxfer::config::ClientOptions options;
  try {
    options = bxfer::config::parse_client_options(argc, argv);
  } catch (const bxfer::config::ConfigError& e) {
    std::cerr << e.what() << "\nRun with --help for usage.\n";
    return 1;
  }
  if (options.show_help) {
    std::cout << options.help_text;
    return 0;
  }

  bxfer::logging::init_logging(options.log);
  try {
    return run_client(options);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Client: " << e.what();
    std::cerr << "Client error: " << e.what() << '\n';
    return 1;
  }
}
