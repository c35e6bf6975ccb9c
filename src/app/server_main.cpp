#include <csignal>
#include <iostream>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "auth/audit_log.hpp"
#include "auth/credential_store.hpp"
#include "auth/token_validator.hpp"
#include "config/options.hpp"
#include "crypto/checksum.hpp"
#include "logger/logger.hpp"
#include "network/file_receiver.hpp"
#include "store/storage_manager.hpp"
#include "transfer/chunk_manager.hpp"

namespace {

int register_client(bxfer::auth::FileCredentialStore& credentials, const std::string& client_id) {
  auto created = credentials.register_client(client_id);
  std::cout << "client_id: " << created.client_id << '\n'
            << "client_secret: " << created.client_secret << '\n';
  return 0;
}

int run_server(const bxfer::config::ServerOptions& options) {
  bxfer::auth::FileCredentialStore credentials(options.credentials_file, options.passphrase);
  if (options.register_client) {
    return register_client(credentials, *options.register_client);
  }

  bxfer::auth::FileAuditLog audit_log(options.audit_log_file);
  bxfer::auth::AuthenticationValidator validator(credentials, audit_log, options.lockout);
  bxfer::crypto::ChecksumService checksum;
  bxfer::store::StorageManager storage(options.storage_root);
  bxfer::transfer::ChunkManager chunk_manager(storage, checksum, options.scratch_dir);

  bxfer::network::FileReceiver receiver(options.receiver, validator, chunk_manager);
  if (!receiver.start_listening(options.port)) {
    std::cerr << "Failed to listen on " << options.receiver.bind_address << ":" << options.port << '\n';
    return 1;
  }
  std::cout << "Listening on " << options.receiver.bind_address << ":" << receiver.bound_port() << std::endl;

  // Block until SIGINT or SIGTERM
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
    }
  });
  signals_context.run();

  receiver.stop_listening();
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  bxfer::config::ServerOptions options;
  try {
    options = bxfer::config::parse_server_options(argc, argv);
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
    return run_server(options);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    std::cerr << "Server error: " << e.what() << '\n';
    return 1;
  }
}
