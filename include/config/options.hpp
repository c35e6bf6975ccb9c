#ifndef BXFER_CONFIG_OPTIONS_HPP
#define BXFER_CONFIG_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "auth/lockout_tracker.hpp"
#include "logger/logger.hpp"
#include "network/file_receiver.hpp"
#include "network/retry_service.hpp"
#include "transfer/transfer_types.hpp"

namespace bxfer {
namespace config {

constexpr uint16_t DEFAULT_PORT = 9450;

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config: " + message) {}
};

struct ServerOptions {
  uint16_t port = DEFAULT_PORT;
  network::ReceiverConfig receiver;
  std::string storage_root = "storage";
  std::string scratch_dir = "scratch";
  std::string credentials_file = "credentials.db";
  std::string passphrase;
  std::string audit_log_file = "audit.log";
  auth::LockoutPolicy lockout;
  logging::LogOptions log;
  // Set when the server should only create this client and exit
  std::optional<std::string> register_client;

  bool show_help = false;
  std::string help_text;
};

struct ClientOptions {
  std::string file_path;
  transfer::TransferConfig transfer;
  std::string credentials_file = "client-credentials.db";
  std::string passphrase;
  std::string resume_dir = "resume";
  std::chrono::seconds resume_max_age = std::chrono::hours(24 * 30);
  network::RetryPolicy retry;
  logging::LogOptions log;

  bool show_help = false;
  std::string help_text;
};

// Command line first, then the --config INI file, then BXFER_* environment
// variables for secrets. Earlier sources win. Throws ConfigError.
ServerOptions parse_server_options(int argc, const char* const argv[]);
ClientOptions parse_client_options(int argc, const char* const argv[]);

} // namespace config
} // namespace bxfer

#endif // BXFER_CONFIG_OPTIONS_HPP
