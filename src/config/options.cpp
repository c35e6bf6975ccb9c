#include "config/options.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <boost/program_options.hpp>

namespace bxfer {
namespace config {

namespace po = boost::program_options;

namespace {

// Only secrets are read from the environment
std::string environment_mapper(const std::string& variable) {
  if (variable == "BXFER_PASSPHRASE") {
    return "passphrase";
  }
  if (variable == "BXFER_CLIENT_SECRET") {
    return "client-secret";
  }
  return {};
}

po::variables_map parse(int argc, const char* const argv[], const po::options_description& desc,
                        const po::positional_options_description& positional = {}) {
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);

    if (vm.count("config")) {
      const auto path = vm["config"].as<std::string>();
      std::ifstream ifs(path);
      if (!ifs) {
        throw ConfigError("Cannot open config file " + path);
      }
      po::store(po::parse_config_file(ifs, desc), vm);
    }

    po::store(po::parse_environment(desc, environment_mapper), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw ConfigError(e.what());
  }
  return vm;
}

std::string help_text(const po::options_description& desc) {
  std::ostringstream os;
  os << desc;
  return os.str();
}

void add_logging_options(po::options_description& desc, logging::LogOptions& log) {
  desc.add_options()
    ("log-file", po::value<std::string>(&log.log_file), "Also write the log to this file")
    ("log-level", po::value<std::string>(&log.level)->default_value(log.level),
     "trace, debug, info, warning, error or fatal");
}

void check_log_level(const logging::LogOptions& log) {
  try {
    logging::parse_severity(log.level);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

} // namespace


//==============================================
// SERVER OPTIONS
//==============================================

ServerOptions parse_server_options(int argc, const char* const argv[]) {
  ServerOptions options;
  auto& receiver = options.receiver;

  int64_t receive_timeout_ms = receiver.receive_timeout.count();
  int64_t session_idle_s = std::chrono::duration_cast<std::chrono::seconds>(receiver.session_idle_timeout).count();
  int64_t lockout_window_s = options.lockout.failure_window.count();
  int64_t lockout_cooldown_s = options.lockout.lockout_duration.count();
  std::string register_client;

  po::options_description desc("bxfer_server options");
  desc.add_options()
    ("help,h", "Show this help")
    ("config", po::value<std::string>(), "INI file with any of these options")
    ("bind", po::value<std::string>(&receiver.bind_address)->default_value(receiver.bind_address),
     "Address to listen on")
    ("port,p", po::value<uint16_t>(&options.port)->default_value(options.port), "Port to listen on, 0 for any")
    ("storage-root", po::value<std::string>(&options.storage_root)->default_value(options.storage_root),
     "Directory that receives finished files")
    ("scratch-dir", po::value<std::string>(&options.scratch_dir)->default_value(options.scratch_dir),
     "Directory for partially received sessions")
    ("credentials", po::value<std::string>(&options.credentials_file)->default_value(options.credentials_file),
     "Encrypted client credential file")
    ("passphrase", po::value<std::string>(&options.passphrase),
     "Credential file passphrase (or BXFER_PASSPHRASE)")
    ("audit-log", po::value<std::string>(&options.audit_log_file)->default_value(options.audit_log_file),
     "Authentication audit log")
    ("tls-cert", po::value<std::string>(&receiver.tls_certificate_file), "PEM certificate chain, enables TLS")
    ("tls-key", po::value<std::string>(&receiver.tls_private_key_file), "PEM private key")
    ("receive-timeout-ms", po::value<int64_t>(&receive_timeout_ms)->default_value(receive_timeout_ms),
     "Idle time allowed between frames of a connection")
    ("session-idle-timeout-s", po::value<int64_t>(&session_idle_s)->default_value(session_idle_s),
     "Discard unfinished sessions idle this long, 0 to keep them")
    ("workers", po::value<std::size_t>(&receiver.worker_threads)->default_value(receiver.worker_threads),
     "Connections served in parallel")
    ("lockout-threshold", po::value<int>(&options.lockout.max_failures)->default_value(options.lockout.max_failures),
     "Failures that lock a client")
    ("lockout-window-s", po::value<int64_t>(&lockout_window_s)->default_value(lockout_window_s),
     "Window in which failures are counted")
    ("lockout-cooldown-s", po::value<int64_t>(&lockout_cooldown_s)->default_value(lockout_cooldown_s),
     "How long a locked client is rejected")
    ("register-client", po::value<std::string>(&register_client),
     "Create a client with a random secret, print it and exit");
  add_logging_options(desc, options.log);

  auto vm = parse(argc, argv, desc);
  options.help_text = help_text(desc);
  if (vm.count("help")) {
    options.show_help = true;
    return options;
  }

  if (options.passphrase.empty()) {
    throw ConfigError("A credential passphrase is required (--passphrase or BXFER_PASSPHRASE)");
  }
  if (receive_timeout_ms <= 0) {
    throw ConfigError("--receive-timeout-ms must be positive");
  }
  if (session_idle_s < 0) {
    throw ConfigError("--session-idle-timeout-s must not be negative");
  }
  if (options.lockout.max_failures <= 0 || lockout_window_s <= 0 || lockout_cooldown_s <= 0) {
    throw ConfigError("Lockout settings must be positive");
  }
  if (receiver.tls_certificate_file.empty() != receiver.tls_private_key_file.empty()) {
    throw ConfigError("--tls-cert and --tls-key must be given together");
  }
  check_log_level(options.log);

  receiver.receive_timeout = std::chrono::milliseconds(receive_timeout_ms);
  receiver.session_idle_timeout = std::chrono::seconds(session_idle_s);
  options.lockout.failure_window = std::chrono::seconds(lockout_window_s);
  options.lockout.lockout_duration = std::chrono::seconds(lockout_cooldown_s);
  if (vm.count("register-client")) {
    options.register_client = register_client;
  }
  return options;
}


//==============================================
// CLIENT OPTIONS
//==============================================

ClientOptions parse_client_options(int argc, const char* const argv[]) {
  ClientOptions options;
  auto& transfer = options.transfer;
  auto& retry = options.retry;

  int64_t connect_timeout_ms = transfer.connect_timeout.count();
  int64_t chunk_timeout_ms = transfer.chunk_timeout.count();
  int64_t session_timeout_s = 0;
  int64_t resume_max_age_s = options.resume_max_age.count();
  int64_t base_delay_ms = retry.base_delay.count();
  int64_t max_delay_ms = retry.max_delay.count();
  bool no_verify = false;

  po::options_description desc("bxfer_client options");
  desc.add_options()
    ("help,h", "Show this help")
    ("config", po::value<std::string>(), "INI file with any of these options")
    ("file,f", po::value<std::string>(&options.file_path), "File to send")
    ("host", po::value<std::string>(&transfer.host)->default_value(transfer.host), "Receiver host")
    ("port,p", po::value<uint16_t>(&transfer.port)->default_value(DEFAULT_PORT), "Receiver port")
    ("tls", po::bool_switch(&transfer.use_tls), "Connect with TLS")
    ("tls-no-verify", po::bool_switch(&no_verify), "Do not verify the receiver certificate")
    ("tls-ca", po::value<std::string>(&transfer.tls_ca_file), "CA file used to verify the receiver")
    ("target-dir,d", po::value<std::string>(&transfer.target_directory), "Directory on the receiver")
    ("name", po::value<std::string>(&transfer.file_name), "File name on the receiver, defaults to the source name")
    ("chunk-size", po::value<int64_t>(&transfer.chunk_size)->default_value(transfer.chunk_size), "Chunk size in bytes")
    ("client-id", po::value<std::string>(&transfer.client.client_id), "Client identity")
    ("client-secret", po::value<std::string>(&transfer.client.client_secret),
     "Client secret (or BXFER_CLIENT_SECRET)")
    ("credentials", po::value<std::string>(&options.credentials_file)->default_value(options.credentials_file),
     "Encrypted local credential file holding the default identity")
    ("passphrase", po::value<std::string>(&options.passphrase),
     "Credential file passphrase (or BXFER_PASSPHRASE)")
    ("resume-dir", po::value<std::string>(&options.resume_dir)->default_value(options.resume_dir),
     "Directory for resume markers")
    ("resume-max-age-s", po::value<int64_t>(&resume_max_age_s)->default_value(resume_max_age_s),
     "Drop resume markers not updated for this long, 0 to keep them")
    ("retries", po::value<int>(&retry.max_attempts)->default_value(retry.max_attempts), "Attempts per operation")
    ("retry-base-ms", po::value<int64_t>(&base_delay_ms)->default_value(base_delay_ms), "First backoff delay")
    ("retry-max-ms", po::value<int64_t>(&max_delay_ms)->default_value(max_delay_ms), "Backoff delay cap")
    ("connect-timeout-ms", po::value<int64_t>(&connect_timeout_ms)->default_value(connect_timeout_ms),
     "Connect timeout")
    ("chunk-timeout-ms", po::value<int64_t>(&chunk_timeout_ms)->default_value(chunk_timeout_ms),
     "Timeout of each frame exchange")
    ("session-timeout-s", po::value<int64_t>(&session_timeout_s)->default_value(0),
     "Bound on the whole transfer including retries, 0 for none");
  add_logging_options(desc, options.log);

  po::positional_options_description positional;
  positional.add("file", 1);

  auto vm = parse(argc, argv, desc, positional);
  options.help_text = help_text(desc);
  if (vm.count("help")) {
    options.show_help = true;
    return options;
  }

  if (options.file_path.empty()) {
    throw ConfigError("No file to send");
  }
  if (options.passphrase.empty()) {
    throw ConfigError("A credential passphrase is required (--passphrase or BXFER_PASSPHRASE)");
  }
  if (connect_timeout_ms <= 0 || chunk_timeout_ms <= 0 || session_timeout_s < 0) {
    throw ConfigError("Timeouts must be positive");
  }
  if (resume_max_age_s < 0) {
    throw ConfigError("--resume-max-age-s must not be negative");
  }
  if (retry.max_attempts <= 0 || base_delay_ms < 0 || max_delay_ms < base_delay_ms) {
    throw ConfigError("Invalid retry settings");
  }
  check_log_level(options.log);

  transfer.tls_verify_peer = !no_verify;
  transfer.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
  transfer.chunk_timeout = std::chrono::milliseconds(chunk_timeout_ms);
  if (session_timeout_s > 0) {
    transfer.session_timeout = std::chrono::seconds(session_timeout_s);
  }
  options.resume_max_age = std::chrono::seconds(resume_max_age_s);
  retry.base_delay = std::chrono::milliseconds(base_delay_ms);
  retry.max_delay = std::chrono::milliseconds(max_delay_ms);
  return options;
}

} // namespace config
} // namespace bxfer
