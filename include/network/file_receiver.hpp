#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>
#include "auth/token_validator.hpp"
#include "network/transport.hpp"
#include "transfer/chunk_manager.hpp"

namespace bxfer {
namespace network {

struct ReceiverConfig {
  std::string bind_address = "0.0.0.0";
  // Bounds the wait for the next frame of a connection
  std::chrono::milliseconds receive_timeout{60000};
  std::chrono::milliseconds send_timeout{30000};
  std::chrono::milliseconds handshake_timeout{10000};
  std::size_t worker_threads = 4;
  // Sessions no connection holds are discarded after this much inactivity, zero keeps them forever
  std::chrono::milliseconds session_idle_timeout = std::chrono::hours(24);
  std::chrono::milliseconds sweep_interval{60000};

  // TLS is enabled when both are set
  std::string tls_certificate_file;
  std::string tls_private_key_file;

  bool use_tls() const { return !tls_certificate_file.empty() && !tls_private_key_file.empty(); }
};

// Accepts connections on an io_context thread and serves each one as an
// independent ReceiverSession on a worker pool.
class FileReceiver {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileReceiver(ReceiverConfig config, auth::AuthenticationValidator& validator,
               transfer::ChunkManager& chunk_manager);
  ~FileReceiver();

  FileReceiver(const FileReceiver&) = delete;
  FileReceiver& operator=(const FileReceiver&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Port 0 binds an ephemeral port. Returns false if already listening or the bind fails.
  bool start_listening(uint16_t port);
  // Idempotent. Closes live connections and waits for their workers.
  void stop_listening();


  // ---- GETTERS ----
  bool is_listening() const { return is_running_.load(); }
  uint16_t bound_port() const { return bound_port_.load(); }
  std::size_t active_connections() const;

private:

  // ---- PARAMETERS ----
  ReceiverConfig config_;
  auth::AuthenticationValidator& validator_;
  transfer::ChunkManager& chunk_manager_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::mutex lifecycle_mutex_;

  // Incoming connection handlers
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<std::thread> io_thread_;
  std::unique_ptr<boost::asio::thread_pool> workers_;
  std::shared_ptr<boost::asio::ssl::context> tls_context_;
  std::unique_ptr<boost::asio::steady_timer> sweep_timer_;

  // Live connections, aborted on shutdown
  mutable std::mutex connections_mutex_;
  std::unordered_set<std::shared_ptr<Transport>> connections_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  template <typename ConcreteTransport>
  void accept_into(std::shared_ptr<ConcreteTransport> transport);
  // Runs on a worker thread
  void serve(std::shared_ptr<Transport> transport);

  // ---- SESSION EXPIRY ----
  void schedule_sweep();
  void sweep_idle_sessions();

  std::shared_ptr<boost::asio::ssl::context> create_tls_context() const;
};

} // namespace network
} // namespace bxfer
