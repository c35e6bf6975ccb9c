#include "network/file_receiver.hpp"
#include <algorithm>
#include "network/receiver_session.hpp"

namespace bxfer {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileReceiver::FileReceiver(ReceiverConfig config, auth::AuthenticationValidator& validator,
                           transfer::ChunkManager& chunk_manager)
  : config_(std::move(config))
  , validator_(validator)
  , chunk_manager_(chunk_manager) {
  BOOST_LOG_TRIVIAL(info) << "File receiver: Initializing on " << config_.bind_address
                          << (config_.use_tls() ? " with TLS" : "");
}

FileReceiver::~FileReceiver() {
  stop_listening();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool FileReceiver::start_listening(uint16_t port) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "File receiver: Already listening on port " << bound_port_;
    return false;
  }

  try {
    tls_context_ = config_.use_tls() ? create_tls_context() : nullptr;

    io_context_ = std::make_unique<boost::asio::io_context>();
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(config_.bind_address), port);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(*io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Failed to listen on " << config_.bind_address << ":" << port
                             << ": " << e.what();
    acceptor_.reset();
    io_context_.reset();
    tls_context_.reset();
    return false;
  }

  workers_ = std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(config_.worker_threads, 1));
  is_running_ = true;
  start_accept();

  if (config_.session_idle_timeout.count() > 0) {
    sweep_timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);
    // Clears scratch a previous run left behind
    boost::asio::post(*workers_, [this]() { sweep_idle_sessions(); });
    schedule_sweep();
  }

  // Start io_context in a separate thread
  io_thread_ = std::make_unique<std::thread>([this]() {
    auto work = boost::asio::make_work_guard(*io_context_);
    try {
      io_context_->run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "File receiver: IO context error: " << e.what();
    }
  });

  BOOST_LOG_TRIVIAL(info) << "File receiver: Listening on " << config_.bind_address << ":" << bound_port_;
  return true;
}

void FileReceiver::stop_listening() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "File receiver: Initiating shutdown";

  // No accept handler runs once the io thread is joined
  io_context_->stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  boost::system::error_code ec;
  acceptor_->close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Error closing acceptor: " << ec.message();
  }

  {
    std::lock_guard<std::mutex> connections_lock(connections_mutex_);
    BOOST_LOG_TRIVIAL(debug) << "File receiver: Closing " << connections_.size() << " live connections";
    for (const auto& transport : connections_) {
      transport->abort();
    }
  }
  workers_->join();

  {
    std::lock_guard<std::mutex> connections_lock(connections_mutex_);
    connections_.clear();
  }
  sweep_timer_.reset();
  workers_.reset();
  io_thread_.reset();
  acceptor_.reset();
  io_context_.reset();
  tls_context_.reset();
  bound_port_ = 0;

  BOOST_LOG_TRIVIAL(info) << "File receiver: Shutdown complete";
}

std::size_t FileReceiver::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}


//==============================================
// CONNECTION HANDLING
//==============================================

void FileReceiver::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  if (tls_context_) {
    accept_into(std::make_shared<TlsTransport>(tls_context_));
  } else {
    accept_into(std::make_shared<TcpTransport>());
  }
}

template <typename ConcreteTransport>
void FileReceiver::accept_into(std::shared_ptr<ConcreteTransport> transport) {
  acceptor_->async_accept(transport->socket(),
    [this, transport](const boost::system::error_code& error) {
      if (!error) {
        {
          std::lock_guard<std::mutex> lock(connections_mutex_);
          connections_.insert(transport);
        }
        boost::asio::post(*workers_, [this, transport]() { serve(transport); });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "File receiver: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void FileReceiver::serve(std::shared_ptr<Transport> transport) {
  try {
    if (auto tls = std::dynamic_pointer_cast<TlsTransport>(transport)) {
      tls->accept_handshake(config_.handshake_timeout);
    }
    ReceiverSession session(*transport, validator_, chunk_manager_, config_.receive_timeout, config_.send_timeout);
    session.run();
  } catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(warning) << "File receiver: Connection from " << transport->remote_address()
                               << " ended: " << e.what();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Connection handler error: " << e.what();
  }

  transport->close();
  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.erase(transport);
}


//==============================================
// SESSION EXPIRY
//==============================================

void FileReceiver::schedule_sweep() {
  sweep_timer_->expires_after(config_.sweep_interval);
  sweep_timer_->async_wait([this](const boost::system::error_code& error) {
    if (error || !is_running_) {
      return;
    }
    boost::asio::post(*workers_, [this]() { sweep_idle_sessions(); });
    schedule_sweep();
  });
}

void FileReceiver::sweep_idle_sessions() {
  try {
    chunk_manager_.expire_idle_sessions(config_.session_idle_timeout);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Session expiry failed: " << e.what();
  }
}

std::shared_ptr<boost::asio::ssl::context> FileReceiver::create_tls_context() const {
  auto context = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_server);
  context->set_options(boost::asio::ssl::context::default_workarounds |
                       boost::asio::ssl::context::no_sslv2 |
                       boost::asio::ssl::context::no_sslv3);
  context->use_certificate_chain_file(config_.tls_certificate_file);
  context->use_private_key_file(config_.tls_private_key_file, boost::asio::ssl::context::pem);
  BOOST_LOG_TRIVIAL(debug) << "File receiver: Loaded TLS certificate " << config_.tls_certificate_file;
  return context;
}

} // namespace network
} // namespace bxfer
