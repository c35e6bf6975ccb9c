#include "network/transport.hpp"

namespace bxfer {
namespace network {

//==============================================
// TLS TRANSPORT
//==============================================

TlsTransport::TlsTransport(std::shared_ptr<boost::asio::ssl::context> context)
  : StreamTransport(*context)
  , context_(std::move(context)) {
}

void TlsTransport::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  connect_socket(host, port, timeout);

  // Server name indication for virtual-hosted receivers
  if (!SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str())) {
    BOOST_LOG_TRIVIAL(warning) << "TLS transport: Failed to set SNI host name " << host;
  }
  if (SSL_get_verify_mode(stream_.native_handle()) & SSL_VERIFY_PEER) {
    stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));
  }
  handshake(boost::asio::ssl::stream_base::client, deadline);
}

void TlsTransport::accept_handshake(std::chrono::milliseconds timeout) {
  handshake(boost::asio::ssl::stream_base::server, Clock::now() + timeout);
}

void TlsTransport::handshake(boost::asio::ssl::stream_base::handshake_type type, Clock::time_point deadline) {
  bool done = false;
  boost::system::error_code result;
  stream_.async_handshake(type, [&](const boost::system::error_code& ec) {
    result = ec;
    done = true;
  });
  run_until(done, deadline, "TLS handshake");
  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TLS transport: Handshake failed: " << result.message();
    close();
    throw TransportError(TransportErrorCode::TLS_ERROR, "TLS handshake failed");
  }
  BOOST_LOG_TRIVIAL(debug) << "TLS transport: Handshake complete with " << remote_address();
}


//==============================================
// CLIENT CONNECTION
//==============================================

std::unique_ptr<Transport> connect_transport(const TransportOptions& options,
                                             const utils::CancellationToken* cancellation) {
  if (!options.use_tls) {
    auto transport = std::make_unique<TcpTransport>();
    transport->set_cancellation(cancellation);
    transport->connect(options.host, options.port, options.connect_timeout);
    return transport;
  }

  auto context = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
  boost::system::error_code ec;
  if (options.ca_file.empty()) {
    context->set_default_verify_paths(ec);
  } else {
    context->load_verify_file(options.ca_file, ec);
  }
  if (ec) {
    throw TransportError(TransportErrorCode::TLS_ERROR, "Failed to load TLS trust store: " + ec.message());
  }
  context->set_verify_mode(options.verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);

  auto transport = std::make_unique<TlsTransport>(context);
  transport->set_cancellation(cancellation);
  transport->connect(options.host, options.port, options.connect_timeout);
  return transport;
}

} // namespace network
} // namespace bxfer
