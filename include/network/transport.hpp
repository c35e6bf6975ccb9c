#ifndef BXFER_NETWORK_TRANSPORT_HPP
#define BXFER_NETWORK_TRANSPORT_HPP

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "network/network_error.hpp"
#include "utils/cancellation.hpp"

namespace bxfer {
namespace network {

// Blocking frame transport, every call is bounded by its own timeout
class Transport {
public:
  virtual ~Transport() = default;

  // Throw TransportError, or OperationCancelled when the attached token fires
  virtual void send_frame(const Frame& frame, std::chrono::milliseconds timeout) = 0;
  virtual Frame receive_frame(std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;
  // Thread-safe, makes a blocked send or receive fail promptly
  virtual void abort() = 0;
  virtual bool is_open() const = 0;
  virtual std::string remote_address() const = 0;

  void set_cancellation(const utils::CancellationToken* cancellation) { cancellation_ = cancellation; }

protected:
  const utils::CancellationToken* cancellation_ = nullptr;
};

// Transport over any Asio stream whose lowest layer is a TCP socket.
// Owns a private io_context and runs it only while a call is in progress.
template <typename Stream>
class StreamTransport : public Transport {
public:
  using Clock = std::chrono::steady_clock;
  using Socket = typename Stream::lowest_layer_type;

  ~StreamTransport() override { close(); }

  StreamTransport(const StreamTransport&) = delete;
  StreamTransport& operator=(const StreamTransport&) = delete;

  // ---- FRAME OPERATIONS ----
  void send_frame(const Frame& frame, std::chrono::milliseconds timeout) override;
  Frame receive_frame(std::chrono::milliseconds timeout) override;


  // ---- CONNECTION CONTROL ----
  // Resolves host and connects the underlying socket
  void connect_socket(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
  void close() override;
  void abort() override;
  bool is_open() const override { return stream_.lowest_layer().is_open() && !aborted_.load(); }
  std::string remote_address() const override;

  Socket& socket() { return stream_.lowest_layer(); }

protected:
  template <typename... Args>
  explicit StreamTransport(Args&&... args)
    : stream_(io_context_, std::forward<Args>(args)...) {}

  // Runs the io_context until done is set, the deadline passes, the token fires or abort() is called
  void run_until(const bool& done, Clock::time_point deadline, const char* operation);
  // Closes the socket and rethrows ec as a TransportError
  [[noreturn]] void fail(const boost::system::error_code& ec, const char* operation);

  boost::asio::io_context io_context_;
  Stream stream_;

private:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

  void read_exact(uint8_t* data, std::size_t size, Clock::time_point deadline);
  // Closes the socket and drains the handlers of aborted operations
  void cancel_pending();

  std::atomic<bool> aborted_{false};
};

class TcpTransport : public StreamTransport<boost::asio::ip::tcp::socket> {
public:
  TcpTransport() = default;

  void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    connect_socket(host, port, timeout);
  }
};

class TlsTransport : public StreamTransport<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> {
public:
  explicit TlsTransport(std::shared_ptr<boost::asio::ssl::context> context);

  // TCP connect followed by a client handshake
  void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
  // Server handshake on an accepted socket
  void accept_handshake(std::chrono::milliseconds timeout);

private:
  void handshake(boost::asio::ssl::stream_base::handshake_type type, Clock::time_point deadline);

  std::shared_ptr<boost::asio::ssl::context> context_;
};

struct TransportOptions {
  std::string host = "127.0.0.1";
  uint16_t port = 0;
  bool use_tls = false;
  bool verify_peer = true;
  // Empty uses the system default verify paths
  std::string ca_file;
  std::chrono::milliseconds connect_timeout{10000};
};

// Connects a TCP or TLS transport, the token is attached before connecting
std::unique_ptr<Transport> connect_transport(const TransportOptions& options,
                                             const utils::CancellationToken* cancellation);


//==============================================
// STREAM TRANSPORT IMPLEMENTATION
//==============================================

template <typename Stream>
void StreamTransport<Stream>::send_frame(const Frame& frame, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  std::vector<uint8_t> bytes;
  try {
    bytes = Codec::serialize(frame);
  } catch (const CodecError& e) {
    throw TransportError(TransportErrorCode::PROTOCOL_ERROR, e.what());
  }

  bool done = false;
  boost::system::error_code result;
  boost::asio::async_write(stream_, boost::asio::buffer(bytes),
    [&](const boost::system::error_code& ec, std::size_t) {
      result = ec;
      done = true;
    });
  run_until(done, deadline, "send");
  if (result) {
    fail(result, "send");
  }
  BOOST_LOG_TRIVIAL(trace) << "Transport: Sent " << frame_type_to_string(frame.type) << " frame ("
                           << bytes.size() << " bytes)";
}

template <typename Stream>
Frame StreamTransport<Stream>::receive_frame(std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  std::array<uint8_t, FRAME_HEADER_SIZE> header{};
  read_exact(header.data(), header.size(), deadline);

  FrameHeader parsed{};
  try {
    parsed = Codec::parse_header(header.data());
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: " << e.what();
    close();
    throw TransportError(TransportErrorCode::PROTOCOL_ERROR, e.what());
  }

  Frame frame{parsed.type, std::vector<uint8_t>(parsed.payload_length)};
  if (parsed.payload_length > 0) {
    read_exact(frame.payload.data(), frame.payload.size(), deadline);
  }
  BOOST_LOG_TRIVIAL(trace) << "Transport: Received " << frame_type_to_string(frame.type) << " frame ("
                           << parsed.payload_length << " payload bytes)";
  return frame;
}

template <typename Stream>
void StreamTransport<Stream>::read_exact(uint8_t* data, std::size_t size, Clock::time_point deadline) {
  bool done = false;
  boost::system::error_code result;
  boost::asio::async_read(stream_, boost::asio::buffer(data, size),
    [&](const boost::system::error_code& ec, std::size_t) {
      result = ec;
      done = true;
    });
  run_until(done, deadline, "receive");
  if (result) {
    fail(result, "receive");
  }
}

template <typename Stream>
void StreamTransport<Stream>::connect_socket(const std::string& host, uint16_t port,
                                             std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  BOOST_LOG_TRIVIAL(debug) << "Transport: Resolving " << host << ":" << port;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  boost::system::error_code result;
  auto endpoints = resolver.resolve(host, std::to_string(port), result);
  if (result) {
    throw TransportError(TransportErrorCode::RESOLVE_FAILED,
                         "Failed to resolve " + host + ": " + result.message());
  }

  bool done = false;
  boost::asio::async_connect(socket(), endpoints,
    [&](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
      result = ec;
      done = true;
    });
  run_until(done, deadline, "connect");
  if (result) {
    fail(result, "connect");
  }

  boost::system::error_code ignored;
  socket().set_option(boost::asio::ip::tcp::no_delay(true), ignored);
  BOOST_LOG_TRIVIAL(info) << "Transport: Connected to " << host << ":" << port;
}

template <typename Stream>
void StreamTransport<Stream>::run_until(const bool& done, Clock::time_point deadline, const char* operation) {
  io_context_.restart();
  while (!done) {
    if (aborted_) {
      cancel_pending();
      throw TransportError(TransportErrorCode::CONNECTION_CLOSED,
                           std::string("Transport aborted during ") + operation);
    }
    if (cancellation_ && cancellation_->is_cancelled()) {
      cancel_pending();
      throw utils::OperationCancelled(std::string("Network ") + operation);
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      BOOST_LOG_TRIVIAL(warning) << "Transport: " << operation << " timed out";
      cancel_pending();
      throw TransportError(TransportErrorCode::TIMEOUT, std::string("Network ") + operation + " timed out");
    }

    io_context_.run_for(std::min<Clock::duration>(deadline - now, POLL_INTERVAL));
    if (io_context_.stopped()) {
      io_context_.restart();
    }
  }
}

template <typename Stream>
void StreamTransport<Stream>::fail(const boost::system::error_code& ec, const char* operation) {
  const auto code = aborted_ ? TransportErrorCode::CONNECTION_CLOSED : classify(ec);
  BOOST_LOG_TRIVIAL(debug) << "Transport: " << operation << " failed: " << ec.message();
  close();
  throw TransportError(code, std::string("Network ") + operation + " failed: " + transport_error_to_string(code));
}

template <typename Stream>
void StreamTransport<Stream>::cancel_pending() {
  boost::system::error_code ignored;
  stream_.lowest_layer().close(ignored);
  io_context_.restart();
  io_context_.run();
}

template <typename Stream>
void StreamTransport<Stream>::close() {
  boost::system::error_code ignored;
  if (stream_.lowest_layer().is_open()) {
    stream_.lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    stream_.lowest_layer().close(ignored);
  }
}

template <typename Stream>
void StreamTransport<Stream>::abort() {
  aborted_ = true;
  // Socket close has to happen on the thread running the io_context
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ignored;
    stream_.lowest_layer().close(ignored);
  });
}

template <typename Stream>
std::string StreamTransport<Stream>::remote_address() const {
  boost::system::error_code ec;
  auto endpoint = stream_.lowest_layer().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_TRANSPORT_HPP
