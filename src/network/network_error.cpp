#include "network/network_error.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

namespace bxfer {
namespace network {

const char* transport_error_to_string(TransportErrorCode code) {
  switch (code) {
    case TransportErrorCode::TIMEOUT:            return "Timeout";
    case TransportErrorCode::CONNECTION_REFUSED: return "Connection refused";
    case TransportErrorCode::CONNECTION_RESET:   return "Connection reset";
    case TransportErrorCode::CONNECTION_CLOSED:  return "Connection closed";
    case TransportErrorCode::HOST_UNREACHABLE:   return "Host unreachable";
    case TransportErrorCode::RESOLVE_FAILED:     return "Name resolution failed";
    case TransportErrorCode::TLS_ERROR:          return "TLS error";
    case TransportErrorCode::PROTOCOL_ERROR:     return "Protocol error";
    case TransportErrorCode::UNKNOWN_ERROR:      return "Unknown error";
    default:                                     return "Undefined error";
  }
}

bool is_transient(TransportErrorCode code) {
  switch (code) {
    case TransportErrorCode::TLS_ERROR:
    case TransportErrorCode::PROTOCOL_ERROR:
      return false;
    default:
      return true;
  }
}

TransportErrorCode classify(const boost::system::error_code& ec) {
  namespace error = boost::asio::error;

  if (ec == error::timed_out || ec == error::operation_aborted || ec == error::try_again) {
    return TransportErrorCode::TIMEOUT;
  }
  if (ec == error::connection_refused) {
    return TransportErrorCode::CONNECTION_REFUSED;
  }
  if (ec == error::connection_reset || ec == error::connection_aborted || ec == error::broken_pipe) {
    return TransportErrorCode::CONNECTION_RESET;
  }
  if (ec == error::eof || ec == error::not_connected || ec == error::shut_down ||
      ec == boost::asio::ssl::error::stream_truncated) {
    return TransportErrorCode::CONNECTION_CLOSED;
  }
  if (ec == error::host_unreachable || ec == error::network_unreachable ||
      ec == error::network_down || ec == error::network_reset) {
    return TransportErrorCode::HOST_UNREACHABLE;
  }
  if (ec == error::host_not_found || ec == error::host_not_found_try_again ||
      ec == error::no_data) {
    return TransportErrorCode::RESOLVE_FAILED;
  }
  if (ec.category() == error::get_ssl_category()) {
    return TransportErrorCode::TLS_ERROR;
  }
  return TransportErrorCode::UNKNOWN_ERROR;
}

} // namespace network
} // namespace bxfer
