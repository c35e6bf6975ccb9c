#ifndef BXFER_NETWORK_ERROR_HPP
#define BXFER_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

namespace bxfer {
namespace network {

enum class TransportErrorCode {
    TIMEOUT,
    CONNECTION_REFUSED,
    CONNECTION_RESET,
    CONNECTION_CLOSED,
    HOST_UNREACHABLE,
    RESOLVE_FAILED,
    TLS_ERROR,
    PROTOCOL_ERROR,
    UNKNOWN_ERROR
};

const char* transport_error_to_string(TransportErrorCode code);

// Whether an error of this kind may succeed when the operation is retried
bool is_transient(TransportErrorCode code);

// Maps an Asio error to a transport error code
TransportErrorCode classify(const boost::system::error_code& ec);

class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    TransportErrorCode code() const { return code_; }
    bool is_transient() const { return network::is_transient(code_); }

private:
    TransportErrorCode code_;
};

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_ERROR_HPP
