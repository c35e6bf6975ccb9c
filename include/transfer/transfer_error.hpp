#ifndef BXFER_TRANSFER_ERROR_HPP
#define BXFER_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bxfer {
namespace transfer {

// Errors that end a transfer session, none of them is retried
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message) 
        : std::runtime_error(message) {}
};

class AuthenticationError : public TransferError {
public:
    explicit AuthenticationError(const std::string& message) 
        : TransferError(message) {}
};

class IntegrityError : public TransferError {
public:
    explicit IntegrityError(const std::string& message) 
        : TransferError(message) {}
};

class ResourceError : public TransferError {
public:
    explicit ResourceError(const std::string& message) 
        : TransferError(message) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message) 
        : TransferError(message) {}
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_ERROR_HPP
