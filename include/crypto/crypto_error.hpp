#ifndef BXFER_CRYPTO_ERROR_HPP
#define BXFER_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bxfer::crypto {

enum class CryptoErrorCode {
    INITIALIZATION,   // bad key/iv, missing context, key derivation
    ENCRYPTION,
    DECRYPTION,       // includes padding failures from a wrong key
    DIGEST,
    ENCODING,
    STREAM_IO
};

inline const char* to_string(CryptoErrorCode code) {
    switch (code) {
        case CryptoErrorCode::INITIALIZATION: return "Initialization error";
        case CryptoErrorCode::ENCRYPTION:     return "Encryption error";
        case CryptoErrorCode::DECRYPTION:     return "Decryption error";
        case CryptoErrorCode::DIGEST:         return "Digest error";
        case CryptoErrorCode::ENCODING:       return "Encoding error";
        case CryptoErrorCode::STREAM_IO:      return "Stream error";
    }
    return "Crypto error";
}

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message,
                         CryptoErrorCode code = CryptoErrorCode::STREAM_IO)
        : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code) {}

    CryptoErrorCode code() const { return code_; }

private:
    CryptoErrorCode code_;
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError(message, CryptoErrorCode::INITIALIZATION) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError(message, CryptoErrorCode::ENCRYPTION) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError(message, CryptoErrorCode::DECRYPTION) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError(message, CryptoErrorCode::DIGEST) {}
};

class EncodingError : public CryptoError {
public:
    explicit EncodingError(const std::string& message)
        : CryptoError(message, CryptoErrorCode::ENCODING) {}
};

} // namespace bxfer::crypto

#endif // BXFER_CRYPTO_ERROR_HPP
