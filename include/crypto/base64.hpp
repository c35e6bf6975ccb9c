#ifndef BXFER_CRYPTO_BASE64_HPP
#define BXFER_CRYPTO_BASE64_HPP

#include <string>
#include "crypto_error.hpp"

namespace bxfer::crypto::base64 {

// Standard alphabet with '=' padding
std::string encode(const std::string& input);

// Strict decode: rejects whitespace, characters outside the alphabet,
// lengths not a multiple of four and misplaced padding. Throws EncodingError.
std::string decode(const std::string& input);

} // namespace bxfer::crypto::base64

#endif // BXFER_CRYPTO_BASE64_HPP
