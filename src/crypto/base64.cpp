#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <vector>

namespace bxfer::crypto::base64 {

namespace {

bool is_alphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string encode(const std::string& input) {
  if (input.empty()) {
    return {};
  }

  std::vector<unsigned char> output(4 * ((input.size() + 2) / 3) + 1);
  int length = EVP_EncodeBlock(output.data(),
                               reinterpret_cast<const unsigned char*>(input.data()),
                               static_cast<int>(input.size()));
  if (length < 0) {
    throw EncodingError("Base64 encoding failed");
  }
  return std::string(reinterpret_cast<const char*>(output.data()), static_cast<size_t>(length));
}

std::string decode(const std::string& input) {
  if (input.empty()) {
    throw EncodingError("Empty input");
  }
  if (input.size() % 4 != 0) {
    throw EncodingError("Invalid length");
  }

  // Padding may only occupy the last one or two positions
  size_t padding = 0;
  if (input[input.size() - 1] == '=') {
    padding = (input[input.size() - 2] == '=') ? 2 : 1;
  }
  for (size_t i = 0; i < input.size() - padding; ++i) {
    if (!is_alphabet(input[i])) {
      throw EncodingError("Invalid character");
    }
  }

  std::vector<unsigned char> output(3 * (input.size() / 4));
  int length = EVP_DecodeBlock(output.data(),
                               reinterpret_cast<const unsigned char*>(input.data()),
                               static_cast<int>(input.size()));
  if (length < 0 || static_cast<size_t>(length) < padding) {
    throw EncodingError("Malformed input");
  }

  // EVP_DecodeBlock counts padding as zero bytes
  return std::string(reinterpret_cast<const char*>(output.data()), static_cast<size_t>(length) - padding);
}

} // namespace bxfer::crypto::base64
