#ifndef BXFER_CRYPTO_CHECKSUM_HPP
#define BXFER_CRYPTO_CHECKSUM_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace bxfer::crypto {

struct DigestState;

// Incremental SHA-256 over a sequence of buffers
class DigestContext {
public:
  DigestContext();
  ~DigestContext();

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, size_t size);
  // Lowercase hex digest, context cannot be updated afterwards
  std::string final_hex();

private:
  std::unique_ptr<DigestState> state_;
  bool finalized_ = false;
};

// SHA-256 digests used identically by client and receiver for chunks and whole files
class ChecksumService {
public:
  static constexpr size_t DIGEST_HEX_LENGTH = 64;

  // ---- DIGEST ----
  std::string digest(const std::vector<uint8_t>& data) const;
  std::string digest(const uint8_t* data, size_t size) const;
  // Streams the file through the digest, throws DigestError if it cannot be read
  std::string digest_file(const std::filesystem::path& path) const;

  
  // ---- VERIFICATION ----
  bool verify(const std::vector<uint8_t>& data, const std::string& expected_digest) const;
  bool verify_file(const std::filesystem::path& path, const std::string& expected_digest) const;

  // Case-insensitive, constant time for equal lengths
  static bool digests_equal(const std::string& lhs, const std::string& rhs);
};

} // namespace bxfer::crypto

#endif // BXFER_CRYPTO_CHECKSUM_HPP
