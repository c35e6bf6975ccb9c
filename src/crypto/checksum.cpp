#include "crypto/checksum.hpp"
#include <openssl/evp.h>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bxfer::crypto {

//==============================================
// DIGEST CONTEXT
//==============================================

struct DigestState {
  EVP_MD_CTX* ctx = nullptr;

  DigestState() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
      EVP_MD_CTX_free(ctx);
      throw DigestError("Failed to initialize SHA-256");
    }
  }

  ~DigestState() {
    EVP_MD_CTX_free(ctx);
  }
};

DigestContext::DigestContext() : state_(std::make_unique<DigestState>()) {}

DigestContext::~DigestContext() = default;

void DigestContext::update(const void* data, size_t size) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(state_->ctx, data, size) != 1) {
    throw DigestError("Failed to update digest");
  }
}

std::string DigestContext::final_hex() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(state_->ctx, hash, &length) != 1) {
    throw DigestError("Failed to finalize digest");
  }
  finalized_ = true;

  // Convert hash bytes to hex string
  std::stringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

//==============================================
// DIGEST
//==============================================

std::string ChecksumService::digest(const std::vector<uint8_t>& data) const {
  return digest(data.data(), data.size());
}

std::string ChecksumService::digest(const uint8_t* data, size_t size) const {
  DigestContext context;
  context.update(data, size);
  return context.final_hex();
}

std::string ChecksumService::digest_file(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Checksum: Failed to open file: " << path.string();
    throw DigestError("Failed to open file: " + path.string());
  }

  DigestContext context;
  std::array<char, 64 * 1024> buffer;
  size_t total_bytes = 0;
  while (file) {
    file.read(buffer.data(), buffer.size());
    auto bytes_read = file.gcount();
    if (bytes_read > 0) {
      context.update(buffer.data(), static_cast<size_t>(bytes_read));
      total_bytes += static_cast<size_t>(bytes_read);
    }
  }
  if (file.bad()) {
    throw DigestError("Failed to read file: " + path.string());
  }

  auto result = context.final_hex();
  BOOST_LOG_TRIVIAL(debug) << "Checksum: Digested " << total_bytes << " bytes of " << path.string();
  return result;
}

//==============================================
// VERIFICATION
//==============================================

bool ChecksumService::verify(const std::vector<uint8_t>& data, const std::string& expected_digest) const {
  return digests_equal(digest(data), expected_digest);
}

bool ChecksumService::verify_file(const std::filesystem::path& path, const std::string& expected_digest) const {
  return digests_equal(digest_file(path), expected_digest);
}

bool ChecksumService::digests_equal(const std::string& lhs, const std::string& rhs) {
  if (lhs.size() != rhs.size() || lhs.empty()) {
    return false;
  }

  unsigned char diff = 0;
  for (size_t i = 0; i < lhs.size(); ++i) {
    diff |= static_cast<unsigned char>(
      std::tolower(static_cast<unsigned char>(lhs[i])) ^ std::tolower(static_cast<unsigned char>(rhs[i])));
  }
  return diff == 0;
}

} // namespace bxfer::crypto
