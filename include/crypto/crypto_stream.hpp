#ifndef BXFER_CRYPTO_STREAM_HPP
#define BXFER_CRYPTO_STREAM_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "crypto_error.hpp"

namespace bxfer::crypto {

struct CipherContext;

// AES-256-CBC stream cipher used to keep credential data encrypted at rest
class CryptoStream {
public:
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t IV_SIZE = 16;
  static constexpr size_t SALT_SIZE = 16;
  static constexpr size_t ENVELOPE_HEADER_SIZE = SALT_SIZE + IV_SIZE;
  static constexpr int KDF_ITERATIONS = 100000;

  enum class Direction { ENCRYPT, DECRYPT };

  CryptoStream();
  ~CryptoStream();

  // ---- INITIALIZATION ----
  // Key must be KEY_SIZE bytes and IV must be IV_SIZE bytes
  void initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);

  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

  // ---- PASSPHRASE ENVELOPE ----
  // Layout: salt | iv | ciphertext, key derived from the passphrase and salt
  static std::string seal(const std::string& passphrase, const std::string& plaintext);
  // Throws DecryptionError on a short envelope or wrong passphrase
  static std::string open(const std::string& passphrase, const std::string& envelope);

  // ---- KEY MATERIAL ----
  std::vector<uint8_t> generate_IV() const;
  static std::vector<uint8_t> random_bytes(size_t count);
  // PBKDF2-HMAC-SHA256, KEY_SIZE bytes
  static std::vector<uint8_t> derive_key(const std::string& passphrase, const std::vector<uint8_t>& salt);

private:
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  static constexpr size_t BUFFER_SIZE = 8192;

  void transform(std::istream& input, std::ostream& output, Direction direction);
};

} // namespace bxfer::crypto

#endif // BXFER_CRYPTO_STREAM_HPP
