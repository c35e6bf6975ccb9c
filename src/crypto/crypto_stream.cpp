#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <array>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bxfer::crypto {

namespace {

const char* direction_name(CryptoStream::Direction direction) {
  return direction == CryptoStream::Direction::ENCRYPT ? "encryption" : "decryption";
}

[[noreturn]] void throw_for(CryptoStream::Direction direction, const std::string& message) {
  if (direction == CryptoStream::Direction::ENCRYPT) {
    throw EncryptionError(message);
  }
  throw DecryptionError(message);
}

} // namespace

//==============================================
// CIPHER CONTEXT
//==============================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx;

  CipherContext() : ctx(EVP_CIPHER_CTX_new()) {
    if (!ctx) {
      throw InitializationError("Failed to allocate cipher context");
    }
  }

  ~CipherContext() { EVP_CIPHER_CTX_free(ctx); }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;
};

CryptoStream::CryptoStream() : context_(std::make_unique<CipherContext>()) {}

CryptoStream::~CryptoStream() = default;

void CryptoStream::initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Key is " << key.size() << " bytes, expected " << KEY_SIZE;
    throw InitializationError("Invalid key size");
  }
  if (iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: IV is " << iv.size() << " bytes, expected " << IV_SIZE;
    throw InitializationError("Invalid IV size");
  }

  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

//==============================================
// STREAM TRANSFORM
//==============================================

void CryptoStream::transform(std::istream& input, std::ostream& output, Direction direction) {
  if (!is_initialized_) {
    throw InitializationError("Cipher used before initialize()");
  }
  if (!input.good() || !output.good()) {
    throw CryptoError("Stream not usable");
  }

  EVP_CIPHER_CTX* ctx = context_->ctx;
  EVP_CIPHER_CTX_reset(ctx);
  const int enc = direction == Direction::ENCRYPT ? 1 : 0;
  if (EVP_CipherInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key_.data(), iv_.data(), enc) != 1) {
    throw_for(direction, "Failed to set up cipher");
  }

  std::array<uint8_t, BUFFER_SIZE> in;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> out;
  size_t produced = 0;

  auto emit = [&](int length) {
    if (length <= 0) {
      return;
    }
    output.write(reinterpret_cast<const char*>(out.data()), length);
    if (!output.good()) {
      throw CryptoError("Failed to write cipher output");
    }
    produced += static_cast<size_t>(length);
  };

  while (input) {
    input.read(reinterpret_cast<char*>(in.data()), static_cast<std::streamsize>(in.size()));
    const auto count = input.gcount();
    if (count <= 0) {
      break;
    }
    int length = 0;
    if (EVP_CipherUpdate(ctx, out.data(), &length, in.data(), static_cast<int>(count)) != 1) {
      throw_for(direction, "Failed to process block");
    }
    emit(length);
  }
  if (input.bad()) {
    throw CryptoError("Failed to read cipher input");
  }

  // A wrong key surfaces here as a padding failure
  int length = 0;
  if (EVP_CipherFinal_ex(ctx, out.data(), &length) != 1) {
    throw_for(direction, "Failed to finalize");
  }
  emit(length);
  output.flush();

  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: " << direction_name(direction) << " produced " << produced << " bytes";
}

std::ostream& CryptoStream::encrypt(std::istream& input, std::ostream& output) {
  transform(input, output, Direction::ENCRYPT);
  return output;
}

std::ostream& CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  transform(input, output, Direction::DECRYPT);
  return output;
}

//==============================================
// PASSPHRASE ENVELOPE
//==============================================

std::string CryptoStream::seal(const std::string& passphrase, const std::string& plaintext) {
  const auto salt = random_bytes(SALT_SIZE);
  const auto iv = random_bytes(IV_SIZE);

  CryptoStream cipher;
  cipher.initialize(derive_key(passphrase, salt), iv);
  std::istringstream in(plaintext);
  std::ostringstream out;
  out.write(reinterpret_cast<const char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
  out.write(reinterpret_cast<const char*>(iv.data()), static_cast<std::streamsize>(iv.size()));
  cipher.encrypt(in, out);
  return out.str();
}

std::string CryptoStream::open(const std::string& passphrase, const std::string& envelope) {
  if (envelope.size() <= ENVELOPE_HEADER_SIZE) {
    throw DecryptionError("Envelope too short");
  }
  const std::vector<uint8_t> salt(envelope.begin(), envelope.begin() + SALT_SIZE);
  const std::vector<uint8_t> iv(envelope.begin() + SALT_SIZE, envelope.begin() + ENVELOPE_HEADER_SIZE);

  CryptoStream cipher;
  cipher.initialize(derive_key(passphrase, salt), iv);
  std::istringstream in(envelope.substr(ENVELOPE_HEADER_SIZE));
  std::ostringstream out;
  cipher.decrypt(in, out);
  return out.str();
}

//==============================================
// KEY MATERIAL
//==============================================

std::vector<uint8_t> CryptoStream::generate_IV() const {
  return random_bytes(IV_SIZE);
}

std::vector<uint8_t> CryptoStream::random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw InitializationError("RAND_bytes failed");
  }
  return bytes;
}

std::vector<uint8_t> CryptoStream::derive_key(const std::string& passphrase, const std::vector<uint8_t>& salt) {
  if (passphrase.empty()) {
    throw InitializationError("Empty passphrase");
  }

  std::vector<uint8_t> key(KEY_SIZE);
  if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        KDF_ITERATIONS, EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    throw InitializationError("PBKDF2 failed");
  }
  return key;
}

} // namespace bxfer::crypto
