#ifndef BXFER_AUTH_CREDENTIALS_HPP
#define BXFER_AUTH_CREDENTIALS_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace bxfer {
namespace auth {

using SystemClock = std::chrono::system_clock;

// Identity registered with the receiver
struct ClientCredentials {
  std::string client_id;
  std::string client_secret;
  bool is_active = true;
  SystemClock::time_point created_at = SystemClock::now();
  std::optional<SystemClock::time_point> expires_at;

  bool is_expired(SystemClock::time_point now = SystemClock::now()) const {
    return expires_at && now > *expires_at;
  }
};

// Client-side identity, empty fields are resolved to the default identity
struct ClientConfiguration {
  std::string client_id;
  std::string client_secret;

  bool has_identity() const { return !client_id.empty() && !client_secret.empty(); }
};

struct ValidationResult {
  bool is_valid = false;
  std::string client_id;
  std::string error_message;

  static ValidationResult success(const std::string& client_id) {
    return ValidationResult{true, client_id, {}};
  }
  static ValidationResult failure(const std::string& message) {
    return ValidationResult{false, {}, message};
  }
};

class CredentialError : public std::runtime_error {
public:
  explicit CredentialError(const std::string& message) : std::runtime_error(message) {}
};

// ---- FIELD LIMITS ----
constexpr std::size_t MIN_CLIENT_ID_LENGTH = 3;
constexpr std::size_t MAX_CLIENT_ID_LENGTH = 100;
constexpr std::size_t MIN_CLIENT_SECRET_LENGTH = 8;
constexpr std::size_t MAX_CLIENT_SECRET_LENGTH = 256;

// Throws CredentialError when id or secret break the length or colon rules
void validate_credentials(const ClientCredentials& credentials);

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_CREDENTIALS_HPP
