#ifndef BXFER_AUTH_TOKEN_VALIDATOR_HPP
#define BXFER_AUTH_TOKEN_VALIDATOR_HPP

#include <optional>
#include <string>
#include "auth/audit_log.hpp"
#include "auth/credential_store.hpp"
#include "auth/lockout_tracker.hpp"

namespace bxfer {
namespace auth {

// Messages returned to clients, none of them carry internal details
namespace messages {
constexpr const char* INVALID_FORMAT = "Invalid authentication token format";
constexpr const char* INVALID_CREDENTIALS = "Invalid client credentials";
constexpr const char* INACTIVE = "Client account is inactive";
constexpr const char* EXPIRED = "Client credentials have expired";
constexpr const char* LOCKED = "Account temporarily locked due to too many failed authentication attempts";
} // namespace messages

// Server side: validates bearer tokens, enforces lockout and audits every attempt
class AuthenticationValidator {
public:
  static constexpr const char* AUDIT_OPERATION = "token-validation";

  AuthenticationValidator(CredentialStore& credential_store, AuditLog& audit_log,
                          LockoutPolicy policy = {}, LockoutTracker::TimeSource time_source = {});

  // Exactly one audit record is written before returning
  ValidationResult validate_token(const std::string& token);

  LockoutTracker& lockout() { return lockout_; }

private:
  struct ParsedToken {
    std::string client_id;
    std::string client_secret;
  };

  // Empty optional when the token is not base64 of exactly "id:secret"
  static std::optional<ParsedToken> parse(const std::string& token);
  static bool secrets_equal(const std::string& lhs, const std::string& rhs);

  ValidationResult reject(const std::optional<std::string>& client_id, const char* message,
                          const std::string& detail, bool count_failure);

  CredentialStore& credential_store_;
  AuditLog& audit_log_;
  LockoutTracker lockout_;
};

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_TOKEN_VALIDATOR_HPP
