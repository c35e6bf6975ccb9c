#include "auth/token_validator.hpp"
#include "crypto/base64.hpp"
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace bxfer {
namespace auth {

AuthenticationValidator::AuthenticationValidator(CredentialStore& credential_store, AuditLog& audit_log,
                                                 LockoutPolicy policy, LockoutTracker::TimeSource time_source)
  : credential_store_(credential_store)
  , audit_log_(audit_log)
  , lockout_(policy, std::move(time_source)) {
}

ValidationResult AuthenticationValidator::validate_token(const std::string& token) {
  auto parsed = parse(token);
  if (!parsed) {
    return reject(std::nullopt, messages::INVALID_FORMAT, "malformed token", false);
  }

  const auto& client_id = parsed->client_id;

  if (lockout_.is_locked(client_id)) {
    return reject(client_id, messages::LOCKED, "client locked out", false);
  }

  auto credentials = credential_store_.lookup(client_id);
  if (!credentials) {
    return reject(client_id, messages::INVALID_CREDENTIALS, "unknown client", true);
  }
  if (!secrets_equal(credentials->client_secret, parsed->client_secret)) {
    return reject(client_id, messages::INVALID_CREDENTIALS, "secret mismatch", true);
  }
  if (!credentials->is_active) {
    return reject(client_id, messages::INACTIVE, "client inactive", true);
  }
  if (credentials->is_expired()) {
    return reject(client_id, messages::EXPIRED, "credentials expired", true);
  }

  lockout_.record_success(client_id);
  audit_log_.record(AuditEntry{AUDIT_OPERATION, AuditOutcome::SUCCESS, client_id, SystemClock::now(), {}});
  BOOST_LOG_TRIVIAL(info) << "Auth validator: Client " << client_id << " authenticated";
  return ValidationResult::success(client_id);
}

ValidationResult AuthenticationValidator::reject(const std::optional<std::string>& client_id, const char* message,
                                                 const std::string& detail, bool count_failure) {
  if (count_failure && client_id) {
    lockout_.record_failure(*client_id);
  }

  audit_log_.record(AuditEntry{AUDIT_OPERATION, AuditOutcome::FAILURE, client_id, SystemClock::now(), detail});
  BOOST_LOG_TRIVIAL(warning) << "Auth validator: Authentication failed for client "
                             << client_id.value_or("unknown") << ": " << detail;
  return ValidationResult::failure(message);
}

std::optional<AuthenticationValidator::ParsedToken> AuthenticationValidator::parse(const std::string& token) {
  if (token.empty()) {
    return std::nullopt;
  }

  std::string decoded;
  try {
    decoded = crypto::base64::decode(token);
  } catch (const crypto::EncodingError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Auth validator: Token is not valid base64: " << e.what();
    return std::nullopt;
  }

  const auto colon = decoded.find(':');
  if (colon == std::string::npos || decoded.find(':', colon + 1) != std::string::npos) {
    return std::nullopt;
  }

  ParsedToken parsed{decoded.substr(0, colon), decoded.substr(colon + 1)};
  if (parsed.client_id.empty() || parsed.client_secret.empty()) {
    return std::nullopt;
  }
  return parsed;
}

bool AuthenticationValidator::secrets_equal(const std::string& lhs, const std::string& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

} // namespace auth
} // namespace bxfer
