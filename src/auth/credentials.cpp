#include "auth/credentials.hpp"

namespace bxfer {
namespace auth {

void validate_credentials(const ClientCredentials& credentials) {
  const auto& id = credentials.client_id;
  const auto& secret = credentials.client_secret;

  if (id.size() < MIN_CLIENT_ID_LENGTH || id.size() > MAX_CLIENT_ID_LENGTH) {
    throw CredentialError("Client ID must be between " + std::to_string(MIN_CLIENT_ID_LENGTH) +
                          " and " + std::to_string(MAX_CLIENT_ID_LENGTH) + " characters");
  }
  if (secret.size() < MIN_CLIENT_SECRET_LENGTH || secret.size() > MAX_CLIENT_SECRET_LENGTH) {
    throw CredentialError("Client secret must be between " + std::to_string(MIN_CLIENT_SECRET_LENGTH) +
                          " and " + std::to_string(MAX_CLIENT_SECRET_LENGTH) + " characters");
  }
  if (id.find(':') != std::string::npos) {
    throw CredentialError("Client ID cannot contain colon (:) character");
  }
  if (secret.find(':') != std::string::npos) {
    throw CredentialError("Client secret cannot contain colon (:) character");
  }
}

} // namespace auth
} // namespace bxfer
