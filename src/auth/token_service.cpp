#include "auth/token_service.hpp"
#include "crypto/base64.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace bxfer {
namespace auth {

AuthenticationTokenService::AuthenticationTokenService(CredentialStore& credential_store)
  : credential_store_(credential_store) {
}

std::string AuthenticationTokenService::create_token(ClientConfiguration* configuration) {
  if (!configuration) {
    throw std::invalid_argument("Client configuration must not be null");
  }

  if (configuration->client_id.empty() && configuration->client_secret.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Token service: No client identity configured, resolving default identity";
    auto credentials = credential_store_.ensure_default();
    configuration->client_id = credentials.client_id;
    configuration->client_secret = credentials.client_secret;
  } else if (!configuration->has_identity()) {
    throw std::invalid_argument("Client ID and client secret must both be set");
  }

  if (configuration->client_id.find(':') != std::string::npos) {
    throw std::invalid_argument("Client ID cannot contain colon (:) character");
  }
  if (configuration->client_secret.find(':') != std::string::npos) {
    throw std::invalid_argument("Client secret cannot contain colon (:) character");
  }

  BOOST_LOG_TRIVIAL(debug) << "Token service: Created token for client " << configuration->client_id;
  return crypto::base64::encode(configuration->client_id + ":" + configuration->client_secret);
}

} // namespace auth
} // namespace bxfer
