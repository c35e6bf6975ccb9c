#ifndef BXFER_AUTH_TOKEN_SERVICE_HPP
#define BXFER_AUTH_TOKEN_SERVICE_HPP

#include <string>
#include "auth/credential_store.hpp"

namespace bxfer {
namespace auth {

// Client side: builds the bearer credential base64(client_id:client_secret).
// The scheme carries no signature or expiry.
class AuthenticationTokenService {
public:
  explicit AuthenticationTokenService(CredentialStore& credential_store);

  // Throws std::invalid_argument for a null configuration, a colon in either field
  // or a half-filled identity. An empty identity is replaced in place by the default one.
  std::string create_token(ClientConfiguration* configuration);

private:
  CredentialStore& credential_store_;
};

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_TOKEN_SERVICE_HPP
