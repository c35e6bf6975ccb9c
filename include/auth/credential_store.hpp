#ifndef BXFER_AUTH_CREDENTIAL_STORE_HPP
#define BXFER_AUTH_CREDENTIAL_STORE_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "auth/credentials.hpp"

namespace bxfer {
namespace auth {

class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  // Inserts or replaces credentials for credentials.client_id
  virtual void store(const ClientCredentials& credentials) = 0;
  // Returns the default identity, creating it with a random secret if absent
  virtual ClientCredentials ensure_default() = 0;
  virtual std::optional<ClientCredentials> lookup(const std::string& client_id) const = 0;
};

// Credential file encrypted with AES-256-CBC under a passphrase-derived key.
// Layout: salt | iv | ciphertext of a JSON document.
class FileCredentialStore : public CredentialStore {
public:
  static constexpr const char* DEFAULT_CLIENT_ID = "default-client";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Loads an existing file, throws CredentialError if it cannot be decrypted
  FileCredentialStore(const std::filesystem::path& file_path, const std::string& passphrase,
                      const std::string& default_client_id = DEFAULT_CLIENT_ID);

  
  // ---- CREDENTIAL OPERATIONS ----
  void store(const ClientCredentials& credentials) override;
  ClientCredentials ensure_default() override;
  std::optional<ClientCredentials> lookup(const std::string& client_id) const override;

  // Creates a new client with a random secret, throws CredentialError if it already exists
  ClientCredentials register_client(const std::string& client_id);

  
  // ---- QUERY OPERATIONS ----
  std::vector<std::string> client_ids() const;
  const std::filesystem::path& file_path() const { return file_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path file_path_;
  std::string passphrase_;
  std::string default_client_id_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, ClientCredentials> credentials_;

  
  // ---- PERSISTENCE ----
  void load();
  // Caller holds the exclusive lock
  void persist() const;
  std::string serialize() const;
  void deserialize(const std::string& json);

  static std::string generate_secret();
};

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_CREDENTIAL_STORE_HPP
