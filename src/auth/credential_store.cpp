#include "auth/credential_store.hpp"
#include "crypto/base64.hpp"
#include "crypto/crypto_stream.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>

namespace bxfer {
namespace auth {

namespace {

int64_t to_epoch_seconds(SystemClock::time_point time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

SystemClock::time_point from_epoch_seconds(int64_t seconds) {
  return SystemClock::time_point(std::chrono::seconds(seconds));
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileCredentialStore::FileCredentialStore(const std::filesystem::path& file_path, const std::string& passphrase,
                                         const std::string& default_client_id)
  : file_path_(file_path)
  , passphrase_(passphrase)
  , default_client_id_(default_client_id) {
  BOOST_LOG_TRIVIAL(info) << "Credential store: Opening credential store at " << file_path_.string();
  if (passphrase_.empty()) {
    throw CredentialError("Credential store passphrase must not be empty");
  }
  load();
  BOOST_LOG_TRIVIAL(debug) << "Credential store: Loaded " << credentials_.size() << " client(s)";
}


//==============================================
// CREDENTIAL OPERATIONS
//==============================================

void FileCredentialStore::store(const ClientCredentials& credentials) {
  validate_credentials(credentials);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  credentials_[credentials.client_id] = credentials;
  persist();
  BOOST_LOG_TRIVIAL(info) << "Credential store: Stored credentials for client " << credentials.client_id;
}

ClientCredentials FileCredentialStore::ensure_default() {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = credentials_.find(default_client_id_);
    if (it != credentials_.end()) {
      return it->second;
    }
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  // Another writer may have created it while we waited
  auto it = credentials_.find(default_client_id_);
  if (it != credentials_.end()) {
    return it->second;
  }

  ClientCredentials credentials;
  credentials.client_id = default_client_id_;
  credentials.client_secret = generate_secret();
  credentials.is_active = true;
  validate_credentials(credentials);

  credentials_[credentials.client_id] = credentials;
  persist();
  BOOST_LOG_TRIVIAL(info) << "Credential store: Created default client " << default_client_id_;
  return credentials;
}

std::optional<ClientCredentials> FileCredentialStore::lookup(const std::string& client_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = credentials_.find(client_id);
  if (it == credentials_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ClientCredentials FileCredentialStore::register_client(const std::string& client_id) {
  ClientCredentials credentials;
  credentials.client_id = client_id;
  credentials.client_secret = generate_secret();
  validate_credentials(credentials);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (credentials_.count(client_id) > 0) {
    throw CredentialError("Client already exists: " + client_id);
  }
  credentials_[client_id] = credentials;
  persist();
  BOOST_LOG_TRIVIAL(info) << "Credential store: Registered client " << client_id;
  return credentials;
}

std::vector<std::string> FileCredentialStore::client_ids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto& entry : credentials_) {
    ids.push_back(entry.first);
  }
  return ids;
}


//==============================================
// PERSISTENCE
//==============================================

void FileCredentialStore::load() {
  if (!std::filesystem::exists(file_path_)) {
    BOOST_LOG_TRIVIAL(debug) << "Credential store: No credential file yet at " << file_path_.string();
    return;
  }

  std::ifstream file(file_path_, std::ios::binary);
  if (!file) {
    throw CredentialError("Failed to open credential file: " + file_path_.string());
  }
  std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  std::string json;
  try {
    json = crypto::CryptoStream::open(passphrase_, contents);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Credential store: " << e.what();
    throw CredentialError("Failed to decrypt credential file: wrong passphrase or corrupt file");
  }

  deserialize(json);
}

void FileCredentialStore::persist() const {
  if (file_path_.has_parent_path()) {
    std::filesystem::create_directories(file_path_.parent_path());
  }

  const auto sealed = crypto::CryptoStream::seal(passphrase_, serialize());

  // Write beside the target then rename so readers never see a partial file
  auto temp_path = file_path_;
  temp_path += ".tmp";
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw CredentialError("Failed to write credential file: " + temp_path.string());
    }
    file.write(sealed.data(), static_cast<std::streamsize>(sealed.size()));
    if (!file.good()) {
      throw CredentialError("Failed to write credential file: " + temp_path.string());
    }
  }
  std::filesystem::rename(temp_path, file_path_);
  BOOST_LOG_TRIVIAL(debug) << "Credential store: Persisted " << credentials_.size() << " client(s)";
}

std::string FileCredentialStore::serialize() const {
  boost::property_tree::ptree clients;
  for (const auto& [id, credentials] : credentials_) {
    boost::property_tree::ptree node;
    node.put("client_id", credentials.client_id);
    node.put("client_secret", credentials.client_secret);
    node.put("active", credentials.is_active);
    node.put("created_at", to_epoch_seconds(credentials.created_at));
    if (credentials.expires_at) {
      node.put("expires_at", to_epoch_seconds(*credentials.expires_at));
    }
    clients.push_back(std::make_pair("", node));
  }

  boost::property_tree::ptree root;
  root.put("version", 1);
  root.add_child("clients", clients);

  std::ostringstream out;
  boost::property_tree::write_json(out, root, false);
  return out.str();
}

void FileCredentialStore::deserialize(const std::string& json) {
  try {
    boost::property_tree::ptree root;
    std::istringstream in(json);
    boost::property_tree::read_json(in, root);

    credentials_.clear();
    auto clients = root.get_child_optional("clients");
    if (!clients) {
      return;
    }
    for (const auto& [key, node] : *clients) {
      ClientCredentials credentials;
      credentials.client_id = node.get<std::string>("client_id");
      credentials.client_secret = node.get<std::string>("client_secret");
      credentials.is_active = node.get<bool>("active", true);
      credentials.created_at = from_epoch_seconds(node.get<int64_t>("created_at", 0));
      if (auto expires = node.get_optional<int64_t>("expires_at")) {
        credentials.expires_at = from_epoch_seconds(*expires);
      }
      credentials_[credentials.client_id] = credentials;
    }
  } catch (const boost::property_tree::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Credential store: Failed to parse credential document: " << e.what();
    throw CredentialError("Credential file is corrupt: " + file_path_.string());
  }
}

std::string FileCredentialStore::generate_secret() {
  auto bytes = crypto::CryptoStream::random_bytes(32);
  return crypto::base64::encode(std::string(bytes.begin(), bytes.end()));
}

} // namespace auth
} // namespace bxfer
