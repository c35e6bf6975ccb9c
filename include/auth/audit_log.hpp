#ifndef BXFER_AUTH_AUDIT_LOG_HPP
#define BXFER_AUTH_AUDIT_LOG_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include "auth/credentials.hpp"

namespace bxfer {
namespace auth {

enum class AuditOutcome {
  SUCCESS,
  FAILURE
};

const char* to_string(AuditOutcome outcome);

struct AuditEntry {
  std::string operation;
  AuditOutcome outcome = AuditOutcome::FAILURE;
  // Absent when the client could not be identified
  std::optional<std::string> client_id;
  SystemClock::time_point timestamp = SystemClock::now();
  std::string detail;
};

class AuditLog {
public:
  virtual ~AuditLog() = default;
  // Returns once the entry is durable
  virtual void record(const AuditEntry& entry) = 0;
};

// Appends one line per entry and flushes before returning
class FileAuditLog : public AuditLog {
public:
  explicit FileAuditLog(const std::filesystem::path& file_path);

  void record(const AuditEntry& entry) override;

  // Renders the line written for an entry
  static std::string format(const AuditEntry& entry);

private:
  std::mutex mutex_;
  std::filesystem::path file_path_;
  std::ofstream stream_;
};

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_AUDIT_LOG_HPP
