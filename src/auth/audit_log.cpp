#include "auth/audit_log.hpp"
#include <boost/log/trivial.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bxfer {
namespace auth {

const char* to_string(AuditOutcome outcome) {
  switch (outcome) {
    case AuditOutcome::SUCCESS: return "success";
    case AuditOutcome::FAILURE: return "failure";
    default:                    return "unknown";
  }
}

FileAuditLog::FileAuditLog(const std::filesystem::path& file_path) : file_path_(file_path) {
  if (file_path_.has_parent_path()) {
    std::filesystem::create_directories(file_path_.parent_path());
  }
  stream_.open(file_path_, std::ios::out | std::ios::app);
  if (!stream_) {
    throw std::runtime_error("Audit log: Failed to open " + file_path_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Audit log: Writing audit records to " << file_path_.string();
}

void FileAuditLog::record(const AuditEntry& entry) {
  const auto line = format(entry);

  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_.good()) {
    BOOST_LOG_TRIVIAL(error) << "Audit log: Failed to write record to " << file_path_.string();
    throw std::runtime_error("Audit log: Failed to write record");
  }
  BOOST_LOG_TRIVIAL(debug) << "Audit log: " << line;
}

std::string FileAuditLog::format(const AuditEntry& entry) {
  const std::time_t time = SystemClock::to_time_t(entry.timestamp);
  std::tm utc{};
  gmtime_r(&time, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ")
      << " operation=" << entry.operation
      << " outcome=" << to_string(entry.outcome)
      << " client=" << entry.client_id.value_or("unknown");
  if (!entry.detail.empty()) {
    out << " detail=" << std::quoted(entry.detail);
  }
  return out.str();
}

} // namespace auth
} // namespace bxfer
