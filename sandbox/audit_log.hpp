#ifndef SANDBOX_AUDIT_LOG_HPP
#define SANDBOX_AUDIT_LOG_HPP

#include <ctime>
#include <mutex>
#include <string>

#include "glog/logging.h"

namespace sandbox {

// Per-run log file. Messages reach it through LOG_TO_SINK(sink, severity),
// which also forwards them to the regular glog destinations; when no path is
// configured Sink() is nullptr and only the latter are used.
class AuditLog : public google::LogSink {
 public:
  AuditLog() = default;
  ~AuditLog() override;

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  // Opens path for appending, close-on-exec. An empty path disables the audit
  // log. Returns false if the file cannot be opened.
  bool Open(const std::string& path);

  google::LogSink* Sink() { return fd_ != -1 ? this : nullptr; }

  void send(google::LogSeverity severity, const char* full_filename,
            const char* base_filename, int line, const struct ::tm* tm_time,
            const char* message, size_t message_len) override;

 private:
  std::mutex mutex_;
  int fd_ = -1;
};

}  // namespace sandbox

// Logs to glog and to the audit log of the current run.
#define AUDIT(audit, severity) LOG_TO_SINK((audit)->Sink(), severity)

#endif
