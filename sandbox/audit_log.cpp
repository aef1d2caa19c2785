#include "sandbox/audit_log.hpp"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <iomanip>
#include <sstream>

#include "util/error.hpp"

namespace sandbox {

AuditLog::~AuditLog() {
  if (fd_ != -1) close(fd_);
}

bool AuditLog::Open(const std::string& path) {
  if (path.empty()) return true;
  fd_ = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  return fd_ != -1;
}

void AuditLog::send(google::LogSeverity severity,
                    const char* /*full_filename*/, const char* base_filename,
                    int line, const struct ::tm* tm_time, const char* message,
                    size_t message_len) {
  std::ostringstream out;
  out << google::GetLogSeverityName(severity)[0]
      << std::put_time(tm_time, "%Y-%m-%d %H:%M:%S") << " " << base_filename
      << ":" << line << "] ";
  out.write(message, message_len);
  out << '\n';
  const std::string entry = out.str();

  std::lock_guard<std::mutex> lck(mutex_);
  size_t pos = 0;
  while (pos < entry.size()) {
    ssize_t written = write(fd_, entry.c_str() + pos, entry.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      // LOG here would come back to this sink.
      RAW_LOG(WARNING, "audit log write: %s", util::StrError(errno).c_str());
      return;
    }
    pos += written;
  }
}

}  // namespace sandbox
