#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <system_error>

#include "glog/logging.h"
#include "util/error.hpp"

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kChunkSize = 32 * 1024;

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* contents) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& contents,
            mode_t mode) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.c_str() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  // The mode given to open is filtered by the umask.
  if (fchmod(fd, mode) == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string contents;
  int err = OsRead(path, &contents);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 mode_t mode) {
  int err = OsWrite(path, contents, mode);
  if (err) {
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::Copy(const std::string& from, const std::string& to, mode_t mode) {
  Write(to, Read(from), mode);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return -1;
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (path_.empty()) return;
  if (!OsRemoveTree(path_)) {
    LOG(WARNING) << "Could not remove " << path_ << ": "
                 << StrError(errno);
  }
}

}  // namespace util
