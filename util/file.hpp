#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <sys/types.h>

#include <cstdint>
#include <string>

namespace util {

class File {
 public:
  // Reads the whole file specified by path. Throws std::system_error on
  // failure.
  static std::string Read(const std::string& path);

  // Writes contents to path, replacing the file if it exists, and sets its
  // permissions to mode. Throws std::system_error on failure.
  static void Write(const std::string& path, const std::string& contents,
                    mode_t mode = 0644);

  // Makes a full copy of the given file with the given permissions.
  static void Copy(const std::string& from, const std::string& to,
                   mode_t mode);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);
};

// Directory created under base with a unique name, removed with its contents
// on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
};

}  // namespace util

#endif
