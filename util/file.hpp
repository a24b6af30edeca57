#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>

#include <kj/common.h>

namespace util {

// Size of the reads done by ReadString.
static const constexpr size_t kReadChunkSize = 64 * 1024;

// Filesystem helpers. Every failure is reported as a std::system_error.
class File {
 public:
  // Reads a whole file in memory.
  static std::string ReadString(const std::string& path);

  // Writes content to a new file with the given mode. Fails if the file
  // exists already.
  static void WriteString(const std::string& path, const std::string& content,
                          int mode = 0600);

  // Creates path and all its missing parents.
  static void MakeDirs(const std::string& path);

  // Creates exactly one directory with exactly the given mode, failing if it
  // already exists.
  static void MakeDir(const std::string& path, int mode = 0700);

  // Recursively removes a tree. Does not cross mount points.
  static void RemoveTree(const std::string& path);

  static std::string JoinPath(const std::string& first,
                              const std::string& second);
  static std::string BaseName(const std::string& path);

  // True if path is a regular file the current user can execute.
  static bool IsExecutable(const std::string& path);
};

// A fresh directory inside base, removed with its content on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  ~TempDir();
  KJ_DISALLOW_COPY(TempDir);

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace util

#endif
