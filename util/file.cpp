#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
#include <vector>

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>

namespace {

const constexpr char kPathSeparator = '/';

[[noreturn]] void Fail(const std::string& what, const std::string& path) {
  throw std::system_error(errno, std::system_category(), what + " " + path);
}

int RemoveEntry(const char* fpath, const struct stat* /*unused*/,
                int /*unused*/, struct FTW* /*unused*/) {
  return remove(fpath);
}

}  // namespace

namespace util {

std::string File::ReadString(const std::string& path) {
  kj::AutoCloseFd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));  // NOLINT
  if (fd.get() == -1) Fail("open", path);
  std::string content;
  std::vector<char> buf(kReadChunkSize);
  while (true) {
    ssize_t amount = read(fd, buf.data(), buf.size());
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) Fail("read", path);
    if (amount == 0) break;
    content.append(buf.data(), amount);
  }
  return content;
}

void File::WriteString(const std::string& path, const std::string& content,
                       int mode) {
  kj::AutoCloseFd fd(open(path.c_str(),  // NOLINT
                          O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode));
  if (fd.get() == -1) Fail("open", path);
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) Fail("write", path);
    pos += written;
  }
}

void File::MakeDirs(const std::string& path) {
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find(kPathSeparator, pos + 1);
    std::string prefix = path.substr(0, pos);
    if (mkdir(prefix.c_str(), 0755) == -1 && errno != EEXIST) {
      Fail("mkdir", prefix);
    }
  }
}

void File::MakeDir(const std::string& path, int mode) {
  if (mkdir(path.c_str(), mode) == -1) Fail("mkdir", path);
  // mkdir applies the umask.
  if (chmod(path.c_str(), mode) == -1) Fail("chmod", path);
}

void File::RemoveTree(const std::string& path) {
  // FTW_MOUNT keeps the walk away from anything an engine mounted inside.
  if (nftw(path.c_str(), RemoveEntry, 64,
           FTW_DEPTH | FTW_PHYS | FTW_MOUNT) == -1) {
    Fail("remove", path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (second[0] == kPathSeparator) return second;
  return first + kPathSeparator + second;
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.rfind(kPathSeparator) + 1);
}

bool File::IsExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string templ = File::JoinPath(base, "XXXXXX");
  if (mkdtemp(&templ[0]) == nullptr) Fail("mkdtemp", templ);
  path_ = templ;
}

TempDir::~TempDir() {
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([&]() {
    try {
      File::RemoveTree(path_);
    } catch (const std::system_error& exc) {
      KJ_LOG(WARNING, "removing temporary directory", path_, exc.what());
    }
  });
}

}  // namespace util
