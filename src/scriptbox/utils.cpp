#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

inline bool IsContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusName, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(CallOutcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CallOutcomeName, CallOutcome, ENUM_CALL_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

bool SetNonblock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    spdlog::warn("Failed setting O_NONBLOCK on fd {}: {}", fd, strerror(errno));
    return false;
  }
  return true;
}

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) return false;
    ptr += ret;
    len -= ret;
  }
  return true;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

std::string Utf8Prefix(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) return str;
  size_t len = max_bytes;
  while (len > 0 && IsContinuation(str[len])) len--;
  return str.substr(0, len);
}

std::string Utf8Suffix(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) return str;
  size_t pos = str.size() - max_bytes;
  while (pos < str.size() && IsContinuation(str[pos])) pos++;
  return str.substr(pos);
}
