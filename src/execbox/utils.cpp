#include "utils.h"

#include <fcntl.h>
#include <dirent.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <ctime>
#include <cstring>
#include <chrono>
#include <random>

#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

namespace {

std::mt19937_64& Rng() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  return rng;
}

} // namespace

// getdents64 rather than opendir, since this runs between fork and exec
int CloseFromProcFs(int minfd) {
  int dfd = open("/proc/self/fd", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) return -1;
  alignas(struct dirent64) char buf[4096];
  long n;
  while ((n = syscall(SYS_getdents64, dfd, buf, sizeof(buf))) > 0) {
    for (long off = 0; off < n;) {
      auto dent = reinterpret_cast<struct dirent64*>(buf + off);
      off += dent->d_reclen;
      const char* ptr = dent->d_name;
      if (*ptr < '0' || *ptr > '9') continue; // . and ..
      int fd = 0;
      for (; *ptr >= '0' && *ptr <= '9'; ptr++) fd = fd * 10 + (*ptr - '0');
      if (fd >= minfd && fd != dfd && close(fd) && errno != EBADF) {
        close(dfd);
        return -1;
      }
    }
  }
  close(dfd);
  return n < 0 ? -1 : 0;
}

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  if (close_range(minfd, ~0U, 0) == 0) return 0;
  // kernels older than 5.9
  return errno == ENOSYS ? CloseFromProcFs(minfd) : -1;
}
#else
int CloseFrom(int minfd) {
  return CloseFromProcFs(minfd);
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeName, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeDesc, Outcome, ENUM_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

std::string RandomHex(size_t len) {
  static const char kDigits[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string ret(len, '0');
  for (auto& c : ret) c = kDigits[dist(Rng())];
  return ret;
}

std::string NewExecutionId() {
  return RandomHex(8);
}

std::string NewSessionId() {
  std::string hex = RandomHex(32);
  hex[12] = '4';
  hex[16] = "89ab"[std::uniform_int_distribution<int>(0, 3)(Rng())];
  return fmt::format("{}-{}-{}-{}-{}",
      hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4), hex.substr(16, 4), hex.substr(20));
}

int64_t CurrentTimestamp() {
  using namespace std::chrono;
  return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

std::string FormatTimestamp(int64_t timestamp) {
  std::time_t secs = timestamp / 1'000'000;
  struct tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", tm, timestamp % 1'000'000);
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

fs::path MakeTempDir(const fs::path& templ) {
  if (!CreateDirs(templ.parent_path())) return fs::path();
  std::string buf = templ.string();
  if (!mkdtemp(buf.data())) {
    spdlog::warn("Failed creating directory {}: {}", buf, strerror(errno));
    return fs::path();
  }
  spdlog::debug("Created directory {}", buf);
  return buf;
}
