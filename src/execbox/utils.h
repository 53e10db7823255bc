#ifndef EXECBOX_UTILS_H_
#define EXECBOX_UTILS_H_

#include <filesystem>

#include <execbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm700 = fs::perms::owner_all;

// async-signal-safe
int CloseFrom(int minfd);
int CloseFromProcFs(int minfd);

// lowercase hex, thread-safe
std::string RandomHex(size_t len);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// mkdtemp; the template must end with XXXXXX. Returns an empty path on failure
fs::path MakeTempDir(const fs::path& templ);

#endif  // EXECBOX_UTILS_H_
