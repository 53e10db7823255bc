#include <execbox/paths.h>

#include <cctype>

fs::path kWorkRoot = "/tmp/execbox";
std::vector<std::string> kInterpreter = {"/usr/bin/env", "python3"};
long kDefaultTimeoutMs = 30'000;
long kMaxTimeoutMs = 120'000;
long kMaxOutputBytes = 2 * 1024 * 1024; // 2M
std::vector<std::string> kScrubEnv = {"SUPABASE_SERVICE_ROLE_KEY", "SUPABASE_URL"};

namespace {

// session ids are caller-controlled; keep only characters safe in a file name
inline std::string SanitizedPrefix(const std::string& id, size_t width) {
  std::string ret;
  for (char c : id) {
    if (ret.size() == width) break;
    if (isalnum((unsigned char)c) || c == '-' || c == '_') ret.push_back(c);
  }
  return ret;
}

} // namespace

fs::path TransientDirTemplate() {
  return kWorkRoot / "exec_XXXXXX";
}

fs::path SessionDirTemplate(const std::string& session_id) {
  return kWorkRoot / ("session_" + SanitizedPrefix(session_id, 8) + "_XXXXXX");
}

fs::path ScriptPath(const fs::path& workdir, const std::string& tag) {
  return workdir / ("script_" + tag + ".py");
}
