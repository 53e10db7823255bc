#ifndef INCLUDE_EXECBOX_PATHS_H_
#define INCLUDE_EXECBOX_PATHS_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Session and transient working directories are all created under this root
extern fs::path kWorkRoot;
// Interpreter command; the script path is appended as the last argument
extern std::vector<std::string> kInterpreter;
extern long kDefaultTimeoutMs;
extern long kMaxTimeoutMs;
// per stream, bytes
extern long kMaxOutputBytes;
// exact variable names removed from the child environment
extern std::vector<std::string> kScrubEnv;

// mkdtemp templates
fs::path TransientDirTemplate();
fs::path SessionDirTemplate(const std::string& session_id);

fs::path ScriptPath(const fs::path& workdir, const std::string& tag);

#endif  // INCLUDE_EXECBOX_PATHS_H_
