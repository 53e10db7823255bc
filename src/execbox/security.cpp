#include <execbox/security.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/imports.h>

namespace {

constexpr size_t kMaxFragment = 60;

} // namespace

const std::vector<std::string>& DefaultBlockedModules() {
  static const std::vector<std::string> kModules = {
    // process & system access
    "subprocess", "multiprocessing", "ctypes", "cffi", "pty",
    "signal", "resource", "mmap", "sysconfig", "distutils",
    // raw networking; HTTP client libraries are allowed
    "socket", "ssl", "asyncio",
    // bulk filesystem manipulation
    "shutil",
    // code execution tricks
    "code", "codeop", "compileall", "py_compile",
    "builtins",
    // dynamic import
    "importlib",
  };
  return kModules;
}

const std::vector<std::string>& DefaultBlockedPatterns() {
  static const std::vector<std::string> kPatterns = {
    R"(os\s*\.\s*system\s*\()",
    R"(os\s*\.\s*popen\s*\()",
    R"(os\s*\.\s*exec[lv])",
    R"(os\s*\.\s*fork\s*\()",
    R"(os\s*\.\s*spawn)",
    R"(os\s*\.\s*kill\s*\()",
    R"(shutil\s*\.\s*rmtree)",
    R"(__import__\s*\()",
    R"(eval\s*\()",
    R"(exec\s*\()",
    R"(compile\s*\()",
    // open() in a writing mode
    R"(open\s*\([^)]*,\s*(?:mode\s*=\s*)?["'][rwax]?[bt]*[wax+][bt+]*["'])",
    R"(globals\s*\(\s*\))",
    R"(locals\s*\(\s*\))",
  };
  return kPatterns;
}

ImportValidator::ImportValidator() : ImportValidator(DefaultBlockedModules()) {}

ImportValidator::ImportValidator(const std::vector<std::string>& blocked_modules) :
    blocked_(blocked_modules.begin(), blocked_modules.end()) {}

SecurityVerdict ImportValidator::Check(const std::string& code) const {
  std::vector<ImportRef> imports;
  std::string error;
  if (!ScanImports(code, imports, &error)) {
    spdlog::debug("Import scan failed, leaving the syntax error to the interpreter: {}", error);
    return SecurityVerdict();
  }
  for (auto& ref : imports) {
    if (!blocked_.count(ref.TopLevel())) continue;
    if (ref.is_from) {
      return SecurityVerdict::Unsafe(
          fmt::format("Security: 'from {} import ...' is not permitted", ref.module));
    }
    return SecurityVerdict::Unsafe(
        fmt::format("Security: import of '{}' is not permitted", ref.module));
  }
  return SecurityVerdict();
}

PatternValidator::PatternValidator() : PatternValidator(DefaultBlockedPatterns()) {}

PatternValidator::PatternValidator(const std::vector<std::string>& patterns) {
  for (auto& i : patterns) patterns_.emplace_back(i, std::regex(i, std::regex::ECMAScript));
}

SecurityVerdict PatternValidator::Check(const std::string& code) const {
  std::smatch match;
  for (auto& [source, pattern] : patterns_) {
    if (!std::regex_search(code, match, pattern)) continue;
    std::string fragment = match.str(0).substr(0, kMaxFragment);
    spdlog::debug("Pattern {} matched '{}'", source, fragment);
    return SecurityVerdict::Unsafe(
        fmt::format("Security: call matching '{}' is not permitted", fragment));
  }
  return SecurityVerdict();
}

SecurityAnalyzer::SecurityAnalyzer() {
  validators_.push_back(std::make_unique<ImportValidator>());
  validators_.push_back(std::make_unique<PatternValidator>());
}

SecurityAnalyzer::SecurityAnalyzer(std::vector<std::unique_ptr<SecurityValidator>>&& validators) :
    validators_(std::move(validators)) {}

void SecurityAnalyzer::AddValidator(std::unique_ptr<SecurityValidator>&& validator) {
  validators_.push_back(std::move(validator));
}

SecurityVerdict SecurityAnalyzer::Analyze(const std::string& code) const {
  for (auto& validator : validators_) {
    SecurityVerdict verdict = validator->Check(code);
    if (!verdict.safe) {
      spdlog::debug("{} pass rejected code: {}", validator->Name(), verdict.reason);
      return verdict;
    }
  }
  return SecurityVerdict();
}
