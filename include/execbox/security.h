#ifndef INCLUDE_EXECBOX_SECURITY_H_
#define INCLUDE_EXECBOX_SECURITY_H_

#include <regex>
#include <memory>
#include <string>
#include <vector>
#include <unordered_set>

struct SecurityVerdict {
  bool safe;
  std::string reason; // empty when safe

  SecurityVerdict() : safe(true) {}
  static SecurityVerdict Unsafe(std::string reason) {
    SecurityVerdict ret;
    ret.safe = false;
    ret.reason = std::move(reason);
    return ret;
  }
};

// One independent screening pass. Validators must be safe to call concurrently.
class SecurityValidator {
 public:
  virtual ~SecurityValidator() = default;
  virtual const char* Name() const = 0;
  virtual SecurityVerdict Check(const std::string& code) const = 0;
};

// Rejects imports whose top-level module is blocklisted.
// Code that does not parse is let through; the interpreter reports the syntax error.
class ImportValidator : public SecurityValidator {
  std::unordered_set<std::string> blocked_;
 public:
  ImportValidator();
  explicit ImportValidator(const std::vector<std::string>& blocked_modules);
  const char* Name() const override { return "import"; }
  SecurityVerdict Check(const std::string& code) const override;
};

// Rejects dangerous call sites by regex over the raw text, parseable or not.
// Strings built at runtime are not detected.
class PatternValidator : public SecurityValidator {
  std::vector<std::pair<std::string, std::regex>> patterns_;
 public:
  PatternValidator();
  explicit PatternValidator(const std::vector<std::string>& patterns);
  const char* Name() const override { return "pattern"; }
  SecurityVerdict Check(const std::string& code) const override;
};

class SecurityAnalyzer {
  std::vector<std::unique_ptr<SecurityValidator>> validators_;
 public:
  // import pass followed by pattern pass
  SecurityAnalyzer();
  explicit SecurityAnalyzer(std::vector<std::unique_ptr<SecurityValidator>>&& validators);

  void AddValidator(std::unique_ptr<SecurityValidator>&& validator);
  // first unsafe verdict wins
  SecurityVerdict Analyze(const std::string& code) const;
};

const std::vector<std::string>& DefaultBlockedModules();
const std::vector<std::string>& DefaultBlockedPatterns();

#endif  // INCLUDE_EXECBOX_SECURITY_H_
