#ifndef INCLUDE_EXECBOX_IMPORTS_H_
#define INCLUDE_EXECBOX_IMPORTS_H_

#include <string>
#include <vector>

struct ImportRef {
  // dotted module name as the parser normalized it, without leading dots of a relative import
  std::string module;
  int level; // number of leading dots (from-imports only)
  bool is_from;
  int line, col;

  std::string TopLevel() const { return module.substr(0, module.find('.')); }
};

// Collect every import statement of a Python source, in source order, using the
// embedded interpreter's ast module.
// Returns false if the source does not compile; |imports| is left untouched in that case.
// Throws ExecutionError if the analysis itself fails.
bool ScanImports(const std::string& code, std::vector<ImportRef>& imports,
                 std::string* error = nullptr);

#endif  // INCLUDE_EXECBOX_IMPORTS_H_
