#include <execbox/imports.h>

#include <mutex>
#include <algorithm>

#include <fmt/core.h>
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <execbox/executor.h>

namespace py = pybind11;

namespace {

std::once_flag interpreter_once;

// The interpreter lives until exit; the GIL is released so any thread can acquire it.
void EnsureInterpreter() {
  std::call_once(interpreter_once, []() {
    if (!Py_IsInitialized()) {
      // no signal handlers: SIGINT/SIGTERM belong to the daemon
      py::initialize_interpreter(false);
      PyEval_SaveThread();
      spdlog::debug("Embedded Python {} for import analysis", Py_GetVersion());
    }
  });
}

// errors that mean "the interpreter would refuse this source as well"
bool IsSourceError(py::error_already_set& err) {
  return err.matches(PyExc_SyntaxError) || err.matches(PyExc_ValueError) ||
         err.matches(PyExc_RecursionError) || err.matches(PyExc_MemoryError);
}

} // namespace

bool ScanImports(const std::string& code, std::vector<ImportRef>& imports, std::string* error) {
  EnsureInterpreter();
  py::gil_scoped_acquire gil;
  try {
    py::module_ ast = py::module_::import("ast");
    // bytes, so that a BOM or coding cookie is honored the way the interpreter honors it
    py::object tree = ast.attr("parse")(py::bytes(code), "<script>", "exec");
    py::object ast_Import = ast.attr("Import");
    py::object ast_ImportFrom = ast.attr("ImportFrom");

    std::vector<ImportRef> found;
    for (auto node : ast.attr("walk")(tree)) {
      bool is_from = py::isinstance(node, ast_ImportFrom);
      if (!is_from && !py::isinstance(node, ast_Import)) continue;
      int line = node.attr("lineno").cast<int>();
      int col = node.attr("col_offset").cast<int>();
      if (is_from) {
        py::object module = node.attr("module");
        found.push_back({module.is_none() ? "" : module.cast<std::string>(),
                         node.attr("level").cast<int>(), true, line, col});
      } else {
        for (auto alias : node.attr("names")) {
          found.push_back({alias.attr("name").cast<std::string>(), 0, false, line, col});
        }
      }
    }
    // ast.walk is breadth-first
    std::stable_sort(found.begin(), found.end(), [](const ImportRef& a, const ImportRef& b) {
      return std::make_pair(a.line, a.col) < std::make_pair(b.line, b.col);
    });
    imports.insert(imports.end(), found.begin(), found.end());
    return true;
  } catch (py::error_already_set& err) {
    if (!IsSourceError(err)) {
      throw ExecutionError(fmt::format("Import analysis failed: {}", err.what()));
    }
    if (error) *error = err.what();
    return false;
  }
}
