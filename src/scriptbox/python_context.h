#ifndef SCRIPTBOX_PYTHON_CONTEXT_H_
#define SCRIPTBOX_PYTHON_CONTEXT_H_

#include <string>
#include <optional>

#include <pybind11/embed.h>
#include <nlohmann/json.hpp>
#include "pending_calls.h"

struct ScriptOutcome {
  std::optional<std::string> error; // "<ExceptionType>: <message>"
  bool limit_error; // the script died of an unhandled ToolLimitExceeded
  // value of the script's trailing expression, if it has one that is not None
  std::optional<nlohmann::json> return_value;

  ScriptOutcome() : limit_error(false) {}
};

// The embedded interpreter. Only one may exist per process.
// Scripts see the tool functions, console, print, ToolError and ToolLimitExceeded; builtins
// that reach the host directly are removed and imports are limited to an allowlist.
class PythonContext {
  ToolProxy& proxy_;
  std::optional<pybind11::scoped_interpreter> interpreter_;
 public:
  explicit PythonContext(ToolProxy& proxy) : proxy_(proxy) {}
  PythonContext(const PythonContext&) = delete;
  PythonContext& operator=(const PythonContext&) = delete;

  bool Init();
  ScriptOutcome Run(const std::string& code);
};

#endif  // SCRIPTBOX_PYTHON_CONTEXT_H_
