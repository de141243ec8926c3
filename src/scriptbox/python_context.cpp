#include "python_context.h"

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(_scriptbox, m) {
  py::class_<ToolProxy>(m, "ToolProxy")
    .def("submit", [](ToolProxy& proxy, const std::string& name, const std::string& args_json) {
      nlohmann::json args = nlohmann::json::parse(args_json, nullptr, false);
      if (args.is_discarded()) throw py::value_error("tool arguments are not valid JSON");
      return proxy.Submit(name, args);
    })
    .def("wait", [](ToolProxy& proxy, const std::string& id) {
      CallSettlement settlement = proxy.Wait(id);
      return py::make_tuple(static_cast<int>(settlement.kind), settlement.text);
    })
    .def("emit", [](ToolProxy& proxy, int stream, const std::string& data) {
      if (stream != static_cast<int>(OutputStream::STDOUT) &&
          stream != static_cast<int>(OutputStream::STDERR)) {
        throw py::value_error("invalid output stream");
      }
      proxy.Emit(static_cast<OutputStream>(stream), data);
    });
}

namespace {

// Runs in __main__ with the real builtins; scripts get their own scope from _scriptbox_run.
// The numeric constants mirror SettleKind and OutputStream.
const char kPrelude[] = R"py(
import builtins as _builtins
import json as _json
import sys as _sys
import ast as _ast
import _scriptbox as _sb

_proxy = _sb.proxy

_RESULT, _TOOL_ERROR, _LIMIT_EXCEEDED, _CANCELLED = 0, 1, 2, 3
_STDOUT, _STDERR = 0, 1


class ToolError(Exception):
    pass


class ToolLimitExceeded(ToolError):
    pass


class PendingTool:
    def __init__(self, name, call_id):
        self.name = name
        self.id = call_id
        self._settled = False
        self._value = None
        self._error = None

    def result(self):
        if not self._settled:
            kind, text = _proxy.wait(self.id)
            self._settled = True
            if kind == _RESULT:
                self._value = text
            elif kind == _LIMIT_EXCEEDED:
                self._error = ToolLimitExceeded(text)
            else:
                self._error = ToolError(text)
        if self._error is not None:
            raise self._error
        return self._value


def submit_tool(name, **args):
    args = {k: v for k, v in args.items() if v is not None}
    return PendingTool(name, _proxy.submit(str(name), _json.dumps(args, default=str)))


def call_tool(name, **args):
    return submit_tool(name, **args).result()


def read(path, **options):
    return call_tool("read", path=path, **options)


def write(path, content):
    return call_tool("write", path=path, content=content)


def edit(**params):
    return call_tool("edit", **params)


def bash(command, **options):
    return call_tool("bash", command=command, **options)


def grep(pattern, **options):
    return call_tool("grep", pattern=pattern, **options)


def ls(path=None):
    return call_tool("ls", path=path)


def find(pattern, **options):
    return call_tool("find", pattern=pattern, **options)


def lsp(**params):
    return call_tool("lsp", **params)


def _render(value):
    if isinstance(value, str):
        return value
    try:
        return _json.dumps(value, indent=2)
    except (TypeError, ValueError):
        return str(value)


def _emit(stream, args):
    _proxy.emit(stream, " ".join(_render(a) for a in args) + "\n")


class _Console:
    def log(self, *args):
        _emit(_STDOUT, args)

    def info(self, *args):
        _emit(_STDOUT, args)

    def warn(self, *args):
        _emit(_STDERR, args)

    def error(self, *args):
        _emit(_STDERR, args)

    def debug(self, *args):
        pass


class _Stream:
    def __init__(self, stream):
        self._stream = stream

    def write(self, text):
        text = str(text)
        _proxy.emit(self._stream, text)
        return len(text)

    def flush(self):
        pass


def _print(*args, sep=" ", end="\n", file=None, flush=False):
    sep = " " if sep is None else sep
    end = "\n" if end is None else end
    text = sep.join(str(a) for a in args) + end
    if file is None:
        _proxy.emit(_STDOUT, text)
        return
    file.write(text)
    if flush and hasattr(file, "flush"):
        file.flush()


_ALLOWED_MODULES = frozenset((
    "base64", "bisect", "cmath", "collections", "copy", "dataclasses", "datetime",
    "decimal", "difflib", "enum", "fractions", "functools", "hashlib", "heapq",
    "itertools", "json", "math", "operator", "random", "re", "statistics", "string",
    "textwrap", "time", "typing", "unicodedata",
))
_REMOVED_BUILTINS = ("open", "exec", "eval", "compile", "input", "breakpoint")
_real_import = _builtins.__import__


def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.partition(".")[0] not in _ALLOWED_MODULES:
        raise ImportError(f"import of '{name}' is not allowed")
    return _real_import(name, globals, locals, fromlist, level)


def _restricted_builtins():
    ret = dict(_builtins.__dict__)
    for name in _REMOVED_BUILTINS:
        ret.pop(name, None)
    ret["__import__"] = _guarded_import
    ret["print"] = _print
    return ret


def _describe(exc):
    try:
        message = str(exc)
    except Exception:
        message = "<unprintable>"
    if not message:
        return type(exc).__name__
    return f"{type(exc).__name__}: {message}"


def _encode_value(value):
    if value is None:
        return None
    try:
        return _json.dumps(value, allow_nan=False)
    except (TypeError, ValueError):
        return _json.dumps(str(value))


def _scriptbox_run(code):
    scope = {
        "__builtins__": _restricted_builtins(),
        "__name__": "__script__",
        "console": _Console(),
        "ToolError": ToolError,
        "ToolLimitExceeded": ToolLimitExceeded,
        "PendingTool": PendingTool,
    }
    for func in (read, write, edit, bash, grep, ls, find, lsp, call_tool, submit_tool):
        scope[func.__name__] = func
    try:
        tree = _ast.parse(code, "<script>", "exec")
        # a trailing expression is the script's value
        tail = None
        if tree.body and isinstance(tree.body[-1], _ast.Expr):
            tail = _ast.Expression(tree.body.pop().value)
        exec(compile(tree, "<script>", "exec"), scope)
        value = eval(compile(tail, "<script>", "eval"), scope) if tail is not None else None
    except SystemExit as exc:
        if exc.code is None or exc.code == 0:
            return None, False, None
        return _describe(exc), False, None
    except BaseException as exc:
        return _describe(exc), isinstance(exc, ToolLimitExceeded), None
    return None, False, _encode_value(value)


_sys.stdout = _Stream(_STDOUT)
_sys.stderr = _Stream(_STDERR)
)py";

} // namespace

bool PythonContext::Init() {
  try {
    // no signal handlers: the supervisor ends the worker with SIGKILL only
    interpreter_.emplace(false);
    py::module_ sb = py::module_::import("_scriptbox");
    sb.attr("proxy") = py::cast(&proxy_, py::return_value_policy::reference);
    py::exec(kPrelude);
  } catch (const py::error_already_set& err) {
    spdlog::error("Failed to set up the script environment: {}", err.what());
    return false;
  } catch (const std::exception& err) {
    spdlog::error("Python initialization failed: {}", err.what());
    return false;
  }
  return true;
}

ScriptOutcome PythonContext::Run(const std::string& code) {
  ScriptOutcome outcome;
  if (!interpreter_) {
    outcome.error = "InternalError: interpreter not initialized";
    return outcome;
  }
  try {
    py::object run = py::module_::import("__main__").attr("_scriptbox_run");
    py::tuple ret = run(code);
    if (!ret[0].is_none()) outcome.error = ret[0].cast<std::string>();
    outcome.limit_error = ret[1].cast<bool>();
    if (!ret[2].is_none()) {
      nlohmann::json value = nlohmann::json::parse(ret[2].cast<std::string>(), nullptr, false);
      if (!value.is_discarded()) outcome.return_value = std::move(value);
    }
  } catch (const std::exception& err) {
    spdlog::error("Script runner failed: {}", err.what());
    outcome.error = "InternalError: script runner failed";
  }
  return outcome;
}
