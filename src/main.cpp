#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <system_error>
#include <filesystem>

#include <tortellini.hh>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <scriptbox/logger.h>
#include <scriptbox/paths.h>
#include <scriptbox/utils.h>
#include <scriptbox/execution.h>
#include "command_tool.h"

namespace {

std::string tool_command;
std::string script_path;
bool json_output = false;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string output_root = ini[""]["output_root"] | "";
  if (output_root.size()) kOutputRoot = output_root;
  kDefaultTimeoutMs = ini[""]["timeout_ms"] | kDefaultTimeoutMs;
  kDefaultMaxToolCalls = ini[""]["max_tool_calls"] | kDefaultMaxToolCalls;
  kDefaultMaxWorkerMemoryMb = ini[""]["max_worker_memory_mb"] | kDefaultMaxWorkerMemoryMb;
  kDefaultMaxOutputBytes = ini[""]["max_output_bytes"] | kDefaultMaxOutputBytes;
  kDefaultPreviewLines = ini[""]["preview_lines"] | kDefaultPreviewLines;
  tool_command = ini[""]["tool_command"] | tool_command;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "scriptbox");
  parser.add_argument("script")
    .help("Python script to run, or - for stdin");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/scriptbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout-ms")
    .scan<'d', long>()
    .help("Wall-clock limit of the execution");
  parser.add_argument("--max-tool-calls")
    .scan<'d', long>()
    .help("Number of tool calls that may be dispatched");
  parser.add_argument("--max-memory-mb")
    .scan<'d', long>()
    .help("Address space limit of the worker; 0 for no limit");
  parser.add_argument("--max-output-bytes")
    .scan<'d', long>()
    .help("Captured output bound");
  parser.add_argument("--tool-command")
    .help("Shell command that handles tool calls");
  parser.add_argument("--json")
    .default_value(false)
    .implicit_value(true)
    .help("Print the result as JSON");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::info("Configuration file {} not loaded; using defaults", std::string(config_file));
  }
  if (auto val = parser.present<long>("--timeout-ms")) kDefaultTimeoutMs = val.value();
  if (auto val = parser.present<long>("--max-tool-calls")) kDefaultMaxToolCalls = val.value();
  if (auto val = parser.present<long>("--max-memory-mb")) kDefaultMaxWorkerMemoryMb = val.value();
  if (auto val = parser.present<long>("--max-output-bytes")) kDefaultMaxOutputBytes = val.value();
  if (auto val = parser.present("--tool-command")) tool_command = val.value();
  json_output = parser["--json"] == true;
  script_path = parser.get<std::string>("script");
}

bool ReadScript(const std::string& path, std::string& code) {
  if (path == "-") {
    code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  code.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

const CancelToken* cancel_token = nullptr;

void CancelHandler(int) {
  // eventfd write only; safe in a signal handler
  if (cancel_token) cancel_token->Cancel();
}

void PrintResult(const ExecutionResult& result) {
  if (json_output) {
    std::cout << result.ToJson().dump(2) << std::endl;
    return;
  }
  std::cout << result.stdout_preview;
  if (result.stdout_preview.size() && result.stdout_preview.back() != '\n') std::cout << '\n';
  std::cout.flush();
  std::cerr << result.stderr_preview;
  if (result.stderr_preview.size() && result.stderr_preview.back() != '\n') std::cerr << '\n';
  fmt::print(stderr, "[{}] {} tool calls, {} ms\n", ExecutionStatusName(result.status),
             result.tool_calls, result.duration_ms);
  if (result.error_message) fmt::print(stderr, "error: {}\n", *result.error_message);
  if (result.return_value) {
    const nlohmann::json& value = *result.return_value;
    fmt::print(stderr, "return value: {}\n", value.is_string() ?
               value.get<std::string>() : value.dump(2));
  }
  if (result.full_output_path.size()) {
    fmt::print(stderr, "full output: {}\n", result.full_output_path);
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);

  std::string code;
  if (!ReadScript(script_path, code)) {
    spdlog::error("Failed to read script {}", script_path);
    return 1;
  }
  ExecutionRequest request(std::move(code));
  CommandToolCollaborator tools(tool_command);
  std::unique_ptr<CancelToken> cancel;
  try {
    cancel = std::make_unique<CancelToken>();
  } catch (const std::system_error& err) {
    spdlog::error("Failed to set up cancellation: {}", err.what());
    return 1;
  }
  // Ctrl-C settles the execution as cancelled instead of killing the supervisor
  cancel_token = cancel.get();
  signal(SIGINT, CancelHandler);
  signal(SIGTERM, CancelHandler);
  ExecutionResult result;
  bool started = true;
  try {
    result = Execute(request, tools, nullptr, cancel.get());
  } catch (const SpawnError& err) {
    spdlog::error("Failed to start worker: {}", err.what());
    started = false;
  }
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  cancel_token = nullptr;
  if (!started) return 1;
  PrintResult(result);
  return result.status == ExecutionStatus::SUCCESS ? 0 : 1;
}
