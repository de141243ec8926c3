#include <fcntl.h>
#include <csignal>
#include <cstdlib>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "ipc.h"
#include "pending_calls.h"
#include "python_context.h"
#include "utils.h"

namespace {

void SetupLogger() {
  spdlog::set_pattern("[worker %P] %+");
  spdlog::set_level(spdlog::level::warn);
  if (const char* level = getenv("SCRIPTBOX_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(level));
  }
}

// error text and return value are reported whole up to kMaxReportBytes
void CapReport(ScriptOutcome& outcome) {
  if (outcome.error && outcome.error->size() > kMaxReportBytes) {
    outcome.error = Utf8Prefix(*outcome.error, kMaxReportBytes);
  }
  if (outcome.return_value) {
    std::string dumped = outcome.return_value->dump(-1, ' ', false,
                                                    nlohmann::json::error_handler_t::replace);
    if (dumped.size() > kMaxReportBytes) {
      outcome.return_value = Utf8Prefix(dumped, kMaxReportBytes) + "...";
    }
  }
}

} // namespace

int main() {
  SetupLogger();
  signal(SIGPIPE, SIG_IGN);
  // a terminal interrupt cancels through the supervisor, which then kills the worker
  signal(SIGINT, SIG_IGN);
  const int fd = kWorkerChannelFd;
  if (fcntl(fd, F_GETFD) < 0) {
    spdlog::error("Channel fd {} is not open", fd);
    return 1;
  }
  if (!SendMessage(fd, Message::Ready())) return 1;
  Message request;
  if (ReceiveMessage(fd, request) != ReceiveStatus::OK || request.type != MessageType::EXECUTE) {
    spdlog::error("Expected an execute message");
    return 1;
  }

  OutputBuffer output(std::max(request.max_output_bytes, 2L));
  ToolProxy proxy(fd, output);
  ScriptOutcome outcome;
  {
    PythonContext context(proxy);
    if (context.Init()) {
      outcome = context.Run(request.text);
    } else {
      outcome.error = "InternalError: failed to initialize the interpreter";
    }
    // calls submitted but never awaited are still settled before done
    proxy.Drain();
    CapReport(outcome);
    if (!SendMessage(fd, Message::Done(output.Text(OutputStream::STDOUT),
                                       output.Text(OutputStream::STDERR),
                                       outcome.error, outcome.limit_error,
                                       outcome.return_value))) {
      spdlog::warn("Failed to send done");
      return 1;
    }
  }
  return 0;
}
