#include <scriptbox/execution.h>

#include <poll.h>
#include <unistd.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

#include <scriptbox/utils.h>

long kDefaultTimeoutMs = 300000;
long kDefaultMaxToolCalls = 500;
long kDefaultMaxWorkerMemoryMb = 512;
long kDefaultMaxOutputBytes = 20L * 1024 * 1024;
long kDefaultPreviewLines = 50;
long kDefaultMaxPreviewBytes = 50L * 1024;

nlohmann::json ExecutionResult::ToJson() const {
  nlohmann::json calls_json = nlohmann::json::array();
  for (auto& i : calls) {
    calls_json.push_back({
        {"id", i.id},
        {"tool", i.tool},
        {"args", i.args},
        {"result_preview", i.result_preview},
        {"is_error", i.is_error},
        {"outcome", CallOutcomeName(i.outcome)},
    });
  }
  nlohmann::json ret = {
    {"execution_id", execution_id},
    {"status", ExecutionStatusName(status)},
    {"stdout_preview", stdout_preview},
    {"stderr_preview", stderr_preview},
    {"full_output_path", full_output_path},
    {"tool_calls", tool_calls},
    {"calls", std::move(calls_json)},
    {"duration_ms", duration_ms},
  };
  ret["exit_code"] = exit_code ? nlohmann::json(*exit_code) : nlohmann::json(nullptr);
  ret["term_signal"] = term_signal ? nlohmann::json(*term_signal) : nlohmann::json(nullptr);
  ret["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
  ret["return_value"] = return_value ? *return_value : nlohmann::json(nullptr);
  return ret;
}

CancelToken::CancelToken() : fd_(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
  if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "eventfd");
}

CancelToken::~CancelToken() {
  close(fd_);
}

void CancelToken::Cancel() const {
  uint64_t one = 1;
  // EAGAIN only if the counter is saturated, which still leaves it readable
  if (write(fd_, &one, sizeof(one)) < 0) return;
}

bool CancelToken::Cancelled() const {
  struct pollfd pfd = {fd_, POLLIN, 0};
  return poll(&pfd, 1, 0) > 0;
}
