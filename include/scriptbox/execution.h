#ifndef INCLUDE_SCRIPTBOX_EXECUTION_H_
#define INCLUDE_SCRIPTBOX_EXECUTION_H_

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <functional>

#include <nlohmann/json.hpp>

// defaults for newly constructed ExecutionRequest; may be overridden at startup
extern long kDefaultTimeoutMs;
extern long kDefaultMaxToolCalls;
extern long kDefaultMaxWorkerMemoryMb;
extern long kDefaultMaxOutputBytes;
extern long kDefaultPreviewLines;
extern long kDefaultMaxPreviewBytes;

#define ENUM_EXECUTION_STATUS_ \
  X(SUCCESS, "success") \
  X(SCRIPT_ERROR, "script_error") \
  X(TIMEOUT, "timeout") \
  X(LIMIT_EXCEEDED, "limit_exceeded") \
  X(CRASHED, "crashed") \
  X(CANCELLED, "cancelled")
enum class ExecutionStatus {
#define X(name, str) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

#define ENUM_CALL_OUTCOME_ \
  X(DISPATCHED, "dispatched") \
  X(LIMIT_EXCEEDED, "limit_exceeded") \
  X(CANCELLED, "cancelled") \
  X(REJECTED, "rejected") /* protocol anomaly, e.g. duplicate id */
enum class CallOutcome {
#define X(name, str) name,
  ENUM_CALL_OUTCOME_
#undef X
};

class ExecutionRequest {
 public:
  std::string code;
  long timeout_ms;
  long max_tool_calls;
  long max_worker_memory_mb; // 0 = unlimited
  long max_output_bytes;
  // preview: this many lines from each end, and at most max_preview_bytes in total
  long preview_lines;
  long max_preview_bytes;

  ExecutionRequest() :
      timeout_ms(kDefaultTimeoutMs),
      max_tool_calls(kDefaultMaxToolCalls),
      max_worker_memory_mb(kDefaultMaxWorkerMemoryMb),
      max_output_bytes(kDefaultMaxOutputBytes),
      preview_lines(kDefaultPreviewLines),
      max_preview_bytes(kDefaultMaxPreviewBytes) {}
  explicit ExecutionRequest(std::string code_) : ExecutionRequest() {
    code = std::move(code_);
  }
};

struct ToolCallRecord {
  std::string id;
  std::string tool;
  nlohmann::json args;
  std::string result_preview; // first 200 characters
  bool is_error;
  CallOutcome outcome;
};

class ExecutionResult {
 public:
  long execution_id;
  ExecutionStatus status;
  std::string stdout_preview, stderr_preview;
  std::string full_output_path; // empty if the artifact could not be written
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  std::optional<std::string> error_message;
  // value of the script's trailing expression; strings stay strings, other values are JSON
  std::optional<nlohmann::json> return_value;
  long tool_calls; // dispatched calls
  std::vector<ToolCallRecord> calls;
  long duration_ms;

  ExecutionResult() :
      execution_id(0), status(ExecutionStatus::CRASHED), tool_calls(0), duration_ms(0) {}

  nlohmann::json ToJson() const;
};

class SpawnError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ToolOutcome {
  std::string text;
  bool is_error;
};

// Cancels running executions from another thread or a signal handler.
// One token may be shared by several executions; once cancelled it stays cancelled.
class CancelToken {
  int fd_; // eventfd, readable once cancelled
 public:
  // throws std::system_error if the eventfd cannot be created
  CancelToken();
  ~CancelToken();
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  // async-signal-safe
  void Cancel() const;
  bool Cancelled() const;
  int Fd() const { return fd_; }
};

// Bounds of one dispatched tool call
struct ToolCallContext {
  long timeout_ms; // time left before the execution times out; -1 if unbounded
  int cancel_fd;   // readable once the execution is cancelled; -1 if it cannot be
};

// The real tool layer. Implementations do their own permission checks and auditing.
class ToolCollaborator {
 public:
  virtual ~ToolCollaborator() = default;
  // Called on the supervisor's thread only; exceptions become error outcomes.
  // The execution cannot time out or be cancelled while this runs, so long-running
  // implementations should give up once ctx says so.
  virtual ToolOutcome Invoke(const std::string& tool, const nlohmann::json& args,
                             const ToolCallContext& ctx) = 0;
};

// Progress callbacks; these are called synchronously from the event loop and should not block
struct ExecutionObserver {
  std::function<void(const ExecutionRequest&, const std::vector<ToolCallRecord>&)> ReportToolCall;
  std::function<void(const ExecutionResult&)> ReportFinished;
};

// Blocks until the execution settles. Throws SpawnError if the worker cannot be started;
// every other failure is reported through the returned result.
// Thread-safe: concurrent calls run independent workers.
ExecutionResult Execute(const ExecutionRequest&, ToolCollaborator&,
                        const ExecutionObserver* observer = nullptr,
                        const CancelToken* cancel = nullptr);

#endif  // INCLUDE_SCRIPTBOX_EXECUTION_H_
