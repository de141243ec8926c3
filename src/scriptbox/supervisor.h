#ifndef SCRIPTBOX_SUPERVISOR_H_
#define SCRIPTBOX_SUPERVISOR_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <unordered_set>

#include <scriptbox/execution.h>
#include "ipc.h"
#include "arbiter.h"
#include "output_buffer.h"
#include "worker_process.h"

// the worker must report ready within this time after spawn
extern long kReadyTimeoutMs;
// after done, the worker gets this long to exit by itself before it is killed
extern long kExitGraceMs;

constexpr size_t kResultPreviewChars = 200;

WorkerSpawnOptions DefaultWorkerOptions(const ExecutionRequest&);

// One execution: owns the worker process, gates tool calls against the budget and feeds
// the completion arbiter. Single-threaded; Run() drives everything from one poll loop.
class Supervisor {
  using Clock = std::chrono::steady_clock;

  const ExecutionRequest& req_;
  ToolCollaborator& tools_;
  const ExecutionObserver* observer_;
  const CancelToken* cancel_;
  WorkerSpawnOptions spawn_opt_;
  long id_;

  std::unique_ptr<WorkerHandle> worker_;
  FrameReader reader_;
  FrameWriter writer_;
  CompletionArbiter arbiter_;
  OutputBuffer mirror_;

  long call_counter_;
  std::unordered_set<std::string> seen_ids_;
  std::string stdio_line_;
  std::vector<ToolCallRecord> calls_;
  bool ready_, done_seen_, channel_closed_, stdio_closed_, exit_seen_, cancel_seen_;
  Clock::time_point start_, deadline_, ready_deadline_;

  int PollTimeout_() const;
  ToolCallContext CallContext_() const;
  void ReadChannel_();
  void ReadStdio_();
  void HandleMessage_(const Message&);
  void CancelUnread_();
  void RecordCall_(ToolCallRecord&&);
  ExecutionResult Finish_();
 public:
  Supervisor(const ExecutionRequest&, ToolCollaborator&, const ExecutionObserver* = nullptr,
             const CancelToken* cancel = nullptr);
  Supervisor(const ExecutionRequest&, ToolCollaborator&, const ExecutionObserver*,
             const CancelToken* cancel, WorkerSpawnOptions spawn_opt);
  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  long Id() const { return id_; }
  long CallCounter() const { return call_counter_; }
  ArbiterState State() const { return arbiter_.State(); }
  const WorkerHandle* Worker() const { return worker_.get(); }

  // throws SpawnError
  void Spawn();
  // budget check, then dispatch or reply limit_exceeded; calls arriving after the deadline
  // or a cancellation are recorded but never dispatched
  void OnToolCall(const Message& call);
  // SIGKILL the worker; no-op if it is already gone or the call is repeated
  void Terminate(const std::string& reason);
  // spawn and process events until settled; returns the only result of this execution
  ExecutionResult Run();
};

#endif  // SCRIPTBOX_SUPERVISOR_H_
