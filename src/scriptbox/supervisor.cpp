#include "supervisor.h"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <optional>

#include <spdlog/spdlog.h>
#include <scriptbox/utils.h>
#include "truncator.h"
#include "utils.h"

long kReadyTimeoutMs = 10000;
long kExitGraceMs = 1000;

namespace {

bool PollIn(int fd, int timeout_ms) {
  struct pollfd pfd = {fd, POLLIN, 0};
  while (true) {
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno == EINTR) continue;
    return ret > 0;
  }
}

} // namespace

WorkerSpawnOptions DefaultWorkerOptions(const ExecutionRequest& req) {
  WorkerSpawnOptions opt;
  opt.program = WorkerProgram();
  opt.memory_mb = req.max_worker_memory_mb;
  auto level = spdlog::level::to_string_view(spdlog::get_level());
  opt.envs.push_back("SCRIPTBOX_LOG_LEVEL=" + std::string(level.data(), level.size()));
  return opt;
}

Supervisor::Supervisor(const ExecutionRequest& req, ToolCollaborator& tools,
                       const ExecutionObserver* observer, const CancelToken* cancel) :
    Supervisor(req, tools, observer, cancel, DefaultWorkerOptions(req)) {}

Supervisor::Supervisor(const ExecutionRequest& req, ToolCollaborator& tools,
                       const ExecutionObserver* observer, const CancelToken* cancel,
                       WorkerSpawnOptions spawn_opt) :
    req_(req), tools_(tools), observer_(observer), cancel_(cancel),
    spawn_opt_(std::move(spawn_opt)), id_(GetUniqueExecutionId()),
    reader_(MaxFrameSize(req.max_output_bytes)), arbiter_(req.timeout_ms),
    mirror_(std::max(req.max_output_bytes, 2L)), call_counter_(0),
    ready_(false), done_seen_(false), channel_closed_(false), stdio_closed_(false),
    exit_seen_(false), cancel_seen_(false) {}

void Supervisor::Spawn() {
  if (worker_) return;
  worker_ = SpawnWorker(spawn_opt_);
  spdlog::info("Execution {}: worker started, pid {}", id_, worker_->Pid());
}

void Supervisor::Terminate(const std::string& reason) {
  if (!worker_ || worker_->Killed() || worker_->Reaped()) return;
  spdlog::info("Execution {}: terminating worker: {}", id_, reason);
  worker_->Kill();
}

void Supervisor::RecordCall_(ToolCallRecord&& rec) {
  spdlog::debug("Execution {}: call {} ({}) {}", id_, rec.id, rec.tool,
                CallOutcomeName(rec.outcome));
  calls_.push_back(std::move(rec));
  if (observer_ && observer_->ReportToolCall) observer_->ReportToolCall(req_, calls_);
}

void Supervisor::OnToolCall(const Message& call) {
  ToolCallRecord rec{call.id, call.name, call.args, "", false, CallOutcome::DISPATCHED};
  if (!seen_ids_.insert(call.id).second) {
    spdlog::warn("Execution {}: duplicate call id {}", id_, call.id);
    rec.outcome = CallOutcome::REJECTED;
    rec.is_error = true;
    rec.result_preview = "duplicate call id";
    writer_.Push(Message::ToolResult(call.id, rec.result_preview, true));
    RecordCall_(std::move(rec));
    return;
  }
  // the timeout and the cancellation are offered by the event loop; the worker gets no reply
  if (req_.timeout_ms > 0 && Clock::now() >= deadline_) {
    rec.outcome = CallOutcome::CANCELLED;
    rec.is_error = true;
    rec.result_preview = "cancelled: execution timed out";
    RecordCall_(std::move(rec));
    return;
  }
  if (cancel_seen_ || (cancel_ && cancel_->Cancelled())) {
    rec.outcome = CallOutcome::CANCELLED;
    rec.is_error = true;
    rec.result_preview = "cancelled: execution cancelled";
    RecordCall_(std::move(rec));
    return;
  }
  if (call_counter_ >= req_.max_tool_calls) {
    std::string reason = fmt::format("Tool call limit of {} exceeded", req_.max_tool_calls);
    spdlog::info("Execution {}: call {} ({}) refused: {}", id_, call.id, call.name, reason);
    rec.outcome = CallOutcome::LIMIT_EXCEEDED;
    rec.is_error = true;
    rec.result_preview = reason;
    writer_.Push(Message::LimitExceeded(call.id, reason));
    RecordCall_(std::move(rec));
    return;
  }
  call_counter_++;
  ToolOutcome outcome;
  try {
    outcome = tools_.Invoke(call.name, call.args, CallContext_());
  } catch (const std::exception& err) {
    spdlog::info("Execution {}: tool {} failed: {}", id_, call.name, err.what());
    outcome = ToolOutcome{err.what(), true};
  }
  rec.is_error = outcome.is_error;
  rec.result_preview = Utf8Prefix(outcome.text, kResultPreviewChars);
  writer_.Push(Message::ToolResult(call.id, outcome.text, outcome.is_error));
  RecordCall_(std::move(rec));
}

void Supervisor::HandleMessage_(const Message& msg) {
  if (!IsWorkerMessage(msg.type)) {
    spdlog::warn("Execution {}: unexpected {} message from worker", id_, MessageTypeName(msg.type));
    return;
  }
  if (done_seen_) {
    if (msg.type == MessageType::TOOL_CALL) {
      ToolCallRecord rec{msg.id, msg.name, msg.args, "call after done", true, CallOutcome::REJECTED};
      RecordCall_(std::move(rec));
    } else {
      spdlog::debug("Execution {}: ignoring {} after done", id_, MessageTypeName(msg.type));
    }
    return;
  }
  switch (msg.type) {
    case MessageType::READY:
      if (ready_) {
        spdlog::warn("Execution {}: duplicate ready", id_);
        break;
      }
      ready_ = true;
      writer_.Push(Message::Execute(req_.code, req_.max_output_bytes));
      break;
    case MessageType::TOOL_CALL:
      OnToolCall(msg);
      break;
    case MessageType::OUTPUT:
      mirror_.Append(msg.stream, msg.text);
      break;
    case MessageType::DONE:
      done_seen_ = true;
      arbiter_.OfferDone(msg);
      break;
    default:
      __builtin_unreachable();
  }
}

void Supervisor::ReadChannel_() {
  if (channel_closed_) return;
  auto status = reader_.Fill(worker_->ChannelFd());
  std::string payload;
  while (reader_.Next(payload)) {
    Message msg;
    DecodeStatus decoded = DecodeMessage(payload, msg);
    if (decoded == DecodeStatus::UNKNOWN) continue;
    if (decoded == DecodeStatus::MALFORMED) {
      arbiter_.OfferViolation("malformed message");
      status = FrameReader::Status::ERROR;
      break;
    }
    HandleMessage_(msg);
  }
  if (reader_.Malformed()) {
    arbiter_.OfferViolation("malformed frame");
    status = FrameReader::Status::ERROR;
  }
  if (status != FrameReader::Status::AGAIN) {
    if (status == FrameReader::Status::CLOSED && !reader_.Empty()) {
      spdlog::debug("Execution {}: channel closed with a partial frame", id_);
    }
    channel_closed_ = true;
    writer_.Clear();
    worker_->CloseChannel();
  }
}

void Supervisor::ReadStdio_() {
  if (stdio_closed_) return;
  char buf[4096];
  std::string data;
  while (true) {
    ssize_t ret = read(worker_->StdioFd(), buf, sizeof(buf));
    if (ret > 0) {
      data.append(buf, ret);
      continue;
    }
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
    if (ret < 0) spdlog::warn("Execution {}: stdio read error: {}", id_, strerror(errno));
    stdio_closed_ = true;
    break;
  }
  if (!data.empty()) {
    mirror_.Append(OutputStream::STDERR, data);
    stdio_line_ += data;
    size_t pos;
    while ((pos = stdio_line_.find('\n')) != std::string::npos) {
      spdlog::debug("worker[{}]: {}", worker_->Pid(), stdio_line_.substr(0, pos));
      stdio_line_.erase(0, pos + 1);
    }
  }
  if (stdio_closed_) {
    if (!stdio_line_.empty()) spdlog::debug("worker[{}]: {}", worker_->Pid(), stdio_line_);
    stdio_line_.clear();
    worker_->CloseStdio();
  }
}

int Supervisor::PollTimeout_() const {
  auto now = Clock::now();
  std::optional<Clock::time_point> until;
  if (req_.timeout_ms > 0) until = deadline_;
  if (!ready_ && (!until || ready_deadline_ < *until)) until = ready_deadline_;
  if (!until) return -1;
  if (*until <= now) return 0;
  auto ms = std::chrono::ceil<std::chrono::milliseconds>(*until - now).count();
  return (int)std::min<long long>(ms, 1L << 30);
}

ToolCallContext Supervisor::CallContext_() const {
  ToolCallContext ctx{-1, cancel_ ? cancel_->Fd() : -1};
  if (req_.timeout_ms > 0) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline_ - Clock::now()).count();
    ctx.timeout_ms = std::max<long>(left, 0);
  }
  return ctx;
}

// Tool calls the worker sent that were never read are settled as cancelled
void Supervisor::CancelUnread_() {
  if (channel_closed_) return;
  reader_.Fill(worker_->ChannelFd());
  std::string payload;
  while (reader_.Next(payload)) {
    Message msg;
    DecodeStatus decoded = DecodeMessage(payload, msg);
    if (decoded == DecodeStatus::UNKNOWN) continue;
    if (decoded == DecodeStatus::MALFORMED) break;
    if (msg.type != MessageType::TOOL_CALL || seen_ids_.count(msg.id)) continue;
    seen_ids_.insert(msg.id);
    RecordCall_(ToolCallRecord{msg.id, msg.name, msg.args, "cancelled: execution ended", true,
                               CallOutcome::CANCELLED});
  }
}

ExecutionResult Supervisor::Run() {
  start_ = Clock::now();
  deadline_ = start_ + std::chrono::milliseconds(req_.timeout_ms);
  ready_deadline_ = start_ + std::chrono::milliseconds(kReadyTimeoutMs);
  Spawn();

  while (!arbiter_.Settled()) {
    if (!channel_closed_ && writer_.Pending() && !writer_.Flush(worker_->ChannelFd())) {
      // the worker is going away; its exit will be observed through the pidfd
      writer_.Clear();
    }
    struct pollfd fds[4];
    int nfds = 0, channel_idx = -1, stdio_idx = -1, pid_idx = -1, cancel_idx = -1;
    if (!channel_closed_) {
      channel_idx = nfds;
      fds[nfds++] = {worker_->ChannelFd(), (short)(POLLIN | (writer_.Pending() ? POLLOUT : 0)), 0};
    }
    if (!stdio_closed_) {
      stdio_idx = nfds;
      fds[nfds++] = {worker_->StdioFd(), POLLIN, 0};
    }
    if (!exit_seen_) {
      pid_idx = nfds;
      fds[nfds++] = {worker_->PidFd(), POLLIN, 0};
    }
    if (cancel_ && !cancel_seen_) {
      cancel_idx = nfds;
      fds[nfds++] = {cancel_->Fd(), POLLIN, 0};
    }
    int ret = poll(fds, nfds, PollTimeout_());
    if (ret < 0) {
      if (errno != EINTR) {
        spdlog::error("Execution {}: poll failed: {}", id_, strerror(errno));
        arbiter_.OfferViolation(std::string("supervisor poll failed: ") + strerror(errno));
      }
    } else if (ret > 0) {
      if (channel_idx >= 0 && fds[channel_idx].revents) {
        if (fds[channel_idx].revents & POLLOUT) {
          if (!writer_.Flush(worker_->ChannelFd())) writer_.Clear();
        }
        if (fds[channel_idx].revents & ~POLLOUT) ReadChannel_();
      }
      if (stdio_idx >= 0 && fds[stdio_idx].revents) ReadStdio_();
      if (cancel_idx >= 0 && fds[cancel_idx].revents) {
        spdlog::info("Execution {}: cancelled", id_);
        cancel_seen_ = true;
        arbiter_.OfferCancel();
      }
      if (pid_idx >= 0 && fds[pid_idx].revents) {
        // everything the worker managed to send is processed before its exit is considered
        ReadChannel_();
        ReadStdio_();
        if (worker_->TryReap()) {
          exit_seen_ = true;
          arbiter_.OfferExit(worker_->Exit());
        }
      }
    }
    auto now = Clock::now();
    if (req_.timeout_ms > 0 && now >= deadline_) arbiter_.OfferTimeout();
    if (!ready_ && now >= ready_deadline_) {
      arbiter_.OfferViolation(fmt::format("worker did not become ready within {} ms",
                                          kReadyTimeoutMs));
    }
    if (arbiter_.EndTurn()) {
      const Settlement& settlement = arbiter_.GetSettlement();
      if (!settlement.has_done && !exit_seen_) {
        Terminate(settlement.error_message.value_or(ExecutionStatusName(settlement.status)));
      }
    }
  }
  return Finish_();
}

ExecutionResult Supervisor::Finish_() {
  const Settlement& settlement = arbiter_.GetSettlement();
  if (!exit_seen_) {
    if (!PollIn(worker_->PidFd(), settlement.has_done ? kExitGraceMs : 0)) {
      Terminate("worker still running after settlement");
    }
    CancelUnread_();
    worker_->Reap();
  }

  ExecutionResult ret;
  ret.execution_id = id_;
  ret.status = settlement.status;
  ret.error_message = settlement.error_message;
  ret.return_value = settlement.return_value;
  std::string out, err;
  if (settlement.has_done) {
    out = settlement.stdout_text;
    err = settlement.stderr_text;
  } else {
    out = mirror_.Text(OutputStream::STDOUT);
    err = mirror_.Text(OutputStream::STDERR);
  }
  TruncatedOutput output = TruncateOutput(out, err, ExecutionOutputPath(id_),
      PreviewOptions{req_.preview_lines, req_.max_preview_bytes});
  ret.stdout_preview = std::move(output.stdout_preview);
  ret.stderr_preview = std::move(output.stderr_preview);
  ret.full_output_path = output.full_path.string();
  const WorkerExit& exit = worker_->Exit();
  if (exit.exited) {
    ret.exit_code = exit.status;
  } else {
    ret.term_signal = exit.status;
  }
  ret.tool_calls = call_counter_;
  ret.calls = calls_;
  ret.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start_).count();
  spdlog::info("Execution {}: {} after {} ms, {} tool calls{}", id_,
               ExecutionStatusName(ret.status), ret.duration_ms, ret.tool_calls,
               output.truncated ? ", previews truncated" : "");
  if (observer_ && observer_->ReportFinished) observer_->ReportFinished(ret);
  return ret;
}

ExecutionResult Execute(const ExecutionRequest& req, ToolCollaborator& tools,
                        const ExecutionObserver* observer, const CancelToken* cancel) {
  Supervisor supervisor(req, tools, observer, cancel);
  return supervisor.Run();
}
