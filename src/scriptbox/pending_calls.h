#ifndef SCRIPTBOX_PENDING_CALLS_H_
#define SCRIPTBOX_PENDING_CALLS_H_

#include <chrono>
#include <string>
#include <optional>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include "ipc.h"
#include "output_buffer.h"

#define ENUM_SETTLE_KIND_ \
  X(RESULT) \
  X(TOOL_ERROR) \
  X(LIMIT_EXCEEDED) \
  X(CANCELLED)
enum class SettleKind {
#define X(name) name,
  ENUM_SETTLE_KIND_
#undef X
};

const char* SettleKindName(SettleKind);

struct CallSettlement {
  SettleKind kind;
  std::string text; // result, error or limit reason
};

struct PendingCall {
  std::string id;
  std::string tool_name;
  nlohmann::json args;
  std::chrono::steady_clock::time_point created_at;
};

// Worker-side registry of tool calls awaiting a reply, keyed by id.
// Each call is settled exactly once; a settlement is kept until it is taken.
class PendingCalls {
  long seq_;
  std::unordered_map<std::string, PendingCall> pending_;
  std::unordered_map<std::string, CallSettlement> settled_;
 public:
  PendingCalls() : seq_(0) {}

  // return the new call's id (call_1, call_2, ...)
  std::string Register(const std::string& tool, const nlohmann::json& args);
  // apply a tool_result / limit_exceeded; return false (protocol anomaly) if the id is
  // unknown or already settled
  bool Settle(const Message& reply);
  void CancelAll(const std::string& reason);
  std::optional<CallSettlement> Take(const std::string& id);

  bool IsPending(const std::string& id) const { return pending_.count(id); }
  bool IsSettled(const std::string& id) const { return settled_.count(id); }
  size_t PendingCount() const { return pending_.size(); }
};

// The worker's end of the channel. Blocking; used from the interpreter thread only.
class ToolProxy {
  int fd_;
  bool closed_;
  PendingCalls calls_;
  OutputBuffer& output_;

  void Receive_();
 public:
  ToolProxy(int fd, OutputBuffer& output) : fd_(fd), closed_(false), output_(output) {}

  // send a tool_call and return its id; the call is cancelled if the channel is gone
  std::string Submit(const std::string& tool, const nlohmann::json& args);
  // block until the call is settled; replies to other calls are settled on the way
  CallSettlement Wait(const std::string& id);
  // wait for every outstanding call
  void Drain();
  // capture a chunk of script output and mirror it to the supervisor
  void Emit(OutputStream stream, const std::string& data);

  PendingCalls& Calls() { return calls_; }
  bool Closed() const { return closed_; }
};

#endif  // SCRIPTBOX_PENDING_CALLS_H_
