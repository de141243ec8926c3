#ifndef SCRIPTBOX_ARBITER_H_
#define SCRIPTBOX_ARBITER_H_

#include <string>
#include <optional>

#include <scriptbox/execution.h>
#include "ipc.h"

#define ENUM_ARBITER_STATE_ \
  X(RUNNING) \
  X(SETTLING) \
  X(SETTLED)
enum class ArbiterState {
#define X(name) name,
  ENUM_ARBITER_STATE_
#undef X
};

struct WorkerExit {
  bool exited; // false if killed by a signal
  int status;  // exit code or signal number
};

struct Settlement {
  ExecutionStatus status;
  std::optional<std::string> error_message;
  // valid if the execution was settled by a done message
  bool has_done;
  std::string stdout_text, stderr_text;
  std::optional<nlohmann::json> return_value;

  Settlement() : status(ExecutionStatus::CRASHED), has_done(false) {}
};

// Reconciles done / exit / violation / cancel / timeout into exactly one settlement.
// Triggers observed during one event-loop turn are offered first and resolved together in
// EndTurn(), where done > violation > exit > cancel > timeout. The first turn that has any trigger
// settles the execution; every later offer is ignored.
class CompletionArbiter {
  ArbiterState state_;
  std::optional<Message> done_;
  std::optional<std::string> violation_;
  std::optional<WorkerExit> exit_;
  bool cancel_;
  bool timeout_;
  long timeout_ms_;
  Settlement settlement_;

  Settlement Resolve_() const;
 public:
  explicit CompletionArbiter(long timeout_ms = 0) :
      state_(ArbiterState::RUNNING), cancel_(false), timeout_(false), timeout_ms_(timeout_ms) {}

  // return false if the offer is ignored because the execution is already settled
  bool OfferDone(const Message& done);
  bool OfferExit(const WorkerExit&);
  bool OfferViolation(const std::string& reason);
  bool OfferCancel();
  bool OfferTimeout();

  // return true if this call settled the execution
  bool EndTurn();

  ArbiterState State() const { return state_; }
  bool Settled() const { return state_ == ArbiterState::SETTLED; }
  // only valid once settled
  const Settlement& GetSettlement() const { return settlement_; }
};

#endif  // SCRIPTBOX_ARBITER_H_
