#include "arbiter.h"

#include <csignal>
#include <cstring>

#include <spdlog/spdlog.h>
#include <scriptbox/utils.h>

bool CompletionArbiter::OfferDone(const Message& done) {
  if (Settled()) {
    spdlog::debug("Ignoring done message; execution already settled");
    return false;
  }
  // the first done of a turn counts; the worker sends exactly one
  if (!done_) done_ = done;
  return true;
}

bool CompletionArbiter::OfferExit(const WorkerExit& info) {
  if (Settled()) return false;
  exit_ = info;
  return true;
}

bool CompletionArbiter::OfferViolation(const std::string& reason) {
  if (Settled()) {
    spdlog::debug("Ignoring protocol violation after settlement: {}", reason);
    return false;
  }
  if (!violation_) violation_ = reason;
  return true;
}

bool CompletionArbiter::OfferCancel() {
  if (Settled()) return false;
  cancel_ = true;
  return true;
}

bool CompletionArbiter::OfferTimeout() {
  if (Settled()) return false;
  timeout_ = true;
  return true;
}

Settlement CompletionArbiter::Resolve_() const {
  Settlement ret;
  if (done_) {
    ret.has_done = true;
    ret.stdout_text = done_->stdout_text;
    ret.stderr_text = done_->stderr_text;
    ret.return_value = done_->return_value;
    if (!done_->error) {
      ret.status = ExecutionStatus::SUCCESS;
    } else {
      ret.status = done_->limit_error ? ExecutionStatus::LIMIT_EXCEEDED : ExecutionStatus::SCRIPT_ERROR;
      ret.error_message = done_->error;
    }
  } else if (violation_) {
    ret.status = ExecutionStatus::CRASHED;
    ret.error_message = "Protocol violation: " + *violation_;
  } else if (exit_) {
    ret.status = ExecutionStatus::CRASHED;
    if (!exit_->exited) {
      ret.error_message = "Worker killed by signal " + std::to_string(exit_->status) +
          " (" + strsignal(exit_->status) + ")";
    } else if (exit_->status != 0) {
      ret.error_message = "Worker exited with code " + std::to_string(exit_->status);
    } else {
      ret.error_message = "Worker exited without reporting completion";
    }
  } else if (cancel_) {
    ret.status = ExecutionStatus::CANCELLED;
    ret.error_message = "Execution cancelled";
  } else {
    ret.status = ExecutionStatus::TIMEOUT;
    ret.error_message = "Execution timed out after " + std::to_string(timeout_ms_) + " ms";
  }
  return ret;
}

bool CompletionArbiter::EndTurn() {
  if (Settled()) return false;
  if (!done_ && !violation_ && !exit_ && !cancel_ && !timeout_) return false;
  state_ = ArbiterState::SETTLING;
  settlement_ = Resolve_();
  state_ = ArbiterState::SETTLED;
  spdlog::debug("Execution settled: status={} done={} exit={} violation={} cancel={} timeout={}",
                ExecutionStatusName(settlement_.status), done_.has_value(), exit_.has_value(),
                violation_.has_value(), cancel_, timeout_);
  return true;
}
