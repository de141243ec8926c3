#include "pending_calls.h"

#include <spdlog/spdlog.h>
#include "utils.h"

#define X(name) case SettleKind::name: return #name;
const char* SettleKindName(SettleKind kind) {
  switch (kind) {
    ENUM_SETTLE_KIND_
  }
  __builtin_unreachable();
}
#undef X

std::string PendingCalls::Register(const std::string& tool, const nlohmann::json& args) {
  std::string id = "call_" + std::to_string(++seq_);
  pending_.emplace(id, PendingCall{id, tool, args, std::chrono::steady_clock::now()});
  return id;
}

bool PendingCalls::Settle(const Message& reply) {
  auto it = pending_.find(reply.id);
  if (it == pending_.end()) {
    spdlog::warn("{} for {} call {}", MessageTypeName(reply.type),
                 settled_.count(reply.id) ? "already settled" : "unknown", reply.id);
    return false;
  }
  CallSettlement settlement;
  switch (reply.type) {
    case MessageType::TOOL_RESULT:
      settlement.kind = reply.is_error ? SettleKind::TOOL_ERROR : SettleKind::RESULT;
      break;
    case MessageType::LIMIT_EXCEEDED:
      settlement.kind = SettleKind::LIMIT_EXCEEDED;
      break;
    default:
      spdlog::warn("{} cannot settle call {}", MessageTypeName(reply.type), reply.id);
      return false;
  }
  settlement.text = reply.text;
  auto elapsed = std::chrono::steady_clock::now() - it->second.created_at;
  spdlog::debug("Call {} ({}) settled: {}, {} ms", reply.id, it->second.tool_name,
                SettleKindName(settlement.kind),
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
  pending_.erase(it);
  settled_.emplace(reply.id, std::move(settlement));
  return true;
}

void PendingCalls::CancelAll(const std::string& reason) {
  for (auto& i : pending_) {
    settled_.emplace(i.first, CallSettlement{SettleKind::CANCELLED, reason});
  }
  if (pending_.size()) spdlog::debug("Cancelled {} pending calls: {}", pending_.size(), reason);
  pending_.clear();
}

std::optional<CallSettlement> PendingCalls::Take(const std::string& id) {
  auto it = settled_.find(id);
  if (it == settled_.end()) return std::nullopt;
  CallSettlement ret = std::move(it->second);
  settled_.erase(it);
  return ret;
}

void ToolProxy::Receive_() {
  Message msg;
  switch (ReceiveMessage(fd_, msg)) {
    case ReceiveStatus::OK:
      if (msg.type == MessageType::TOOL_RESULT || msg.type == MessageType::LIMIT_EXCEEDED) {
        calls_.Settle(msg);
      } else {
        spdlog::warn("Unexpected {} message from supervisor", MessageTypeName(msg.type));
      }
      return;
    case ReceiveStatus::CLOSED:
      spdlog::warn("Supervisor closed the channel");
      break;
    case ReceiveStatus::MALFORMED:
      spdlog::warn("Malformed message from supervisor");
      break;
  }
  closed_ = true;
  calls_.CancelAll("channel to supervisor lost");
}

std::string ToolProxy::Submit(const std::string& tool, const nlohmann::json& args) {
  std::string id = calls_.Register(tool, args);
  if (closed_ || !SendMessage(fd_, Message::ToolCall(id, tool, args))) {
    closed_ = true;
    calls_.CancelAll("channel to supervisor lost");
  }
  return id;
}

CallSettlement ToolProxy::Wait(const std::string& id) {
  while (true) {
    if (auto ret = calls_.Take(id)) return *ret;
    if (!calls_.IsPending(id)) return CallSettlement{SettleKind::CANCELLED, "unknown call " + id};
    Receive_();
  }
}

void ToolProxy::Drain() {
  while (calls_.PendingCount() && !closed_) Receive_();
}

void ToolProxy::Emit(OutputStream stream, const std::string& data) {
  if (data.empty()) return;
  // the mirror never needs more than the buffer could keep of one write
  std::string kept = Utf8Suffix(data, output_.MaxBytes());
  output_.Append(stream, data);
  if (!closed_ && !SendMessage(fd_, Message::Output(stream, kept))) {
    spdlog::debug("Failed to mirror output");
  }
}
