// Worker stand-in that follows a fixed script given as argv[1]; drives the supervisor
// through orderings a real interpreter cannot produce on demand.
#include <unistd.h>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include "scriptbox/ipc.h"
#include "scriptbox/pending_calls.h"

namespace {

const int fd = kWorkerChannelFd;

bool Handshake() {
  if (!SendMessage(fd, Message::Ready())) return false;
  Message msg;
  return ReceiveMessage(fd, msg) == ReceiveStatus::OK && msg.type == MessageType::EXECUTE;
}

void WriteRawFrame(const std::string& payload, long size) {
  std::string frame(sizeof(size), '\0');
  memcpy(frame.data(), &size, sizeof(size));
  frame += payload;
  if (write(fd, frame.data(), frame.size()) < 0) _exit(2);
}

[[noreturn]] void Hang() {
  while (true) pause();
}

// submit n calls before awaiting any of them, then report how each settled
int Calls(long n) {
  OutputBuffer output(1 << 20);
  ToolProxy proxy(fd, output);
  std::vector<std::string> ids;
  for (long i = 0; i < n; i++) {
    ids.push_back(proxy.Submit("read", {{"path", "file" + std::to_string(i)}}));
  }
  for (auto& id : ids) {
    CallSettlement res = proxy.Wait(id);
    proxy.Emit(OutputStream::STDOUT, id + ":" + SettleKindName(res.kind) + ":" + res.text + "\n");
  }
  SendMessage(fd, Message::Done(output.Text(OutputStream::STDOUT), "", std::nullopt));
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::warn);
  if (argc < 2) return 2;
  std::string scenario = argv[1];
  if (scenario == "no-ready") Hang();
  if (!Handshake()) return 2;

  if (scenario == "done") {
    SendMessage(fd, Message::Output(OutputStream::STDOUT, "hello\n"));
    SendMessage(fd, Message::Done("hello\n", "", std::nullopt));
    return 0;
  }
  if (scenario == "done-then-fail") {
    // done is authoritative even if the process dies right after it
    SendMessage(fd, Message::Done("reported\n", "", std::nullopt));
    raise(SIGKILL);
  }
  if (scenario == "exit-before-done") {
    // a grandchild holding the channel reports done only after this process is gone
    pid_t pid = fork();
    if (pid == 0) {
      usleep(300 * 1000);
      SendMessage(fd, Message::Done("late\n", "", std::nullopt));
      _exit(0);
    }
    return 0;
  }
  if (scenario == "crash") {
    SendMessage(fd, Message::Output(OutputStream::STDOUT, "partial\n"));
    SendMessage(fd, Message::Output(OutputStream::STDERR, "warned\n"));
    raise(SIGKILL);
  }
  if (scenario == "flood-crash") {
    for (int i = 0; i < 100; i++) {
      SendMessage(fd, Message::Output(OutputStream::STDOUT,
                                      "chunk" + std::to_string(1000 + i) + std::string(94, '.') + "\n"));
    }
    raise(SIGKILL);
  }
  if (scenario == "silent-exit") return 0;
  if (scenario == "exit-code") return 3;
  if (scenario == "bad-length") {
    WriteRawFrame("", -5);
    Hang();
  }
  if (scenario == "bad-json") {
    WriteRawFrame("{", 1);
    Hang();
  }
  if (scenario == "unknown-type") {
    std::string payload = R"({"type":"heartbeat"})";
    WriteRawFrame(payload, payload.size());
    SendMessage(fd, Message::ToolResult("call_1", "wrong direction", false));
    SendMessage(fd, Message::Done("still fine\n", "", std::nullopt));
    return 0;
  }
  if (scenario == "hang") Hang();
  if (scenario == "calls") return Calls(argc > 2 ? atol(argv[2]) : 1);
  if (scenario == "duplicate") {
    SendMessage(fd, Message::ToolCall("call_1", "read", {{"path", "a"}}));
    SendMessage(fd, Message::ToolCall("call_1", "read", {{"path", "b"}}));
    Message first, second;
    if (ReceiveMessage(fd, first) != ReceiveStatus::OK ||
        ReceiveMessage(fd, second) != ReceiveStatus::OK) return 2;
    SendMessage(fd, Message::Done(first.text + "|" + second.text + "\n", "", std::nullopt));
    return 0;
  }
  if (scenario == "unawaited") {
    // tool calls still in the socket when the execution times out
    for (int i = 1; i <= 3; i++) {
      SendMessage(fd, Message::ToolCall("call_" + std::to_string(i), "bash", {{"command", "sleep"}}));
    }
    Hang();
  }
  return 2;
}
