#include <unistd.h>
#include <sys/socket.h>
#include <thread>
#include <gtest/gtest.h>
#include "scriptbox/pending_calls.h"

TEST(PendingCallsTest, SettlesOutOfOrder) {
  PendingCalls calls;
  std::string id1 = calls.Register("read", {{"path", "a"}});
  std::string id2 = calls.Register("bash", {{"command", "ls"}});
  EXPECT_EQ(id1, "call_1");
  EXPECT_EQ(id2, "call_2");
  EXPECT_EQ(calls.PendingCount(), 2);

  EXPECT_TRUE(calls.Settle(Message::ToolResult(id2, "files", false)));
  EXPECT_FALSE(calls.Take(id1));
  EXPECT_TRUE(calls.Settle(Message::LimitExceeded(id1, "Tool call limit of 1 exceeded")));
  EXPECT_EQ(calls.PendingCount(), 0);

  auto res1 = calls.Take(id1), res2 = calls.Take(id2);
  ASSERT_TRUE(res1 && res2);
  EXPECT_EQ(res1->kind, SettleKind::LIMIT_EXCEEDED);
  EXPECT_EQ(res1->text, "Tool call limit of 1 exceeded");
  EXPECT_EQ(res2->kind, SettleKind::RESULT);
  EXPECT_EQ(res2->text, "files");
  EXPECT_FALSE(calls.Take(id2));
}

TEST(PendingCallsTest, AnomaliesAreIgnored) {
  PendingCalls calls;
  std::string id = calls.Register("read", nlohmann::json::object());
  EXPECT_FALSE(calls.Settle(Message::ToolResult("call_9", "x", false)));
  EXPECT_TRUE(calls.Settle(Message::ToolResult(id, "no such file", true)));
  // already settled: the first settlement stands
  EXPECT_FALSE(calls.Settle(Message::ToolResult(id, "x", false)));
  auto res = calls.Take(id);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->kind, SettleKind::TOOL_ERROR);
  EXPECT_EQ(res->text, "no such file");
  EXPECT_FALSE(calls.Settle(Message::Output(OutputStream::STDOUT, "x")));
}

TEST(PendingCallsTest, CancelAll) {
  PendingCalls calls;
  std::string id1 = calls.Register("read", nlohmann::json::object());
  std::string id2 = calls.Register("read", nlohmann::json::object());
  calls.Settle(Message::ToolResult(id1, "ok", false));
  calls.CancelAll("execution ended");
  EXPECT_EQ(calls.PendingCount(), 0);
  EXPECT_EQ(calls.Take(id1)->kind, SettleKind::RESULT);
  auto res = calls.Take(id2);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->kind, SettleKind::CANCELLED);
  EXPECT_EQ(res->text, "execution ended");
}

TEST(ToolProxyTest, RepliesForOtherCallsAreKept) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
  OutputBuffer output(1024);
  ToolProxy proxy(fds[1], output);

  std::string id1 = proxy.Submit("read", {{"path", "a"}});
  std::string id2 = proxy.Submit("read", {{"path", "b"}});
  proxy.Emit(OutputStream::STDOUT, "hello\n");
  // the supervisor side answers in reverse order
  std::thread supervisor([&]() {
    Message call1, call2, out;
    ASSERT_EQ(ReceiveMessage(fds[0], call1), ReceiveStatus::OK);
    ASSERT_EQ(ReceiveMessage(fds[0], call2), ReceiveStatus::OK);
    ASSERT_EQ(ReceiveMessage(fds[0], out), ReceiveStatus::OK);
    EXPECT_EQ(call1.args["path"], "a");
    EXPECT_EQ(out.type, MessageType::OUTPUT);
    EXPECT_EQ(out.text, "hello\n");
    SendMessage(fds[0], Message::ToolResult(call2.id, "B", false));
    SendMessage(fds[0], Message::ToolResult(call1.id, "A", false));
  });
  CallSettlement res1 = proxy.Wait(id1);
  EXPECT_EQ(res1.kind, SettleKind::RESULT);
  EXPECT_EQ(res1.text, "A");
  EXPECT_TRUE(proxy.Calls().IsSettled(id2));
  EXPECT_EQ(proxy.Wait(id2).text, "B");
  supervisor.join();
  EXPECT_EQ(output.Text(OutputStream::STDOUT), "hello\n");

  // a lost channel cancels whatever is still pending
  std::string id3 = proxy.Submit("ls", nlohmann::json::object());
  close(fds[0]);
  CallSettlement res3 = proxy.Wait(id3);
  EXPECT_EQ(res3.kind, SettleKind::CANCELLED);
  EXPECT_TRUE(proxy.Closed());
  close(fds[1]);
}

TEST(ToolProxyTest, MirrorKeepsOnlyWhatFitsTheBuffer) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
  OutputBuffer output(100);
  ToolProxy proxy(fds[1], output);
  proxy.Emit(OutputStream::STDERR, std::string(5000, 'a') + std::string(100, 'b'));
  Message out;
  ASSERT_EQ(ReceiveMessage(fds[0], out), ReceiveStatus::OK);
  EXPECT_EQ(out.type, MessageType::OUTPUT);
  EXPECT_EQ(out.stream, OutputStream::STDERR);
  EXPECT_EQ(out.text, std::string(100, 'b'));
  EXPECT_EQ(output.Text(OutputStream::STDERR), kTruncationMarker + std::string(100, 'b'));
  close(fds[0]);
  close(fds[1]);
}
