#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <cstring>
#include <limits>
#include <gtest/gtest.h>
#include "scriptbox/ipc.h"

namespace {

std::string Frame(const std::string& payload, long size) {
  std::string ret(sizeof(size), '\0');
  memcpy(ret.data(), &size, sizeof(size));
  return ret + payload;
}

std::string Frame(const std::string& payload) {
  return Frame(payload, payload.size());
}

class ChannelTest : public ::testing::Test {
 protected:
  int fds[2];
  void SetUp() override {
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    ASSERT_EQ(fcntl(fds[0], F_SETFL, O_NONBLOCK), 0);
  }
  void TearDown() override {
    close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
  }
  void Write(const std::string& data) {
    ASSERT_EQ(write(fds[1], data.data(), data.size()), (ssize_t)data.size());
  }
};

} // namespace

TEST(IpcTest, DecodeToolCall) {
  Message msg;
  ASSERT_EQ(DecodeMessage(R"({"type":"tool_call","id":"call_1","name":"read","args":{"path":"a.txt"}})",
                          msg), DecodeStatus::OK);
  EXPECT_EQ(msg.type, MessageType::TOOL_CALL);
  EXPECT_EQ(msg.id, "call_1");
  EXPECT_EQ(msg.name, "read");
  EXPECT_EQ(msg.args["path"], "a.txt");
  EXPECT_TRUE(IsWorkerMessage(msg.type));
}

TEST(IpcTest, DecodeDone) {
  Message msg;
  ASSERT_EQ(DecodeMessage(R"({"type":"done","stdout":"x","stderr":"","error":null})", msg),
            DecodeStatus::OK);
  EXPECT_EQ(msg.stdout_text, "x");
  EXPECT_FALSE(msg.error.has_value());
  EXPECT_FALSE(msg.limit_error);
  ASSERT_EQ(DecodeMessage(R"({"type":"done","stdout":"","stderr":"","error":"ToolLimitExceeded: x",
                              "limit_error":true})", msg), DecodeStatus::OK);
  EXPECT_EQ(msg.error, "ToolLimitExceeded: x");
  EXPECT_TRUE(msg.limit_error);
}

TEST(IpcTest, DoneCarriesReturnValue) {
  Message msg;
  std::string payload = EncodeMessage(Message::Done("", "", std::nullopt, false,
                                                    nlohmann::json{{"count", 3}}));
  ASSERT_EQ(DecodeMessage(payload, msg), DecodeStatus::OK);
  ASSERT_TRUE(msg.return_value);
  EXPECT_EQ((*msg.return_value)["count"], 3);
  ASSERT_EQ(DecodeMessage(EncodeMessage(Message::Done("", "", std::nullopt)), msg),
            DecodeStatus::OK);
  EXPECT_FALSE(msg.return_value);
}

TEST(IpcTest, FrameLimitScalesWithOutputLimit) {
  EXPECT_EQ(MaxFrameSize(0), kMaxFrameSize);
  EXPECT_EQ(MaxFrameSize(-1), kMaxFrameSize);
  EXPECT_EQ(MaxFrameSize(1024), kMaxFrameSize + 6 * 1024);
  EXPECT_GT(MaxFrameSize(100L * 1024 * 1024), 100L * 1024 * 1024 * 2);
  EXPECT_EQ(MaxFrameSize(std::numeric_limits<long>::max()), std::numeric_limits<long>::max());
}

TEST(IpcTest, DecodeRejects) {
  Message msg;
  EXPECT_EQ(DecodeMessage(R"({"type":"telemetry","x":1})", msg), DecodeStatus::UNKNOWN);
  EXPECT_EQ(DecodeMessage("not json", msg), DecodeStatus::MALFORMED);
  EXPECT_EQ(DecodeMessage(R"({"type":"tool_call","name":"read"})", msg), DecodeStatus::MALFORMED);
  EXPECT_EQ(DecodeMessage(R"({"type":"output","stream":"stdin","data":""})", msg),
            DecodeStatus::MALFORMED);
  EXPECT_EQ(DecodeMessage(R"([1,2])", msg), DecodeStatus::MALFORMED);
}

TEST(IpcTest, EncodeReplacesInvalidUtf8) {
  std::string payload = EncodeMessage(Message::ToolResult("call_1", "bad \xff byte", false));
  Message msg;
  ASSERT_EQ(DecodeMessage(payload, msg), DecodeStatus::OK);
  EXPECT_EQ(msg.type, MessageType::TOOL_RESULT);
  EXPECT_EQ(msg.text, "bad \xef\xbf\xbd byte");
}

TEST_F(ChannelTest, ReaderHandlesPartialFrames) {
  FrameReader reader;
  std::string frame = Frame(EncodeMessage(Message::Ready()));
  std::string payload;
  Write(frame.substr(0, 3));
  EXPECT_EQ(reader.Fill(fds[0]), FrameReader::Status::AGAIN);
  EXPECT_FALSE(reader.Next(payload));
  Write(frame.substr(3) + frame);
  EXPECT_EQ(reader.Fill(fds[0]), FrameReader::Status::AGAIN);
  ASSERT_TRUE(reader.Next(payload));
  Message msg;
  ASSERT_EQ(DecodeMessage(payload, msg), DecodeStatus::OK);
  EXPECT_EQ(msg.type, MessageType::READY);
  EXPECT_TRUE(reader.Next(payload));
  EXPECT_FALSE(reader.Next(payload));
  EXPECT_TRUE(reader.Empty());
  close(fds[1]);
  fds[1] = -1;
  EXPECT_EQ(reader.Fill(fds[0]), FrameReader::Status::CLOSED);
}

TEST_F(ChannelTest, ReaderRejectsBadLength) {
  FrameReader reader;
  Write(Frame("", -5));
  reader.Fill(fds[0]);
  std::string payload;
  EXPECT_FALSE(reader.Next(payload));
  EXPECT_TRUE(reader.Malformed());

  FrameReader reader2;
  Write(Frame("", kMaxFrameSize + 1));
  reader2.Fill(fds[0]);
  EXPECT_FALSE(reader2.Next(payload));
  EXPECT_TRUE(reader2.Malformed());
}

TEST_F(ChannelTest, ReaderUsesConfiguredLimit) {
  std::string big = EncodeMessage(Message::Output(OutputStream::STDOUT, std::string(200, 'x')));
  FrameReader small(100);
  Write(Frame(big));
  small.Fill(fds[0]);
  std::string payload;
  EXPECT_FALSE(small.Next(payload));
  EXPECT_TRUE(small.Malformed());

  FrameReader reader(MaxFrameSize(1000));
  Write(Frame(big));
  reader.Fill(fds[0]);
  ASSERT_TRUE(reader.Next(payload));
  EXPECT_EQ(payload, big);
  EXPECT_FALSE(reader.Malformed());
}

TEST_F(ChannelTest, WriterToBlockingReceiver) {
  FrameWriter writer;
  writer.Push(Message::Execute("print(1)", 1024));
  writer.Push(Message::LimitExceeded("call_3", "Tool call limit of 2 exceeded"));
  EXPECT_TRUE(writer.Pending());
  ASSERT_TRUE(writer.Flush(fds[0]));
  EXPECT_FALSE(writer.Pending());

  Message msg;
  ASSERT_EQ(ReceiveMessage(fds[1], msg), ReceiveStatus::OK);
  EXPECT_EQ(msg.type, MessageType::EXECUTE);
  EXPECT_EQ(msg.text, "print(1)");
  EXPECT_EQ(msg.max_output_bytes, 1024);
  ASSERT_EQ(ReceiveMessage(fds[1], msg), ReceiveStatus::OK);
  EXPECT_EQ(msg.type, MessageType::LIMIT_EXCEEDED);
  EXPECT_EQ(msg.id, "call_3");
}

TEST_F(ChannelTest, ReceiveSkipsUnknownType) {
  int fl = fcntl(fds[0], F_GETFL);
  ASSERT_EQ(fcntl(fds[0], F_SETFL, fl & ~O_NONBLOCK), 0);
  Write(Frame(R"({"type":"heartbeat"})") + Frame(EncodeMessage(Message::ToolResult("call_1", "ok", true))));
  Message msg;
  ASSERT_EQ(ReceiveMessage(fds[0], msg), ReceiveStatus::OK);
  EXPECT_EQ(msg.type, MessageType::TOOL_RESULT);
  EXPECT_TRUE(msg.is_error);
  Write(Frame("{", 1));
  EXPECT_EQ(ReceiveMessage(fds[0], msg), ReceiveStatus::MALFORMED);
  close(fds[1]);
  fds[1] = -1;
  EXPECT_EQ(ReceiveMessage(fds[0], msg), ReceiveStatus::CLOSED);
}
