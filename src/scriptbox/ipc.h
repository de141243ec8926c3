#ifndef SCRIPTBOX_IPC_H_
#define SCRIPTBOX_IPC_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>
#include "output_buffer.h"

// Frames are a native long length followed by a JSON object; platform dependent,
// only intended for the same machine
constexpr long kMaxFrameSize = 64L * 1024 * 1024;
// error and return value carried by done are cut to this size
constexpr size_t kMaxReportBytes = 1024 * 1024;

// Frame limit for a channel whose output and done messages carry up to max_output_bytes
// of captured text; JSON escaping may turn each byte into six
long MaxFrameSize(long max_output_bytes);

// the worker inherits its end of the channel as this fd
constexpr int kWorkerChannelFd = 3;

#define ENUM_MESSAGE_TYPE_ \
  X(READY, "ready") /* worker -> supervisor */ \
  X(EXECUTE, "execute") /* supervisor -> worker */ \
  X(TOOL_CALL, "tool_call") /* worker -> supervisor */ \
  X(TOOL_RESULT, "tool_result") /* supervisor -> worker */ \
  X(LIMIT_EXCEEDED, "limit_exceeded") /* supervisor -> worker */ \
  X(OUTPUT, "output") /* worker -> supervisor */ \
  X(DONE, "done") /* worker -> supervisor */
enum class MessageType {
#define X(name, str) name,
  ENUM_MESSAGE_TYPE_
#undef X
};

const char* MessageTypeName(MessageType);
bool IsWorkerMessage(MessageType);

struct Message {
  MessageType type;
  // tool_call, tool_result, limit_exceeded
  std::string id;
  // tool_call
  std::string name;
  nlohmann::json args;
  // execute: code; tool_result: result; limit_exceeded: reason; output: data
  std::string text;
  // tool_result
  bool is_error;
  // output
  OutputStream stream;
  // execute
  long max_output_bytes;
  // done
  std::string stdout_text, stderr_text;
  std::optional<std::string> error;
  bool limit_error; // error was an unhandled ToolLimitExceeded
  std::optional<nlohmann::json> return_value;

  explicit Message(MessageType type_ = MessageType::READY) :
      type(type_), is_error(false), stream(OutputStream::STDOUT),
      max_output_bytes(0), limit_error(false) {}

  static Message Ready();
  static Message Execute(const std::string& code, long max_output_bytes);
  static Message ToolCall(const std::string& id, const std::string& name, nlohmann::json args);
  static Message ToolResult(const std::string& id, const std::string& result, bool is_error);
  static Message LimitExceeded(const std::string& id, const std::string& reason);
  static Message Output(OutputStream stream, const std::string& data);
  static Message Done(const std::string& out, const std::string& err,
                      std::optional<std::string> error, bool limit_error = false,
                      std::optional<nlohmann::json> return_value = std::nullopt);
};

std::string EncodeMessage(const Message&);
// UNKNOWN: well-formed JSON whose type is not a known message; callers log and skip it
enum class DecodeStatus { OK, UNKNOWN, MALFORMED };
DecodeStatus DecodeMessage(const std::string& payload, Message&);

// Incremental reader for a non-blocking fd
class FrameReader {
 public:
  enum class Status { AGAIN, CLOSED, ERROR };

 private:
  std::string buf_;
  size_t pos_;
  long max_frame_size_;
  bool malformed_;

 public:
  explicit FrameReader(long max_frame_size = kMaxFrameSize) :
      pos_(0), max_frame_size_(max_frame_size), malformed_(false) {}
  // read everything currently available
  Status Fill(int fd);
  // return true and set payload if a complete frame is buffered
  bool Next(std::string& payload);
  bool Malformed() const { return malformed_; }
  bool Empty() const { return pos_ == buf_.size(); }
};

// Outgoing queue for a non-blocking fd
class FrameWriter {
  std::string out_;
  size_t pos_;
 public:
  FrameWriter() : pos_(0) {}
  void Push(const Message&);
  // write as much as possible; return false on a write error other than EAGAIN
  bool Flush(int fd);
  bool Pending() const { return pos_ < out_.size(); }
  void Clear() { out_.clear(); pos_ = 0; }
};

// blocking variants for the worker side; messages of unknown type are skipped
bool SendMessage(int fd, const Message&);
enum class ReceiveStatus { OK, CLOSED, MALFORMED };
ReceiveStatus ReceiveMessage(int fd, Message&);

#endif  // SCRIPTBOX_IPC_H_
