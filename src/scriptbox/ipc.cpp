#include "ipc.h"

#include <unistd.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <limits>

#include <spdlog/spdlog.h>
#include "utils.h"

using nlohmann::json;

#define X(name, str) case MessageType::name: return str;
const char* MessageTypeName(MessageType type) {
  switch (type) {
    ENUM_MESSAGE_TYPE_
  }
  __builtin_unreachable();
}
#undef X

namespace {

bool GetMessageType(const std::string& str, MessageType& type) {
#define X(name, s) if (str == s) { type = MessageType::name; return true; }
  ENUM_MESSAGE_TYPE_
#undef X
  return false;
}

std::string MakeFrame(const std::string& payload) {
  long size = payload.size();
  std::string ret(sizeof(size), '\0');
  memcpy(ret.data(), &size, sizeof(size));
  ret += payload;
  return ret;
}

} // namespace

bool IsWorkerMessage(MessageType type) {
  switch (type) {
    case MessageType::READY: [[fallthrough]];
    case MessageType::TOOL_CALL: [[fallthrough]];
    case MessageType::OUTPUT: [[fallthrough]];
    case MessageType::DONE: return true;
    case MessageType::EXECUTE: [[fallthrough]];
    case MessageType::TOOL_RESULT: [[fallthrough]];
    case MessageType::LIMIT_EXCEEDED: return false;
  }
  __builtin_unreachable();
}

Message Message::Ready() {
  return Message(MessageType::READY);
}

Message Message::Execute(const std::string& code, long max_output_bytes) {
  Message ret(MessageType::EXECUTE);
  ret.text = code;
  ret.max_output_bytes = max_output_bytes;
  return ret;
}

Message Message::ToolCall(const std::string& id, const std::string& name, json args) {
  Message ret(MessageType::TOOL_CALL);
  ret.id = id;
  ret.name = name;
  ret.args = std::move(args);
  return ret;
}

Message Message::ToolResult(const std::string& id, const std::string& result, bool is_error) {
  Message ret(MessageType::TOOL_RESULT);
  ret.id = id;
  ret.text = result;
  ret.is_error = is_error;
  return ret;
}

Message Message::LimitExceeded(const std::string& id, const std::string& reason) {
  Message ret(MessageType::LIMIT_EXCEEDED);
  ret.id = id;
  ret.text = reason;
  return ret;
}

Message Message::Output(OutputStream stream, const std::string& data) {
  Message ret(MessageType::OUTPUT);
  ret.stream = stream;
  ret.text = data;
  return ret;
}

Message Message::Done(const std::string& out, const std::string& err,
                      std::optional<std::string> error, bool limit_error,
                      std::optional<nlohmann::json> return_value) {
  Message ret(MessageType::DONE);
  ret.stdout_text = out;
  ret.stderr_text = err;
  ret.error = std::move(error);
  ret.limit_error = limit_error;
  ret.return_value = std::move(return_value);
  return ret;
}

long MaxFrameSize(long max_output_bytes) {
  if (max_output_bytes <= 0) return kMaxFrameSize;
  if (max_output_bytes > (std::numeric_limits<long>::max() - kMaxFrameSize) / 6) {
    return std::numeric_limits<long>::max();
  }
  return kMaxFrameSize + 6 * max_output_bytes;
}

std::string EncodeMessage(const Message& msg) {
  json data = {{"type", MessageTypeName(msg.type)}};
  switch (msg.type) {
    case MessageType::READY: break;
    case MessageType::EXECUTE:
      data["code"] = msg.text;
      data["max_output_bytes"] = msg.max_output_bytes;
      break;
    case MessageType::TOOL_CALL:
      data["id"] = msg.id;
      data["name"] = msg.name;
      data["args"] = msg.args.is_null() ? json::object() : msg.args;
      break;
    case MessageType::TOOL_RESULT:
      data["id"] = msg.id;
      data["result"] = msg.text;
      data["is_error"] = msg.is_error;
      break;
    case MessageType::LIMIT_EXCEEDED:
      data["id"] = msg.id;
      data["reason"] = msg.text;
      break;
    case MessageType::OUTPUT:
      data["stream"] = OutputStreamName(msg.stream);
      data["data"] = msg.text;
      break;
    case MessageType::DONE:
      data["stdout"] = msg.stdout_text;
      data["stderr"] = msg.stderr_text;
      if (msg.error) data["error"] = *msg.error;
      if (msg.limit_error) data["limit_error"] = true;
      if (msg.return_value) data["return_value"] = *msg.return_value;
      break;
  }
  // tool output is not guaranteed to be valid UTF-8
  return data.dump(-1, ' ', false, json::error_handler_t::replace);
}

DecodeStatus DecodeMessage(const std::string& payload, Message& msg) {
  try {
    json data = json::parse(payload);
    MessageType type;
    if (!GetMessageType(data.at("type").get<std::string>(), type)) {
      spdlog::warn("Unknown message type: {}", data["type"].dump());
      return DecodeStatus::UNKNOWN;
    }
    msg = Message(type);
    switch (type) {
      case MessageType::READY: break;
      case MessageType::EXECUTE:
        msg.text = data.at("code").get<std::string>();
        msg.max_output_bytes = data.at("max_output_bytes").get<long>();
        break;
      case MessageType::TOOL_CALL:
        msg.id = data.at("id").get<std::string>();
        msg.name = data.at("name").get<std::string>();
        msg.args = data.value("args", json::object());
        break;
      case MessageType::TOOL_RESULT:
        msg.id = data.at("id").get<std::string>();
        msg.text = data.at("result").get<std::string>();
        msg.is_error = data.value("is_error", false);
        break;
      case MessageType::LIMIT_EXCEEDED:
        msg.id = data.at("id").get<std::string>();
        msg.text = data.at("reason").get<std::string>();
        break;
      case MessageType::OUTPUT:
        if (!GetOutputStream(data.at("stream").get<std::string>(), msg.stream)) {
          spdlog::warn("Unknown output stream: {}", data["stream"].dump());
          return DecodeStatus::MALFORMED;
        }
        msg.text = data.at("data").get<std::string>();
        break;
      case MessageType::DONE:
        msg.stdout_text = data.value("stdout", "");
        msg.stderr_text = data.value("stderr", "");
        if (data.contains("error") && !data["error"].is_null()) {
          msg.error = data["error"].get<std::string>();
        }
        msg.limit_error = data.value("limit_error", false);
        if (data.contains("return_value") && !data["return_value"].is_null()) {
          msg.return_value = data["return_value"];
        }
        break;
    }
  } catch (json::exception& err) {
    spdlog::warn("Message decoding error: {}", err.what());
    return DecodeStatus::MALFORMED;
  }
  return DecodeStatus::OK;
}

FrameReader::Status FrameReader::Fill(int fd) {
  char buf[65536];
  while (true) {
    ssize_t ret = read(fd, buf, sizeof(buf));
    if (ret > 0) {
      buf_.append(buf, ret);
      continue;
    }
    if (ret == 0) return Status::CLOSED;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return Status::AGAIN;
    spdlog::warn("Channel read error: {}", strerror(errno));
    return Status::ERROR;
  }
}

bool FrameReader::Next(std::string& payload) {
  if (malformed_) return false;
  size_t avail = buf_.size() - pos_;
  if (avail < sizeof(long)) return false;
  long size;
  memcpy(&size, buf_.data() + pos_, sizeof(size));
  if (size < 0 || size > max_frame_size_) {
    spdlog::warn("Malformed frame: length {}", size);
    malformed_ = true;
    return false;
  }
  if (avail < sizeof(long) + size) return false;
  payload = buf_.substr(pos_ + sizeof(long), size);
  pos_ += sizeof(long) + size;
  // compact once the consumed prefix dominates
  if (pos_ > 65536 && pos_ * 2 > buf_.size()) {
    buf_.erase(0, pos_);
    pos_ = 0;
  }
  return true;
}

void FrameWriter::Push(const Message& msg) {
  out_ += MakeFrame(EncodeMessage(msg));
}

bool FrameWriter::Flush(int fd) {
  while (pos_ < out_.size()) {
    ssize_t ret = send(fd, out_.data() + pos_, out_.size() - pos_, MSG_NOSIGNAL);
    if (ret < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
      spdlog::debug("Channel write error: {}", strerror(errno));
      return false;
    }
    pos_ += ret;
  }
  Clear();
  return true;
}

bool SendMessage(int fd, const Message& msg) {
  std::string frame = MakeFrame(EncodeMessage(msg));
  return WriteAll(fd, frame.data(), frame.size());
}

ReceiveStatus ReceiveMessage(int fd, Message& msg) {
  while (true) {
    long size = 0;
    if (!ReadAll(fd, &size, sizeof(size))) return ReceiveStatus::CLOSED;
    if (size < 0 || size > kMaxFrameSize) {
      spdlog::warn("Malformed frame: length {}", size);
      return ReceiveStatus::MALFORMED;
    }
    std::string payload(size, '\0');
    if (!ReadAll(fd, payload.data(), size)) return ReceiveStatus::CLOSED;
    switch (DecodeMessage(payload, msg)) {
      case DecodeStatus::OK: return ReceiveStatus::OK;
      case DecodeStatus::UNKNOWN: continue;
      case DecodeStatus::MALFORMED: return ReceiveStatus::MALFORMED;
    }
  }
}
