#include "command_tool.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

constexpr char kNoHandler[] = "no tool handler configured";

enum class ExchangeStatus { OK, IO_ERROR, TIMEOUT, CANCELLED };

// write input to in_fd while collecting out_fd until EOF, the deadline or a cancellation
ExchangeStatus Exchange(int in_fd, int out_fd, const std::string& input, std::string& output,
                        const ToolCallContext& ctx) {
  using Clock = std::chrono::steady_clock;
  Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(std::max(ctx.timeout_ms, 0L));
  ExchangeStatus status = ExchangeStatus::OK;
  size_t pos = 0;
  char buf[65536];
  if (input.empty()) {
    close(in_fd);
    in_fd = -1;
  }
  while (true) {
    int timeout = -1;
    if (ctx.timeout_ms >= 0) {
      auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now()).count();
      if (left <= 0) {
        status = ExchangeStatus::TIMEOUT;
        break;
      }
      timeout = (int)std::min<long long>(left, 1L << 30);
    }
    struct pollfd fds[3];
    int nfds = 0, in_idx = -1, cancel_idx = -1;
    fds[nfds++] = {out_fd, POLLIN, 0};
    if (in_fd >= 0) {
      in_idx = nfds;
      fds[nfds++] = {in_fd, POLLOUT, 0};
    }
    if (ctx.cancel_fd >= 0) {
      cancel_idx = nfds;
      fds[nfds++] = {ctx.cancel_fd, POLLIN, 0};
    }
    int ret = poll(fds, nfds, timeout);
    if (ret < 0) {
      if (errno == EINTR) continue;
      goto err;
    }
    if (ret == 0) continue;
    if (cancel_idx >= 0 && fds[cancel_idx].revents) {
      status = ExchangeStatus::CANCELLED;
      break;
    }
    if (in_idx >= 0 && fds[in_idx].revents) {
      ssize_t n = write(in_fd, input.data() + pos, input.size() - pos);
      if (n < 0 && errno != EAGAIN && errno != EINTR) {
        // the command does not read its input; not an error by itself
        n = input.size() - pos;
      }
      if (n > 0) pos += n;
      if (pos == input.size()) {
        close(in_fd);
        in_fd = -1;
      }
    }
    if (fds[0].revents) {
      ssize_t n = read(out_fd, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        goto err;
      }
      if (n == 0) break;
      output.append(buf, n);
    }
  }
  if (in_fd >= 0) close(in_fd);
  return status;
err:
  spdlog::warn("Tool command I/O error: {}", strerror(errno));
  if (in_fd >= 0) close(in_fd);
  return ExchangeStatus::IO_ERROR;
}

} // namespace

ToolOutcome CommandToolCollaborator::Invoke(const std::string& tool, const nlohmann::json& args,
                                            const ToolCallContext& ctx) {
  if (command_.empty()) return {kNoHandler, true};
  std::string input = nlohmann::json{{"tool", tool}, {"args", args}}.dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
  int inpipe[2], outpipe[2];
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    goto err;
  }
  {
    pid_t pid = fork();
    if (pid < 0) {
      close(inpipe[0]);
      close(inpipe[1]);
      close(outpipe[0]);
      close(outpipe[1]);
      goto err;
    }
    if (pid == 0) {
      setpgid(0, 0);
      dup2(inpipe[0], 0);
      dup2(outpipe[1], 1);
      execl("/bin/sh", "sh", "-c", command_.c_str(), nullptr);
      _exit(127);
    }
    // set on both sides so the group exists before any kill below
    setpgid(pid, pid);
    close(inpipe[0]);
    close(outpipe[1]);
    fcntl(inpipe[1], F_SETFL, fcntl(inpipe[1], F_GETFL) | O_NONBLOCK);
    spdlog::debug("Tool {} forwarded to pid {}, {} ms left", tool, pid, ctx.timeout_ms);

    // the caller ignores SIGPIPE, so a command that exits early only ends the write
    std::string output;
    ExchangeStatus status = Exchange(inpipe[1], outpipe[0], input, output, ctx);
    if (status == ExchangeStatus::TIMEOUT || status == ExchangeStatus::CANCELLED) {
      spdlog::info("Killing tool command {}: {}", pid,
                   status == ExchangeStatus::TIMEOUT ? "out of time" : "cancelled");
      kill(-pid, SIGKILL);
    }
    close(outpipe[0]);
    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR);
    switch (status) {
      case ExchangeStatus::IO_ERROR: return {"tool command I/O error", true};
      case ExchangeStatus::TIMEOUT: return {"tool command timed out", true};
      case ExchangeStatus::CANCELLED: return {"tool command cancelled", true};
      case ExchangeStatus::OK: break;
    }
    if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) return {output, false};
    if (output.empty()) {
      output = WIFSIGNALED(wstatus) ?
          "tool command killed by signal " + std::to_string(WTERMSIG(wstatus)) :
          "tool command exited with code " + std::to_string(WEXITSTATUS(wstatus));
    }
    return {output, true};
  }
err:
  spdlog::warn("Failed to run tool command: {}", strerror(errno));
  return {std::string("failed to run tool command: ") + strerror(errno), true};
}
