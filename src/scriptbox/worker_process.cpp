#include "worker_process.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "ipc.h"
#include "utils.h"

extern char** environ;

namespace {

// the exec error pipe is moved here in the child, right above the channel
constexpr int kExecErrorFd = kWorkerChannelFd + 1;

int PidfdOpen(pid_t pid) {
  return syscall(SYS_pidfd_open, pid, 0);
}

WorkerExit ToWorkerExit(int status) {
  if (WIFSIGNALED(status)) return {false, WTERMSIG(status)};
  return {true, WEXITSTATUS(status)};
}

std::vector<std::string> MergeEnv(const std::vector<std::string>& envs) {
  std::vector<std::string> ret;
  for (char** ptr = environ; ptr && *ptr; ptr++) {
    std::string entry = *ptr;
    std::string key = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (auto& i : envs) {
      if (i.compare(0, key.size() + 1, key + "=") == 0) overridden = true;
    }
    if (!overridden) ret.push_back(std::move(entry));
  }
  ret.insert(ret.end(), envs.begin(), envs.end());
  return ret;
}

/// child; only async-signal-safe calls from here on
[[noreturn]] void ExecChild(const WorkerSpawnOptions& opt, int channel, int stdio, int errfd,
                            char* const* argv, char* const* envp) {
  int devnull = open("/dev/null", O_RDONLY);
  if (devnull < 0 || dup2(devnull, 0) < 0 ||
      dup2(stdio, 1) < 0 || dup2(stdio, 2) < 0 ||
      dup2(channel, kWorkerChannelFd) < 0 ||
      dup2(errfd, kExecErrorFd) < 0 ||
      fcntl(kExecErrorFd, F_SETFD, FD_CLOEXEC) < 0) {
    goto err;
  }
  CloseFrom(kExecErrorFd + 1);
  // a dead supervisor must not leave the worker running
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) goto err;
  {
    sigset_t set;
    sigemptyset(&set);
    sigprocmask(SIG_SETMASK, &set, nullptr);
    struct rlimit core = {0, 0};
    if (setrlimit(RLIMIT_CORE, &core) < 0) goto err;
    if (opt.memory_mb > 0) {
      rlim_t bytes = (rlim_t)opt.memory_mb * 1024 * 1024;
      struct rlimit as = {bytes, bytes};
      if (setrlimit(RLIMIT_AS, &as) < 0) goto err;
    }
  }
  execve(argv[0], argv, envp);
err:
  {
    int err = errno;
    IGNORE_RETURN(write(kExecErrorFd, &err, sizeof(err)));
  }
  _exit(127);
}

} // namespace

void WorkerHandle::Close_(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

WorkerHandle::~WorkerHandle() {
  if (!reaped_) {
    Kill();
    Reap();
  }
  Close_(pidfd_);
  Close_(channel_fd_);
  Close_(stdio_fd_);
}

void WorkerHandle::Kill() {
  if (killed_ || reaped_) return;
  spdlog::debug("Killing worker pid={}", pid_);
  // the pidfd cannot refer to a recycled pid
  if (syscall(SYS_pidfd_send_signal, pidfd_, SIGKILL, nullptr, 0) < 0 && errno != ESRCH) {
    spdlog::warn("Failed to kill worker pid={}: {}", pid_, strerror(errno));
    return;
  }
  killed_ = true;
}

bool WorkerHandle::TryReap() {
  if (reaped_) return true;
  int status;
  pid_t ret = waitpid(pid_, &status, WNOHANG);
  if (ret == 0) return false;
  if (ret < 0) {
    if (errno == EINTR) return false;
    spdlog::warn("waitpid on worker pid={} failed: {}", pid_, strerror(errno));
    // nothing left to wait for; report as killed
    status = SIGKILL;
  }
  reaped_ = true;
  exit_ = ToWorkerExit(status);
  spdlog::debug("Worker pid={} reaped: exited={} status={}", pid_, exit_.exited, exit_.status);
  return true;
}

void WorkerHandle::Reap() {
  if (reaped_) return;
  int status;
  pid_t ret;
  while ((ret = waitpid(pid_, &status, 0)) < 0 && errno == EINTR);
  if (ret < 0) {
    spdlog::warn("waitpid on worker pid={} failed: {}", pid_, strerror(errno));
    status = SIGKILL;
  }
  reaped_ = true;
  exit_ = ToWorkerExit(status);
  spdlog::debug("Worker pid={} reaped: exited={} status={}", pid_, exit_.exited, exit_.status);
}

std::unique_ptr<WorkerHandle> SpawnWorker(const WorkerSpawnOptions& opt) {
  // everything the child needs is prepared before fork
  std::vector<std::string> args = {opt.program.string()};
  args.insert(args.end(), opt.args.begin(), opt.args.end());
  std::vector<std::string> envs = MergeEnv(opt.envs);
  std::vector<char*> argv, envp;
  for (auto& i : args) argv.push_back(i.data());
  argv.push_back(nullptr);
  for (auto& i : envs) envp.push_back(i.data());
  envp.push_back(nullptr);

  int channel[2] = {-1, -1}, stdio[2] = {-1, -1}, errpipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int fd : {channel[0], channel[1], stdio[0], stdio[1], errpipe[0], errpipe[1]}) {
      if (fd >= 0) close(fd);
    }
  };
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0 ||
      pipe2(stdio, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0) {
    int err = errno;
    close_all();
    throw SpawnError(std::string("Failed to create worker channel: ") + strerror(err));
  }
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close_all();
    throw SpawnError(std::string("fork failed: ") + strerror(err));
  }
  if (pid == 0) ExecChild(opt, channel[1], stdio[1], errpipe[1], argv.data(), envp.data());

  spdlog::debug("Spawned worker pid={} program={} args={} memory_mb={}",
                pid, opt.program.c_str(), fmt::format("{}", opt.args), opt.memory_mb);
  close(channel[1]);
  close(stdio[1]);
  close(errpipe[1]);
  int child_errno = 0;
  bool exec_failed = ReadAll(errpipe[0], &child_errno, sizeof(child_errno));
  close(errpipe[0]);
  if (exec_failed) {
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    close(channel[0]);
    close(stdio[0]);
    throw SpawnError("Failed to execute " + opt.program.string() + ": " + strerror(child_errno));
  }
  int pidfd = PidfdOpen(pid);
  if (pidfd < 0) {
    int err = errno;
    kill(pid, SIGKILL);
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    close(channel[0]);
    close(stdio[0]);
    throw SpawnError(std::string("pidfd_open failed: ") + strerror(err));
  }
  SetNonblock(channel[0]);
  SetNonblock(stdio[0]);
  return std::make_unique<WorkerHandle>(pid, pidfd, channel[0], stdio[0]);
}
