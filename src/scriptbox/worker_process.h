#ifndef SCRIPTBOX_WORKER_PROCESS_H_
#define SCRIPTBOX_WORKER_PROCESS_H_

#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#include <scriptbox/paths.h>
#include "arbiter.h"

struct WorkerSpawnOptions {
  fs::path program;
  std::vector<std::string> args; // excluding argv[0]
  long memory_mb; // RLIMIT_AS; 0 for no limit
  std::vector<std::string> envs; // appended to (and overriding) the supervisor's environment

  WorkerSpawnOptions() : memory_mb(0) {}
};

// A running worker process: the supervisor end of the channel, the worker's merged stdout/stderr
// pipe and a pidfd that becomes readable when the process exits.
// The destructor kills and reaps the process if that has not happened yet.
class WorkerHandle {
  pid_t pid_;
  int pidfd_, channel_fd_, stdio_fd_;
  bool killed_, reaped_;
  WorkerExit exit_;

  void Close_(int& fd);
 public:
  WorkerHandle(pid_t pid, int pidfd, int channel_fd, int stdio_fd) :
      pid_(pid), pidfd_(pidfd), channel_fd_(channel_fd), stdio_fd_(stdio_fd),
      killed_(false), reaped_(false), exit_{} {}
  ~WorkerHandle();
  WorkerHandle(const WorkerHandle&) = delete;
  WorkerHandle& operator=(const WorkerHandle&) = delete;

  pid_t Pid() const { return pid_; }
  int PidFd() const { return pidfd_; }
  int ChannelFd() const { return channel_fd_; }
  int StdioFd() const { return stdio_fd_; }
  void CloseChannel() { Close_(channel_fd_); }
  void CloseStdio() { Close_(stdio_fd_); }

  // SIGKILL; no-op if already killed or reaped
  void Kill();
  bool Killed() const { return killed_; }
  // non-blocking; return true once the process has been reaped
  bool TryReap();
  // blocking
  void Reap();
  bool Reaped() const { return reaped_; }
  // only valid once reaped
  const WorkerExit& Exit() const { return exit_; }
};

// Throws SpawnError if the process cannot be created or the program cannot be executed
std::unique_ptr<WorkerHandle> SpawnWorker(const WorkerSpawnOptions&);

#endif  // SCRIPTBOX_WORKER_PROCESS_H_
