#include <scriptbox/paths.h>

#include <unistd.h>

fs::path kOutputRoot = "/tmp/scriptbox_output";

namespace internal {
fs::path kDataDir = fs::path(SCRIPTBOX_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path WorkerProgram() {
  return internal::kDataDir / "scriptbox-worker";
}

// the pid keeps ids from different supervisor processes apart
fs::path ExecutionOutputDir(long id) {
  return kOutputRoot / (std::to_string(getpid()) + "-" + PadInt(id, 6));
}

fs::path ExecutionOutputPath(long id) {
  return ExecutionOutputDir(id) / "output.txt";
}
