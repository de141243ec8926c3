#include "truncator.h"

#include <vector>
#include <limits>

#include <spdlog/spdlog.h>
#include "utils.h"

const char kPreviewMarker[] = "...truncated...";

namespace {

constexpr char kStderrSeparator[] = "--- stderr ---\n";

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (start < text.size()) {
    size_t pos = text.find('\n', start);
    if (pos == std::string::npos) {
      ret.push_back(text.substr(start));
      break;
    }
    ret.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return ret;
}

} // namespace

std::string MakePreview(const std::string& text, const PreviewOptions& opt, bool* truncated) {
  if (truncated) *truncated = false;
  const size_t max_lines = opt.lines > 0 ? opt.lines : std::numeric_limits<size_t>::max();
  const size_t max_bytes = opt.max_bytes > 0 ? opt.max_bytes : std::numeric_limits<size_t>::max();
  std::vector<std::string> lines = SplitLines(text);
  const size_t n = lines.size();
  // fits in 2 * max_lines without overflowing
  if (text.size() <= max_bytes && (n <= max_lines || n - max_lines <= max_lines)) return text;
  const size_t head_budget = max_bytes / 2, tail_budget = max_bytes - head_budget;

  // head
  std::vector<std::string> head;
  size_t head_bytes = 0;
  size_t first = 0; // first line not in head
  for (; first < n && head.size() < max_lines; first++) {
    size_t len = lines[first].size() + 1;
    if (head_bytes + len > head_budget) {
      if (head.empty()) head.push_back(Utf8Prefix(lines[first], head_budget));
      break;
    }
    head.push_back(lines[first]);
    head_bytes += len;
  }
  // tail; never overlaps the head
  std::vector<std::string> tail;
  size_t tail_bytes = 0;
  size_t last = n; // lines [last, n) are in tail
  for (; last > first && tail.size() < max_lines; last--) {
    size_t len = lines[last - 1].size() + 1;
    if (tail_bytes + len > tail_budget) {
      if (tail.empty()) tail.push_back(Utf8Suffix(lines[last - 1], tail_budget));
      break;
    }
    tail.push_back(lines[last - 1]);
    tail_bytes += len;
  }

  if (truncated) *truncated = true;
  std::string ret;
  for (auto& i : head) ret += i + '\n';
  ret += kPreviewMarker;
  for (auto it = tail.rbegin(); it != tail.rend(); ++it) ret += '\n' + *it;
  return ret;
}

std::string FullOutputText(const std::string& stdout_text, const std::string& stderr_text) {
  std::string ret = stdout_text;
  if (!stderr_text.empty()) {
    if (!ret.empty() && ret.back() != '\n') ret += '\n';
    ret += kStderrSeparator;
    ret += stderr_text;
  }
  return ret;
}

TruncatedOutput TruncateOutput(const std::string& stdout_text, const std::string& stderr_text,
                               const std::filesystem::path& full_path, const PreviewOptions& opt) {
  TruncatedOutput ret;
  if (CreateDirs(full_path.parent_path()) &&
      WriteFile(full_path, FullOutputText(stdout_text, stderr_text))) {
    ret.full_path = full_path;
  } else {
    spdlog::warn("Full output for {} is not available", full_path.c_str());
  }
  bool out_truncated, err_truncated;
  ret.stdout_preview = MakePreview(stdout_text, opt, &out_truncated);
  ret.stderr_preview = MakePreview(stderr_text, opt, &err_truncated);
  ret.truncated = out_truncated || err_truncated;
  return ret;
}
