#include "utils.h"

#include <fstream>
#include <iterator>

ToolOutcome CountingTools::Invoke(const std::string& tool, const nlohmann::json& args_,
                                  const ToolCallContext& ctx) {
  invocations++;
  tools.push_back(tool);
  args.push_back(args_);
  contexts.push_back(ctx);
  if (handler) return handler(tool, args_);
  return {"ok:" + tool, false};
}

ExecutionObserver AssertStatusObserver::GetObserver() {
  ExecutionObserver observer;
  observer.ReportToolCall = [this](const ExecutionRequest&, const std::vector<ToolCallRecord>& calls) {
    EXPECT_EQ(finished_, 0);
    EXPECT_EQ(calls.size(), last_progress_ + 1);
    last_progress_ = calls.size();
  };
  observer.ReportFinished = [this](const ExecutionResult& res) {
    EXPECT_EQ(res.status, expect_status) << ExecutionStatusName(res.status) << ": "
                                         << res.error_message.value_or("");
    finished_++;
  };
  return observer;
}

std::string ReadFileOrEmpty(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return "";
  return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}
