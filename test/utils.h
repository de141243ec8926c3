#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <functional>

#include <gtest/gtest.h>
#include <scriptbox/utils.h>
#include <scriptbox/execution.h>

// Tool layer stub; counts every invocation that reaches it
class CountingTools : public ToolCollaborator {
 public:
  using Handler = std::function<ToolOutcome(const std::string&, const nlohmann::json&)>;

  long invocations;
  std::vector<std::string> tools;
  std::vector<nlohmann::json> args;
  std::vector<ToolCallContext> contexts;
  Handler handler;

  CountingTools() : invocations(0) {}
  explicit CountingTools(Handler handler_) : invocations(0), handler(std::move(handler_)) {}

  ToolOutcome Invoke(const std::string& tool, const nlohmann::json& args_,
                     const ToolCallContext& ctx) override;
};

// Checks that exactly one result is reported and that it has the expected status
class AssertStatusObserver {
  int finished_;
  size_t last_progress_;
 public:
  ExecutionStatus expect_status;

  explicit AssertStatusObserver(ExecutionStatus status) :
      finished_(0), last_progress_(0), expect_status(status) {}
  ~AssertStatusObserver() { EXPECT_EQ(finished_, 1); }

  int Finished() const { return finished_; }
  size_t Progress() const { return last_progress_; }
  ExecutionObserver GetObserver();
};

std::string ReadFileOrEmpty(const std::string& path);

#endif // TEST_UTILS_H_
