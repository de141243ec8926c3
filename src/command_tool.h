#ifndef COMMAND_TOOL_H_
#define COMMAND_TOOL_H_

#include <string>

#include <scriptbox/execution.h>

// Forwards each tool call to `/bin/sh -c <command>`: the request {"tool", "args"} is written
// to its stdin and its stdout is the result. A nonzero exit marks the result as an error.
// The command runs in its own process group, which is killed once the call's time is up or
// the execution is cancelled.
class CommandToolCollaborator : public ToolCollaborator {
  std::string command_;
 public:
  explicit CommandToolCollaborator(std::string command) : command_(std::move(command)) {}
  ToolOutcome Invoke(const std::string& tool, const nlohmann::json& args,
                     const ToolCallContext& ctx) override;
};

#endif  // COMMAND_TOOL_H_
