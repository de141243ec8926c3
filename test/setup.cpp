#include <unistd.h>
#include <csignal>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <scriptbox/paths.h>
#include <scriptbox/logger.h>
#include "../src/scriptbox/utils.h"

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    InitLogger();
  }
  void TearDown() override {
    RemoveAll(kOutputRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  // tool commands may exit without reading their input
  signal(SIGPIPE, SIG_IGN);
  if (argc) internal::kDataDir = fs::path(argv[0]).parent_path();
  kOutputRoot = fs::temp_directory_path() / ("scriptbox-test-" + std::to_string(getpid()));
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
