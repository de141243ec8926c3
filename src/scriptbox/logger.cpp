#include <scriptbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// all console sinks share this mutex; a child must not inherit it locked
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
