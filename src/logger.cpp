#include <runbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// fork() may happen while another thread holds the console mutex; keep it
// locked across the fork so neither side inherits it mid-write
void LockConsole() {
  spdlog::details::console_mutex::mutex().lock();
}

void UnlockConsole() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(LockConsole, UnlockConsole, UnlockConsole);
}
