#include <gymjudge/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// Every colored console sink shares this lock; hold it across fork() so the child
//  never starts with it owned by a thread that does not exist there
void LockConsole() {
  spdlog::details::console_mutex::mutex().lock();
}

void UnlockConsole() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(LockConsole, UnlockConsole, UnlockConsole);
}
