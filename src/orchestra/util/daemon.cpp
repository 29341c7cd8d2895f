#include "orchestra/util/daemon.hpp"

#include <semaphore.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace orchestra {

namespace {

auto shutdown_source() -> CancellationSource& {
  static CancellationSource source;
  return source;
}

sem_t g_signal_sem;
std::atomic<bool> g_signals_installed{false};

void signal_handler(int) {
  sem_post(&g_signal_sem);
}

void watch_signals() {
  while (sem_wait(&g_signal_sem) != 0) {
    if (errno != EINTR) {
      return;
    }
  }
  shutdown_source().cancel();
}

}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);
  return true;
}

auto setup_signal_handlers() -> bool {
  if (g_signals_installed.exchange(true)) {
    return true;
  }
  if (sem_init(&g_signal_sem, 0, 0) != 0) {
    g_signals_installed = false;
    return false;
  }
  // Lives until the first signal; the process may exit while it waits.
  std::thread(watch_signals).detach();
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  return true;
}

auto shutdown_token() -> CancellationToken {
  return shutdown_source().token();
}

}  // namespace orchestra
