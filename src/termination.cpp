#include "termination.h"

#include "tui.h"

#include <pthread.h>
#include <unistd.h>

#include <csignal>
#include <system_error>
#include <thread>
#include <tuple>

namespace bale {

void termination_handler_install(std::stop_source stop) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (int const rc{ ::pthread_sigmask(SIG_BLOCK, &signals, nullptr) }; rc != 0) {
    throw std::system_error(rc, std::system_category(), "termination_handler_install");
  }

  std::thread{ [signals, stop]() mutable {
    for (bool first{ true };; first = false) {
      int sig{ 0 };
      if (::sigwait(&signals, &sig) != 0) { return; }
      if (!first) {
        // Restore cursor visibility and auto-wrap before exit
        std::ignore = ::write(STDERR_FILENO, "\x1b[?25h\x1b[?7h", 12);
        ::_exit(128 + sig);
      }
      tui::warn("interrupted, stopping (interrupt again to exit immediately)");
      stop.request_stop();
    }
  } }.detach();
}

}  // namespace bale
