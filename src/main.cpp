#include "app.hpp"
#include "log.hpp"

#include <csignal>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    umon::ensure_default_logger();
    return umon::category_logger("app");
  }();
  return logger;
}

volatile std::sig_atomic_t g_stop_requested = 0;
volatile std::sig_atomic_t g_refresh_requested = 0;

extern "C" void handle_stop_signal(int) { g_stop_requested = 1; }

#ifndef _WIN32
extern "C" void handle_refresh_signal(int) { g_refresh_requested = 1; }
#endif
} // namespace

/**
 * Program entry point. SIGINT and SIGTERM stop the daemon; SIGUSR1 requests
 * an immediate refresh.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  try {
    umon::App app;
    int ret = app.run(argc, argv);
    if (ret != 0 || app.should_exit()) {
      spdlog::shutdown();
      return ret;
    }
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
#ifndef _WIN32
    std::signal(SIGUSR1, handle_refresh_signal);
#endif
    ret = app.serve([] { return g_stop_requested != 0; },
                    [] {
                      if (g_refresh_requested == 0) {
                        return false;
                      }
                      g_refresh_requested = 0;
                      return true;
                    });
    spdlog::shutdown();
    return ret;
  } catch (const std::exception &e) {
    main_log()->critical("Fatal error: {}", e.what());
    spdlog::shutdown();
    return 1;
  }
}
