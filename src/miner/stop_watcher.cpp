#include "miner/stop_watcher.h"
#include "common/logging.h"

namespace oreminer {
namespace miner {

StopWatcher::StopWatcher(const std::atomic<bool> &shutdown_flag,
                         DecisionLoop &loop,
                         std::chrono::milliseconds poll_interval)
    : shutdown_flag_(shutdown_flag), loop_(loop),
      poll_interval_(poll_interval), thread_(&StopWatcher::watch, this) {}

StopWatcher::~StopWatcher() {
  finished_.store(true);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StopWatcher::watch() {
  while (!finished_.load()) {
    if (shutdown_flag_.load()) {
      LOG_INFO("main", "Shutdown signal received, finishing round...");
      triggered_.store(true);
      loop_.request_stop();
      return;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

} // namespace miner
} // namespace oreminer
