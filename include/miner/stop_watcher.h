#pragma once

#include "miner/decision_loop.h"
#include <atomic>
#include <chrono>
#include <thread>

namespace oreminer {
namespace miner {

/**
 * @brief Forwards a process-wide shutdown flag to a running DecisionLoop
 *
 * A background thread polls the flag and calls request_stop() once it is set.
 * The thread is joined on destruction, including during stack unwinding.
 */
class StopWatcher {
public:
  StopWatcher(const std::atomic<bool> &shutdown_flag, DecisionLoop &loop,
              std::chrono::milliseconds poll_interval =
                  std::chrono::milliseconds(50));
  ~StopWatcher();

  StopWatcher(const StopWatcher &) = delete;
  StopWatcher &operator=(const StopWatcher &) = delete;

  /// True once the flag was observed and the loop asked to stop
  bool triggered() const { return triggered_.load(); }

private:
  const std::atomic<bool> &shutdown_flag_;
  DecisionLoop &loop_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> finished_{false};
  std::atomic<bool> triggered_{false};
  std::thread thread_;

  void watch();
};

} // namespace miner
} // namespace oreminer
