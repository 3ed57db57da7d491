#include "common/logging.h"
#include "miner/stop_watcher.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace oreminer;
using namespace oreminer::common;
using namespace oreminer::miner;

namespace {

class NullLedger : public ILedgerSink {
public:
    Result<bool> append(const LedgerRecord &) override { return Result<bool>(true); }
};

} // namespace

class StopWatcherTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_output(&log_output); }
    void TearDown() override { Logger::instance().set_output(&std::cout); }

    LoopConfig unbounded_dry_run() {
        LoopConfig c;
        c.dry_run = true;
        c.pacing_interval = std::chrono::milliseconds(10);
        return c;
    }

    round::RoundSnapshotBuilder builder{nullptr, "program"};
    strategy::LeastCrowdedStrategy strategy{5, 0.01};
    NullLedger ledger;
    std::atomic<bool> shutdown{false};
    std::ostringstream log_output;
};

TEST_F(StopWatcherTest, ShutdownFlagStopsRunningLoop) {
    DecisionLoop loop(builder, strategy, nullptr, ledger, unbounded_dry_run());
    StopWatcher watcher(shutdown, loop, std::chrono::milliseconds(5));

    std::thread signaller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        shutdown.store(true);
    });

    LoopSummary summary = loop.run();
    signaller.join();

    EXPECT_TRUE(watcher.triggered());
    EXPECT_TRUE(loop.stop_requested());
    EXPECT_GE(summary.rounds_completed, 1u);
    EXPECT_NE(log_output.str().find("Shutdown signal received"), std::string::npos);
}

TEST_F(StopWatcherTest, IdleWatcherLeavesLoopAlone) {
    DecisionLoop loop(builder, strategy, nullptr, ledger, unbounded_dry_run());
    {
        StopWatcher watcher(shutdown, loop, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        EXPECT_FALSE(watcher.triggered());
    }
    EXPECT_FALSE(loop.stop_requested());
}

TEST_F(StopWatcherTest, ExceptionInScopeJoinsWatcher) {
    DecisionLoop loop(builder, strategy, nullptr, ledger, unbounded_dry_run());

    // Without the join in the destructor this would call std::terminate
    EXPECT_THROW(
        {
            StopWatcher watcher(shutdown, loop);
            throw std::runtime_error("loop failed");
        },
        std::runtime_error);
    EXPECT_FALSE(loop.stop_requested());
}
