#include <gtest/gtest.h>
#include "sync/ProcessStreamer.hpp"
#include "types/SyncError.hpp"

#include <chrono>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace ds::sync;
using namespace ds::types;
using namespace std::chrono_literals;

class ProcessStreamerTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::vector<std::string> out, err;

    ProcessStreamer shell(const std::string& script) {
        return ProcessStreamer(
            {"/bin/sh", "-c", script},
            [this](std::string_view line) { std::scoped_lock lock(mutex); out.emplace_back(line); },
            [this](std::string_view line) { std::scoped_lock lock(mutex); err.emplace_back(line); });
    }
};

TEST_F(ProcessStreamerTest, StreamsBothOutputsLineByLine) {
    const auto result = shell("echo one; echo two; echo oops 1>&2; printf 'tail'").run({});

    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(out, (std::vector<std::string>{"one", "two", "tail"}));
    EXPECT_EQ(err, std::vector<std::string>{"oops"});
}

TEST_F(ProcessStreamerTest, StripsCarriageReturns) {
    shell("printf 'progress\\r\\ndone\\n'").run({});
    EXPECT_EQ(out, (std::vector<std::string>{"progress", "done"}));
}

TEST_F(ProcessStreamerTest, ReportsExitStatus) {
    const auto result = shell("exit 23").run({});
    EXPECT_EQ(result.exitStatus, 23);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(ProcessStreamerTest, ExecFailureThrowsToolInvocationFailed) {
    const ProcessStreamer streamer({"/nonexistent/dirsync-tool"}, [](std::string_view) {}, [](std::string_view) {});
    try {
        streamer.run({});
        FAIL() << "expected SyncException";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), SyncError::ToolInvocationFailed);
        EXPECT_NE(std::string(e.what()).find("Failed to start /nonexistent/dirsync-tool"), std::string::npos);
    }
}

TEST_F(ProcessStreamerTest, EmptyArgvThrows) {
    const ProcessStreamer streamer({}, [](std::string_view) {}, [](std::string_view) {});
    EXPECT_THROW(streamer.run({}), SyncException);
}

TEST_F(ProcessStreamerTest, StopRequestKillsProcessGroupPromptly) {
    std::stop_source stop;
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(200ms);
        stop.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    // the child sleep keeps the pipes open; only a group kill ends the run early
    const auto result = shell("echo started; sleep 30; echo unreachable").run(stop.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(out, std::vector<std::string>{"started"});
}

TEST_F(ProcessStreamerTest, StopAfterCleanExitIsNotCancellation) {
    std::stop_source stop;
    const ProcessStreamer streamer(
        {"/bin/sh", "-c", "echo done"},
        [&stop](std::string_view) {
            // the child has exited by now but is not reaped until the pipes drain
            std::this_thread::sleep_for(200ms);
            stop.request_stop();
        },
        [](std::string_view) {});

    const auto result = streamer.run(stop.get_token());
    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(ProcessStreamerTest, AlreadyStoppedTokenSkipsSpawn) {
    std::stop_source stop;
    stop.request_stop();
    const auto result = shell("echo never").run(stop.get_token());
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(out.empty());
}
