/*
 * test_execution_session.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file test_execution_session.cpp
 * @brief Tests for dispatch preparation and the controller receive loop
 *
 * The sandbox side is played by a thread holding the child end of the
 * channel; a paused forked process stands in for the sandbox PID so the
 * kill paths have something to kill.
 */

#include <gtest/gtest.h>
#include "sandbox/execution_session.hpp"
#include "sandbox/process_spawning.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <thread>

#include <unistd.h>

using namespace warden::sandbox;
using namespace warden;
using namespace std::chrono_literals;

// =============================================================================
// Dispatch Preparation
// =============================================================================

TEST(PrepareDispatchTest, SanitizesAndMergesLimits) {
    ResourceLimiter limiter;
    limiter.setMemory(4096);
    limiter.setExecutionTime(900ms);

    config::SandboxConfig config;
    config.monitorIntervalMs = 25;
    config.networkRequestCap = 3;

    ExecutionContext context;
    context.timeout = 500ms;
    context.networkAccess = false;
    context.values = {{"user", "bob"}};

    auto plan = prepareDispatch("x = eval('1')\nreturn 2", context, limiter, config);

    EXPECT_EQ(plan.request.code.find("eval("), std::string::npos);
    ASSERT_EQ(plan.warnings.size(), 1u);
    EXPECT_NE(plan.warnings[0].find("line 1"), std::string::npos);

    EXPECT_EQ(plan.request.context["user"], "bob");
    EXPECT_EQ(plan.request.context["memoryLimit"], 4096);
    EXPECT_EQ(plan.request.context["executionTime"], 900);
    EXPECT_FALSE(plan.request.networkAccess);
    EXPECT_EQ(plan.request.memoryLimit, 4096u);
    EXPECT_EQ(plan.request.executionTimeMs, 900);
    EXPECT_EQ(plan.request.cpuLimit, ResourceLimits::DEFAULT_CPU);
    EXPECT_EQ(plan.request.monitorIntervalMs, 25);
    EXPECT_EQ(plan.request.networkRequestCap, 3u);
    EXPECT_EQ(plan.timeout, 500ms);
}

TEST(PrepareDispatchTest, DefaultTimeoutComesFromConfig) {
    ResourceLimiter limiter;
    config::SandboxConfig config;
    config.defaultTimeoutMs = 1234;

    auto plan = prepareDispatch("return 1", ExecutionContext{}, limiter, config);
    EXPECT_EQ(plan.timeout, 1234ms);
    EXPECT_EQ(plan.request.code, "return 1");
    EXPECT_TRUE(plan.warnings.empty());
    EXPECT_TRUE(plan.request.networkAccess);
}

// =============================================================================
// Helpers
// =============================================================================

TEST(ExecutionHelpersTest, ContextIdsAreNonZero) {
    std::set<uint32_t> seen;
    for (int i = 0; i < 64; ++i) {
        auto id = generateContextId();
        EXPECT_NE(id, 0u);
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST(ExecutionHelpersTest, TimeoutMessageNamesTheLimit) {
    auto error = describeFailure(SandboxErrorCode::Timeout, 200ms);
    EXPECT_EQ(error.code(), SandboxErrorCode::Timeout);
    EXPECT_NE(std::string(error.what()).find("200ms"), std::string::npos);
    EXPECT_NE(std::string(error.what()).find("execution time limit"),
              std::string::npos);
}

TEST(ExecutionHelpersTest, OtherFailuresUseDefaultText) {
    auto error = describeFailure(SandboxErrorCode::Terminated, 1s);
    EXPECT_EQ(error.code(), SandboxErrorCode::Terminated);
    EXPECT_STREQ(error.what(), "Execution terminated");

    auto lost = describeFailure(SandboxErrorCode::ProtocolError, 1s);
    EXPECT_STREQ(lost.what(), "Sandbox process exited without reporting a result");
}

TEST(ExecutionHelpersTest, RejectedFutureIsReadyAndThrows) {
    auto future = rejectedFuture(SandboxError(SandboxErrorCode::AlreadyExecuting));
    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    try {
        future.get();
        FAIL() << "Expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.code(), SandboxErrorCode::AlreadyExecuting);
    }
}

// =============================================================================
// ExecutionControl
// =============================================================================

TEST(ExecutionControlTest, OnlyOneCallAtATime) {
    ExecutionControl control;
    EXPECT_FALSE(control.isExecuting());
    EXPECT_TRUE(control.tryBegin());
    EXPECT_TRUE(control.isExecuting());
    EXPECT_FALSE(control.tryBegin());
    control.finish();
    EXPECT_FALSE(control.isExecuting());
    EXPECT_TRUE(control.tryBegin());
    control.finish();
}

TEST(ExecutionControlTest, TerminateWhenIdleIsNoOp) {
    ExecutionControl control;
    ProcessLifecycle lifecycle;
    control.terminate(lifecycle);
    EXPECT_FALSE(lifecycle.isTerminationRequested());
}

TEST(ExecutionControlTest, EarlyTerminationIsDeliveredOnEnter) {
    ExecutionControl control;
    ProcessLifecycle lifecycle;
    ASSERT_TRUE(control.tryBegin());

    control.terminate(lifecycle);
    EXPECT_FALSE(lifecycle.isTerminationRequested());

    control.enterSession(lifecycle);
    EXPECT_TRUE(lifecycle.isTerminationRequested());
    control.leaveSession();
    control.finish();
}

TEST(ExecutionControlTest, TerminateInSessionIsImmediate) {
    ExecutionControl control;
    ProcessLifecycle lifecycle;
    ASSERT_TRUE(control.tryBegin());
    control.enterSession(lifecycle);
    EXPECT_FALSE(lifecycle.isTerminationRequested());

    control.terminate(lifecycle);
    EXPECT_TRUE(lifecycle.isTerminationRequested());
    control.leaveSession();
    control.finish();
}

TEST(ExecutionControlTest, PendingTerminationDoesNotLeakIntoNextCall) {
    ExecutionControl control;
    ProcessLifecycle lifecycle;
    ASSERT_TRUE(control.tryBegin());
    control.terminate(lifecycle);
    control.finish();

    ASSERT_TRUE(control.tryBegin());
    control.enterSession(lifecycle);
    EXPECT_FALSE(lifecycle.isTerminationRequested());
    control.leaveSession();
    control.finish();
}

// =============================================================================
// ExecutionTracker
// =============================================================================

TEST(ExecutionTrackerTest, IdleSnapshotIsLastResult) {
    ExecutionTracker tracker;
    EXPECT_FALSE(tracker.isActive());
    EXPECT_EQ(tracker.snapshot().executionTime, 0ms);

    tracker.begin(::getpid());
    EXPECT_TRUE(tracker.isActive());

    ExecutionMetrics finished;
    finished.executionTime = 42ms;
    finished.memoryUsage = 99;
    tracker.finish(finished);

    EXPECT_FALSE(tracker.isActive());
    EXPECT_EQ(tracker.snapshot().executionTime, 42ms);
    EXPECT_EQ(tracker.snapshot().memoryUsage, 99u);
}

TEST(ExecutionTrackerTest, LiveSnapshotReadsProcess) {
    ExecutionTracker tracker;
    tracker.begin(::getpid());
    tracker.recordNetworkRequest();
    tracker.recordNetworkRequest();
    std::this_thread::sleep_for(20ms);

    auto live = tracker.snapshot();
    EXPECT_GE(live.executionTime, 15ms);
    EXPECT_GT(live.memoryUsage, 0u);
    EXPECT_EQ(live.networkRequests, 2u);
    tracker.abandon();
}

TEST(ExecutionTrackerTest, AbandonKeepsElapsedAndRequests) {
    ExecutionTracker tracker;
    tracker.begin(::getpid());
    tracker.recordNetworkRequest();
    std::this_thread::sleep_for(10ms);
    tracker.abandon();

    EXPECT_FALSE(tracker.isActive());
    auto metrics = tracker.snapshot();
    EXPECT_GE(metrics.executionTime, 5ms);
    EXPECT_EQ(metrics.networkRequests, 1u);

    // A second abandon leaves the recorded values alone
    tracker.abandon();
    EXPECT_EQ(tracker.snapshot().networkRequests, 1u);
}

// =============================================================================
// ExecutionSession
// =============================================================================

class ExecutionSessionTest : public ::testing::Test {
protected:
    static constexpr uint32_t kContext = 4711;

    void SetUp() override {
        // Forked before the pipes exist so it holds none of their ends
        auto pid = ProcessSpawner::forkChild([] {
            for (;;) {
                ::pause();
            }
            return 0;
        });
        ASSERT_TRUE(pid.has_value());
        standIn_ = *pid;

        channel_ = std::make_shared<ipc::BidirectionalChannel>();
        ASSERT_TRUE(channel_->create().has_value());
        channel_->setContextId(kContext);
        auto [readFd, writeFd] = channel_->getSubprocessFds();
        guest_.adoptChild(::dup(readFd), ::dup(writeFd));
        guest_.setContextId(kContext);
        channel_->setupParent();
        lifecycle_.attach(standIn_, channel_);

        plan_.request.code = "return 2";
        plan_.timeout = 3000ms;
        plan_.warnings = {"Removed storage construct 'open(' at line 3"};
    }

    void TearDown() override {
        if (guestThread_.joinable()) {
            guestThread_.join();
        }
        lifecycle_.requestTermination();
        lifecycle_.shutdown();
        guest_.close();
    }

    template <typename Fn>
    void playGuest(Fn&& body) {
        guestThread_ = std::thread([this, body = std::forward<Fn>(body)]() mutable {
            auto execute = guest_.receive(2000ms);
            ASSERT_TRUE(execute.has_value());
            ASSERT_EQ(execute->header.type, ipc::MessageType::Execute);
            body(*execute);
        });
    }

    SandboxResult<ExecutionResult> runSession() {
        ExecutionSession session(lifecycle_, handler_, tracker_);
        return session.run(plan_);
    }

    int standIn_{-1};
    std::shared_ptr<ipc::BidirectionalChannel> channel_;
    ipc::BidirectionalChannel guest_;
    ProcessLifecycle lifecycle_;
    MessageHandler handler_;
    ExecutionTracker tracker_;
    DispatchPlan plan_;
    std::thread guestThread_;
};

TEST_F(ExecutionSessionTest, ReturnsGuestResult) {
    playGuest([this](const ipc::Message& execute) {
        auto request = ipc::ExecuteRequest::fromJson(*execute.getPayloadAsJson());
        ASSERT_TRUE(request.has_value());
        EXPECT_EQ(request->code, "return 2");

        ipc::ExecuteResult done;
        done.success = true;
        done.result = 2;
        done.executionTimeMs = 7;
        EXPECT_TRUE(guest_.send(ipc::MessageType::Result, done.toJson()).has_value());
    });

    auto result = runSession();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->output, 2);
    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_FALSE(tracker_.isActive());
    EXPECT_EQ(tracker_.snapshot().executionTime, 7ms);
}

TEST_F(ExecutionSessionTest, ConsoleLinesArriveBeforeResult) {
    std::vector<std::string> lines;
    handler_.setConsoleCallback(
        [&](const ConsoleEntry& entry) { lines.push_back(entry.message); });

    playGuest([this](const ipc::Message&) {
        (void)guest_.send(ipc::MessageType::Log, ipc::LogRecord{"log", "one", 0}.toJson());
        (void)guest_.send(ipc::MessageType::Log, ipc::LogRecord{"log", "two", 0}.toJson());
        ipc::ExecuteResult done;
        done.success = true;
        (void)guest_.send(ipc::MessageType::Result, done.toJson());
    });

    auto result = runSession();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(result->logs.size(), 2u);
}

TEST_F(ExecutionSessionTest, NetworkRequestIsAnswered) {
    std::optional<ipc::NetworkResponsePayload> answer;
    playGuest([this, &answer](const ipc::Message&) {
        auto request = ipc::Message::create(ipc::MessageType::NetworkRequest,
                                            {{"url", "https://example.com"}}, 900,
                                            kContext);
        ASSERT_TRUE(guest_.send(request).has_value());

        auto reply = guest_.receive(2000ms);
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ(reply->header.type, ipc::MessageType::NetworkResponse);
        EXPECT_EQ(reply->header.sequenceId, 900u);
        auto parsed = ipc::NetworkResponsePayload::fromJson(*reply->getPayloadAsJson());
        if (parsed) {
            answer = *parsed;
        }

        ipc::ExecuteResult done;
        done.success = true;
        done.networkRequests = 1;
        (void)guest_.send(ipc::MessageType::Result, done.toJson());
    });

    auto result = runSession();
    ASSERT_TRUE(result.has_value());
    guestThread_.join();
    ASSERT_TRUE(answer.has_value());
    EXPECT_FALSE(answer->ok);
    EXPECT_EQ(answer->error, "Network access is not available");
    EXPECT_EQ(result->metrics.networkRequests, 1u);
}

TEST_F(ExecutionSessionTest, StaleResultIsIgnored) {
    playGuest([this](const ipc::Message&) {
        ipc::ExecuteResult stale;
        stale.success = true;
        stale.result = "old";
        (void)guest_.send(ipc::Message::create(ipc::MessageType::Result, stale.toJson(),
                                               1, kContext + 1));

        ipc::ExecuteResult done;
        done.success = true;
        done.result = "new";
        (void)guest_.send(ipc::MessageType::Result, done.toJson());
    });

    auto result = runSession();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->output, "new");
}

TEST_F(ExecutionSessionTest, GuestErrorIsAResult) {
    playGuest([this](const ipc::Message&) {
        ipc::ExecuteResult failed;
        failed.error = "NameError: name 'y' is not defined";
        (void)guest_.send(ipc::MessageType::Error, failed.toJson());
    });

    auto result = runSession();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error, "NameError: name 'y' is not defined");
}

TEST_F(ExecutionSessionTest, DeadlineKillsSandbox) {
    plan_.timeout = 100ms;
    playGuest([](const ipc::Message&) {});

    auto start = std::chrono::steady_clock::now();
    auto result = runSession();
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SandboxErrorCode::Timeout);
    EXPECT_TRUE(lifecycle_.isTerminationRequested());
    EXPECT_GE(waited, 100ms);
    EXPECT_LT(waited, 1000ms);
    EXPECT_FALSE(tracker_.isActive());
    EXPECT_GE(tracker_.snapshot().executionTime, 100ms);
}

TEST_F(ExecutionSessionTest, TerminationFromAnotherThread) {
    playGuest([](const ipc::Message&) {});
    std::thread killer([this] {
        std::this_thread::sleep_for(50ms);
        lifecycle_.requestTermination();
    });

    auto result = runSession();
    killer.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SandboxErrorCode::Terminated);
}

TEST_F(ExecutionSessionTest, ClosedChannelWithoutResultIsProtocolError) {
    playGuest([this](const ipc::Message&) { guest_.close(); });

    auto result = runSession();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SandboxErrorCode::ProtocolError);
}

TEST(ExecutionSessionStandaloneTest, DetachedLifecycleIsUnavailable) {
    ProcessLifecycle lifecycle;
    MessageHandler handler;
    ExecutionTracker tracker;
    ExecutionSession session(lifecycle, handler, tracker);

    auto result = session.run(DispatchPlan{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SandboxErrorCode::WorkerUnavailable);
    EXPECT_FALSE(tracker.isActive());
}
