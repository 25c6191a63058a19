/*
 * test_message_handlers.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file test_message_handlers.cpp
 * @brief Tests for controller-side dispatch of sandbox messages
 */

#include <gtest/gtest.h>
#include "sandbox/message_handlers.hpp"

#include <stdexcept>
#include <vector>

using namespace warden::sandbox;
using namespace warden::ipc;

// =============================================================================
// Test Fixture
// =============================================================================

class MessageHandlerTest : public ::testing::Test {
protected:
    static constexpr uint32_t kContext = 77;

    MessageHandlerResult feed(MessageType type, const json& payload,
                              uint32_t contextId = kContext,
                              uint32_t sequenceId = 0) {
        return handler_.processMessage(
            Message::create(type, payload, sequenceId, contextId), result_, kContext);
    }

    MessageHandler handler_;
    ExecutionResult result_;
};

// =============================================================================
// Terminal Messages
// =============================================================================

TEST_F(MessageHandlerTest, ResultCompletesExecution) {
    ExecuteResult payload;
    payload.success = true;
    payload.result = 2;
    payload.executionTimeMs = 15;
    payload.memoryUsage = 2048;
    payload.networkRequests = 1;

    auto handled = feed(MessageType::Result, payload.toJson());
    EXPECT_TRUE(handled.executionComplete);
    EXPECT_FALSE(handled.shouldContinue);
    EXPECT_FALSE(handled.reply.has_value());

    EXPECT_TRUE(result_.success);
    EXPECT_EQ(result_.output, 2);
    EXPECT_EQ(result_.metrics.executionTime.count(), 15);
    EXPECT_EQ(result_.metrics.memoryUsage, 2048u);
    EXPECT_EQ(result_.metrics.networkRequests, 1u);
}

TEST_F(MessageHandlerTest, ErrorCarriesMessageAndStack) {
    ExecuteResult payload;
    payload.success = false;
    payload.error = "ZeroDivisionError: division by zero";
    payload.stack = "Traceback (most recent call last): ...";

    auto handled = feed(MessageType::Error, payload.toJson());
    EXPECT_TRUE(handled.executionComplete);
    EXPECT_FALSE(result_.success);
    EXPECT_EQ(result_.error, "ZeroDivisionError: division by zero");
    ASSERT_TRUE(result_.stack.has_value());
}

TEST_F(MessageHandlerTest, ErrorIsNeverSuccess) {
    ExecuteResult payload;
    payload.success = true;
    feed(MessageType::Error, payload.toJson());
    EXPECT_FALSE(result_.success);
    EXPECT_EQ(result_.error, "Unknown error");
}

TEST_F(MessageHandlerTest, WarningsAreAppended) {
    result_.warnings = {"Removed storage construct 'open(' at line 1"};
    ExecuteResult payload;
    payload.success = true;
    payload.warnings = {"CPU usage 99% exceeded advisory limit 80%"};
    feed(MessageType::Result, payload.toJson());
    ASSERT_EQ(result_.warnings.size(), 2u);
    EXPECT_EQ(result_.warnings[1], "CPU usage 99% exceeded advisory limit 80%");
}

TEST_F(MessageHandlerTest, MalformedTerminalStillCompletes) {
    auto handled = feed(MessageType::Result, {{"warnings", "not a list"}});
    EXPECT_TRUE(handled.executionComplete);
    EXPECT_FALSE(result_.success);
    EXPECT_EQ(result_.error, "Malformed result from sandbox");
}

// =============================================================================
// Context Filtering
// =============================================================================

TEST_F(MessageHandlerTest, ForeignContextIsDiscarded) {
    ExecuteResult payload;
    payload.success = true;
    payload.result = "stale";

    auto handled = feed(MessageType::Result, payload.toJson(), kContext + 1);
    EXPECT_FALSE(handled.executionComplete);
    EXPECT_TRUE(handled.shouldContinue);
    EXPECT_FALSE(result_.success);
    EXPECT_TRUE(result_.output.is_null());
}

TEST_F(MessageHandlerTest, ForeignNetworkRequestGetsNoReply) {
    auto handled = feed(MessageType::NetworkRequest, {{"url", "https://a"}}, 1);
    EXPECT_FALSE(handled.reply.has_value());
}

// =============================================================================
// Console
// =============================================================================

TEST_F(MessageHandlerTest, ThrowingConsoleCallbackIsContained) {
    handler_.setConsoleCallback([](const ConsoleEntry&) {
        throw std::runtime_error("listener gone");
    });

    LogRecord record{"log", "still recorded", 1700000000000};
    MessageHandlerResult handled;
    EXPECT_NO_THROW(handled = feed(MessageType::Log, record.toJson()));
    EXPECT_TRUE(handled.shouldContinue);
    ASSERT_EQ(result_.logs.size(), 1u);
    EXPECT_EQ(result_.logs[0].message, "still recorded");
}

TEST_F(MessageHandlerTest, LogIsRecordedAndForwarded) {
    std::vector<ConsoleEntry> seen;
    handler_.setConsoleCallback([&](const ConsoleEntry& entry) { seen.push_back(entry); });

    LogRecord record{"warn", "careful", 1700000000000};
    auto handled = feed(MessageType::Log, record.toJson());

    EXPECT_FALSE(handled.executionComplete);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].level, "warn");
    EXPECT_EQ(seen[0].message, "careful");
    ASSERT_EQ(result_.logs.size(), 1u);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(
                  result_.logs[0].timestamp.time_since_epoch())
                  .count(),
              1700000000000);
}

TEST_F(MessageHandlerTest, LogWithoutCallbackIsStillRecorded) {
    feed(MessageType::Log, LogRecord{"log", "plain", 0}.toJson());
    ASSERT_EQ(result_.logs.size(), 1u);
    EXPECT_EQ(result_.logs[0].message, "plain");
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_F(MessageHandlerTest, DiagnosticBecomesWarning) {
    DiagnosticReport report;
    report.error = "RuntimeError: late failure";
    auto handled = feed(MessageType::Diagnostic, report.toJson());

    EXPECT_FALSE(handled.executionComplete);
    ASSERT_EQ(result_.warnings.size(), 1u);
    EXPECT_EQ(result_.warnings[0], "Unhandled error in sandbox: RuntimeError: late failure");
}

TEST_F(MessageHandlerTest, DiagnosticDoesNotChangeResolvedResult) {
    ExecuteResult payload;
    payload.success = true;
    payload.result = 1;
    feed(MessageType::Result, payload.toJson());

    feed(MessageType::Diagnostic, DiagnosticReport{"ValueError: x", std::nullopt}.toJson());
    EXPECT_TRUE(result_.success);
    EXPECT_EQ(result_.output, 1);
}

// =============================================================================
// Network Relay
// =============================================================================

TEST_F(MessageHandlerTest, DefaultHandlerDenies) {
    auto handled = feed(MessageType::NetworkRequest,
                        NetworkRequestPayload{"https://example.com", "GET", json::object(), ""}
                            .toJson(),
                        kContext, 12);
    ASSERT_TRUE(handled.reply.has_value());
    EXPECT_EQ(handled.reply->header.type, MessageType::NetworkResponse);
    EXPECT_EQ(handled.reply->header.sequenceId, 12u);
    EXPECT_EQ(handled.reply->header.contextId, kContext);

    auto body = NetworkResponsePayload::fromJson(*handled.reply->getPayloadAsJson());
    ASSERT_TRUE(body.has_value());
    EXPECT_FALSE(body->ok);
    EXPECT_EQ(body->status, 0);
    EXPECT_EQ(body->error, "Network access is not available");
}

TEST_F(MessageHandlerTest, InstalledHandlerServesRequest) {
    NetworkRequest captured;
    handler_.setNetworkHandler([&](const NetworkRequest& request) {
        captured = request;
        NetworkResponse response;
        response.ok = true;
        response.status = 201;
        response.body = "created";
        return response;
    });

    auto handled = feed(MessageType::NetworkRequest,
                        {{"url", "https://api"}, {"method", "POST"}, {"body", "{}"}});
    ASSERT_TRUE(handled.reply.has_value());
    EXPECT_EQ(captured.method, "POST");
    EXPECT_EQ(captured.body, "{}");

    auto body = NetworkResponsePayload::fromJson(*handled.reply->getPayloadAsJson());
    ASSERT_TRUE(body.has_value());
    EXPECT_TRUE(body->ok);
    EXPECT_EQ(body->status, 201);
    EXPECT_EQ(body->body, "created");
}

TEST_F(MessageHandlerTest, ThrowingHandlerBecomesErrorResponse) {
    handler_.setNetworkHandler([](const NetworkRequest&) -> NetworkResponse {
        throw std::runtime_error("upstream down");
    });
    auto handled = feed(MessageType::NetworkRequest, {{"url", "https://api"}});
    ASSERT_TRUE(handled.reply.has_value());
    auto body = NetworkResponsePayload::fromJson(*handled.reply->getPayloadAsJson());
    ASSERT_TRUE(body.has_value());
    EXPECT_FALSE(body->ok);
    EXPECT_EQ(body->error, "upstream down");
}

TEST_F(MessageHandlerTest, ClearingHandlerRestoresDenial) {
    handler_.setNetworkHandler([](const NetworkRequest&) {
        NetworkResponse response;
        response.ok = true;
        return response;
    });
    handler_.setNetworkHandler({});

    auto handled = feed(MessageType::NetworkRequest, {{"url", "https://api"}});
    auto body = NetworkResponsePayload::fromJson(*handled.reply->getPayloadAsJson());
    ASSERT_TRUE(body.has_value());
    EXPECT_FALSE(body->ok);
}

TEST_F(MessageHandlerTest, MalformedRequestIsAnswered) {
    auto handled = feed(MessageType::NetworkRequest, {{"method", "GET"}});
    ASSERT_TRUE(handled.reply.has_value());
    auto body = NetworkResponsePayload::fromJson(*handled.reply->getPayloadAsJson());
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->error, "Malformed network request");
}

TEST_F(MessageHandlerTest, UnexpectedTypeIsIgnored) {
    auto handled = feed(MessageType::Handshake, json::object());
    EXPECT_TRUE(handled.shouldContinue);
    EXPECT_FALSE(handled.executionComplete);
}
