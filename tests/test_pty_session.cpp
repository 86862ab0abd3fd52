/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/path_utils.hpp"
#include "shell/code_sender.hpp"
#include "shell/echo_controller.hpp"
#include "shell/session_manager.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <thread>

using namespace rpl::shell;
using rpl::core::param::EchoMode;
using rpl::core::param::ShellParameters;
using rpl::source::SourceBuffer;

// End-to-end tests against a real python3 behind a pty.
class PtySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!rpl::core::find_executable("python3"))
            GTEST_SKIP() << "python3 not found on PATH";

        params_.interpreter = "python3";
        params_.ready_timeout_ms = 10000;
        params_.echo_output = EchoMode::Always;
        manager_ = std::make_unique<SessionManager>(params_);
        echo_ = std::make_unique<EchoController>(params_);
    }

    // Runs one send and waits for its captured output.
    std::optional<EchoMessage> evaluate(const std::function<rpl::core::Result<SendResult>(CodeSender&, MessageSink)>& send) {
        auto sender = CodeSender::create(*manager_, *echo_);
        EXPECT_TRUE(sender.has_value());
        if (!sender)
            return std::nullopt;

        auto promise = std::make_shared<std::promise<EchoMessage>>();
        auto future = promise->get_future();
        const auto sent = send(*sender, [promise](const EchoMessage& message) { promise->set_value(message); });
        EXPECT_TRUE(sent.has_value()) << (sent ? "" : sent.error().message);
        if (!sent)
            return std::nullopt;

        if (future.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
            return std::nullopt;
        return future.get();
    }

    ShellParameters params_;
    std::unique_ptr<SessionManager> manager_;
    std::unique_ptr<EchoController> echo_;
};

TEST_F(PtySessionTest, StartsAndShowsPrompt) {
    const auto session = manager_->ensure_running("script.py");
    ASSERT_TRUE(session.has_value()) << session.error().message;
    EXPECT_TRUE((*session)->has_started());
    EXPECT_TRUE((*session)->is_alive());
    EXPECT_NE((*session)->transcript().find(">>> "), std::string::npos);
}

TEST_F(PtySessionTest, EvaluatesAStatement) {
    const SourceBuffer buffer("1 + 1\n");
    const auto message = evaluate([&](CodeSender& sender, MessageSink sink) {
        return sender.send_statement({"script.py", buffer}, 0, std::move(sink));
    });
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->kind, EchoKind::Output);
    EXPECT_EQ(message->text, "2");
}

TEST_F(PtySessionTest, ReportsExceptions) {
    const SourceBuffer buffer("x = 1\n1 / 0\n");
    const auto message = evaluate([&](CodeSender& sender, MessageSink sink) {
        return sender.send_statement({"script.py", buffer}, buffer.line(1).begin, std::move(sink));
    });
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->kind, EchoKind::Exception);
    EXPECT_NE(message->text.find("ZeroDivisionError"), std::string::npos);
    // Padding keeps the traceback on the original line
    EXPECT_NE(message->text.find("line 2"), std::string::npos);
}

TEST_F(PtySessionTest, IndentedBlockRunsAndShowsTrailingValue) {
    const SourceBuffer buffer(
        "def f():\n"
        "    y = 20\n"
        "    y + 22\n");
    const auto message = evaluate([&](CodeSender& sender, MessageSink sink) {
        return sender.send_region({"script.py", buffer}, buffer.line(1).begin, buffer.size(), std::move(sink));
    });
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->text, "42");
}

TEST_F(PtySessionTest, BufferSkipsMainGuard) {
    const SourceBuffer buffer(
        "x = 21\n"
        "if __name__ == '__main__':\n"
        "    print('main ran')\n"
        "x * 2\n");
    const auto message = evaluate([&](CodeSender& sender, MessageSink sink) {
        return sender.send_buffer({"script.py", buffer}, std::move(sink));
    });
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->text, "42");
}

TEST_F(PtySessionTest, KillEndsTheProcess) {
    const auto session = manager_->ensure_running("script.py");
    ASSERT_TRUE(session.has_value()) << session.error().message;
    ASSERT_TRUE(manager_->kill((*session)->name(), false));
    EXPECT_FALSE((*session)->is_alive());
    EXPECT_TRUE(manager_->live_targets().empty());
}

TEST_F(PtySessionTest, OutputSinkMayKillTheSession) {
    const auto running = manager_->ensure_running("script.py");
    ASSERT_TRUE(running.has_value()) << running.error().message;
    const auto session = *running;

    auto promise = std::make_shared<std::promise<EchoMessage>>();
    auto future = promise->get_future();
    SendStrategy strategy;
    strategy.on_output = [promise, session](const EchoMessage& message) {
        session->kill();
        promise->set_value(message);
    };
    ASSERT_TRUE(session->send({.text = "6 * 7"}, strategy).has_value());

    ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(future.get().text, "42");
    EXPECT_EQ(session->state(), SessionState::Killed);
    EXPECT_FALSE(session->is_alive());
}

TEST_F(PtySessionTest, InterpreterExitEndsTheSession) {
    const auto running = manager_->ensure_running("script.py");
    ASSERT_TRUE(running.has_value()) << running.error().message;
    const auto session = *running;

    ASSERT_TRUE(session->send({.text = "raise SystemExit(3)"}).has_value());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (session->is_alive() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(session->is_alive());
    EXPECT_TRUE(manager_->live_targets().empty());
}
