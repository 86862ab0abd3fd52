/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "output_capture.hpp"
#include "prompt.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rpl::shell {

    enum class SessionState {
        NotStarted,
        Starting,
        Ready,
        Busy,
        Killed
    };

    std::string_view to_string(SessionState state);

    enum class SendMode {
        Code, // a fragment; written directly when it is a single line
        File  // a whole module, always loaded through the bootstrap
    };

    struct SendRequest {
        std::string text;
        bool echo = true;
        bool add_to_history = false;

        SendMode mode = SendMode::Code;
        std::string display_name = "<string>"; // file name shown in tracebacks
        bool keep_main_guard = true;           // File mode only
    };

    class Session;

    // Per-call hooks around a transmission; nothing outlives the call except an installed capture.
    struct SendStrategy {
        // Runs once the send has been accepted, before anything is written
        std::function<void(Session&)> before_transmit;
        // When set, output is captured until the next prompt and delivered here exactly once
        std::function<void(const EchoMessage&)> on_output;
    };

    /**
     * One interpreter process and its transcript.
     *
     * Output is appended to the transcript from the transport's thread; at most
     * one capture is pending at a time. Killing the session drops a pending
     * capture without delivering it.
     */
    class Session {
    public:
        Session(std::string name,
                std::unique_ptr<Transport> transport,
                PromptMatcher prompt,
                std::string transcript = {});
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        const std::string& name() const { return name_; }

        SessionState state() const;
        bool is_alive() const;
        bool is_ready() const;
        // The interpreter has shown its first prompt
        bool has_started() const;
        // A capture is pending or the transcript does not end at a prompt
        bool is_busy() const;
        bool capture_pending() const;

        bool visible() const { return visible_; }
        void set_visible(bool visible) { visible_ = visible; }

        core::Result<void> send(const SendRequest& request, const SendStrategy& strategy = {});

        void append_transcript(std::string_view text);
        std::string transcript() const;

        void add_history(std::string entry);
        std::vector<std::string> history() const;

        void kill();

    private:
        void on_output(std::string_view chunk);
        core::Result<std::string> build_transmission(const SendRequest& request,
                                                     std::optional<std::filesystem::path>& temp_file) const;

        const std::string name_;
        std::unique_ptr<Transport> transport_;
        const PromptMatcher prompt_;

        mutable std::mutex mutex_;
        SessionState state_ = SessionState::NotStarted;
        std::string transcript_;
        std::vector<std::string> history_;
        std::optional<OutputCapture> capture_;
        std::function<void(const EchoMessage&)> capture_sink_;
        std::string startup_output_; // process output before its first prompt
        bool visible_ = false;
    };

} // namespace rpl::shell
