/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "session.hpp"

#include <core/logger.hpp>
#include <core/path_utils.hpp>
#include <source/line_classifier.hpp>
#include <source/source_transformer.hpp>

#include <algorithm>
#include <format>
#include <regex>
#include <system_error>

namespace rpl::shell {

    using core::ErrorKind;
    using core::make_error;

    namespace {
        // A single line that opens a block needs a second newline at the prompt.
        bool is_compound_header(const std::string_view line) {
            static const std::regex re(R"(^[ \t]*(?:if|elif|else|for|while|with|try|except|finally|def|class|async|match|case)\b)");
            return std::regex_search(line.begin(), line.end(), re);
        }

        std::string_view trim_trailing_newlines(std::string_view text) {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
                text.remove_suffix(1);
            return text;
        }
    } // namespace

    std::string_view to_string(const SessionState state) {
        switch (state) {
        case SessionState::NotStarted: return "not started";
        case SessionState::Starting: return "starting";
        case SessionState::Ready: return "ready";
        case SessionState::Busy: return "busy";
        case SessionState::Killed: return "killed";
        }
        return "unknown";
    }

    Session::Session(std::string name,
                     std::unique_ptr<Transport> transport,
                     PromptMatcher prompt,
                     std::string transcript)
        : name_(std::move(name)),
          transport_(std::move(transport)),
          prompt_(std::move(prompt)),
          transcript_(std::move(transcript)) {
        state_ = transport_ ? SessionState::Starting : SessionState::NotStarted;
        if (transport_)
            transport_->set_output_handler([this](const std::string_view chunk) { on_output(chunk); });
    }

    Session::~Session() {
        if (transport_)
            transport_->terminate();
    }

    SessionState Session::state() const {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Ready &&
            (capture_ || !prompt_.ends_with_prompt(transcript_)))
            return SessionState::Busy;
        return state_;
    }

    bool Session::is_alive() const {
        {
            std::lock_guard lock(mutex_);
            if (state_ == SessionState::Killed || state_ == SessionState::NotStarted)
                return false;
        }
        return transport_->is_running();
    }

    bool Session::is_ready() const {
        return state() == SessionState::Ready;
    }

    bool Session::has_started() const {
        std::lock_guard lock(mutex_);
        return state_ == SessionState::Ready;
    }

    bool Session::is_busy() const {
        return state() == SessionState::Busy;
    }

    bool Session::capture_pending() const {
        std::lock_guard lock(mutex_);
        return capture_.has_value();
    }

    void Session::on_output(const std::string_view chunk) {
        std::optional<EchoMessage> message;
        std::function<void(const EchoMessage&)> sink;
        {
            std::lock_guard lock(mutex_);
            if (state_ == SessionState::Killed)
                return;

            transcript_.append(chunk);

            // Startup output up to the first prompt never belongs to a send
            std::string_view fresh = chunk;
            if (state_ == SessionState::Starting) {
                const size_t chunk_begin = startup_output_.size();
                startup_output_.append(chunk);
                if (const auto prompt_end = prompt_.find_first(startup_output_)) {
                    state_ = SessionState::Ready;
                    LOG_DEBUG("Session {} is ready", name_);
                    fresh = chunk.substr(std::max(*prompt_end, chunk_begin) - chunk_begin);
                    startup_output_.clear();
                } else {
                    fresh = {};
                }
            }

            if (capture_ && !fresh.empty()) {
                message = capture_->feed(fresh);
                if (message) {
                    sink = std::move(capture_sink_);
                    capture_sink_ = nullptr;
                    capture_.reset();
                }
            }
        }
        if (message && sink)
            sink(*message);
    }

    core::Result<std::string> Session::build_transmission(const SendRequest& request,
                                                          std::optional<std::filesystem::path>& temp_file) const {
        if (request.mode == SendMode::Code) {
            const auto code = trim_trailing_newlines(request.text);
            if (code.find('\n') == std::string_view::npos && !is_compound_header(code))
                return std::string(code) + "\n";
        }

        temp_file = core::write_temp_file(request.text);
        if (!temp_file)
            return make_error(ErrorKind::Transport, "Cannot stage {} for the interpreter", request.display_name);

        const bool file_mode = request.mode == SendMode::File;
        const std::string encoding = file_mode ? source::detect_encoding(request.text) : std::string("utf-8");
        return source::build_bootstrap(*temp_file, encoding, request.display_name,
                                       file_mode ? request.keep_main_guard : true);
    }

    core::Result<void> Session::send(const SendRequest& request, const SendStrategy& strategy) {
        std::optional<std::filesystem::path> temp_file;
        bool installed = false;
        bool sent = false;

        // Whatever happens below, a failed send leaves no capture and no temp file behind.
        struct SendGuard {
            Session& session;
            std::optional<std::filesystem::path>& temp_file;
            const bool& installed;
            const bool& sent;
            ~SendGuard() {
                if (sent)
                    return;
                if (installed) {
                    std::lock_guard lock(session.mutex_);
                    session.capture_.reset();
                    session.capture_sink_ = nullptr;
                }
                if (temp_file) {
                    std::error_code ec;
                    std::filesystem::remove(*temp_file, ec);
                }
            }
        } guard{*this, temp_file, installed, sent};

        {
            std::lock_guard lock(mutex_);
            if (state_ == SessionState::Killed || state_ == SessionState::NotStarted)
                return make_error(ErrorKind::SessionUnavailable, "Session {} has no running interpreter", name_);
            if (capture_)
                return make_error(ErrorKind::SessionBusy, "Session {} is still evaluating the previous input", name_);
        }
        if (!transport_->is_running())
            return make_error(ErrorKind::SessionUnavailable, "The interpreter of session {} has exited", name_);

        auto transmission = build_transmission(request, temp_file);
        if (!transmission)
            return std::unexpected(transmission.error());

        if (strategy.on_output) {
            std::lock_guard lock(mutex_);
            if (capture_)
                return make_error(ErrorKind::SessionBusy, "Session {} is still evaluating the previous input", name_);
            capture_.emplace(prompt_);
            capture_sink_ = strategy.on_output;
            installed = true;
        }

        if (strategy.before_transmit)
            strategy.before_transmit(*this);

        if (auto written = transport_->write(*transmission); !written) {
            LOG_ERROR("Send to {} failed: {}", name_, written.error().message);
            return written;
        }
        sent = true;

        LOG_DEBUG("Sent {} bytes to {}{}", transmission->size(), name_,
                  temp_file ? std::format(" via {}", core::path_to_utf8(*temp_file)) : std::string());
        return {};
    }

    void Session::append_transcript(const std::string_view text) {
        std::lock_guard lock(mutex_);
        transcript_.append(text);
    }

    std::string Session::transcript() const {
        std::lock_guard lock(mutex_);
        return transcript_;
    }

    void Session::add_history(std::string entry) {
        std::lock_guard lock(mutex_);
        history_.push_back(std::move(entry));
    }

    std::vector<std::string> Session::history() const {
        std::lock_guard lock(mutex_);
        return history_;
    }

    void Session::kill() {
        {
            std::lock_guard lock(mutex_);
            if (state_ == SessionState::Killed)
                return;
            if (capture_)
                LOG_DEBUG("Discarding pending capture of {}", name_);
            capture_.reset();
            capture_sink_ = nullptr;
            state_ = SessionState::Killed;
        }
        // The lock is released first: terminating joins the thread that calls on_output.
        if (transport_)
            transport_->terminate();
        LOG_INFO("Session {} killed", name_);
    }

} // namespace rpl::shell
