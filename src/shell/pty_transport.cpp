/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pty_transport.hpp"

#include <core/logger.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace rpl::shell {

    using core::ErrorKind;
    using core::make_error;

    namespace {
        constexpr int READ_POLL_MS = 50;
        constexpr size_t READ_CHUNK = 4096;
    } // namespace

    PtyTransport::~PtyTransport() {
        terminate();
        if (reader_.joinable())
            reader_.detach();
    }

    core::Result<std::unique_ptr<Transport>> PtyTransport::launch(const LaunchSpec& spec) {
        auto transport = std::make_unique<PtyTransport>(Private{});
        if (!transport->process_.start(spec.program, spec.args, spec.working_directory))
            return make_error(ErrorKind::Transport, "Failed to start {}", spec.program);

        transport->reader_ = std::jthread([raw = transport.get()](std::stop_token stop) { raw->read_loop(stop); });
        return std::unique_ptr<Transport>(std::move(transport));
    }

    void PtyTransport::read_loop(const std::stop_token stop) {
        std::array<char, READ_CHUNK> buf{};
        const int fd = process_.fd();

        while (!stop.stop_requested()) {
            struct pollfd pfd = {fd, POLLIN, 0};
            const int ready = poll(&pfd, 1, READ_POLL_MS);
            if (ready < 0) {
                if (errno == EINTR)
                    continue;
                LOG_ERROR("poll() on pty failed: {}", strerror(errno));
                break;
            }
            if (ready == 0)
                continue;

            const ssize_t n = process_.read(buf.data(), buf.size());
            if (n < 0) {
                log_exit();
                break;
            }
            if (n == 0)
                continue;

            std::string chunk(buf.data(), static_cast<size_t>(n));
            std::erase(chunk, '\r');
            if (!chunk.empty())
                deliver(chunk);
        }
    }

    void PtyTransport::log_exit() const {
        std::lock_guard lock(process_mutex_);
        if (process_.is_running() || process_.exit_code() < 0) {
            LOG_DEBUG("Interpreter output closed");
            return;
        }
        if (process_.exit_code() == 0)
            LOG_INFO("Interpreter exited");
        else
            LOG_WARN("Interpreter exited with code {}", process_.exit_code());
    }

    void PtyTransport::deliver(const std::string_view chunk) {
        std::lock_guard lock(handler_mutex_);
        if (!handler_) {
            pending_.append(chunk);
            return;
        }
        handler_(chunk);
    }

    void PtyTransport::set_output_handler(OutputHandler handler) {
        std::lock_guard lock(handler_mutex_);
        handler_ = std::move(handler);
        if (handler_ && !pending_.empty()) {
            handler_(pending_);
            pending_.clear();
        }
    }

    core::Result<void> PtyTransport::write(const std::string_view data) {
        std::lock_guard lock(process_mutex_);
        if (!process_.is_running())
            return make_error(ErrorKind::SessionUnavailable, "Interpreter process is not running");
        if (!process_.write(data))
            return make_error(ErrorKind::Transport, "Failed to write {} bytes to the interpreter", data.size());
        return {};
    }

    bool PtyTransport::is_running() const {
        std::lock_guard lock(process_mutex_);
        return process_.is_running();
    }

    void PtyTransport::terminate() {
        if (reader_.joinable()) {
            reader_.request_stop();
            // From an output handler the reader stops once the handler returns; the destructor joins it
            if (reader_.get_id() != std::this_thread::get_id())
                reader_.join();
        }
        std::lock_guard lock(process_mutex_);
        process_.kill();
    }

} // namespace rpl::shell
