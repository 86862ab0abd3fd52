/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "subprocess.hpp"

#include <core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace rpl::shell {

    SubProcess::~SubProcess() {
        kill();
    }

    bool SubProcess::start(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::filesystem::path& working_directory) {
        kill();

        constexpr unsigned short PTY_COLS = 512;
        constexpr unsigned short PTY_ROWS = 24;
        struct winsize ws = {};
        ws.ws_col = PTY_COLS;
        ws.ws_row = PTY_ROWS;

        pid_ = forkpty(&master_fd_, nullptr, nullptr, &ws);
        if (pid_ == -1) {
            LOG_ERROR("forkpty() failed: {}", strerror(errno));
            master_fd_ = -1;
            return false;
        }

        if (pid_ == 0) {
            // Input is echoed by the driver, never by the terminal.
            struct termios tio = {};
            if (tcgetattr(STDIN_FILENO, &tio) == 0) {
                tio.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHONL);
                tio.c_oflag &= ~static_cast<tcflag_t>(ONLCR);
                tcsetattr(STDIN_FILENO, TCSANOW, &tio);
            }

            setenv("TERM", "dumb", 1);
            setenv("PYTHON_BASIC_REPL", "1", 1);
            setenv("PYTHONUNBUFFERED", "1", 1);

            if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
                const std::string message = std::string("cannot change directory to ") + working_directory.string() +
                                            ": " + strerror(errno) + "\n";
                [[maybe_unused]] const ssize_t n = ::write(STDERR_FILENO, message.data(), message.size());
                _exit(126);
            }

            std::vector<const char*> argv;
            argv.push_back(program.c_str());
            for (const auto& arg : args)
                argv.push_back(arg.c_str());
            argv.push_back(nullptr);

            execvp(program.c_str(), const_cast<char* const*>(argv.data()));
            _exit(127);
        }

        const int flags = fcntl(master_fd_, F_GETFL, 0);
        fcntl(master_fd_, F_SETFL, flags | O_NONBLOCK);

        LOG_INFO("Subprocess started: {} (pid {})", program, pid_);
        return true;
    }

    ssize_t SubProcess::read(char* buf, size_t len) {
        if (master_fd_ < 0)
            return -1;

        const ssize_t n = ::read(master_fd_, buf, len);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            return 0;
        if (n == 0)
            return -1;
        return n;
    }

    bool SubProcess::write(std::string_view data) {
        if (master_fd_ < 0)
            return false;

        while (!data.empty()) {
            const ssize_t n = ::write(master_fd_, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {master_fd_, POLLOUT, 0};
                    if (poll(&pfd, 1, 1000) < 0 && errno != EINTR) {
                        LOG_ERROR("poll() on pty failed: {}", strerror(errno));
                        return false;
                    }
                    continue;
                }
                LOG_ERROR("write() to pty failed: {}", strerror(errno));
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    bool SubProcess::is_running() const {
        if (pid_ <= 0)
            return false;
        int status;
        const pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status))
                const_cast<SubProcess*>(this)->exit_code_ = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                const_cast<SubProcess*>(this)->exit_code_ = 128 + WTERMSIG(status);
            const_cast<SubProcess*>(this)->pid_ = -1;
            return false;
        }
        return result == 0;
    }

    void SubProcess::kill() {
        if (master_fd_ >= 0) {
            close(master_fd_);
            master_fd_ = -1;
        }
        if (pid_ > 0) {
            ::kill(pid_, SIGTERM);
            usleep(50000);
            if (is_running())
                ::kill(pid_, SIGKILL);
            if (pid_ > 0) {
                int status;
                if (waitpid(pid_, &status, 0) == pid_) {
                    if (WIFEXITED(status))
                        exit_code_ = WEXITSTATUS(status);
                    else if (WIFSIGNALED(status))
                        exit_code_ = 128 + WTERMSIG(status);
                }
                pid_ = -1;
            }
        }
    }

} // namespace rpl::shell
