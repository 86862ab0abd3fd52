/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace rpl::shell {

    // Child process attached to a pseudo-terminal. POSIX only.
    class SubProcess {
    public:
        SubProcess() = default;
        ~SubProcess();

        SubProcess(const SubProcess&) = delete;
        SubProcess& operator=(const SubProcess&) = delete;

        // Terminal echo is disabled in the child and TERM is set to "dumb".
        bool start(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::filesystem::path& working_directory);

        // Non-blocking; returns 0 when nothing is available, -1 on EOF or error.
        ssize_t read(char* buf, size_t len);
        // Writes everything or fails; returns false on error.
        bool write(std::string_view data);

        bool is_running() const;
        void kill();

        int fd() const { return master_fd_; }
        // -1 until the child has been reaped; 128 + signal when it was killed
        int exit_code() const { return exit_code_; }

    private:
        int master_fd_ = -1;
        pid_t pid_ = -1;
        int exit_code_ = -1;
    };

} // namespace rpl::shell
