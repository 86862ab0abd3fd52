/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/path_utils.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace rpl::core {

    namespace {

        bool is_executable_file(const std::filesystem::path& p) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(p, ec))
                return false;
            return ::access(p.c_str(), X_OK) == 0;
        }

    } // namespace

    std::optional<std::filesystem::path> find_executable(const std::string& name) {
        if (name.empty())
            return std::nullopt;

        if (name.find('/') != std::string::npos) {
            const auto p = utf8_to_path(name);
            if (is_executable_file(p))
                return p;
            return std::nullopt;
        }

        const char* const path_env = std::getenv("PATH");
        if (!path_env)
            return std::nullopt;

        std::string_view remaining(path_env);
        while (true) {
            const auto sep = remaining.find(':');
            const auto dir = remaining.substr(0, sep);
            // An empty PATH entry means the current directory
            std::error_code ec;
            const auto base = dir.empty() ? std::filesystem::current_path(ec) : std::filesystem::path(std::string(dir));
            if (!ec) {
                const auto candidate = base / name;
                if (is_executable_file(candidate))
                    return candidate;
            }
            if (sep == std::string_view::npos)
                break;
            remaining.remove_prefix(sep + 1);
        }
        return std::nullopt;
    }

    std::optional<std::filesystem::path> write_temp_file(const std::string& content, const std::string& suffix) {
        std::error_code ec;
        const auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            LOG_ERROR("No temp directory: {}", ec.message());
            return std::nullopt;
        }

        std::string templ = path_to_utf8(dir / "replink-XXXXXX") + suffix;
        std::vector<char> buf(templ.begin(), templ.end());
        buf.push_back('\0');

        const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd == -1) {
            LOG_ERROR("mkstemps() failed: {}", std::strerror(errno));
            return std::nullopt;
        }

        const char* data = content.data();
        size_t left = content.size();
        while (left > 0) {
            const ssize_t n = ::write(fd, data, left);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                LOG_ERROR("write() to temp file failed: {}", std::strerror(errno));
                ::close(fd);
                ::unlink(buf.data());
                return std::nullopt;
            }
            data += n;
            left -= static_cast<size_t>(n);
        }
        ::close(fd);
        return std::filesystem::path(buf.data());
    }

} // namespace rpl::core
