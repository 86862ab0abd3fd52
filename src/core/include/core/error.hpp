/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace rpl::core {

    enum class ErrorKind {
        Configuration,      // bad working-directory mode, interpreter not found, bad pattern
        Navigation,         // a boundary scan made no progress
        MalformedBlock,     // inconsistent indentation in a fragment
        NoActiveBlock,      // point is outside the requested unit (informational)
        SessionUnavailable, // no live process where one is required
        SessionBusy,        // a previous send is still capturing output
        Transport           // OS-level failure talking to the subprocess
    };

    struct Error {
        ErrorKind kind = ErrorKind::Transport;
        std::string message;

        // Only NoActiveBlock is reported as a plain message rather than a failure.
        bool is_fatal() const { return kind != ErrorKind::NoActiveBlock; }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(const ErrorKind kind, std::string message) {
        return std::unexpected(Error{kind, std::move(message)});
    }

    template <typename... Args>
    std::unexpected<Error> make_error(const ErrorKind kind, std::format_string<Args...> fmt, Args&&... args) {
        return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...)});
    }

    constexpr std::string_view to_string(const ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::Navigation: return "navigation error";
        case ErrorKind::MalformedBlock: return "malformed block";
        case ErrorKind::NoActiveBlock: return "no active block";
        case ErrorKind::SessionUnavailable: return "session unavailable";
        case ErrorKind::SessionBusy: return "session busy";
        case ErrorKind::Transport: return "transport error";
        }
        return "error";
    }

} // namespace rpl::core
