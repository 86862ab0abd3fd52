/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "output_capture.hpp"

#include <core/logger.hpp>

namespace rpl::shell {

    namespace {
        constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

        std::string_view trim(std::string_view text) {
            const size_t first = text.find_first_not_of(WHITESPACE);
            if (first == std::string_view::npos)
                return {};
            const size_t last = text.find_last_not_of(WHITESPACE);
            return text.substr(first, last - first + 1);
        }
    } // namespace

    std::string EchoMessage::summary() const {
        switch (kind) {
        case EchoKind::Exception: return "Exception during evaluation.";
        case EchoKind::NoOutput: return "No output was produced.";
        case EchoKind::Output: return text;
        }
        return text;
    }

    EchoMessage OutputCapture::classify(const std::string_view output) {
        const auto trimmed = trim(output);
        if (trimmed.find(TRACEBACK_MARKER) != std::string_view::npos)
            return {EchoKind::Exception, std::string(trimmed)};
        if (trimmed.empty())
            return {EchoKind::NoOutput, {}};
        return {EchoKind::Output, std::string(trimmed)};
    }

    std::optional<EchoMessage> OutputCapture::feed(const std::string_view chunk) {
        if (flushed_)
            return std::nullopt;

        buffer_.append(chunk);
        const auto prompt = prompt_.find(buffer_);
        if (!prompt)
            return std::nullopt;

        auto message = classify(std::string_view(buffer_).substr(0, *prompt));
        buffer_.clear();
        flushed_ = true;
        LOG_TRACE("Capture flushed ({} chars)", message.text.size());
        return message;
    }

} // namespace rpl::shell
