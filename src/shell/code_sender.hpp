/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "echo_controller.hpp"
#include "session_manager.hpp"

#include <source/block_locator.hpp>
#include <source/source_buffer.hpp>

#include <filesystem>

namespace rpl::shell {

    struct SendResult {
        source::Block block;
        size_t step_position = 0; // where point goes for send-and-step
    };

    // A source file as the user currently sees it
    struct SourceView {
        std::filesystem::path path;
        const source::SourceBuffer& buffer;
    };

    // Editor-level send commands: locate a unit at point, then send it to the file's session.
    class CodeSender {
    public:
        CodeSender(SessionManager& sessions, const EchoController& echo, source::CellPatterns cells);

        static core::Result<CodeSender> create(SessionManager& sessions, const EchoController& echo);

        core::Result<SendResult> send_statement(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_top_statement(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_defun(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_defclass(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_group(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_cell(const SourceView& view, size_t pos, MessageSink sink = {});
        core::Result<SendResult> send_region(const SourceView& view, size_t begin, size_t end, MessageSink sink = {});
        core::Result<SendResult> send_buffer(const SourceView& view, MessageSink sink = {});

        const source::CellPatterns& cell_patterns() const { return cells_; }

    private:
        core::Result<SendResult> send_block(const SourceView& view, core::Result<source::Block> block, MessageSink sink);
        core::Result<void> transmit(const SourceView& view, const SendRequest& request, MessageSink sink);

        SessionManager& sessions_;
        const EchoController& echo_;
        source::CellPatterns cells_;
    };

} // namespace rpl::shell
