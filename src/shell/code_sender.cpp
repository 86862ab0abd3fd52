/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "code_sender.hpp"

#include <core/logger.hpp>
#include <core/path_utils.hpp>
#include <source/source_transformer.hpp>

namespace rpl::shell {

    namespace {
        std::string display_name(const SourceView& view) {
            return view.path.empty() ? std::string("<string>") : core::path_to_utf8(view.path);
        }
    } // namespace

    CodeSender::CodeSender(SessionManager& sessions, const EchoController& echo, source::CellPatterns cells)
        : sessions_(sessions),
          echo_(echo),
          cells_(std::move(cells)) {
    }

    core::Result<CodeSender> CodeSender::create(SessionManager& sessions, const EchoController& echo) {
        const auto& params = sessions.params();
        auto cells = source::CellPatterns::compile(params.cell_boundary_pattern, params.cell_beginning_pattern);
        if (!cells)
            return std::unexpected(cells.error());
        return CodeSender(sessions, echo, std::move(*cells));
    }

    core::Result<void> CodeSender::transmit(const SourceView& view, const SendRequest& request, MessageSink sink) {
        auto session = sessions_.ensure_running(view.path);
        if (!session)
            return std::unexpected(session.error());
        return echo_.send(**session, request, std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_block(const SourceView& view,
                                                    core::Result<source::Block> block,
                                                    MessageSink sink) {
        if (!block)
            return std::unexpected(block.error());

        const source::BlockLocator locator(view.buffer);

        SendRequest request;
        request.text = source::prepare_region(view.buffer, *block);
        request.add_to_history = true;
        request.mode = SendMode::Code;
        request.display_name = display_name(view);

        if (auto sent = transmit(view, request, std::move(sink)); !sent)
            return std::unexpected(sent.error());

        LOG_INFO("Sent {} (lines {}-{}) of {}", source::to_string(block->kind), block->first_line + 1,
                 block->last_line + 1, request.display_name);
        return SendResult{*block, locator.step_position(*block)};
    }

    core::Result<SendResult> CodeSender::send_statement(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_statement(pos), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_top_statement(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_top_statement(pos), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_defun(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_defun(pos), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_defclass(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_defclass(pos), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_group(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_group(pos), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_cell(const SourceView& view, const size_t pos, MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).locate_cell(pos, cells_), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_region(const SourceView& view,
                                                     const size_t begin,
                                                     const size_t end,
                                                     MessageSink sink) {
        return send_block(view, source::BlockLocator(view.buffer).region(begin, end), std::move(sink));
    }

    core::Result<SendResult> CodeSender::send_buffer(const SourceView& view, MessageSink sink) {
        auto block = source::BlockLocator(view.buffer).whole_buffer();
        if (!block)
            return std::unexpected(block.error());

        SendRequest request;
        request.text = view.buffer.text();
        request.add_to_history = false;
        request.mode = SendMode::File;
        request.display_name = display_name(view);
        request.keep_main_guard = sessions_.params().send_main_guard;

        if (auto sent = transmit(view, request, std::move(sink)); !sent)
            return std::unexpected(sent.error());

        LOG_INFO("Sent {} ({} lines)", request.display_name, view.buffer.line_count());
        return SendResult{*block, view.buffer.size()};
    }

} // namespace rpl::shell
