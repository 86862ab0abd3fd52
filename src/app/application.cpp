/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "shell/code_sender.hpp"
#include "shell/echo_controller.hpp"
#include "shell/session_manager.hpp"
#include "source/block_locator.hpp"
#include "source/source_buffer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <expected>
#include <format>
#include <fstream>
#include <future>
#include <print>
#include <sstream>
#include <thread>

namespace rpl::app {

    namespace {

        using core::args::Unit;
        using core::args::UnitRequest;

        constexpr int EXIT_NO_BLOCK = 3;

        std::expected<std::string, std::string> read_source(const std::filesystem::path& path) {
            std::ifstream file;
            if (!core::open_file_for_read(path, file)) {
                return std::unexpected(std::format("Cannot open {}", core::path_to_utf8(path)));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        // Offset of (line, column); lines past the end map to the end of the buffer.
        size_t offset_of(const source::SourceBuffer& buffer, const size_t line, const size_t column) {
            if (line == 0 || line > buffer.line_count())
                return buffer.size();
            const auto& info = buffer.line(line - 1);
            return std::min(info.begin + column, info.end);
        }

        core::Result<source::Block> locate(const source::SourceBuffer& buffer,
                                           const UnitRequest& request,
                                           const source::CellPatterns& cells) {
            const source::BlockLocator locator(buffer);
            const size_t pos = offset_of(buffer, request.line, request.column);

            switch (request.unit) {
            case Unit::Statement: return locator.locate_statement(pos);
            case Unit::TopStatement: return locator.locate_top_statement(pos);
            case Unit::Defun: return locator.locate_defun(pos);
            case Unit::Defclass: return locator.locate_defclass(pos);
            case Unit::Group: return locator.locate_group(pos);
            case Unit::Cell: return locator.locate_cell(pos, cells);
            case Unit::Region: {
                const size_t end_line = request.end_line.value_or(request.line);
                const size_t end = end_line < buffer.line_count() ? buffer.line(end_line).begin : buffer.size();
                return locator.region(offset_of(buffer, request.line, 0), end);
            }
            case Unit::Buffer: return locator.whole_buffer();
            }
            return core::make_error(core::ErrorKind::Navigation, "Unknown unit");
        }

        void print_position(const source::SourceBuffer& buffer, const std::string_view label, const size_t offset) {
            if (buffer.empty()) {
                std::println("{}: 1:0 (offset {})", label, offset);
                return;
            }
            const size_t line = buffer.line_at(offset);
            const size_t column = offset - std::min(offset, buffer.line(line).begin);
            std::println("{}: {}:{} (offset {})", label, line + 1, column, offset);
        }

        void print_block(const source::SourceBuffer& buffer, const source::Block& block, const bool step) {
            std::println("{}: lines {}-{} (offsets {}-{})", source::to_string(block.kind), block.first_line + 1,
                         block.last_line + 1, block.begin, block.end);
            if (step)
                print_position(buffer, "step", source::BlockLocator(buffer).step_position(block));
        }

        int report(const core::Error& error) {
            if (!error.is_fatal()) {
                std::println("{}", error.message);
                return EXIT_NO_BLOCK;
            }
            LOG_ERROR("{}: {}", core::to_string(error.kind), error.message);
            std::println(stderr, "Error: {}", error.message);
            return 1;
        }

        core::Result<shell::SendResult> dispatch(shell::CodeSender& sender,
                                                 const shell::SourceView& view,
                                                 const UnitRequest& request,
                                                 shell::MessageSink sink) {
            const size_t pos = offset_of(view.buffer, request.line, request.column);
            switch (request.unit) {
            case Unit::Statement: return sender.send_statement(view, pos, std::move(sink));
            case Unit::TopStatement: return sender.send_top_statement(view, pos, std::move(sink));
            case Unit::Defun: return sender.send_defun(view, pos, std::move(sink));
            case Unit::Defclass: return sender.send_defclass(view, pos, std::move(sink));
            case Unit::Group: return sender.send_group(view, pos, std::move(sink));
            case Unit::Cell: return sender.send_cell(view, pos, std::move(sink));
            case Unit::Region: {
                const size_t end_line = request.end_line.value_or(request.line);
                const size_t end = end_line < view.buffer.line_count() ? view.buffer.line(end_line).begin
                                                                       : view.buffer.size();
                return sender.send_region(view, offset_of(view.buffer, request.line, 0), end, std::move(sink));
            }
            case Unit::Buffer: return sender.send_buffer(view, std::move(sink));
            }
            return core::make_error(core::ErrorKind::Navigation, "Unknown unit");
        }

        // Waits until the transcript has grown past `since` and ends at a prompt, bounded by timeout.
        void wait_until_idle(const shell::Session& session, const size_t since, const std::chrono::milliseconds timeout) {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while ((session.transcript().size() <= since || session.is_busy()) &&
                   std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

    } // namespace

    int Application::run(const core::args::LocateMode& mode) {
        const auto text = read_source(mode.request.file);
        if (!text) {
            LOG_ERROR("{}", text.error());
            std::println(stderr, "Error: {}", text.error());
            return 1;
        }

        const auto cells = source::CellPatterns::compile(mode.params.cell_boundary_pattern,
                                                         mode.params.cell_beginning_pattern);
        if (!cells)
            return report(cells.error());

        const source::SourceBuffer buffer(*text);
        const auto block = locate(buffer, mode.request, *cells);
        if (!block)
            return report(block.error());

        print_block(buffer, *block, mode.request.step);
        return 0;
    }

    int Application::run(const core::args::SendMode& mode) {
        LOG_TIMER_DEBUG("send");

        const auto text = read_source(mode.request.file);
        if (!text) {
            LOG_ERROR("{}", text.error());
            std::println(stderr, "Error: {}", text.error());
            return 1;
        }
        const source::SourceBuffer buffer(*text);
        const shell::SourceView view{mode.request.file, buffer};

        shell::SessionManager sessions(mode.params);
        const shell::EchoController echo(mode.params);
        auto sender = shell::CodeSender::create(sessions, echo);
        if (!sender)
            return report(sender.error());

        auto session = sessions.ensure_running(mode.request.file);
        if (!session)
            return report(session.error());
        (*session)->set_visible(mode.visible);

        const size_t transcript_before = (*session)->transcript().size();
        std::promise<shell::EchoMessage> echoed;
        auto echoed_future = echoed.get_future();
        auto sink = [&echoed](const shell::EchoMessage& message) { echoed.set_value(message); };

        const auto sent = dispatch(*sender, view, mode.request, std::move(sink));
        if (!sent) {
            const int code = report(sent.error());
            sessions.kill_all(true, shell::KillConfirmation::None);
            return code;
        }

        const auto timeout = std::chrono::milliseconds(mode.timeout_ms);
        int exit_code = 0;
        if (shell::echo_active(mode.params.echo_output, mode.visible)) {
            if (echoed_future.wait_for(timeout) == std::future_status::ready) {
                const auto message = echoed_future.get();
                std::println("{}", message.summary());
                if (message.kind == shell::EchoKind::Exception) {
                    std::println(stderr, "{}", message.text);
                    exit_code = 2;
                }
            } else {
                LOG_WARN("No prompt from {} within {} ms", (*session)->name(), timeout.count());
                std::println(stderr, "Timed out waiting for output");
                exit_code = 1;
            }
        } else {
            wait_until_idle(**session, transcript_before, timeout);
        }

        if (mode.visible)
            std::print("{}", (*session)->transcript());
        if (mode.request.step)
            print_position(buffer, "step", sent->step_position);

        sessions.kill_all(true, shell::KillConfirmation::None);
        return exit_code;
    }

} // namespace rpl::app
