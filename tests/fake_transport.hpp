/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "shell/transport.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

namespace rpl::test {

    // Shared between a FakeTransport and the test driving it
    struct FakeProcess {
        std::mutex mutex;
        shell::LaunchSpec spec;
        std::vector<std::string> writes;
        shell::Transport::OutputHandler handler;
        std::string pending;
        bool running = true;
        bool fail_writes = false;

        // Delivers output as the reader thread of a real transport would.
        void emit(const std::string& chunk) {
            shell::Transport::OutputHandler current;
            {
                std::lock_guard lock(mutex);
                if (!running)
                    return;
                if (!handler) {
                    pending += chunk;
                    return;
                }
                current = handler;
            }
            current(chunk);
        }

        std::vector<std::string> written() {
            std::lock_guard lock(mutex);
            return writes;
        }
    };

    class FakeTransport final : public shell::Transport {
    public:
        explicit FakeTransport(std::shared_ptr<FakeProcess> process) : process_(std::move(process)) {}

        core::Result<void> write(const std::string_view data) override {
            std::lock_guard lock(process_->mutex);
            if (!process_->running)
                return core::make_error(core::ErrorKind::SessionUnavailable, "fake process exited");
            if (process_->fail_writes)
                return core::make_error(core::ErrorKind::Transport, "fake write failure");
            process_->writes.emplace_back(data);
            return {};
        }

        void set_output_handler(OutputHandler handler) override {
            std::string pending;
            {
                std::lock_guard lock(process_->mutex);
                process_->handler = handler;
                pending.swap(process_->pending);
            }
            if (handler && !pending.empty())
                handler(pending);
        }

        bool is_running() const override {
            std::lock_guard lock(process_->mutex);
            return process_->running;
        }

        void terminate() override {
            std::lock_guard lock(process_->mutex);
            process_->running = false;
            process_->handler = nullptr;
        }

    private:
        std::shared_ptr<FakeProcess> process_;
    };

    // Transport factory recording every launch
    struct FakeLauncher {
        std::vector<std::shared_ptr<FakeProcess>> processes;
        std::string greeting = "Python 3.12.0\n>>> ";
        bool fail = false;

        shell::TransportFactory factory() {
            return [this](const shell::LaunchSpec& spec) -> core::Result<std::unique_ptr<shell::Transport>> {
                if (fail)
                    return core::make_error(core::ErrorKind::Transport, "fake launch failure");
                auto process = std::make_shared<FakeProcess>();
                process->spec = spec;
                process->pending = greeting;
                processes.push_back(process);
                return std::make_unique<FakeTransport>(process);
            };
        }

        std::shared_ptr<FakeProcess> last() const { return processes.empty() ? nullptr : processes.back(); }
    };

    // Reads and deletes the temp file a loader command refers to, as the interpreter would.
    inline std::optional<std::string> take_staged_source(const std::string& command) {
        static const std::regex re(R"(os\.remove\('''([^']+)'''\))");
        std::smatch match;
        if (!std::regex_search(command, match, re))
            return std::nullopt;

        const std::filesystem::path path = match[1].str();
        std::ifstream file(path, std::ios::binary);
        if (!file)
            return std::nullopt;
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        file.close();

        std::error_code ec;
        std::filesystem::remove(path, ec);
        return content;
    }

} // namespace rpl::test
