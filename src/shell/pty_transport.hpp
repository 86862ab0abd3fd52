/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "subprocess.hpp"
#include "transport.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rpl::shell {

    // Transport over a pty child; a reader thread forwards output with '\r' removed.
    // An output handler may terminate the transport but must not destroy it.
    class PtyTransport final : public Transport {
        struct Private {
            explicit Private() = default;
        };

    public:
        explicit PtyTransport(Private) {}
        ~PtyTransport() override;

        static core::Result<std::unique_ptr<Transport>> launch(const LaunchSpec& spec);

        core::Result<void> write(std::string_view data) override;
        void set_output_handler(OutputHandler handler) override;
        bool is_running() const override;
        void terminate() override;

    private:
        void read_loop(std::stop_token stop);
        void log_exit() const;
        void deliver(std::string_view chunk);

        SubProcess process_;
        mutable std::mutex process_mutex_;
        std::mutex handler_mutex_;
        OutputHandler handler_;
        std::string pending_;
        std::jthread reader_;
    };

} // namespace rpl::shell
