/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "prompt.hpp"
#include "session.hpp"
#include "transport.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rpl::shell {

    enum class KillConfirmation {
        None,       // kill without asking
        Bulk,       // one question covering every session
        EachSession // one question per session
    };

    using ConfirmFn = std::function<bool(const std::string& question)>;

    // Resolves where a new interpreter starts for a given source file
    using WorkingDirectoryResolver = std::function<core::Result<std::filesystem::path>(
        const core::param::ShellParameters& params, const std::filesystem::path& source)>;

    core::Result<std::filesystem::path> resolve_working_directory(const core::param::ShellParameters& params,
                                                                  const std::filesystem::path& source);

    /**
     * Owns the interpreter sessions, one per target name.
     *
     * A target is the shared session (`Python`) or, in dedicated mode, one per
     * source file (`Python[<absolute path>]`). A killed session keeps its transcript until
     * it is destroyed; the next get_or_create() starts a fresh process behind it.
     */
    class SessionManager {
    public:
        explicit SessionManager(core::param::ShellParameters params,
                                TransportFactory factory = {},
                                WorkingDirectoryResolver resolver = resolve_working_directory);
        ~SessionManager();

        SessionManager(const SessionManager&) = delete;
        SessionManager& operator=(const SessionManager&) = delete;

        static std::string target_name(const std::string& base,
                                       const std::filesystem::path& source,
                                       bool dedicated);
        std::string target_for(const std::filesystem::path& source) const;

        // Live session for the source's target, started when there is none.
        core::Result<std::shared_ptr<Session>> get_or_create(const std::filesystem::path& source);

        // get_or_create() plus a bounded wait for the first prompt. A timeout is
        // logged, not reported: the handle is returned either way.
        core::Result<std::shared_ptr<Session>> ensure_running(const std::filesystem::path& source);

        std::shared_ptr<Session> find(const std::string& target) const;

        bool kill(const std::string& target, bool destroy_transcript);
        size_t kill_all(bool destroy_transcripts, KillConfirmation confirmation, const ConfirmFn& confirm = {});

        std::vector<std::string> live_targets() const;

        const core::param::ShellParameters& params() const { return params_; }
        core::param::ShellParameters& params() { return params_; }

    private:
        core::param::ShellParameters params_;
        TransportFactory factory_;
        WorkingDirectoryResolver resolver_;

        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<Session>> sessions_; // killed ones keep their transcript
    };

} // namespace rpl::shell
