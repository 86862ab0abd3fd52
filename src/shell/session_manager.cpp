/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "session_manager.hpp"
#include "pty_transport.hpp"

#include <core/logger.hpp>
#include <core/path_utils.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <system_error>
#include <thread>

namespace rpl::shell {

    using core::ErrorKind;
    using core::make_error;

    core::Result<std::filesystem::path> resolve_working_directory(const core::param::ShellParameters& params,
                                                                  const std::filesystem::path& source) {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (params.working_directory == "current") {
            auto cwd = fs::current_path(ec);
            if (ec)
                return make_error(ErrorKind::Configuration, "Cannot determine the current directory: {}", ec.message());
            return cwd;
        }

        if (params.working_directory == "source-directory") {
            if (source.empty())
                return resolve_working_directory(core::param::ShellParameters{}, source);
            auto dir = fs::absolute(source, ec).parent_path();
            if (ec || !fs::is_directory(dir, ec))
                return make_error(ErrorKind::Configuration, "Source directory of {} does not exist",
                                  core::path_to_utf8(source));
            return dir;
        }

        if (params.working_directory == "fixed") {
            if (params.fixed_directory.empty())
                return make_error(ErrorKind::Configuration, "Working directory mode 'fixed' requires fixed_directory");
            if (!fs::is_directory(params.fixed_directory, ec))
                return make_error(ErrorKind::Configuration, "Fixed working directory {} does not exist",
                                  core::path_to_utf8(params.fixed_directory));
            return params.fixed_directory;
        }

        return make_error(ErrorKind::Configuration,
                          "Invalid working directory mode '{}' (expected current, source-directory or fixed)",
                          params.working_directory);
    }

    SessionManager::SessionManager(core::param::ShellParameters params,
                                   TransportFactory factory,
                                   WorkingDirectoryResolver resolver)
        : params_(std::move(params)),
          factory_(factory ? std::move(factory) : TransportFactory(&PtyTransport::launch)),
          resolver_(resolver ? std::move(resolver) : WorkingDirectoryResolver(&resolve_working_directory)) {
    }

    SessionManager::~SessionManager() {
        std::lock_guard lock(mutex_);
        for (auto& [name, session] : sessions_)
            session->kill();
    }

    std::string SessionManager::target_name(const std::string& base,
                                            const std::filesystem::path& source,
                                            const bool dedicated) {
        if (!dedicated || source.empty())
            return base;

        // Same file, same target: relative spellings and symlinks resolve to one identity
        std::error_code ec;
        std::filesystem::path identity = std::filesystem::absolute(source, ec);
        if (ec)
            identity = source;
        const auto canonical = std::filesystem::weakly_canonical(identity, ec);
        identity = ec ? identity.lexically_normal() : canonical;
        return std::format("{}[{}]", base, core::path_to_utf8(identity));
    }

    std::string SessionManager::target_for(const std::filesystem::path& source) const {
        return target_name(params_.session_name, source, params_.dedicated);
    }

    core::Result<std::shared_ptr<Session>> SessionManager::get_or_create(const std::filesystem::path& source) {
        const std::string target = target_for(source);

        std::lock_guard lock(mutex_);
        const auto it = sessions_.find(target);
        if (it != sessions_.end() && it->second->is_alive())
            return it->second;

        auto working_directory = resolver_(params_, source);
        if (!working_directory)
            return std::unexpected(working_directory.error());

        const auto program = core::find_executable(params_.interpreter);
        if (!program)
            return make_error(ErrorKind::Configuration, "Interpreter '{}' not found", params_.interpreter);

        auto prompt = PromptMatcher::compile(params_.prompt_patterns);
        if (!prompt)
            return std::unexpected(prompt.error());

        const LaunchSpec spec{core::path_to_utf8(*program), params_.interpreter_args, *working_directory};
        auto transport = factory_(spec);
        if (!transport)
            return std::unexpected(transport.error());

        std::string transcript;
        if (it != sessions_.end()) {
            it->second->kill();
            transcript = it->second->transcript();
        }

        auto session = std::make_shared<Session>(target, std::move(*transport), std::move(*prompt), std::move(transcript));
        sessions_[target] = session;
        LOG_INFO("Started {} for {} in {}", spec.program, target, core::path_to_utf8(spec.working_directory));
        return session;
    }

    core::Result<std::shared_ptr<Session>> SessionManager::ensure_running(const std::filesystem::path& source) {
        auto session = get_or_create(source);
        if (!session)
            return session;

        using clock = std::chrono::steady_clock;
        const auto timeout = std::chrono::milliseconds(std::max(0, params_.ready_timeout_ms));
        const auto interval = std::chrono::milliseconds(std::max(1, params_.ready_poll_interval_ms));
        const auto deadline = clock::now() + timeout;

        while (!(*session)->has_started()) {
            const auto now = clock::now();
            if (now >= deadline) {
                LOG_WARN("{} did not show a prompt within {} ms, continuing", (*session)->name(), timeout.count());
                break;
            }
            std::this_thread::sleep_for(std::min<clock::duration>(interval, deadline - now));
        }
        return session;
    }

    std::shared_ptr<Session> SessionManager::find(const std::string& target) const {
        std::lock_guard lock(mutex_);
        const auto it = sessions_.find(target);
        return it == sessions_.end() ? nullptr : it->second;
    }

    bool SessionManager::kill(const std::string& target, const bool destroy_transcript) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard lock(mutex_);
            const auto it = sessions_.find(target);
            if (it == sessions_.end())
                return false;
            session = it->second;
            if (destroy_transcript)
                sessions_.erase(it);
        }
        session->kill();
        return true;
    }

    size_t SessionManager::kill_all(const bool destroy_transcripts,
                                    const KillConfirmation confirmation,
                                    const ConfirmFn& confirm) {
        const auto targets = live_targets();
        if (targets.empty())
            return 0;

        if (confirmation == KillConfirmation::Bulk && confirm) {
            std::string names;
            for (const auto& target : targets)
                names += names.empty() ? target : ", " + target;
            const auto question = std::format("Kill {} Python session{}: {}?", targets.size(),
                                              targets.size() == 1 ? "" : "s", names);
            if (!confirm(question))
                return 0;
        }

        size_t killed = 0;
        for (const auto& target : targets) {
            if (confirmation == KillConfirmation::EachSession && confirm &&
                !confirm(std::format("Kill Python session {}?", target)))
                continue;
            if (kill(target, destroy_transcripts))
                ++killed;
        }
        LOG_INFO("Killed {} of {} sessions", killed, targets.size());
        return killed;
    }

    std::vector<std::string> SessionManager::live_targets() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> targets;
        for (const auto& [name, session] : sessions_) {
            if (session->is_alive())
                targets.push_back(name);
        }
        return targets;
    }

} // namespace rpl::shell
