/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rpl::core {

    namespace {

        spdlog::level::level_enum to_spdlog(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            // spdlog has no performance level; it sits between info and warn
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        LogModule module_from_path(std::string_view file) {
            if (file.find("/source/") != std::string_view::npos)
                return LogModule::Source;
            if (file.find("session") != std::string_view::npos)
                return LogModule::Session;
            if (file.find("/shell/") != std::string_view::npos)
                return LogModule::Shell;
            if (file.find("/app/") != std::string_view::npos)
                return LogModule::App;
            if (file.find("/core/") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        std::string_view base_name(std::string_view file) {
            const auto slash = file.find_last_of("/\\");
            return slash == std::string_view::npos ? file : file.substr(slash + 1);
        }

    } // namespace

    LogLevel parse_log_level(const std::string_view level_str) {
        if (level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "info")
            return LogLevel::Info;
        if (level_str == "perf" || level_str == "performance")
            return LogLevel::Performance;
        if (level_str == "warn" || level_str == "warning")
            return LogLevel::Warn;
        if (level_str == "error")
            return LogLevel::Error;
        if (level_str == "critical")
            return LogLevel::Critical;
        if (level_str == "off")
            return LogLevel::Off;
        return LogLevel::Info;
    }

    struct Logger::Impl {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger;
        std::string filter;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (auto& enabled : module_enabled_)
            enabled.store(true, std::memory_order_relaxed);
        for (auto& level : module_level_)
            level.store(static_cast<uint8_t>(LogLevel::Trace), std::memory_order_relaxed);
    }

    Logger::~Logger() {
        flush();
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel console_level,
                      const std::string& log_file,
                      const std::string& filter_pattern) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(to_spdlog(console_level));
        sinks.push_back(console_sink);

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>("replink", sinks.begin(), sinks.end());
        impl_->logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        impl_->logger->set_level(spdlog::level::trace);
        impl_->logger->flush_on(spdlog::level::warn);
        impl_->filter = filter_pattern;
        if (!file_error.empty())
            impl_->logger->warn("Cannot open log file {}: {}", log_file, file_error);

        // The file sink wants everything; the console threshold is enforced by its sink.
        global_level_.store(static_cast<uint8_t>(log_file.empty() ? console_level : LogLevel::Trace),
                            std::memory_order_relaxed);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        const auto module = module_from_path(loc.file_name());
        const auto idx = static_cast<size_t>(module);
        if (!module_enabled_[idx].load(std::memory_order_relaxed))
            return;
        if (static_cast<uint8_t>(level) < module_level_[idx].load(std::memory_order_relaxed))
            return;

        std::lock_guard lock(impl_->mutex);
        if (!impl_->logger) {
            impl_->logger = std::make_shared<spdlog::logger>(
                "replink", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            impl_->logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            impl_->logger->set_level(spdlog::level::trace);
        }
        if (!impl_->filter.empty() && msg.find(impl_->filter) == std::string_view::npos)
            return;

        const std::string file(base_name(loc.file_name()));
        impl_->logger->log(spdlog::source_loc{file.c_str(), static_cast<int>(loc.line()), loc.function_name()},
                           to_spdlog(level),
                           spdlog::string_view_t(msg.data(), msg.size()));
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)].store(enabled, std::memory_order_relaxed);
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)].store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    void Logger::set_level(const LogLevel level) {
        global_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger) {
            for (auto& sink : impl_->logger->sinks())
                sink->set_level(to_spdlog(level));
        }
    }

    void Logger::flush() {
        if (!impl_)
            return;
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger)
            impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::high_resolution_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {
    }

    ScopedTimer::~ScopedTimer() {
        auto& logger = Logger::get();
        if (!logger.is_enabled(level_))
            return;
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start_);
        logger.log(level_, loc_, std::format("{} took {:.3f} ms", name_, elapsed.count() / 1000.0));
    }

} // namespace rpl::core
