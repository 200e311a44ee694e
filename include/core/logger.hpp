/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <source_location>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace arp::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Module detection from file path
    enum class LogModule : uint8_t {
        Core = 0,
        Tracking = 1,
        Scene = 2,
        Placement = 3,
        Input = 4,
        Session = 5,
        Unknown = 6,
        Count = 7
    };

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(console_level));
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %s:%# %v");
            sinks.push_back(console_sink);

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("arplace", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);

            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                module_enabled_[i] = true;
                module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        // False when a message at this level from this source file would be dropped
        bool should_log(LogLevel level, const std::source_location& loc = std::source_location::current()) const {
            if (!logger_)
                return false;

            const auto module_idx = static_cast<size_t>(detect_module(loc.file_name()));
            return module_enabled_[module_idx] &&
                   static_cast<uint8_t>(level) >= module_level_[module_idx] &&
                   static_cast<uint8_t>(level) >= global_level_;
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!should_log(level, loc))
                return;

            auto msg = std::format(fmt, std::forward<Args>(args)...);

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        void enable_module(LogModule module, bool enabled = true) {
            module_enabled_[static_cast<size_t>(module)] = enabled;
        }

        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

    private:
        Logger() = default;

        static LogModule detect_module(std::string_view path) {
            if (path.find("tracking") != std::string_view::npos)
                return LogModule::Tracking;
            if (path.find("placement") != std::string_view::npos)
                return LogModule::Placement;
            if (path.find("input") != std::string_view::npos)
                return LogModule::Input;
            if (path.find("session") != std::string_view::npos)
                return LogModule::Session;
            if (path.find("scene") != std::string_view::npos)
                return LogModule::Scene;
            if (path.find("core") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    inline std::optional<LogModule> parse_log_module(std::string_view name) {
        if (name == "core")
            return LogModule::Core;
        if (name == "tracking")
            return LogModule::Tracking;
        if (name == "scene")
            return LogModule::Scene;
        if (name == "placement")
            return LogModule::Placement;
        if (name == "input")
            return LogModule::Input;
        if (name == "session")
            return LogModule::Session;
        return std::nullopt;
    }

    // "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
    inline std::optional<LogLevel> parse_log_level(std::string_view level_str) {
        if (level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "info")
            return LogLevel::Info;
        if (level_str == "warn" || level_str == "warning")
            return LogLevel::Warn;
        if (level_str == "error")
            return LogLevel::Error;
        if (level_str == "critical")
            return LogLevel::Critical;
        if (level_str == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    // Scoped timer for performance measurement
    class ScopedTimer {
        std::chrono::high_resolution_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;

    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Debug,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::high_resolution_clock::now()),
              name_(std::move(name)),
              level_(level),
              loc_(loc) {}

        ~ScopedTimer() {
            auto duration = std::chrono::high_resolution_clock::now() - start_;
            auto ms = std::chrono::duration<double, std::milli>(duration).count();
            Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
        }
    };

} // namespace arp::core

#define LOG_TRACE(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::arp::core::Logger::get().log_internal(::arp::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name)       ::arp::core::ScopedTimer _timer##__LINE__(name)
#define LOG_TIMER_TRACE(name) ::arp::core::ScopedTimer _timer##__LINE__(name, ::arp::core::LogLevel::Trace)
