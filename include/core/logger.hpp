/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ps::core {

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
        Pipeline = 1,
        State = 2,
        Render = 3,
        Engine = 4,
        Management = 5,
        Unknown = 6,
        Count = 7 // Total number of modules
    };

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Initialize logger
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

            logger_ = std::make_shared<spdlog::logger>("pipescene", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);

            for (auto& level : module_level_) {
                level = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!logger_)
                return;

            auto module = detect_module(loc.file_name());

            auto module_idx = static_cast<size_t>(module);
            if (static_cast<uint8_t>(level) < module_level_[module_idx] ||
                static_cast<uint8_t>(level) < global_level_) {
                return;
            }

            auto msg = std::format(fmt, std::forward<Args>(args)...);

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        // Raises the threshold of one module above the global level, e.g. to silence state tracing
        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        static std::optional<LogModule> module_from_name(std::string_view name) {
            static constexpr std::array<std::pair<std::string_view, LogModule>, 6> names{{
                {"core", LogModule::Core},
                {"pipeline", LogModule::Pipeline},
                {"state", LogModule::State},
                {"render", LogModule::Render},
                {"engine", LogModule::Engine},
                {"management", LogModule::Management},
            }};
            for (const auto& [key, module] : names) {
                if (key == name)
                    return module;
            }
            return std::nullopt;
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

    private:
        Logger() = default;

        static LogModule detect_module(std::string_view path) {
            if (path.find("/project/") != std::string_view::npos ||
                path.find("/management/") != std::string_view::npos)
                return LogModule::Management;
            if (path.find("pipeline") != std::string_view::npos ||
                path.find("Pipeline") != std::string_view::npos)
                return LogModule::Pipeline;
            if (path.find("state") != std::string_view::npos ||
                path.find("State") != std::string_view::npos)
                return LogModule::State;
            if (path.find("render") != std::string_view::npos ||
                path.find("Render") != std::string_view::npos)
                return LogModule::Render;
            if (path.find("engine") != std::string_view::npos ||
                path.find("Engine") != std::string_view::npos)
                return LogModule::Engine;
            if (path.find("core") != std::string_view::npos ||
                path.find("Core") != std::string_view::npos)
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
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

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

} // namespace ps::core

// Global macros defined OUTSIDE namespace - accessible from anywhere
#define LOG_TRACE(...) \
    ::ps::core::Logger::get().log_internal(::ps::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::ps::core::Logger::get().log_internal(::ps::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::ps::core::Logger::get().log_internal(::ps::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::ps::core::Logger::get().log_internal(::ps::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::ps::core::Logger::get().log_internal(::ps::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name) ::ps::core::ScopedTimer _timer##__LINE__(name)
