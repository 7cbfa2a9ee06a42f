/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <args.hxx>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace {

    enum class ParseResult {
        Success,
        Help
    };

    // Parse log level from string
    ps::core::LogLevel parse_log_level(const std::string& level_str) {
        if (level_str == "trace")
            return ps::core::LogLevel::Trace;
        if (level_str == "debug")
            return ps::core::LogLevel::Debug;
        if (level_str == "info")
            return ps::core::LogLevel::Info;
        if (level_str == "warn" || level_str == "warning")
            return ps::core::LogLevel::Warn;
        if (level_str == "error")
            return ps::core::LogLevel::Error;
        if (level_str == "critical")
            return ps::core::LogLevel::Critical;
        if (level_str == "off")
            return ps::core::LogLevel::Off;
        return ps::core::LogLevel::Info; // Default
    }

    std::expected<ParseResult, std::string> parse_arguments(
        const std::vector<std::string>& args,
        ps::param::AppParameters& params) {

        try {
            ::args::ArgumentParser parser(
                "PipeScene: headless visualization pipelines with deferred state.\n",
                "Usage:\n"
                "  Demo:   pipescene --demo [--save <file.psv>]\n"
                "  Open:   pipescene --load <file.psv> [--save <file.psv>]\n");

            ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});
            ::args::CompletionFlag completion(parser, {"complete"});

            ::args::ValueFlag<std::string> load(parser, "file", "Visualization file to load (.psv)", {'l', "load"});
            ::args::ValueFlag<std::string> save(parser, "file", "Save the visualization to this file (.psv)", {'s', "save"});
            ::args::ValueFlag<std::string> preferences(parser, "file", "Preferences file (json)", {"preferences"});
            ::args::Flag demo(parser, "demo", "Build the demo pipeline", {"demo"});
            ::args::Flag list_classes(parser, "list_classes", "List the registered node classes", {"list-classes"});

            // Logging options
            ::args::ValueFlag<std::string> log_level(parser, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(parser, "file", "Optional log file path", {"log-file"});
            ::args::ValueFlagList<std::string> log_module(parser, "module=level", "Per module log level, modules: core, pipeline, state, render, engine, management", {"log-module"});

            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return ParseResult::Help;
            } catch (const ::args::Completion& e) {
                std::print("{}", e.what());
                return ParseResult::Help;
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger based on command line arguments
            {
                auto level = ps::core::LogLevel::Info;
                std::string log_file_path;

                if (log_level) {
                    level = parse_log_level(::args::get(log_level));
                }

                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                ps::core::Logger::get().init(level, log_file_path);

                for (const auto& entry : ::args::get(log_module)) {
                    const auto eq = entry.find('=');
                    const auto module = ps::core::Logger::module_from_name(entry.substr(0, eq));
                    if (eq == std::string::npos || !module) {
                        return std::unexpected(std::format("Invalid --log-module '{}', expected <module>=<level>", entry));
                    }
                    ps::core::Logger::get().set_module_level(*module, parse_log_level(entry.substr(eq + 1)));
                }

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            if (help) {
                return ParseResult::Help;
            }

            if (load) {
                params.load_path = ::args::get(load);
                if (!std::filesystem::exists(params.load_path)) {
                    return std::unexpected(std::format("Visualization file does not exist: {}", params.load_path.string()));
                }
            }

            if (save) {
                params.save_path = ::args::get(save);
                if (params.save_path.extension() != ".psv") {
                    return std::unexpected(std::format("Save path must end with .psv: {}", params.save_path.string()));
                }
            }

            if (preferences) {
                params.preferences_path = ::args::get(preferences);
                if (!std::filesystem::exists(params.preferences_path)) {
                    return std::unexpected(std::format("Preferences file does not exist: {}", params.preferences_path.string()));
                }
            }

            params.demo = demo;
            params.list_classes = list_classes;

            if (params.demo && !params.load_path.empty()) {
                LOG_WARN("--demo and --load given, the demo scene is added after the loaded ones");
            }

            return ParseResult::Success;

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }
} // anonymous namespace

// Public interface
std::expected<std::unique_ptr<ps::param::AppParameters>, std::string>
ps::args::parse_args(int argc, const char* const argv[]) {

    auto params = std::make_unique<ps::param::AppParameters>();

    auto parse_result = parse_arguments(convert_args(argc, argv), *params);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    if (*parse_result == ParseResult::Help) {
        std::exit(0);
    }

    return params;
}
