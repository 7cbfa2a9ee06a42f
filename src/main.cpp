/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>
#include <utility>

int main(int argc, char* argv[]) {
    // Parse arguments (this automatically initializes the logger based on --log-level flag)
    auto params_result = ps::args::parse_args(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    LOG_INFO("========================================");
    LOG_INFO("PipeScene");
    LOG_INFO("========================================");

    ps::Application app;
    const int result = app.run(std::move(*params_result));
    ps::core::Logger::get().flush();
    return result;
}
