/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <memory>
#include <string>

namespace ps {
    namespace args {
        /**
         * @brief Parse command-line arguments and set up logging
         * @param argc Number of arguments
         * @param argv Array of argument strings (const-correct)
         * @return Expected AppParameters or error message
         */
        std::expected<std::unique_ptr<param::AppParameters>, std::string>
        parse_args(int argc, const char* const argv[]);
    } // namespace args
} // namespace ps
