/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/events.hpp"
#include "core/logger.hpp"
#include <exception>
#include <string>

namespace ps {

    class ErrorHandler {
    public:
        ErrorHandler() = default;

        // Log and broadcast a failed operation
        void publishException(const std::string& operation, const std::exception& e) {
            LOG_ERROR("{} failed: {}", operation, e.what());
            events::notify::Error{
                .message = operation + " failed",
                .details = e.what()}
                .emit();
        }

        void publishError(const std::string& message, const std::string& details = "") {
            LOG_ERROR("{}{}{}", message, details.empty() ? "" : ": ", details);
            events::notify::Error{
                .message = message,
                .details = details}
                .emit();
        }
    };

} // namespace ps
