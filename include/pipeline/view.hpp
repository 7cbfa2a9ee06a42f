/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ps::pipeline {

    // Description of the editor panel/dialog for a node, rendered by the GUI layer
    struct View {
        std::string title;
        std::string icon;
        std::string kind = "live";
        std::vector<std::string> items;   // edited fields, in display order
        std::vector<std::string> buttons; // empty means the editor default

        nlohmann::json to_json() const;
        static View from_json(const nlohmann::json& j);
    };

    /**
     * @brief Load an external view file
     * @param path JSON file holding a "view" object
     * @return The view or an error message
     */
    std::expected<View, std::string> load_view_file(const std::filesystem::path& path);

    // "ThresholdFilter" -> "threshold_filter"
    std::string to_snake_case(const std::string& class_name);

} // namespace ps::pipeline
