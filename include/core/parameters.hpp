/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <string>

namespace ps {
    namespace param {

        // What the pipescene executable was asked to do
        struct AppParameters {
            std::filesystem::path load_path;        // visualization file to open
            std::filesystem::path save_path;        // where to write the visualization afterwards
            std::filesystem::path preferences_path; // preferences.json, the lookup default when empty
            bool demo = false;                      // build the demo pipeline
            bool list_classes = false;              // print the registered node classes and exit
        };

    } // namespace param
} // namespace ps
