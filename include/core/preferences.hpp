/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <glm/glm.hpp>
#include <mutex>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ps {
    namespace param {

        struct RootPreferences {
            bool confirm_delete = true;    // Ask before a node is deleted from the tree
            bool show_helper_nodes = true; // Prepend "adder" helper nodes to children lists

            nlohmann::json to_json() const;
            static RootPreferences from_json(const nlohmann::json& j);
        };

        struct ScenePreferences {
            glm::vec3 background_color{0.5f, 0.5f, 0.5f};
            glm::vec3 foreground_color{1.0f, 1.0f, 1.0f};
            int width = 600;
            int height = 400;

            nlohmann::json to_json() const;
            static ScenePreferences from_json(const nlohmann::json& j);
        };

        struct UiPreferences {
            // Root directory searched for external view files
            std::filesystem::path view_root;
            // Root directory icons are resolved against
            std::filesystem::path resource_path = "resources";

            nlohmann::json to_json() const;
            static UiPreferences from_json(const nlohmann::json& j);
        };

        struct Preferences {
            RootPreferences root;
            ScenePreferences scene;
            UiPreferences ui;

            nlohmann::json to_json() const;
            static Preferences from_json(const nlohmann::json& j);
        };

        /**
         * @brief Read preferences from a JSON file
         * @param path Path to the preferences file
         * @return Preferences (defaults for missing keys) or error message
         */
        std::expected<Preferences, std::string> read_preferences(const std::filesystem::path& path);

        /**
         * @brief Write preferences as pretty printed JSON
         * @return Empty on success, error message otherwise
         */
        std::expected<void, std::string> write_preferences(const Preferences& prefs,
                                                           const std::filesystem::path& path);

        // Process wide preferences, read by the pipeline nodes
        class PreferenceManager {
        public:
            static PreferenceManager& get() {
                static PreferenceManager instance;
                return instance;
            }

            Preferences current() const {
                std::lock_guard lock(mutex_);
                return prefs_;
            }

            void set(const Preferences& prefs) {
                std::lock_guard lock(mutex_);
                prefs_ = prefs;
            }

            std::expected<void, std::string> load(const std::filesystem::path& path);

            void reset() { set(Preferences{}); }

        private:
            PreferenceManager() = default;

            mutable std::mutex mutex_;
            Preferences prefs_;
        };

        inline PreferenceManager& preference_manager() { return PreferenceManager::get(); }

    } // namespace param
} // namespace ps
