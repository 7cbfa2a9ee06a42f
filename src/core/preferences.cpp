/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/preferences.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ps {
    namespace param {
        namespace {

            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Preferences file does not exist: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open preferences file: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parsing error in {}: {}", path.string(), e.what()));
                }
            }

            nlohmann::json color_to_json(const glm::vec3& c) {
                return nlohmann::json::array({c.r, c.g, c.b});
            }

            glm::vec3 color_from_json(const nlohmann::json& j, const glm::vec3& fallback) {
                if (!j.is_array() || j.size() != 3) {
                    LOG_WARN("Ignoring malformed color {}, expected [r, g, b]", j.dump());
                    return fallback;
                }
                return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
            }

        } // namespace

        nlohmann::json RootPreferences::to_json() const {
            nlohmann::json j;
            j["confirm_delete"] = confirm_delete;
            j["show_helper_nodes"] = show_helper_nodes;
            return j;
        }

        RootPreferences RootPreferences::from_json(const nlohmann::json& j) {
            RootPreferences r;
            r.confirm_delete = j.value("confirm_delete", r.confirm_delete);
            r.show_helper_nodes = j.value("show_helper_nodes", r.show_helper_nodes);
            return r;
        }

        nlohmann::json ScenePreferences::to_json() const {
            nlohmann::json j;
            j["background_color"] = color_to_json(background_color);
            j["foreground_color"] = color_to_json(foreground_color);
            j["width"] = width;
            j["height"] = height;
            return j;
        }

        ScenePreferences ScenePreferences::from_json(const nlohmann::json& j) {
            ScenePreferences s;
            if (j.contains("background_color")) {
                s.background_color = color_from_json(j["background_color"], s.background_color);
            }
            if (j.contains("foreground_color")) {
                s.foreground_color = color_from_json(j["foreground_color"], s.foreground_color);
            }
            s.width = j.value("width", s.width);
            s.height = j.value("height", s.height);
            return s;
        }

        nlohmann::json UiPreferences::to_json() const {
            nlohmann::json j;
            j["view_root"] = view_root.string();
            j["resource_path"] = resource_path.string();
            return j;
        }

        UiPreferences UiPreferences::from_json(const nlohmann::json& j) {
            UiPreferences u;
            u.view_root = j.value("view_root", u.view_root.string());
            u.resource_path = j.value("resource_path", u.resource_path.string());
            return u;
        }

        nlohmann::json Preferences::to_json() const {
            nlohmann::json j;
            j["root"] = root.to_json();
            j["scene"] = scene.to_json();
            j["ui"] = ui.to_json();
            return j;
        }

        Preferences Preferences::from_json(const nlohmann::json& j) {
            Preferences p;
            if (j.contains("root")) {
                p.root = RootPreferences::from_json(j["root"]);
            }
            if (j.contains("scene")) {
                p.scene = ScenePreferences::from_json(j["scene"]);
            }
            if (j.contains("ui")) {
                p.ui = UiPreferences::from_json(j["ui"]);
            }

            for (const auto& [key, value] : j.items()) {
                if (key != "root" && key != "scene" && key != "ui") {
                    LOG_WARN("Unknown preferences section '{}' ignored", key);
                }
            }
            return p;
        }

        std::expected<Preferences, std::string> read_preferences(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                return Preferences::from_json(*json_result);
            } catch (const nlohmann::json::exception& e) {
                return std::unexpected(std::format("Invalid preferences in {}: {}", path.string(), e.what()));
            }
        }

        std::expected<void, std::string> write_preferences(const Preferences& prefs,
                                                           const std::filesystem::path& path) {
            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected(std::format("Could not open preferences file for writing: {}", path.string()));
            }
            file << prefs.to_json().dump(4) << std::endl;
            return {};
        }

        std::expected<void, std::string> PreferenceManager::load(const std::filesystem::path& path) {
            auto prefs = read_preferences(path);
            if (!prefs) {
                return std::unexpected(prefs.error());
            }
            set(*prefs);
            LOG_INFO("Loaded preferences from {}", path.string());
            return {};
        }

    } // namespace param
} // namespace ps
