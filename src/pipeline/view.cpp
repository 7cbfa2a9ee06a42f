/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/view.hpp"

#include <cctype>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace ps::pipeline {

    nlohmann::json View::to_json() const {
        nlohmann::json j;
        j["title"] = title;
        j["icon"] = icon;
        j["kind"] = kind;
        j["items"] = items;
        j["buttons"] = buttons;
        return j;
    }

    View View::from_json(const nlohmann::json& j) {
        View v;
        v.title = j.value("title", v.title);
        v.icon = j.value("icon", v.icon);
        v.kind = j.value("kind", v.kind);
        v.items = j.value("items", v.items);
        v.buttons = j.value("buttons", v.buttons);
        return v;
    }

    std::expected<View, std::string> load_view_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(std::format("Cannot open view file {}", path.string()));
        }

        try {
            nlohmann::json doc = nlohmann::json::parse(file);
            if (!doc.contains("view") || !doc["view"].is_object()) {
                return std::unexpected(std::format("View file {} has no 'view' object", path.string()));
            }
            return View::from_json(doc["view"]);
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid view file {}: {}", path.string(), e.what()));
        }
    }

    std::string to_snake_case(const std::string& class_name) {
        std::string out;
        out.reserve(class_name.size() + 4);
        for (size_t i = 0; i < class_name.size(); ++i) {
            const auto c = static_cast<unsigned char>(class_name[i]);
            if (std::isupper(c)) {
                if (i > 0) {
                    out.push_back('_');
                }
                out.push_back(static_cast<char>(std::tolower(c)));
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
        return out;
    }

} // namespace ps::pipeline
