/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ps::state {

    // A node state: "__metadata__" = {class_name, version} plus the node's fields
    using State = nlohmann::json;

    inline constexpr const char* METADATA_KEY = "__metadata__";
    inline constexpr const char* CHILDREN_KEY = "children";

    class StateError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Anything the state pickler can capture and restore
    class Persistable {
    public:
        virtual ~Persistable() = default;

        virtual std::string className() const = 0;
        virtual int version() const { return 0; }

        // Persistent fields only, without metadata
        virtual State getPureState() const = 0;
        virtual void setPureState(const State& state) = 0;
    };

    // Upgrades the state of one class from fromVersion() to fromVersion() + 1
    class StateUpgrader {
    public:
        virtual ~StateUpgrader() = default;
        virtual std::string className() const = 0;
        virtual int fromVersion() const = 0;
        virtual void upgrade(State& state) const = 0;
    };

    class UpgradeRegistry {
    public:
        static UpgradeRegistry& get() {
            static UpgradeRegistry instance;
            return instance;
        }

        void registerUpgrader(std::unique_ptr<StateUpgrader> upgrader);
        void setCurrentVersion(const std::string& class_name, int version);
        // -1 when the class never registered a version
        int currentVersion(const std::string& class_name) const;

        // Upgrades a single state (not its children) to the current version of its class
        void upgrade(State& state) const;

    private:
        UpgradeRegistry() = default;

        const StateUpgrader* find(const std::string& class_name, int from_version) const;

        mutable std::mutex mutex_;
        std::vector<std::unique_ptr<StateUpgrader>> upgraders_;
        std::map<std::string, int> current_versions_;
    };

    State get_state(const Persistable& obj);
    void set_state(Persistable& obj, const State& state);

    std::string dumps(const Persistable& obj);
    std::string dumps_state(const State& state);
    State loads_state(std::string_view text);

    // Brings a state tree (children included) up to the registered class versions
    void update_state(State& state);

    std::string class_name_of(const State& state);
    int version_of(const State& state);

    // State without its metadata entry
    State strip_metadata(const State& state);

    // Field `key` of a state, or fallback when it is absent. A mistyped field is a StateError
    template <typename T>
    T field(const State& state, const std::string& key, const T& fallback) {
        const auto it = state.find(key);
        if (it == state.end()) {
            return fallback;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw StateError(std::format("State field '{}' holds {}: {}", key, it->dump(), e.what()));
        }
    }

} // namespace ps::state
