/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "state/state.hpp"
#include "core/logger.hpp"

#include <format>

namespace ps::state {

    void UpgradeRegistry::registerUpgrader(std::unique_ptr<StateUpgrader> upgrader) {
        std::lock_guard lock(mutex_);
        LOG_DEBUG("Registered state upgrader for {} v{}", upgrader->className(), upgrader->fromVersion());
        upgraders_.push_back(std::move(upgrader));
    }

    void UpgradeRegistry::setCurrentVersion(const std::string& class_name, int version) {
        std::lock_guard lock(mutex_);
        current_versions_[class_name] = version;
    }

    int UpgradeRegistry::currentVersion(const std::string& class_name) const {
        std::lock_guard lock(mutex_);
        auto it = current_versions_.find(class_name);
        return it == current_versions_.end() ? -1 : it->second;
    }

    const StateUpgrader* UpgradeRegistry::find(const std::string& class_name, int from_version) const {
        for (const auto& upgrader : upgraders_) {
            if (upgrader->className() == class_name && upgrader->fromVersion() == from_version) {
                return upgrader.get();
            }
        }
        return nullptr;
    }

    void UpgradeRegistry::upgrade(State& state) const {
        const std::string class_name = class_name_of(state);
        int version = version_of(state);

        std::lock_guard lock(mutex_);
        auto it = current_versions_.find(class_name);
        if (it == current_versions_.end()) {
            return;
        }
        const int target = it->second;

        if (version > target) {
            throw StateError(std::format("State of {} has version {}, newer than supported version {}",
                                         class_name, version, target));
        }

        while (version < target) {
            const StateUpgrader* upgrader = find(class_name, version);
            if (!upgrader) {
                throw StateError(std::format("No upgrade path for {} from version {} to {}",
                                             class_name, version, target));
            }
            upgrader->upgrade(state);
            ++version;
            state[METADATA_KEY]["version"] = version;
            LOG_DEBUG("Upgraded {} state to version {}", class_name, version);
        }
    }

    State get_state(const Persistable& obj) {
        State state = obj.getPureState();
        if (!state.is_object()) {
            throw StateError(std::format("Pure state of {} is not an object", obj.className()));
        }
        state[METADATA_KEY] = {{"class_name", obj.className()},
                               {"version", obj.version()}};
        return state;
    }

    void set_state(Persistable& obj, const State& state) {
        const std::string class_name = class_name_of(state);
        if (class_name != obj.className()) {
            throw StateError(std::format("Cannot set state of {} on an instance of {}",
                                         class_name, obj.className()));
        }
        obj.setPureState(state);
    }

    std::string dumps(const Persistable& obj) {
        return dumps_state(get_state(obj));
    }

    std::string dumps_state(const State& state) {
        return state.dump();
    }

    State loads_state(std::string_view text) {
        State state;
        try {
            state = State::parse(text.begin(), text.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw StateError(std::format("Malformed state: {}", e.what()));
        }
        // validates the metadata
        class_name_of(state);
        version_of(state);
        return state;
    }

    void update_state(State& state) {
        UpgradeRegistry::get().upgrade(state);

        if (state.contains(CHILDREN_KEY)) {
            auto& children = state[CHILDREN_KEY];
            if (!children.is_array()) {
                throw StateError(std::format("'{}' of {} is not a list", CHILDREN_KEY, class_name_of(state)));
            }
            for (auto& child : children) {
                update_state(child);
            }
        }
    }

    std::string class_name_of(const State& state) {
        if (!state.is_object() || !state.contains(METADATA_KEY)) {
            throw StateError("State carries no metadata");
        }
        const auto& meta = state[METADATA_KEY];
        if (!meta.contains("class_name") || !meta["class_name"].is_string()) {
            throw StateError("State metadata carries no class name");
        }
        return meta["class_name"].get<std::string>();
    }

    int version_of(const State& state) {
        if (!state.is_object() || !state.contains(METADATA_KEY)) {
            throw StateError("State carries no metadata");
        }
        const auto& meta = state[METADATA_KEY];
        if (!meta.contains("version") || !meta["version"].is_number_integer()) {
            throw StateError("State metadata carries no version");
        }
        return meta["version"].get<int>();
    }

    State strip_metadata(const State& state) {
        State pure = state;
        pure.erase(METADATA_KEY);
        return pure;
    }

} // namespace ps::state
