/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/node_factory.hpp"
#include "core/logger.hpp"
#include "pipeline/base.hpp"
#include "pipeline/module.hpp"
#include "pipeline/scene.hpp"
#include "pipeline/source.hpp"
#include "state/state.hpp"

#include <format>

namespace ps::pipeline {

    namespace {

        // Version 0 parametric sources stored their shape under "function_name"
        class ParametricSourceUpgrader : public state::StateUpgrader {
        public:
            std::string className() const override { return "ParametricSource"; }
            int fromVersion() const override { return 0; }

            void upgrade(state::State& state) const override {
                if (state.contains("function_name")) {
                    state["function"] = state["function_name"];
                    state.erase("function_name");
                }
            }
        };

    } // namespace

    NodeFactory::NodeFactory() {
        registerClass<Base>();
        registerClass<Scene>();
        registerClass<ParametricSource>();
        registerClass<ThresholdFilter>();
        registerClass<OutlineModule>();
        registerClass<SurfaceModule>();

        state::UpgradeRegistry::get().registerUpgrader(std::make_unique<ParametricSourceUpgrader>());
    }

    void NodeFactory::registerClass(const std::string& class_name, Creator creator) {
        if (!creator) {
            throw std::invalid_argument(std::format("No creator given for class '{}'", class_name));
        }

        const int version = creator()->version();
        state::UpgradeRegistry::get().setCurrentVersion(class_name, version);

        std::lock_guard lock(mutex_);
        if (creators_.contains(class_name)) {
            LOG_DEBUG("Replacing node creator for '{}'", class_name);
        }
        creators_[class_name] = std::move(creator);
        LOG_TRACE("Registered node class '{}' at version {}", class_name, version);
    }

    bool NodeFactory::contains(const std::string& class_name) const {
        std::lock_guard lock(mutex_);
        return creators_.contains(class_name);
    }

    std::unique_ptr<Base> NodeFactory::create(const std::string& class_name) const {
        Creator creator;
        {
            std::lock_guard lock(mutex_);
            const auto it = creators_.find(class_name);
            if (it == creators_.end()) {
                throw state::StateError(std::format("Unknown node class '{}'", class_name));
            }
            creator = it->second;
        }
        return creator();
    }

    std::vector<std::string> NodeFactory::classNames() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        names.reserve(creators_.size());
        for (const auto& [name, creator] : creators_) {
            names.push_back(name);
        }
        return names;
    }

    std::unique_ptr<Base> create_instance(const state::State& state) {
        auto node = NodeFactory::get().create(state::class_name_of(state));
        node->setState(state);
        return node;
    }

} // namespace ps::pipeline
