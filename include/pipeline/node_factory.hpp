/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "pipeline/base.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ps::pipeline {

    // Creates stopped nodes by class name, used when states are turned back into objects
    class NodeFactory {
    public:
        using Creator = std::function<std::unique_ptr<Base>()>;

        static NodeFactory& get() {
            static NodeFactory instance;
            return instance;
        }

        // Also records the class version for state upgrades
        void registerClass(const std::string& class_name, Creator creator);

        template <typename T>
        void registerClass() {
            Creator creator = []() -> std::unique_ptr<Base> { return std::make_unique<T>(); };
            const std::string class_name = creator()->className();
            registerClass(class_name, std::move(creator));
        }

        bool contains(const std::string& class_name) const;
        std::unique_ptr<Base> create(const std::string& class_name) const;
        std::vector<std::string> classNames() const;

    private:
        NodeFactory();

        mutable std::mutex mutex_;
        std::map<std::string, Creator> creators_;
    };

    // A stopped node of the state's class holding the state as its saved state
    std::unique_ptr<Base> create_instance(const state::State& state);

} // namespace ps::pipeline
