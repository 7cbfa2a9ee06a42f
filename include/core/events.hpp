/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/event_bus.hpp"
#include <filesystem>
#include <string>

namespace ps {

    namespace pipeline {
        class Base;
    }

// Clean event macro - uses ps::event::bus()
#define EVENT(Name, ...)                                   \
    struct Name {                                          \
        using event_id = Name;                             \
        __VA_ARGS__                                        \
                                                           \
        void emit() const {                                \
            ::ps::event::bus().emit(*this);                \
        }                                                  \
                                                           \
        static auto when(auto&& handler) {                 \
            return ::ps::event::bus().when<Name>(          \
                std::forward<decltype(handler)>(handler)); \
        }                                                  \
    }

    namespace events {

        // ============================================================================
        // Node - property change notifications the tree editor listens to
        // ============================================================================
        namespace node {
            EVENT(RunningChanged, const pipeline::Base* node; bool old_value; bool new_value;);
            EVENT(VisibilityChanged, const pipeline::Base* node; bool visible;);
            EVENT(NameChanged, const pipeline::Base* node; std::string old_name; std::string new_name;);
            EVENT(ChildrenChanged, const pipeline::Base* node; size_t child_count;);
            EVENT(StateDeferred, const pipeline::Base* node; std::string class_name;);
            EVENT(StateApplied, const pipeline::Base* node; std::string class_name;);
        } // namespace node

        // ============================================================================
        // Engine - scene and visualization level broadcasts
        // ============================================================================
        namespace engine {
            EVENT(SceneAdded, std::string name; size_t scene_count;);
            EVENT(SceneRemoved, std::string name; size_t scene_count;);
            EVENT(CurrentSceneChanged, std::string name;);
            EVENT(VisualizationSaved, std::filesystem::path path; size_t scene_count;);
            EVENT(VisualizationLoaded, std::filesystem::path path; size_t scene_count;);
        } // namespace engine

        // ============================================================================
        // Notify - errors surfaced to whoever presents them
        // ============================================================================
        namespace notify {
            EVENT(Error, std::string message; std::string details = "";);
        } // namespace notify

    } // namespace events

} // namespace ps
