/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error_handler.hpp"
#include "state/state.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ps::render {
    class RenderWindow;
}

namespace ps::pipeline {
    class Base;
    class Scene;
} // namespace ps::pipeline

namespace ps::engine {

    /**
     * @brief Owns the scenes of a session and the pipelines hanging off them.
     *
     * New objects go below the current object: sources into the current scene,
     * filters and modules into the current source. The engine starts what it
     * adds while it is running, so deferred states get applied.
     */
    class Engine {
    public:
        using WindowFactory = std::function<std::unique_ptr<render::RenderWindow>()>;

        // Scenes get offscreen windows sized by the scene preferences
        Engine();
        explicit Engine(WindowFactory window_factory);
        ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // A scene whose state fails to apply is reported through notify::Error and stays stopped
        void start();
        void stop();
        bool running() const { return running_; }

        // An empty name becomes "Scene <n>"
        pipeline::Scene& newScene(const std::string& name = {});
        // Throws, after reporting, when the engine runs and the scene fails to start
        pipeline::Scene& addScene(std::unique_ptr<pipeline::Scene> scene);
        void closeScene(pipeline::Scene* scene);
        void closeAll();

        const std::vector<std::unique_ptr<pipeline::Scene>>& scenes() const { return scenes_; }
        pipeline::Scene* currentScene() const { return current_scene_; }
        void setCurrentScene(pipeline::Scene* scene);
        pipeline::Scene* findScene(const std::string& name) const;

        // The current scene unless an object is current. Detaching that object clears it
        pipeline::Base* currentObject() const;
        void setCurrentObject(pipeline::Base* object);

        // Each returns the added node, which becomes the current object
        pipeline::Base* addSource(std::unique_ptr<pipeline::Base> source, pipeline::Scene* scene = nullptr);
        pipeline::Base* addFilter(std::unique_ptr<pipeline::Base> filter, pipeline::Base* object = nullptr);
        pipeline::Base* addModule(std::unique_ptr<pipeline::Base> module, pipeline::Base* object = nullptr);

        void render();

        bool saveVisualization(const std::filesystem::path& path) const;
        // Appends the file's scenes to ours
        bool loadVisualization(const std::filesystem::path& path);

        // Indented "name (class)" listing of every scene
        std::string describe() const;

    private:
        bool startScene(pipeline::Scene& scene);
        std::unique_ptr<pipeline::Scene> loadScene(const state::State& scene_state) const;
        bool inTree(const pipeline::Base* node) const;
        pipeline::Base* addChildTo(pipeline::Base& parent, std::unique_ptr<pipeline::Base> child);

        WindowFactory window_factory_;
        std::vector<std::unique_ptr<pipeline::Scene>> scenes_;
        pipeline::Scene* current_scene_ = nullptr;
        pipeline::Base* current_object_ = nullptr;
        bool running_ = false;
        mutable ErrorHandler error_handler_;
        event::ScopedSubscription<events::node::ChildrenChanged> on_children_changed_;
    };

} // namespace ps::engine
