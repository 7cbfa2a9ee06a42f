/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/engine.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"
#include "core/preferences.hpp"
#include "pipeline/module.hpp"
#include "pipeline/node_factory.hpp"
#include "pipeline/scene.hpp"
#include "project/pipeline_file.hpp"
#include "render/native.hpp"

#include <algorithm>
#include <format>

namespace ps::engine {

    namespace {

        std::unique_ptr<render::RenderWindow> preference_window() {
            const auto prefs = param::preference_manager().current().scene;
            return render::createOffscreenWindow(prefs.width, prefs.height);
        }

        bool subtree_contains(const pipeline::Base& root, const pipeline::Base* node) {
            if (&root == node) {
                return true;
            }
            return std::any_of(root.children().begin(), root.children().end(),
                               [node](const auto& child) { return subtree_contains(*child, node); });
        }

        void describe_node(const pipeline::Base& node, int depth, std::string& out) {
            out += std::format("{:{}}{} ({}){}\n", "", depth * 2,
                               node.name().empty() ? node.className() : node.name(),
                               node.className(),
                               node.running() ? "" : " [stopped]");
            for (const auto& child : node.children()) {
                describe_node(*child, depth + 1, out);
            }
        }

    } // namespace

    Engine::Engine() : Engine(preference_window) {}

    Engine::Engine(WindowFactory window_factory)
        : window_factory_(std::move(window_factory)) {
        if (!window_factory_) {
            throw std::invalid_argument("Engine needs a window factory");
        }
        // Registers the built-in classes and their state versions
        pipeline::NodeFactory::get();

        // A detached node is still alive while this runs
        on_children_changed_ = event::ScopedSubscription<events::node::ChildrenChanged>(
            events::node::ChildrenChanged::when([this](const auto&) {
                if (current_object_ && !inTree(current_object_)) {
                    current_object_ = nullptr;
                }
            }));
    }

    Engine::~Engine() {
        stop();
    }

    void Engine::start() {
        if (running_) {
            return;
        }
        LOG_TIMER("Engine start");
        running_ = true;
        size_t failed = 0;
        for (auto& scene : scenes_) {
            if (!startScene(*scene)) {
                ++failed;
            }
        }
        if (failed > 0) {
            LOG_WARN("Engine started, {} of {} scene(s) stay stopped", failed, scenes_.size());
            return;
        }
        LOG_INFO("Engine started with {} scene(s)", scenes_.size());
    }

    void Engine::stop() {
        if (!running_) {
            return;
        }
        for (auto& scene : scenes_) {
            scene->stop();
        }
        running_ = false;
        LOG_DEBUG("Engine stopped");
    }

    pipeline::Scene& Engine::newScene(const std::string& name) {
        auto scene = std::make_unique<pipeline::Scene>(window_factory_());
        scene->setName(name.empty() ? std::format("Scene {}", scenes_.size() + 1) : name);
        return addScene(std::move(scene));
    }

    pipeline::Scene& Engine::addScene(std::unique_ptr<pipeline::Scene> scene) {
        if (!scene) {
            throw std::invalid_argument("Cannot add a null scene");
        }
        if (running_ && !startScene(*scene)) {
            throw std::runtime_error(std::format("Scene '{}' could not be started", scene->name()));
        }
        pipeline::Scene& added = *scene;
        scenes_.push_back(std::move(scene));

        events::engine::SceneAdded{.name = added.name(), .scene_count = scenes_.size()}.emit();
        setCurrentScene(&added);
        return added;
    }

    void Engine::closeScene(pipeline::Scene* scene) {
        auto it = std::find_if(scenes_.begin(), scenes_.end(),
                               [scene](const auto& s) { return s.get() == scene; });
        if (it == scenes_.end()) {
            LOG_WARN("Cannot close a scene this engine does not own");
            return;
        }

        std::unique_ptr<pipeline::Scene> closing = std::move(*it);
        scenes_.erase(it);
        if (current_object_ && !inTree(current_object_)) {
            current_object_ = nullptr;
        }
        closing->stop();
        const std::string name = closing->name();
        closing.reset();

        events::engine::SceneRemoved{.name = name, .scene_count = scenes_.size()}.emit();
        if (current_scene_ == scene) {
            current_object_ = nullptr;
            setCurrentScene(scenes_.empty() ? nullptr : scenes_.back().get());
        }
    }

    void Engine::closeAll() {
        while (!scenes_.empty()) {
            closeScene(scenes_.back().get());
        }
    }

    void Engine::setCurrentScene(pipeline::Scene* scene) {
        if (current_scene_ == scene) {
            return;
        }
        current_scene_ = scene;
        current_object_ = scene;
        events::engine::CurrentSceneChanged{.name = scene ? scene->name() : std::string{}}.emit();
    }

    bool Engine::startScene(pipeline::Scene& scene) {
        try {
            scene.start();
        } catch (const std::exception& e) {
            scene.stop();
            error_handler_.publishException(std::format("Starting scene '{}'", scene.name()), e);
            return false;
        }
        return true;
    }

    std::unique_ptr<pipeline::Scene> Engine::loadScene(const state::State& scene_state) const {
        auto scene = std::make_unique<pipeline::Scene>(window_factory_());
        // The state waits for start(), the name is wanted right away
        scene->setName(state::field(scene_state, "name", std::string{}));
        scene->setState(scene_state);
        return scene;
    }

    pipeline::Scene* Engine::findScene(const std::string& name) const {
        for (const auto& scene : scenes_) {
            if (scene->name() == name) {
                return scene.get();
            }
        }
        return nullptr;
    }

    pipeline::Base* Engine::currentObject() const {
        return current_object_ ? current_object_ : current_scene_;
    }

    void Engine::setCurrentObject(pipeline::Base* object) {
        if (object && !inTree(object)) {
            throw std::invalid_argument("The current object must belong to one of the engine's scenes");
        }
        current_object_ = object;
    }

    bool Engine::inTree(const pipeline::Base* node) const {
        return std::any_of(scenes_.begin(), scenes_.end(),
                           [node](const auto& scene) { return subtree_contains(*scene, node); });
    }

    pipeline::Base* Engine::addChildTo(pipeline::Base& parent, std::unique_ptr<pipeline::Base> child) {
        if (!child) {
            throw std::invalid_argument("Cannot add a null node");
        }
        pipeline::Base* added = child.get();
        parent.addChild(std::move(child));
        current_object_ = added;
        LOG_DEBUG("Added {} below '{}'", added->className(), parent.name());
        return added;
    }

    pipeline::Base* Engine::addSource(std::unique_ptr<pipeline::Base> source, pipeline::Scene* scene) {
        if (!scene) {
            scene = current_scene_ ? current_scene_ : &newScene();
        }
        return addChildTo(*scene, std::move(source));
    }

    pipeline::Base* Engine::addFilter(std::unique_ptr<pipeline::Base> filter, pipeline::Base* object) {
        pipeline::Base* target = object ? object : currentObject();
        // A module cannot hold children, its source takes them
        while (target && dynamic_cast<pipeline::Module*>(target)) {
            target = target->parent();
        }
        if (!target) {
            throw std::invalid_argument("There is no object to add the filter to");
        }
        return addChildTo(*target, std::move(filter));
    }

    pipeline::Base* Engine::addModule(std::unique_ptr<pipeline::Base> module, pipeline::Base* object) {
        return addFilter(std::move(module), object);
    }

    void Engine::render() {
        for (auto& scene : scenes_) {
            scene->render();
        }
    }

    bool Engine::saveVisualization(const std::filesystem::path& path) const {
        try {
            management::PipelineFile file;
            file.setName(path.stem().string());
            for (const auto& scene : scenes_) {
                file.addScene(scene->currentState());
            }
            if (!file.writeToFile(path)) {
                error_handler_.publishError("Saving the visualization failed", path.string());
                return false;
            }
        } catch (const std::exception& e) {
            error_handler_.publishException(std::format("Saving {}", path.string()), e);
            return false;
        }

        LOG_INFO("Saved {} scene(s) to {}", scenes_.size(), path.string());
        events::engine::VisualizationSaved{.path = path, .scene_count = scenes_.size()}.emit();
        return true;
    }

    bool Engine::loadVisualization(const std::filesystem::path& path) {
        management::PipelineFile file;
        if (!file.readFromFile(path)) {
            error_handler_.publishError("Loading the visualization failed", path.string());
            return false;
        }

        // Build and check every scene before adding any, a bad state leaves us untouched
        std::vector<std::unique_ptr<pipeline::Scene>> loaded;
        try {
            for (state::State scene_state : file.getData().scenes) {
                state::update_state(scene_state);
                auto scene = loadScene(scene_state);
                if (running_) {
                    scene->start();
                } else {
                    // Stopped scenes defer their state, a throwaway copy applies it now
                    auto trial = loadScene(scene_state);
                    trial->start();
                    trial->stop();
                }
                loaded.push_back(std::move(scene));
            }
        } catch (const std::exception& e) {
            error_handler_.publishException(std::format("Loading {}", path.string()), e);
            return false;
        }

        const size_t count = loaded.size();
        for (auto& scene : loaded) {
            addScene(std::move(scene));
        }

        LOG_INFO("Loaded {} scene(s) from {}", count, path.string());
        events::engine::VisualizationLoaded{.path = path, .scene_count = count}.emit();
        return true;
    }

    std::string Engine::describe() const {
        std::string out;
        for (const auto& scene : scenes_) {
            describe_node(*scene, 0, out);
        }
        return out;
    }

} // namespace ps::engine
