/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/scene.hpp"
#include "core/logger.hpp"
#include "core/preferences.hpp"
#include "pipeline/source.hpp"
#include "render/native.hpp"

#include <algorithm>
#include <format>

namespace ps::pipeline {

    namespace {

        std::unique_ptr<render::RenderWindow> default_window() {
            const auto prefs = param::preference_manager().current().scene;
            return render::createOffscreenWindow(prefs.width, prefs.height);
        }

        glm::vec3 color_from_state(const state::State& j) {
            if (!j.is_array() || j.size() != 3 ||
                !std::all_of(j.begin(), j.end(), [](const auto& c) { return c.is_number(); })) {
                throw state::StateError(std::format("Expected an [r, g, b] color, got {}", j.dump()));
            }
            return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
        }

    } // namespace

    Scene::Scene() : Scene(default_window()) {}

    Scene::Scene(std::unique_ptr<render::RenderWindow> window)
        : window_(std::move(window)) {
        if (!window_) {
            throw std::invalid_argument("A scene needs a render window");
        }
        const auto prefs = param::preference_manager().current().scene;
        background_ = prefs.background_color;
        foreground_ = prefs.foreground_color;

        setType(" scene");
        setIcon("scene.ico");
        Base::setScene(window_.get());
    }

    Scene::~Scene() {
        // Children hold actors in our window, they go before it does
        destroyChildren();
    }

    state::State Scene::getPureState() const {
        state::State s = Base::getPureState();
        s["background"] = {background_.r, background_.g, background_.b};
        s["foreground"] = {foreground_.r, foreground_.g, foreground_.b};
        return s;
    }

    void Scene::setPureState(const state::State& state) {
        const glm::vec3 background = state.contains("background") ? color_from_state(state["background"]) : background_;
        const glm::vec3 foreground = state.contains("foreground") ? color_from_state(state["foreground"]) : foreground_;
        background_ = background;
        foreground_ = foreground;
        applyColors();

        window_->setDisableRender(true);
        try {
            Base::setPureState(state);
        } catch (...) {
            window_->setDisableRender(false);
            throw;
        }
        window_->setDisableRender(false);
        render();
    }

    void Scene::start() {
        if (running()) {
            return;
        }
        applyColors();
        Base::start();
        startChildren();
        render();
        LOG_DEBUG("Scene '{}' started with {} source(s)", name(), childCount());
    }

    void Scene::stop() {
        if (!running()) {
            return;
        }
        stopChildren();
        Base::stop();
        LOG_DEBUG("Scene '{}' stopped", name());
    }

    bool Scene::canAddChild(const Base& child) const {
        return dynamic_cast<const Source*>(&child) != nullptr;
    }

    void Scene::addChild(std::unique_ptr<Base> child) {
        if (!child) {
            throw std::invalid_argument("Cannot add a null child");
        }
        if (!canAddChild(*child)) {
            throw std::invalid_argument(std::format("Only sources can be added to a scene, got {}",
                                                    child->className()));
        }
        appendChild(std::move(child));
        render();
    }

    std::unique_ptr<Base> Scene::removeChild(Base* child) {
        auto removed = detachChild(child);
        if (!removed) {
            throw std::invalid_argument(std::format("Scene '{}' is not the parent of the node to remove", name()));
        }
        render();
        return removed;
    }

    void Scene::setScene(render::RenderWindow*) {
        Base::setScene(window_.get());
    }

    void Scene::setBackground(const glm::vec3& color) {
        background_ = color;
        if (running()) {
            applyColors();
            render();
        }
    }

    void Scene::setForeground(const glm::vec3& color) {
        foreground_ = color;
        if (running()) {
            applyColors();
            render();
        }
    }

    void Scene::applyColors() {
        window_->setBackground(background_);
        window_->setForeground(foreground_);
    }

} // namespace ps::pipeline
