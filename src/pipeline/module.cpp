/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/module.hpp"
#include "core/logger.hpp"
#include "pipeline/source.hpp"
#include "render/native.hpp"

#include <algorithm>
#include <format>

namespace ps::pipeline {

    namespace {

        render::Representation parse_representation(const std::string& name) {
            if (name == "surface")
                return render::Representation::Surface;
            if (name == "wireframe")
                return render::Representation::Wireframe;
            if (name == "points")
                return render::Representation::Points;
            throw std::invalid_argument(std::format("Unknown representation '{}'", name));
        }

        glm::vec3 color_from_state(const state::State& j) {
            if (!j.is_array() || j.size() != 3 ||
                !std::all_of(j.begin(), j.end(), [](const auto& c) { return c.is_number(); })) {
                throw state::StateError(std::format("Expected an [r, g, b] color, got {}", j.dump()));
            }
            return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
        }

    } // namespace

    // ------------------------------------------------------------------
    // Module
    // ------------------------------------------------------------------

    Module::Module() {
        setType(" module");
        setIcon("module.ico");
    }

    Module::~Module() {
        teardown();
    }

    void Module::start() {
        if (running()) {
            return;
        }

        const render::Algorithm* input = nullptr;
        if (const auto* source = dynamic_cast<const Source*>(parent())) {
            input = source->output();
        }
        if (!input) {
            LOG_WARN("{} '{}' started without an input", className(), name());
        }

        actor_ = std::make_unique<render::Actor>(input);
        actor_->setVisibility(visible());
        updateActor(*actor_);
        if (scene()) {
            scene()->addActor(actor_.get());
        }

        Base::start();
        render();
    }

    void Module::stop() {
        if (!running()) {
            return;
        }
        teardown();
        Base::stop();
    }

    void Module::teardown() {
        if (!actor_) {
            return;
        }
        if (scene()) {
            scene()->removeActor(actor_.get());
        }
        actor_.reset();
    }

    void Module::actorChanged() {
        if (actor_) {
            updateActor(*actor_);
            render();
        }
    }

    render::Actor& Module::requireActor(const char* operation) {
        if (!actor_) {
            throw std::logic_error(std::format("Cannot {} on {} '{}': its actor does not exist while stopped",
                                               operation, className(), name()));
        }
        return *actor_;
    }

    void Module::onVisibleChanged(bool visible) {
        if (actor_) {
            actor_->setVisibility(visible);
            render();
        }
    }

    // ------------------------------------------------------------------
    // OutlineModule
    // ------------------------------------------------------------------

    OutlineModule::OutlineModule() {
        setType(" outline module");
    }

    void OutlineModule::setColor(const glm::vec3& color) {
        color_ = color;
        actorChanged();
    }

    void OutlineModule::setLineWidth(float width) {
        if (width <= 0.0f) {
            throw std::invalid_argument(std::format("Line width must be positive, got {}", width));
        }
        line_width_ = width;
        actorChanged();
    }

    state::State OutlineModule::getPureState() const {
        state::State s = Base::getPureState();
        s["color"] = {color_.r, color_.g, color_.b};
        s["line_width"] = line_width_;
        return s;
    }

    void OutlineModule::setPureState(const state::State& state) {
        auto& actor = requireActor("set state");

        const glm::vec3 color = state.contains("color") ? color_from_state(state["color"]) : color_;
        const float line_width = state::field(state, "line_width", line_width_);
        if (line_width <= 0.0f) {
            throw state::StateError(std::format("Outline state has line width {}, it must be positive", line_width));
        }
        color_ = color;
        line_width_ = line_width;
        updateActor(actor);

        Base::setPureState(state);
    }

    void OutlineModule::updateActor(render::Actor& actor) const {
        actor.property().color = color_;
        actor.property().line_width = line_width_;
        actor.property().representation = render::Representation::Wireframe;
    }

    // ------------------------------------------------------------------
    // SurfaceModule
    // ------------------------------------------------------------------

    SurfaceModule::SurfaceModule() {
        setType(" surface module");
    }

    void SurfaceModule::setOpacity(float opacity) {
        if (opacity < 0.0f || opacity > 1.0f) {
            throw std::invalid_argument(std::format("Opacity must lie in [0, 1], got {}", opacity));
        }
        opacity_ = opacity;
        actorChanged();
    }

    void SurfaceModule::setRepresentation(const std::string& representation) {
        parse_representation(representation);
        representation_ = representation;
        actorChanged();
    }

    state::State SurfaceModule::getPureState() const {
        state::State s = Base::getPureState();
        s["opacity"] = opacity_;
        s["representation"] = representation_;
        return s;
    }

    void SurfaceModule::setPureState(const state::State& state) {
        auto& actor = requireActor("set state");

        const float opacity = state::field(state, "opacity", opacity_);
        const std::string representation = state::field(state, "representation", representation_);
        if (opacity < 0.0f || opacity > 1.0f) {
            throw state::StateError(std::format("Surface state has opacity {} outside [0, 1]", opacity));
        }
        try {
            parse_representation(representation);
        } catch (const std::invalid_argument& e) {
            throw state::StateError(e.what());
        }
        opacity_ = opacity;
        representation_ = representation;
        updateActor(actor);

        Base::setPureState(state);
    }

    void SurfaceModule::updateActor(render::Actor& actor) const {
        actor.property().opacity = opacity_;
        actor.property().representation = parse_representation(representation_);
    }

} // namespace ps::pipeline
