/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "pipeline/base.hpp"

#include <glm/glm.hpp>
#include <memory>
#include <string>

namespace ps::render {
    class Actor;
}

namespace ps::pipeline {

    /**
     * @brief A leaf node drawing its parent's output through a native actor.
     *
     * The actor only exists while running, so a module's state cannot be applied
     * before start(); restore() keeps it as saved state until then.
     */
    class Module : public Base {
    public:
        Module();
        ~Module() override;

        void start() override;
        void stop() override;

        const render::Actor* actor() const { return actor_.get(); }

    protected:
        // Pushes our configuration into the actor
        virtual void updateActor(render::Actor& actor) const = 0;
        void actorChanged();
        render::Actor& requireActor(const char* operation);

        void onVisibleChanged(bool visible) override;
        std::string moduleDir() const override { return "modules"; }

    private:
        void teardown();

        std::unique_ptr<render::Actor> actor_;
    };

    class OutlineModule : public Module {
    public:
        OutlineModule();

        std::string className() const override { return "OutlineModule"; }

        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        const glm::vec3& color() const { return color_; }
        void setColor(const glm::vec3& color);
        float lineWidth() const { return line_width_; }
        void setLineWidth(float width);

    protected:
        void updateActor(render::Actor& actor) const override;

    private:
        glm::vec3 color_{1.0f, 1.0f, 1.0f};
        float line_width_ = 1.0f;
    };

    class SurfaceModule : public Module {
    public:
        SurfaceModule();

        std::string className() const override { return "SurfaceModule"; }

        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        float opacity() const { return opacity_; }
        void setOpacity(float opacity);
        // "surface", "wireframe" or "points"
        const std::string& representation() const { return representation_; }
        void setRepresentation(const std::string& representation);

    protected:
        void updateActor(render::Actor& actor) const override;

    private:
        float opacity_ = 1.0f;
        std::string representation_ = "surface";
    };

} // namespace ps::pipeline
