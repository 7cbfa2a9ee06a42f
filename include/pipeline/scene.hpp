/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "pipeline/base.hpp"

#include <glm/glm.hpp>
#include <memory>
#include <string>

namespace ps::pipeline {

    // Root of one window's pipeline, owns the native render window
    class Scene : public Base {
    public:
        Scene();
        explicit Scene(std::unique_ptr<render::RenderWindow> window);
        ~Scene() override;

        std::string className() const override { return "Scene"; }

        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        void start() override;
        void stop() override;

        bool canAddChild(const Base& child) const override;
        void addChild(std::unique_ptr<Base> child) override;
        std::unique_ptr<Base> removeChild(Base* child) override;

        // The window is ours, parents cannot reassign it
        void setScene(render::RenderWindow* scene) override;

        render::RenderWindow& window() { return *window_; }
        const render::RenderWindow& window() const { return *window_; }

        const glm::vec3& background() const { return background_; }
        void setBackground(const glm::vec3& color);
        const glm::vec3& foreground() const { return foreground_; }
        void setForeground(const glm::vec3& color);

    protected:
        std::string moduleDir() const override { return "core"; }

    private:
        void applyColors();

        std::unique_ptr<render::RenderWindow> window_;
        glm::vec3 background_;
        glm::vec3 foreground_;
    };

} // namespace ps::pipeline
