/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ps::render {

    // Stand-in for a native pipeline algorithm (reader, source or filter)
    class Algorithm {
    public:
        explicit Algorithm(std::string kind) : kind_(std::move(kind)) {}

        const std::string& kind() const { return kind_; }
        void setKind(std::string kind) { kind_ = std::move(kind); }

        void setParameter(const std::string& key, double value) { parameters_[key] = value; }
        double parameter(const std::string& key) const;
        bool hasParameter(const std::string& key) const { return parameters_.contains(key); }

        void setInput(const Algorithm* input) { input_ = input; }
        const Algorithm* input() const { return input_; }

    private:
        std::string kind_;
        std::map<std::string, double> parameters_;
        const Algorithm* input_ = nullptr;
    };

    enum class Representation {
        Points,
        Wireframe,
        Surface
    };

    struct ActorProperty {
        glm::vec3 color{1.0f, 1.0f, 1.0f};
        float opacity = 1.0f;
        float line_width = 1.0f;
        Representation representation = Representation::Surface;
    };

    // Stand-in for a native actor drawn by a render window
    class Actor {
    public:
        explicit Actor(const Algorithm* input = nullptr) : input_(input) {}

        ActorProperty& property() { return property_; }
        const ActorProperty& property() const { return property_; }

        bool visibility() const { return visibility_; }
        void setVisibility(bool visible) { visibility_ = visible; }

        const Algorithm* input() const { return input_; }
        void setInput(const Algorithm* input) { input_ = input; }

    private:
        ActorProperty property_;
        bool visibility_ = true;
        const Algorithm* input_ = nullptr;
    };

    // Native window/viewport a pipeline is attached to
    class RenderWindow {
    public:
        virtual ~RenderWindow() = default;

        virtual void render() = 0;

        virtual void setBackground(const glm::vec3& color) = 0;
        virtual glm::vec3 background() const = 0;
        virtual void setForeground(const glm::vec3& color) = 0;
        virtual glm::vec3 foreground() const = 0;

        virtual void addActor(Actor* actor) = 0;
        virtual void removeActor(Actor* actor) = 0;
        virtual std::vector<const Actor*> actors() const = 0;

        // Suppresses render() while true, used during bulk pipeline changes
        virtual void setDisableRender(bool disable) = 0;
        virtual bool disableRender() const = 0;
    };

    // Headless window, keeps actors and counts frames
    class OffscreenRenderWindow : public RenderWindow {
    public:
        OffscreenRenderWindow(int width, int height);
        ~OffscreenRenderWindow() override;

        void render() override;

        void setBackground(const glm::vec3& color) override { background_ = color; }
        glm::vec3 background() const override { return background_; }
        void setForeground(const glm::vec3& color) override { foreground_ = color; }
        glm::vec3 foreground() const override { return foreground_; }

        void addActor(Actor* actor) override;
        void removeActor(Actor* actor) override;
        std::vector<const Actor*> actors() const override;

        void setDisableRender(bool disable) override { disable_render_ = disable; }
        bool disableRender() const override { return disable_render_; }

        size_t renderCount() const { return render_count_; }
        size_t visibleActorCount() const;
        int width() const { return width_; }
        int height() const { return height_; }

    private:
        int width_;
        int height_;
        glm::vec3 background_{0.0f};
        glm::vec3 foreground_{1.0f};
        std::vector<Actor*> actors_;
        size_t render_count_ = 0;
        bool disable_render_ = false;
    };

    std::unique_ptr<RenderWindow> createOffscreenWindow(int width, int height);

} // namespace ps::render
