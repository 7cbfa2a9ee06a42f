/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "render/native.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace ps::render {

    double Algorithm::parameter(const std::string& key) const {
        auto it = parameters_.find(key);
        if (it == parameters_.end()) {
            throw std::out_of_range(std::format("Algorithm '{}' has no parameter '{}'", kind_, key));
        }
        return it->second;
    }

    OffscreenRenderWindow::OffscreenRenderWindow(int width, int height)
        : width_(width),
          height_(height) {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument(std::format("Invalid render window size {}x{}", width, height));
        }
        LOG_DEBUG("Offscreen render window {}x{} created", width, height);
    }

    OffscreenRenderWindow::~OffscreenRenderWindow() {
        if (!actors_.empty()) {
            LOG_WARN("Render window destroyed with {} actor(s) still attached", actors_.size());
        }
    }

    void OffscreenRenderWindow::render() {
        if (disable_render_) {
            LOG_TRACE("Render skipped, rendering disabled");
            return;
        }
        ++render_count_;
        LOG_TRACE("Rendered frame {} with {} visible actor(s)", render_count_, visibleActorCount());
    }

    void OffscreenRenderWindow::addActor(Actor* actor) {
        if (!actor) {
            throw std::invalid_argument("Cannot add a null actor");
        }
        if (std::find(actors_.begin(), actors_.end(), actor) == actors_.end()) {
            actors_.push_back(actor);
        }
    }

    void OffscreenRenderWindow::removeActor(Actor* actor) {
        std::erase(actors_, actor);
    }

    std::vector<const Actor*> OffscreenRenderWindow::actors() const {
        return {actors_.begin(), actors_.end()};
    }

    size_t OffscreenRenderWindow::visibleActorCount() const {
        return static_cast<size_t>(std::count_if(actors_.begin(), actors_.end(),
                                                 [](const Actor* a) { return a->visibility(); }));
    }

    std::unique_ptr<RenderWindow> createOffscreenWindow(int width, int height) {
        return std::make_unique<OffscreenRenderWindow>(width, height);
    }

} // namespace ps::render
