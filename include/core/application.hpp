/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <memory>

namespace ps {

    namespace param {
        struct AppParameters;
    } // namespace param

    namespace engine {
        class Engine;
    } // namespace engine

    class Application {
    public:
        int run(std::unique_ptr<param::AppParameters> params);
    };

    // Parametric sphere with an outline, thresholded into a surface
    void build_demo_pipeline(engine::Engine& engine);

} // namespace ps
