/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"
#include "core/preferences.hpp"
#include "engine/engine.hpp"
#include "pipeline/module.hpp"
#include "pipeline/node_factory.hpp"
#include "pipeline/scene.hpp"
#include "pipeline/source.hpp"

#include <print>

namespace ps {

    namespace {

        std::filesystem::path default_preferences_path() {
            std::error_code ec;
            const auto executable = std::filesystem::canonical("/proc/self/exe", ec);
            if (ec) {
                return {};
            }
            return executable.parent_path().parent_path() / "parameter" / "preferences.json";
        }

        bool load_preferences(const param::AppParameters& params) {
            auto path = params.preferences_path;
            if (path.empty()) {
                path = default_preferences_path();
                if (path.empty() || !std::filesystem::exists(path)) {
                    LOG_DEBUG("No preferences file found, using defaults");
                    return true;
                }
            }

            auto result = param::preference_manager().load(path);
            if (!result) {
                LOG_ERROR("Failed to load preferences: {}", result.error());
                return false;
            }
            LOG_DEBUG("Preferences loaded from {}", path.string());
            return true;
        }

    } // namespace

    void build_demo_pipeline(engine::Engine& engine) {
        auto& scene = engine.newScene("Demo");

        auto source = std::make_unique<pipeline::ParametricSource>();
        source->setName("Sphere");
        auto* sphere = engine.addSource(std::move(source), &scene);

        engine.addModule(std::make_unique<pipeline::OutlineModule>(), sphere);

        auto threshold = std::make_unique<pipeline::ThresholdFilter>();
        threshold->setRange(0.25, 0.75);
        auto* filter = engine.addFilter(std::move(threshold), sphere);

        auto surface = std::make_unique<pipeline::SurfaceModule>();
        surface->setOpacity(0.6f);
        engine.addModule(std::move(surface), filter);
    }

    int Application::run(std::unique_ptr<param::AppParameters> params) {
        if (!load_preferences(*params)) {
            return -1;
        }

        if (params->list_classes) {
            for (const auto& name : pipeline::NodeFactory::get().classNames()) {
                std::println("{}", name);
            }
            return 0;
        }

        bool failed = false;
        event::ScopedSubscription<events::notify::Error> on_error(
            events::notify::Error::when([&failed](const events::notify::Error&) { failed = true; }));

        engine::Engine engine;

        if (!params->load_path.empty() && !engine.loadVisualization(params->load_path)) {
            return -1;
        }

        if (params->demo) {
            build_demo_pipeline(engine);
        }

        if (engine.scenes().empty()) {
            LOG_WARN("Nothing to show, pass --load <file> or --demo");
            return 0;
        }

        engine.start();
        engine.render();

        LOG_INFO("Pipeline:\n{}", engine.describe());

        if (!params->save_path.empty() && !engine.saveVisualization(params->save_path)) {
            return -1;
        }

        engine.stop();
        return failed ? -1 : 0;
    }

} // namespace ps
