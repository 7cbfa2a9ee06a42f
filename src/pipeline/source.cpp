/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/source.hpp"
#include "core/logger.hpp"
#include "core/preferences.hpp"
#include "pipeline/module.hpp"
#include "pipeline/node_factory.hpp"
#include "render/native.hpp"

#include <algorithm>
#include <format>

namespace ps::pipeline {

    // ------------------------------------------------------------------
    // AdderNode
    // ------------------------------------------------------------------

    AdderNode::AdderNode(Base* object) : object_(object) {
        setName("Add module or filter");
        setType(" adder");
        setIcon("add.ico");
    }

    // ------------------------------------------------------------------
    // SourceMenuHelper
    // ------------------------------------------------------------------

    std::vector<MenuItem> SourceMenuHelper::actions() const {
        const auto make = [](const char* label, const char* class_name) {
            return Action{.name = label,
                          .action = std::string(ADD_PREFIX) + class_name,
                          .enabled_when = ""};
        };
        return {make("Add Outline", "OutlineModule"),
                make("Add Surface", "SurfaceModule"),
                make("Add Threshold", "ThresholdFilter")};
    }

    bool SourceMenuHelper::perform(const Action& action, Base& object) {
        const std::string_view prefix = ADD_PREFIX;
        if (!action.action.starts_with(prefix)) {
            return false;
        }
        const std::string class_name = action.action.substr(prefix.size());
        LOG_DEBUG("Adding {} to '{}'", class_name, object.name());
        object.addChild(NodeFactory::get().create(class_name));
        return true;
    }

    // ------------------------------------------------------------------
    // Source
    // ------------------------------------------------------------------

    Source::Source()
        : adder_(std::make_unique<AdderNode>(this)) {
        setType(" source");
        setIcon("source.ico");
        setMenuHelper(std::make_shared<SourceMenuHelper>());
    }

    Source::~Source() {
        destroyChildren();
        algorithm_.reset();
    }

    void Source::start() {
        if (running()) {
            return;
        }

        algorithm_ = buildAlgorithm();
        algorithm_->setInput(parentOutput());
        updateAlgorithm(*algorithm_);

        Base::start();
        startChildren();
        LOG_DEBUG("Started {} '{}'", className(), name());
    }

    void Source::stop() {
        if (!running()) {
            return;
        }

        stopChildren();
        algorithm_.reset();
        Base::stop();
        LOG_DEBUG("Stopped {} '{}'", className(), name());
    }

    bool Source::canAddChild(const Base& child) const {
        return dynamic_cast<const Source*>(&child) != nullptr ||
               dynamic_cast<const Module*>(&child) != nullptr;
    }

    void Source::addChild(std::unique_ptr<Base> child) {
        if (!child) {
            throw std::invalid_argument("Cannot add a null child");
        }
        if (!canAddChild(*child)) {
            throw std::invalid_argument(std::format("{} cannot be added to {} '{}'",
                                                    child->className(), className(), name()));
        }
        appendChild(std::move(child));
        render();
    }

    std::unique_ptr<Base> Source::removeChild(Base* child) {
        auto removed = detachChild(child);
        if (!removed) {
            throw std::invalid_argument(std::format("{} '{}' is not the parent of the node to remove",
                                                    className(), name()));
        }
        render();
        return removed;
    }

    std::vector<Base*> Source::childrenUiList() const {
        auto list = Base::childrenUiList();
        if (param::preference_manager().current().root.show_helper_nodes) {
            list.insert(list.begin(), adder_.get());
        }
        return list;
    }

    void Source::pipelineChanged() {
        if (algorithm_) {
            updateAlgorithm(*algorithm_);
            render();
        }
    }

    const render::Algorithm* Source::parentOutput() const {
        if (const auto* source = dynamic_cast<const Source*>(parent())) {
            return source->output();
        }
        return nullptr;
    }

    render::Algorithm& Source::requireAlgorithm(const char* operation) {
        if (!algorithm_) {
            throw std::logic_error(std::format("Cannot {} on {} '{}': its native pipeline is not built",
                                               operation, className(), name()));
        }
        return *algorithm_;
    }

    // ------------------------------------------------------------------
    // ParametricSource
    // ------------------------------------------------------------------

    ParametricSource::ParametricSource() {
        setType(" parametric source");
    }

    const std::vector<std::string>& ParametricSource::functions() {
        static const std::vector<std::string> names = {"sphere", "torus", "plane", "cone"};
        return names;
    }

    void ParametricSource::setFunction(const std::string& function) {
        const auto& names = functions();
        if (std::find(names.begin(), names.end(), function) == names.end()) {
            throw std::invalid_argument(std::format("Unknown parametric function '{}'", function));
        }
        function_ = function;
        pipelineChanged();
    }

    void ParametricSource::setResolution(int resolution) {
        if (resolution < 3) {
            throw std::invalid_argument(std::format("Resolution must be at least 3, got {}", resolution));
        }
        resolution_ = resolution;
        pipelineChanged();
    }

    state::State ParametricSource::getPureState() const {
        state::State s = Base::getPureState();
        s["function"] = function_;
        s["resolution"] = resolution_;
        return s;
    }

    void ParametricSource::setPureState(const state::State& state) {
        auto& algorithm = requireAlgorithm("set state");

        const std::string function = state::field(state, "function", function_);
        const int resolution = state::field(state, "resolution", resolution_);
        const auto& names = functions();
        if (std::find(names.begin(), names.end(), function) == names.end()) {
            throw state::StateError(std::format("Parametric source state names unknown function '{}'", function));
        }
        if (resolution < 3) {
            throw state::StateError(std::format("Parametric source state has resolution {}, below 3", resolution));
        }
        function_ = function;
        resolution_ = resolution;
        updateAlgorithm(algorithm);

        Base::setPureState(state);
    }

    std::unique_ptr<render::Algorithm> ParametricSource::buildAlgorithm() const {
        return std::make_unique<render::Algorithm>("parametric_" + function_);
    }

    void ParametricSource::updateAlgorithm(render::Algorithm& algorithm) const {
        const auto& names = functions();
        const auto index = std::find(names.begin(), names.end(), function_) - names.begin();
        algorithm.setKind("parametric_" + function_);
        algorithm.setParameter("function", static_cast<double>(index));
        algorithm.setParameter("resolution", resolution_);
    }

    // ------------------------------------------------------------------
    // ThresholdFilter
    // ------------------------------------------------------------------

    ThresholdFilter::ThresholdFilter() {
        setType(" filter");
        setIcon("filter.ico");
    }

    void ThresholdFilter::setRange(double lower, double upper) {
        if (lower > upper) {
            throw std::invalid_argument(std::format("Threshold lower bound {} exceeds upper bound {}", lower, upper));
        }
        lower_ = lower;
        upper_ = upper;
        pipelineChanged();
    }

    state::State ThresholdFilter::getPureState() const {
        state::State s = Base::getPureState();
        s["lower"] = lower_;
        s["upper"] = upper_;
        return s;
    }

    void ThresholdFilter::setPureState(const state::State& state) {
        auto& algorithm = requireAlgorithm("set state");

        const double lower = state::field(state, "lower", lower_);
        const double upper = state::field(state, "upper", upper_);
        if (lower > upper) {
            throw state::StateError(std::format("Threshold state has lower bound {} above upper bound {}", lower, upper));
        }
        lower_ = lower;
        upper_ = upper;
        updateAlgorithm(algorithm);

        Base::setPureState(state);
    }

    std::unique_ptr<render::Algorithm> ThresholdFilter::buildAlgorithm() const {
        return std::make_unique<render::Algorithm>("threshold");
    }

    void ThresholdFilter::updateAlgorithm(render::Algorithm& algorithm) const {
        algorithm.setParameter("lower", lower_);
        algorithm.setParameter("upper", upper_);
    }

} // namespace ps::pipeline
