/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "pipeline/base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ps::render {
    class Algorithm;
}

namespace ps::pipeline {

    // Helper node the tree shows first under a source, offers to add children
    class AdderNode : public Base {
    public:
        explicit AdderNode(Base* object = nullptr);

        std::string className() const override { return "AdderNode"; }
        Base* object() const { return object_; }

    private:
        Base* object_;
    };

    // "Add ..." actions of a source's context menu
    class SourceMenuHelper : public MenuHelper {
    public:
        std::vector<MenuItem> actions() const override;
        bool perform(const Action& action, Base& object) override;

        static constexpr const char* ADD_PREFIX = "object.menu_helper.add:";
    };

    /**
     * @brief A node producing data that filters and modules consume.
     *
     * The native algorithm is built in start() and dropped in stop(); children
     * are started after and stopped before it.
     */
    class Source : public Base {
    public:
        Source();
        ~Source() override;

        void start() override;
        void stop() override;

        bool canAddChild(const Base& child) const override;
        void addChild(std::unique_ptr<Base> child) override;
        std::unique_ptr<Base> removeChild(Base* child) override;

        std::vector<Base*> childrenUiList() const override;

        // Output of the native pipeline, null while stopped
        const render::Algorithm* output() const { return algorithm_.get(); }

    protected:
        virtual std::unique_ptr<render::Algorithm> buildAlgorithm() const = 0;
        // Pushes our configuration into the native algorithm
        virtual void updateAlgorithm(render::Algorithm& algorithm) const = 0;
        // Re-pushes the configuration when running, a no-op otherwise
        void pipelineChanged();

        // Output of the Source we are attached to, if any
        const render::Algorithm* parentOutput() const;

        render::Algorithm& requireAlgorithm(const char* operation);

        std::string moduleDir() const override { return "sources"; }

    private:
        std::unique_ptr<render::Algorithm> algorithm_;
        std::unique_ptr<AdderNode> adder_;
    };

    class ParametricSource : public Source {
    public:
        ParametricSource();

        std::string className() const override { return "ParametricSource"; }
        int version() const override { return 1; }

        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        const std::string& function() const { return function_; }
        void setFunction(const std::string& function);
        int resolution() const { return resolution_; }
        void setResolution(int resolution);

        static const std::vector<std::string>& functions();

    protected:
        std::unique_ptr<render::Algorithm> buildAlgorithm() const override;
        void updateAlgorithm(render::Algorithm& algorithm) const override;

    private:
        std::string function_ = "sphere";
        int resolution_ = 32;
    };

    class ThresholdFilter : public Source {
    public:
        ThresholdFilter();

        std::string className() const override { return "ThresholdFilter"; }

        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        double lower() const { return lower_; }
        double upper() const { return upper_; }
        void setRange(double lower, double upper);

    protected:
        std::unique_ptr<render::Algorithm> buildAlgorithm() const override;
        void updateAlgorithm(render::Algorithm& algorithm) const override;
        std::string moduleDir() const override { return "filters"; }

    private:
        double lower_ = 0.0;
        double upper_ = 1.0;
    };

} // namespace ps::pipeline
