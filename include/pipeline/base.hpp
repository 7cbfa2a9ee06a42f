/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "pipeline/menu.hpp"
#include "pipeline/view.hpp"
#include "state/state.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ps::render {
    class RenderWindow;
}

namespace ps::pipeline {

    class NotImplementedError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /**
     * @brief The node every pipeline object (scene, source, filter, module) derives from.
     *
     * A node can be configured while stopped: a state handed to it is kept as a serialized
     * saved state and only applied once start() has built the native pipeline. Transient
     * fields (scene, running, menu, parent, icon path) never enter the persisted state.
     */
    class Base : public state::Persistable {
    public:
        static constexpr const char* HIDDEN_SUFFIX = " [Hidden]";

        Base();
        ~Base() override;

        Base(const Base&) = delete;
        Base& operator=(const Base&) = delete;

        // Persistable
        std::string className() const override { return "Base"; }
        int version() const override { return 0; }
        state::State getPureState() const override;
        void setPureState(const state::State& state) override;

        // Serialized state, the pending saved state if there is one
        std::string serialize() const;
        // Replace our configuration, applied now if running, on start() otherwise
        void restore(const std::string& serialized);
        // Same as restore() for an already parsed and upgraded state
        void setState(const state::State& state);
        // A stopped instance of the same class carrying our configuration
        std::unique_ptr<Base> deepCopy() const;
        // Our state as it would be persisted right now
        state::State currentState() const;

        // Lifecycle
        virtual void start();
        virtual void stop();
        bool running() const { return running_; }

        // Tree structure
        virtual bool canAddChild(const Base& child) const;
        virtual void addChild(std::unique_ptr<Base> child);
        virtual std::unique_ptr<Base> removeChild(Base* child);
        // Detach from our parent; ownership goes to the caller, null without a parent
        std::unique_ptr<Base> remove();

        const std::vector<std::unique_ptr<Base>>& children() const { return children_; }
        size_t childCount() const { return children_.size(); }
        Base* child(size_t index) const;
        Base* parent() const { return parent_; }

        // Children as shown in the tree, may include helper nodes
        virtual std::vector<Base*> childrenUiList() const;

        void render();
        render::RenderWindow* scene() const { return scene_; }
        virtual void setScene(render::RenderWindow* scene);

        // Views
        View dialogView() const;
        View traitView(const std::string& name = {}) const;
        void setTraitView(const std::string& name, View view);

        // Tree node interface
        std::string treeLabel();
        View treeView() const;
        std::optional<bool> treeConfirmDelete() const;
        const Menu* treeMenu();
        std::string treeIcon(bool is_expanded) const;
        std::filesystem::path treeIconPath() const;
        void treeDeleteChild(size_t index);

        // Properties
        const std::string& name() const { return name_; }
        void setName(const std::string& name);
        const std::string& type() const { return type_; }
        void setType(const std::string& type) { type_ = type; }
        const std::string& icon() const { return icon_; }
        void setIcon(const std::string& icon) { icon_ = icon; }
        bool visible() const { return visible_; }
        void setVisible(bool visible);
        void hideShow();

        const std::string& savedState() const { return saved_state_; }
        bool hasSavedState() const { return !saved_state_.empty(); }

        MenuHelper* menuHelper() const { return menu_helper_.get(); }
        void setMenuHelper(std::shared_ptr<MenuHelper> helper);
        void setMenu(Menu menu);
        void clearMenu();

        void setIconPath(const std::filesystem::path& path) { icon_path_ = path; }

    protected:
        void setRunning(bool running);
        void loadSavedState();

        // Adds a child we accepted: parents it, shares our scene, starts it when we run
        void appendChild(std::unique_ptr<Base> child);
        std::unique_ptr<Base> detachChild(Base* child);
        void stopChildren();
        void startChildren();
        void destroyChildren();
        // Applies a list of child states, creating or dropping children to match it
        void setChildrenState(const state::State& children_state);

        // Subclasses push the flag to their native objects
        virtual void onVisibleChanged(bool visible);

        virtual View defaultView() const;
        virtual Menu defaultMenu() const;
        // Directory, below the view root, holding our "ui" folder
        virtual std::string moduleDir() const { return "core"; }

    private:
        std::string name_;
        std::string type_;
        std::string icon_ = "module.ico";
        bool visible_ = true;
        bool running_ = false;

        Base* parent_ = nullptr;
        render::RenderWindow* scene_ = nullptr;
        std::vector<std::unique_ptr<Base>> children_;

        // Loaded on start(), a stopped node has no native pipeline to set it on
        std::string saved_state_;

        std::shared_ptr<MenuHelper> menu_helper_;
        std::optional<Menu> menu_;
        bool menu_cleared_ = false;
        std::filesystem::path icon_path_;
        std::map<std::string, View> named_views_;
    };

} // namespace ps::pipeline
